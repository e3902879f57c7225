#pragma once

#if !defined(CAPGLOB_USE_GHC_FILESYSTEM) || defined(GHC_DO_NOT_USE_STD_FS)
#if !__has_include(<filesystem>) || defined(GHC_DO_NOT_USE_STD_FS)
#define CAPGLOB_USE_GHC_FILESYSTEM   1
#ifndef GHC_DO_NOT_USE_STD_FS
#define GHC_DO_NOT_USE_STD_FS     1
#endif
#endif
#else
#define GHC_DO_NOT_USE_STD_FS     1
#endif

// use the GHC-provided filesystem selector headerfile: ghc/fs_std.hpp
// which listens to both system availability of std::filesystem and the GHC_DO_NOT_USE_STD_FS
// overriding switch/define.
#include <ghc/fs_std.hpp>  // namespace fs = std::filesystem;   or   namespace fs = ghc::filesystem;

namespace capglob {

#if defined(GHC_USE_GHC_FS)
namespace fs = ghc::filesystem;
#else
namespace fs = std::filesystem;
#endif

/// Path component separator test: `/` everywhere, `\` as well on MS Windows.
constexpr bool is_separator(char32_t c) noexcept {
#ifdef _WIN32
	return c == U'/' || c == U'\\';
#else
	return c == U'/';
#endif
}

} // namespace capglob
