#pragma once

#include <capglob/filesystem.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace capglob {

/// A matched path together with the byte ranges of its capture groups.
///
/// Group 0 is the whole path; groups 1..N are the parenthesized parts of the
/// pattern, in the order of their opening parens.
class entry {
public:
	typedef std::pair<std::size_t, std::size_t> group_t;    // [start, end) byte offsets into path().string()

	entry() = default;
	explicit entry(fs::path path);
	entry(fs::path path, std::vector<group_t> groups);

	const fs::path &path() const noexcept { return path_; }

	/// \param n capture group number, 0 being the whole path
	/// \return the captured text, or nothing when there is no such group
	std::optional<std::string> group(std::size_t n) const;

	/// Number of capture groups, not counting group 0.
	std::size_t group_count() const noexcept { return groups_.size(); }

	const std::vector<group_t> &groups() const noexcept { return groups_; }

	operator const fs::path &() const noexcept { return path_; }

	bool operator==(const entry &other) const = default;

private:
	fs::path path_;
	std::vector<group_t> groups_;
};

std::ostream &operator<<(std::ostream &os, const entry &e);

} // namespace capglob
