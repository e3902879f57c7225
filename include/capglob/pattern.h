#pragma once

#include <capglob/entry.h>
#include <capglob/filesystem.h>

#include <compare>
#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace capglob {

/// Options to modify the behaviour of `pattern::matches()` and `pattern::captures()`.
struct match_options {
	bool case_sensitive = true;                  // ASCII-only case folding when false
	bool require_literal_separator = false;      // wildcards and classes never match a path separator
	bool require_literal_leading_dot = false;    // wildcards and classes never match a leading '.' of a path component

	auto operator<=>(const match_options &) const = default;
};

namespace cls {

	struct single {
		char32_t c;
		auto operator<=>(const single &) const = default;
	};

	/// Inclusive range, compared by endpoint order: `[2-1]` matches nothing.
	struct range {
		char32_t first;
		char32_t last;
		auto operator<=>(const range &) const = default;
	};

} // namespace cls

/// One element of a `[...]` or `[!...]` character class.
using char_specifier = std::variant<cls::single, cls::range>;

namespace tok {

	struct literal {
		char32_t c;
		auto operator<=>(const literal &) const = default;
	};

	struct any_char {
		auto operator<=>(const any_char &) const = default;
	};

	struct any_sequence {
		auto operator<=>(const any_sequence &) const = default;
	};

	struct any_recursive_sequence {
		auto operator<=>(const any_recursive_sequence &) const = default;
	};

	struct any_within {
		std::vector<char_specifier> specifiers;
		auto operator<=>(const any_within &) const = default;
	};

	struct any_except {
		std::vector<char_specifier> specifiers;
		auto operator<=>(const any_except &) const = default;
	};

	// `double_star` marks a group boundary adjacent to a `**`: the boundary then steps back over
	// the separator that `**` absorbed.
	struct start_capture {
		std::size_t group;
		bool double_star;
		auto operator<=>(const start_capture &) const = default;
	};

	struct end_capture {
		std::size_t group;
		bool double_star;
		auto operator<=>(const end_capture &) const = default;
	};

} // namespace tok

using token = std::variant<
	tok::literal,
	tok::any_char,
	tok::any_sequence,
	tok::any_recursive_sequence,
	tok::any_within,
	tok::any_except,
	tok::start_capture,
	tok::end_capture>;

/// A pattern syntax error, raised before any matching or filesystem access takes place.
class pattern_error : public std::invalid_argument {
public:
	pattern_error(std::size_t pos, const char *msg);

	/// Byte offset into the pattern string near which the error was detected.
	std::size_t pos() const noexcept { return pos_; }
	const char *msg() const noexcept { return msg_; }

private:
	std::size_t pos_;
	const char *msg_;
};

class substitution_error : public std::runtime_error {
public:
	enum class kind_t {
		missing_group,          // no value was supplied for a capture group
		unexpected_wildcard,    // a wildcard or character class sits outside of any capture group
	};

	explicit substitution_error(kind_t kind, std::size_t group = 0);

	kind_t kind() const noexcept { return kind_; }

	/// 1-based number of the missing group; 0 for `unexpected_wildcard`.
	std::size_t group() const noexcept { return group_; }

private:
	kind_t kind_;
	std::size_t group_;
};

/// A compiled Unix shell style pattern with capture groups.
///
/// - `?` matches any single character.
/// - `*` matches any (possibly empty) sequence of characters.
/// - `**` matches the current directory and arbitrary subdirectories. It must form a single path
///   component, so both `**a` and `b**` are invalid. More than two consecutive `*` are invalid too.
/// - `[...]` matches any character inside the brackets, `[0-9]` style ranges included. `[!...]` is
///   the negation. A `]` directly after `[` or `[!` is part of the set: `[]]` and `[!]]`.
/// - `(...)` captures whatever the enclosed sub-pattern matched, `**` included.
///
/// The metacharacters `?`, `*`, `[`, `]`, `(`, `)` are matched literally by bracketing them, e.g. `[?]`.
class pattern {
public:
	/// The empty pattern; it only matches the empty string.
	pattern() = default;

	/// \param source the pattern text (UTF-8)
	/// \throws pattern_error when `source` is not a valid pattern
	explicit pattern(std::string_view source);

	/// Compiles `source`; with `skip_groups` parens are dropped instead of turned into captures,
	/// which is how the traversal compiles single path components.
	static pattern compile(std::string_view source, bool skip_groups);

	/// Escapes the metacharacters of `s` by bracketing them. The result, compiled, matches `s` and
	/// nothing else.
	static std::string escape(std::string_view s);

	bool matches(std::string_view str, const match_options &options = {}) const;
	bool matches_path(const fs::path &path, const match_options &options = {}) const;

	/// \return an entry holding `str` and the capture group offsets, or nothing when `str` doesn't match
	std::optional<entry> captures(std::string_view str, const match_options &options = {}) const;
	std::optional<entry> captures_path(const fs::path &path, const match_options &options = {}) const;

	/// Renders the pattern with `groups[i]` in place of capture group i+1.
	/// The result is not checked against the pattern: `images/(*.jpg)` happily renders `images/cat.png`.
	/// \throws substitution_error
	std::string substitute(const std::vector<std::string> &groups) const;

	const std::string &str() const noexcept { return original_; }
	const std::vector<token> &tokens() const noexcept { return tokens_; }
	bool is_recursive() const noexcept { return is_recursive_; }
	std::size_t group_count() const noexcept { return group_count_; }

	bool operator==(const pattern &other) const;
	std::strong_ordering operator<=>(const pattern &other) const;

private:
	std::string original_;
	std::vector<token> tokens_;
	bool is_recursive_ = false;
	std::size_t group_count_ = 0;
};

std::ostream &operator<<(std::ostream &os, const pattern &p);

} // namespace capglob
