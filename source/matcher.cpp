#include <capglob/pattern.h>

#include "utf8.h"

namespace capglob {

	namespace {

		enum class match_result {
			match,
			sub_pattern_doesnt_match,		// backtrack to the nearest `*` / `**` choice point
			entire_pattern_doesnt_match,	// input ran out: consuming more at any choice point can't help
		};

		constexpr bool is_ascii(char32_t c) noexcept {
			return c < 0x80;
		}

		constexpr char32_t to_ascii_lower(char32_t c) noexcept {
			return (c >= U'A' && c <= U'Z') ? c + (U'a' - U'A') : c;
		}

		constexpr char32_t to_ascii_upper(char32_t c) noexcept {
			return (c >= U'a' && c <= U'z') ? c - (U'a' - U'A') : c;
		}

		/// Are `a` and `b` equal, possibly case-insensitively? On MS Windows any two separators are equal.
		bool chars_eq(char32_t a, char32_t b, bool case_sensitive) noexcept {
#ifdef _WIN32
			if (is_separator(a) && is_separator(b))
				return true;
#endif
			if (!case_sensitive && is_ascii(a) && is_ascii(b))
				return to_ascii_lower(a) == to_ascii_lower(b);
			return a == b;
		}

		bool in_char_specifiers(const std::vector<char_specifier> &specifiers, char32_t c, const match_options &options) {
			for (const auto &specifier : specifiers) {
				if (const auto *single = std::get_if<cls::single>(&specifier)) {
					if (chars_eq(c, single->c, options.case_sensitive))
						return true;
					continue;
				}

				const auto &r = std::get<cls::range>(specifier);
				if (!options.case_sensitive && is_ascii(c) && is_ascii(r.first) && is_ascii(r.last)) {
					char32_t start = to_ascii_lower(r.first);
					char32_t end = to_ascii_lower(r.last);

					// only fold when both ends are letters
					if (start != to_ascii_upper(start) && end != to_ascii_upper(end)) {
						char32_t lc = to_ascii_lower(c);
						if (lc >= start && lc <= end)
							return true;
					}
				}

				if (c >= r.first && c <= r.last)
					return true;
			}
			return false;
		}

		/// Backtracking matcher over a token program. With a non-null `captures` the capture group
		/// boundaries are recorded as byte offsets into `subject`.
		class matcher {
		public:
			matcher(const std::vector<token> &tokens, std::string_view subject, const match_options &options, std::vector<entry::group_t> *captures)
				: tokens_(tokens),
				subject_(subject),
				options_(options),
				captures_(captures) {
			}

			match_result match_from(bool follows_separator, std::size_t pos, std::size_t ti) {
				for (; ti < tokens_.size(); ti++) {
					const auto &token = tokens_[ti];

					bool recursive = std::holds_alternative<tok::any_recursive_sequence>(token);
					if (recursive || std::holds_alternative<tok::any_sequence>(token)) {
						// empty match first
						auto m = match_from(follows_separator, pos, ti + 1);
						if (m != match_result::sub_pattern_doesnt_match)
							return m;

						while (pos < subject_.size()) {
							char32_t c = next_char(pos);
							if (follows_separator && options_.require_literal_leading_dot && c == U'.')
								return match_result::sub_pattern_doesnt_match;

							follows_separator = is_separator(c);
							if (recursive && !follows_separator)
								continue;
							if (!recursive && options_.require_literal_separator && follows_separator)
								return match_result::sub_pattern_doesnt_match;

							m = match_from(follows_separator, pos, ti + 1);
							if (m != match_result::sub_pattern_doesnt_match)
								return m;
						}
						// input consumed entirely: go on with the remaining tokens against nothing
					}
					else if (const auto *start = std::get_if<tok::start_capture>(&token)) {
						if (captures_) {
							auto off = boundary(pos, start->double_star);
							(*captures_)[start->group] = {off, off};
						}
					}
					else if (const auto *end = std::get_if<tok::end_capture>(&token)) {
						if (captures_) {
							auto &group = (*captures_)[end->group];
							auto off = boundary(pos, end->double_star);
							// `a/(**)/b` matching `a/b`: `**` took nothing, don't end before the start
							if (off < group.first)
								off = group.first;
							group.second = off;
						}
					}
					else {
						if (pos >= subject_.size())
							return match_result::entire_pattern_doesnt_match;

						char32_t c = next_char(pos);
						bool is_sep = is_separator(c);
						if (!matches_char(token, c, is_sep, follows_separator))
							return match_result::sub_pattern_doesnt_match;
						follows_separator = is_sep;
					}
				}

				return pos == subject_.size() ? match_result::match : match_result::sub_pattern_doesnt_match;
			}

		private:
			// `subject_` is validated UTF-8 before any matching starts.
			char32_t next_char(std::size_t &pos) const {
				char32_t c = 0;
				utf8::decode(subject_, pos, c);
				return c;
			}

			std::size_t boundary(std::size_t pos, bool double_star) const {
				if (double_star && pos > 0 && is_separator(static_cast<unsigned char>(subject_[pos - 1])))
					return pos - 1;
				return pos;
			}

			bool matches_char(const token &token, char32_t c, bool is_sep, bool follows_separator) const {
				if (const auto *lit = std::get_if<tok::literal>(&token))
					return chars_eq(c, lit->c, options_.case_sensitive);

				if ((options_.require_literal_separator && is_sep) ||
					(follows_separator && options_.require_literal_leading_dot && c == U'.'))
					return false;

				if (std::holds_alternative<tok::any_char>(token))
					return true;
				if (const auto *within = std::get_if<tok::any_within>(&token))
					return in_char_specifiers(within->specifiers, c, options_);
				if (const auto *except = std::get_if<tok::any_except>(&token))
					return !in_char_specifiers(except->specifiers, c, options_);
				return false;
			}

			const std::vector<token> &tokens_;
			std::string_view subject_;
			const match_options &options_;
			std::vector<entry::group_t> *captures_;
		};

	} // namespace


	bool pattern::matches(std::string_view str, const match_options &options) const {
		if (!utf8::is_valid(str))
			return false;
		return matcher(tokens_, str, options, nullptr).match_from(true, 0, 0) == match_result::match;
	}

	bool pattern::matches_path(const fs::path &path, const match_options &options) const {
		return matches(path.string(), options);
	}

	std::optional<entry> pattern::captures(std::string_view str, const match_options &options) const {
		if (!utf8::is_valid(str))
			return std::nullopt;

		std::vector<entry::group_t> groups(group_count_);
		if (matcher(tokens_, str, options, &groups).match_from(true, 0, 0) != match_result::match)
			return std::nullopt;
		return entry(fs::path(std::string(str)), std::move(groups));
	}

	std::optional<entry> pattern::captures_path(const fs::path &path, const match_options &options) const {
		auto captured = captures(path.string(), options);
		if (!captured)
			return std::nullopt;
		return entry(path, captured->groups());
	}

} // namespace capglob
