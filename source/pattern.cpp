#include <capglob/pattern.h>

#include "utf8.h"

#include <string>
#include <utility>

namespace capglob {

	namespace {

		static constexpr const char *ERROR_WILDCARDS = "wildcards are either regular `*` or recursive `**`";
		static constexpr const char *ERROR_RECURSIVE_WILDCARDS = "recursive wildcards must form a single path component";
		static constexpr const char *ERROR_INVALID_RANGE = "invalid range pattern";
		static constexpr const char *ERROR_UNMATCHED_CLOSE = "Unmatched closing paren";
		static constexpr const char *ERROR_UNMATCHED_OPEN = "Unmatched opening paren";
		static constexpr const char *ERROR_INVALID_UTF8 = "invalid UTF-8 sequence";

		struct decoded_char {
			char32_t c;
			std::size_t offset;		// byte offset of `c` in the source pattern
		};

		std::vector<decoded_char> decode_pattern(std::string_view source) {
			std::vector<decoded_char> chars;
			chars.reserve(source.size());
			std::size_t pos = 0;
			while (pos < source.size()) {
				std::size_t start = pos;
				char32_t c;
				if (!utf8::decode(source, pos, c)) {
					throw pattern_error(start, ERROR_INVALID_UTF8);
				}
				chars.push_back({c, start});
			}
			return chars;
		}

		// True when everything before `end`, ignoring parens, is empty or ends in a separator.
		bool ends_with_sep(const std::vector<decoded_char> &chars, std::size_t end) {
			while (end > 0) {
				char32_t c = chars[--end].c;
				if (c == U'(' || c == U')')
					continue;
				return is_separator(c);
			}
			return true;
		}

		std::vector<char_specifier> parse_char_specifiers(const std::vector<decoded_char> &chars, std::size_t from, std::size_t to) {
			std::vector<char_specifier> cs;
			std::size_t i = from;
			while (i < to) {
				if (i + 3 <= to && chars[i + 1].c == U'-') {
					cs.push_back(cls::range{chars[i].c, chars[i + 2].c});
					i += 3;
				}
				else {
					cs.push_back(cls::single{chars[i].c});
					i += 1;
				}
			}
			return cs;
		}

		// Index of the first ']' at or after `from`, or `n` when there is none.
		std::size_t find_closing_bracket(const std::vector<decoded_char> &chars, std::size_t from) {
			std::size_t n = chars.size();
			for (std::size_t j = from; j < n; j++) {
				if (chars[j].c == U']')
					return j;
			}
			return n;
		}

	} // namespace


	pattern_error::pattern_error(std::size_t pos, const char *msg)
		: std::invalid_argument("Pattern syntax error near position " + std::to_string(pos) + ": " + msg),
		pos_(pos),
		msg_(msg) {
	}

	substitution_error::substitution_error(kind_t kind, std::size_t group)
		: std::runtime_error(kind == kind_t::missing_group
			? "substitution error: missing group " + std::to_string(group)
			: std::string("unexpected wildcard")),
		kind_(kind),
		group_(group) {
	}


	pattern::pattern(std::string_view source)
		: pattern(compile(source, false)) {
	}

	pattern pattern::compile(std::string_view source, bool skip_groups) {
		const auto chars = decode_pattern(source);
		const std::size_t n = chars.size();

		// error positions are reported as byte offsets into `source`
		auto offset_of = [&chars, &source](std::size_t i) -> std::size_t {
			return i < chars.size() ? chars[i].offset : source.size();
		};

		pattern result;
		result.original_ = std::string(source);
		auto &tokens = result.tokens_;

		std::size_t last_capture = 0;
		std::vector<std::pair<std::size_t, std::size_t>> captures_stack;   // (group, char index of its '(')

		auto open_group = [&](std::size_t i, bool double_star) {
			captures_stack.emplace_back(last_capture, i);
			tokens.push_back(tok::start_capture{last_capture, double_star});
			last_capture++;
		};
		auto close_group = [&](std::size_t i, bool double_star) {
			if (captures_stack.empty()) {
				throw pattern_error(offset_of(i), ERROR_UNMATCHED_CLOSE);
			}
			tokens.push_back(tok::end_capture{captures_stack.back().first, double_star});
			captures_stack.pop_back();
		};

		std::size_t i = 0;
		while (i < n) {
			char32_t c = chars[i].c;
			if (c == U'?') {
				tokens.push_back(tok::any_char{});
				i += 1;
			}
			else if (c == U'*') {
				std::size_t old = i;
				while (i < n && chars[i].c == U'*') {
					i += 1;
				}
				std::size_t count = i - old;

				if (count > 2) {
					throw pattern_error(offset_of(old + 2), ERROR_WILDCARDS);
				}
				else if (count == 2) {
					// `**` can only be an entire path component: `a/**/b` is valid, `a**/b` and `a/**b` are not.
					if (!ends_with_sep(chars, old)) {
						throw pattern_error(old > 0 ? offset_of(old - 1) : 0, ERROR_RECURSIVE_WILDCARDS);
					}

					// collapse consecutive `**` into a single token
					if (tokens.empty() || !std::holds_alternative<tok::any_recursive_sequence>(tokens.back())) {
						result.is_recursive_ = true;
						tokens.push_back(tok::any_recursive_sequence{});
					}

					while (i < n && (chars[i].c == U'(' || chars[i].c == U')')) {
						if (!skip_groups) {
							if (chars[i].c == U'(')
								open_group(i, true);
							else
								close_group(i, true);
						}
						i += 1;
					}

					if (i < n && is_separator(chars[i].c)) {
						// the separator belongs to the `**` component
						i += 1;
					}
					else if (i < n) {
						throw pattern_error(offset_of(i), ERROR_RECURSIVE_WILDCARDS);
					}
				}
				else {
					tokens.push_back(tok::any_sequence{});
				}
			}
			else if (c == U'[') {
				if (i + 4 <= n && chars[i + 1].c == U'!') {
					std::size_t j = find_closing_bracket(chars, i + 3);
					if (j < n) {
						tokens.push_back(tok::any_except{parse_char_specifiers(chars, i + 2, j)});
						i = j + 1;
						continue;
					}
				}
				else if (i + 3 <= n && chars[i + 1].c != U'!') {
					std::size_t j = find_closing_bracket(chars, i + 2);
					if (j < n) {
						tokens.push_back(tok::any_within{parse_char_specifiers(chars, i + 1, j)});
						i = j + 1;
						continue;
					}
				}

				// not a valid range pattern
				throw pattern_error(offset_of(i), ERROR_INVALID_RANGE);
			}
			else if (c == U'(') {
				if (!skip_groups)
					open_group(i, false);
				i += 1;
			}
			else if (c == U')') {
				if (!skip_groups)
					close_group(i, false);
				i += 1;
			}
			else {
				tokens.push_back(tok::literal{c});
				i += 1;
			}
		}

		if (!captures_stack.empty()) {
			throw pattern_error(offset_of(captures_stack.front().second), ERROR_UNMATCHED_OPEN);
		}

		result.group_count_ = last_capture;
		return result;
	}

	std::string pattern::escape(std::string_view s) {
		std::string escaped;
		escaped.reserve(s.size());
		for (char c : s) {
			// '!' is only special inside brackets; UTF-8 continuation bytes never collide with these
			switch (c) {
			case '(':
			case ')':
			case '?':
			case '*':
			case '[':
			case ']':
				escaped += '[';
				escaped += c;
				escaped += ']';
				break;
			default:
				escaped += c;
				break;
			}
		}
		return escaped;
	}

	bool pattern::operator==(const pattern &other) const {
		return original_ == other.original_ &&
			tokens_ == other.tokens_ &&
			is_recursive_ == other.is_recursive_;
	}

	std::strong_ordering pattern::operator<=>(const pattern &other) const {
		if (auto cmp = original_ <=> other.original_; cmp != 0)
			return cmp;
		if (auto cmp = tokens_ <=> other.tokens_; cmp != 0)
			return cmp;
		return is_recursive_ <=> other.is_recursive_;
	}

	std::ostream &operator<<(std::ostream &os, const pattern &p) {
		return os << p.str();
	}

} // namespace capglob
