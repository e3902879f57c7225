#pragma once

#include <cstddef>
#include <string_view>

namespace capglob {

	namespace utf8 {

		/// Decodes the code point starting at byte offset `pos` and advances `pos` past it.
		/// \return false (and leaves `pos` untouched) on a malformed or truncated sequence.
		inline bool decode(std::string_view s, std::size_t &pos, char32_t &out) noexcept {
			if (pos >= s.size())
				return false;

			auto lead = static_cast<unsigned char>(s[pos]);
			std::size_t len;
			char32_t cp;

			if (lead < 0x80) {
				out = lead;
				pos += 1;
				return true;
			}
			else if ((lead & 0xE0) == 0xC0) {
				len = 2;
				cp = lead & 0x1F;
			}
			else if ((lead & 0xF0) == 0xE0) {
				len = 3;
				cp = lead & 0x0F;
			}
			else if ((lead & 0xF8) == 0xF0) {
				len = 4;
				cp = lead & 0x07;
			}
			else {
				return false;
			}

			if (pos + len > s.size())
				return false;

			for (std::size_t k = 1; k < len; k++) {
				auto cont = static_cast<unsigned char>(s[pos + k]);
				if ((cont & 0xC0) != 0x80)
					return false;
				cp = (cp << 6) | (cont & 0x3F);
			}

			// overlong forms, surrogates and out of range values
			static constexpr char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
			if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
				return false;

			out = cp;
			pos += len;
			return true;
		}

		inline bool is_valid(std::string_view s) noexcept {
			std::size_t pos = 0;
			char32_t c;
			while (pos < s.size()) {
				if (!decode(s, pos, c))
					return false;
			}
			return true;
		}

		/// Appends the UTF-8 encoding of `cp` to `out`.
		template <typename String>
		void append(String &out, char32_t cp) {
			if (cp < 0x80) {
				out += static_cast<char>(cp);
			}
			else if (cp < 0x800) {
				out += static_cast<char>(0xC0 | (cp >> 6));
				out += static_cast<char>(0x80 | (cp & 0x3F));
			}
			else if (cp < 0x10000) {
				out += static_cast<char>(0xE0 | (cp >> 12));
				out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
				out += static_cast<char>(0x80 | (cp & 0x3F));
			}
			else {
				out += static_cast<char>(0xF0 | (cp >> 18));
				out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
				out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
				out += static_cast<char>(0x80 | (cp & 0x3F));
			}
		}

	} // namespace utf8

} // namespace capglob
