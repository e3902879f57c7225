#include <capglob/pattern.h>

#include "utf8.h"

#include <stdexcept>

namespace capglob {

	std::string pattern::substitute(const std::vector<std::string> &groups) const {
		std::string result;
		result.reserve(original_.size());

		for (std::size_t ti = 0; ti < tokens_.size(); ti++) {
			const auto &token = tokens_[ti];

			if (const auto *lit = std::get_if<tok::literal>(&token)) {
				utf8::append(result, lit->c);
			}
			else if (const auto *start = std::get_if<tok::start_capture>(&token)) {
				if (start->group >= groups.size()) {
					throw substitution_error(substitution_error::kind_t::missing_group, start->group + 1);
				}
				result += groups[start->group];

				// skip the group's own tokens, nested groups included
				for (ti++; ti < tokens_.size(); ti++) {
					const auto *end = std::get_if<tok::end_capture>(&tokens_[ti]);
					if (end && end->group == start->group)
						break;
				}
			}
			else if (std::holds_alternative<tok::end_capture>(token)) {
				// every group end is consumed together with its start
				throw std::logic_error("unbalanced capture group in pattern `" + original_ + "`");
			}
			else {
				throw substitution_error(substitution_error::kind_t::unexpected_wildcard);
			}
		}

		return result;
	}

} // namespace capglob
