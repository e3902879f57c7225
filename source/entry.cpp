#include <capglob/entry.h>

namespace capglob {

	entry::entry(fs::path path)
		: path_(std::move(path)) {
	}

	entry::entry(fs::path path, std::vector<group_t> groups)
		: path_(std::move(path)),
		groups_(std::move(groups)) {
	}

	std::optional<std::string> entry::group(std::size_t n) const {
		if (n == 0)
			return path_.string();
		if (n > groups_.size())
			return std::nullopt;

		// offsets always sit on code point boundaries: the matcher only records them between tokens.
		const auto &[start, end] = groups_[n - 1];
		return path_.string().substr(start, end - start);
	}

	std::ostream &operator<<(std::ostream &os, const entry &e) {
		return os << e.path().string();
	}

} // namespace capglob
