#include <capglob/glob.h>

#include "utf8.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace capglob {

	namespace {

		/// The text of a pattern without metacharacters; nothing when it has any.
		std::optional<std::string> pattern_as_str(const pattern &pat) {
			std::string s;
			for (const auto &token : pat.tokens()) {
				const auto *lit = std::get_if<tok::literal>(&token);
				if (!lit)
					return std::nullopt;
				utf8::append(s, lit->c);
			}
			return s;
		}

		bool starts_with_literal_dot(const pattern &pat) {
			if (pat.tokens().empty())
				return false;
			const auto *lit = std::get_if<tok::literal>(&pat.tokens().front());
			return lit && lit->c == U'.';
		}

		bool is_separator_byte(char c) noexcept {
			return is_separator(static_cast<unsigned char>(c));
		}

		// Like splitting on separators but without the empty pieces that repeated or trailing separators leave.
		std::vector<std::string_view> split_components(std::string_view s) {
			std::vector<std::string_view> parts;
			std::size_t start = 0;
			for (std::size_t i = 0; i <= s.size(); i++) {
				if (i == s.size() || is_separator_byte(s[i])) {
					if (i > start)
						parts.push_back(s.substr(start, i - start));
					start = i + 1;
				}
			}
			return parts;
		}

		std::string collapse_separators(std::string_view s) {
			std::string result;
			result.reserve(s.size());
			for (std::size_t i = 0; i < s.size(); i++) {
				if (i > 0 && is_separator_byte(s[i]) && is_separator_byte(s[i - 1]))
					continue;
				result += s[i];
			}
			return result;
		}

#ifdef _WIN32
		bool is_verbatim(const fs::path &root) {
			auto name = root.root_name().string();
			return name.rfind(R"(\\?\)", 0) == 0;
		}
#endif

	} // namespace


	bool directory_access::is_directory(const fs::path &path) {
		std::error_code ec;
		return fs::is_directory(path, ec);
	}

	bool directory_access::exists(const fs::path &path) {
		std::error_code ec;
		return fs::exists(path, ec);
	}

	std::vector<fs::path> directory_access::read_directory(const fs::path &path, std::error_code &ec) {
		std::vector<fs::path> result;
		ec.clear();
		for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
			result.push_back(it->path());
		}
		if (ec)
			result.clear();
		return result;
	}


	glob_error::glob_error(const fs::path &path, std::error_code ec)
		: fs::filesystem_error("attempting to read `" + path.string() + "` resulted in an error", path, ec) {
	}


	const entry &glob_result::value() const {
		if (const auto *err = std::get_if<glob_error>(&content_))
			throw *err;
		return std::get<entry>(content_);
	}

	entry &glob_result::value() {
		if (const auto *err = std::get_if<glob_error>(&content_))
			throw *err;
		return std::get<entry>(content_);
	}


	entries::iterator::iterator(entries *owner)
		: owner_(owner) {
		++*this;
	}

	entries::iterator &entries::iterator::operator++() {
		current_ = owner_->next();
		if (!current_)
			owner_ = nullptr;
		return *this;
	}


	entries::entries(pattern whole_pattern, std::vector<pattern> dir_patterns, bool require_dir, match_options options,
		std::optional<fs::path> scope, std::shared_ptr<directory_access> access)
		: whole_pattern_(std::move(whole_pattern)),
		dir_patterns_(std::move(dir_patterns)),
		require_dir_(require_dir),
		options_(options),
		scope_(std::move(scope)),
		access_(access ? std::move(access) : std::make_shared<directory_access>()) {
	}

	std::optional<glob_result> entries::next() {
		// The todo stack is seeded here rather than in glob() so that failing to read the scope is
		// an iteration error; constructing the sequence only fails on an invalid pattern.
		if (scope_) {
			fs::path scope = std::move(*scope_);
			scope_.reset();
			if (!dir_patterns_.empty())
				fill_todo(0, scope);
		}

		const std::size_t last = dir_patterns_.size() - 1;

		while (!dir_patterns_.empty() && !todo_.empty()) {
			auto item = std::move(todo_.back());
			todo_.pop_back();

			if (auto *err = std::get_if<glob_error>(&item))
				return glob_result(std::move(*err));

			auto [path, idx] = std::get<todo_item>(std::move(item));

			// already checked by fill_todo(); `.` and `..` never show up as file names anyway
			if (idx == verified) {
				if (require_dir_ && !access_->is_directory(path))
					continue;
				return glob_result(make_entry(path));
			}

			// non-UTF-8 names can't be matched, not even by `*`
			auto name = path.filename().string();
			if (!utf8::is_valid(name))
				continue;

			if (dir_patterns_[idx].is_recursive()) {
				std::size_t next = idx;

				// collapse consecutive recursive patterns
				while (next + 1 < dir_patterns_.size() && dir_patterns_[next + 1].is_recursive()) {
					next++;
				}

				// `**` never crosses a hidden directory when leading dots must be literal
				bool hidden = options_.require_literal_leading_dot && !name.empty() && name[0] == '.';

				if (access_->is_directory(path) && !hidden) {
					fill_todo(next, path);

					if (next == last) {
						// pattern ends in `**`, so this directory is a match itself
						return glob_result(make_entry(path));
					}
					idx = next + 1;
				}
				else if (next != last) {
					idx = next + 1;
				}
				else {
					continue;
				}
			}

			if (!dir_patterns_[idx].matches(name, options_))
				continue;

			if (idx == last) {
				// a pattern can't match a directory *and* its children, so the children are left alone
				if (!require_dir_ || access_->is_directory(path)) {
					auto captured = whole_pattern_.captures_path(path, options_);
					if (!captured) {
						throw std::logic_error("path `" + path.string() + "` matches the components of `" + whole_pattern_.str() + "` but not the whole pattern");
					}
					return glob_result(std::move(*captured));
				}
			}
			else {
				fill_todo(idx + 1, path);
			}
		}

		return std::nullopt;
	}

	// Fills the todo stack with the paths under `path` to be matched by `dir_patterns_[idx]`.
	// `.` and `..` are special-cased, and a component without metacharacters is resolved with a
	// metadata check instead of a directory listing.
	void entries::fill_todo(std::size_t idx, const fs::path &path) {
		const auto &pat = dir_patterns_[idx];
		bool is_dir = access_->is_directory(path);
		bool curdir = path == fs::path(".");

		if (auto s = pattern_as_str(pat)) {
			bool special = *s == "." || *s == "..";
			fs::path next_path = curdir ? fs::path(*s) : path / *s;
			if ((special && is_dir) || (!special && access_->exists(next_path))) {
				add_todo(idx, std::move(next_path));
			}
			return;
		}

		if (!is_dir) {
			// not a directory, nothing more to find
			return;
		}

		std::error_code ec;
		auto children = access_->read_directory(path, ec);
		if (ec) {
			todo_.push_back(glob_error(path, ec));
			return;
		}

		if (curdir) {
			for (auto &child : children) {
				child = child.filename();
			}
		}

		// descending, so that popping the stack yields ascending names
		std::sort(children.begin(), children.end(), [](const fs::path &a, const fs::path &b) {
			return a.filename().native() > b.filename().native();
		});
		for (auto &child : children) {
			todo_.push_back(todo_item{std::move(child), idx});
		}

		// The special entries `.` and `..` are only matched by a pattern with a leading literal dot,
		// independently of `require_literal_leading_dot`.
		if (starts_with_literal_dot(pat)) {
			for (const char *special : {".", ".."}) {
				if (pat.matches(special, options_)) {
					add_todo(idx, curdir ? fs::path(special) : path / special);
				}
			}
		}
	}

	void entries::add_todo(std::size_t idx, fs::path next_path) {
		if (idx + 1 == dir_patterns_.size()) {
			// known to be good: don't make next() match this path against the pattern again
			todo_.push_back(todo_item{std::move(next_path), verified});
		}
		else {
			fill_todo(idx + 1, next_path);
		}
	}

	entry entries::make_entry(const fs::path &path) const {
		if (auto captured = whole_pattern_.captures_path(path, options_))
			return std::move(*captured);
		return entry(path);
	}


	entries glob(std::string_view pathname) {
		return glob_with(pathname, match_options{});
	}

	entries glob_with(std::string_view pathname, const match_options &options, std::shared_ptr<directory_access> access) {
		// compiled as written first, so that error positions refer to the caller's text
		pattern whole(pathname);

		// the whole pattern and its components are both derived from this one string so they always agree
		const std::string normalized = collapse_separators(pathname);

		// `*/` matches directories, but the path of a directory is `something`, without the slash
		bool require_dir = !normalized.empty() && is_separator_byte(normalized.back());

		const fs::path pattern_path{normalized};
		const std::size_t root_len = std::min(normalized.size(),
			pattern_path.root_name().string().size() + (pattern_path.has_root_directory() ? 1 : 0));
		std::optional<fs::path> root;
		if (root_len > 0)
			root = fs::path(normalized.substr(0, root_len));

		std::string_view txt = normalized;
		if (require_dir)
			txt.remove_suffix(1);

		// likewise `./*` matches at the current path, whose entries come without the `./`
		if (!root) {
			while (txt.size() >= 2 && txt[0] == '.' && is_separator_byte(txt[1]))
				txt.remove_prefix(2);
		}

		if (txt != pathname)
			whole = pattern(txt);

#ifdef _WIN32
		if (root && is_verbatim(*root)) {
			// no way to enumerate all UNC shares with a 1-letter server name: yield nothing
			return entries(std::move(whole), {}, false, options, std::nullopt, std::move(access));
		}
#endif

		std::vector<pattern> dir_patterns;
		for (auto component : split_components(txt.substr(std::min(root_len, txt.size())))) {
			dir_patterns.push_back(pattern::compile(component, true));
		}

		// a bare root still needs one terminal component for the traversal to end on
		if (dir_patterns.empty())
			dir_patterns.emplace_back();

		return entries(std::move(whole), std::move(dir_patterns), require_dir, options,
			root ? std::move(root) : std::optional<fs::path>(fs::path(".")), std::move(access));
	}

} // namespace capglob
