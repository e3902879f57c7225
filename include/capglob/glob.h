#pragma once

#include <capglob/entry.h>
#include <capglob/filesystem.h>
#include <capglob/pattern.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace capglob {

/// Filesystem queries used by the traversal.
///
/// Rather than provide a bunch of std::function-based callbacks, userland code overrides these
/// virtual member functions, e.g. to serve a virtual tree or to inject failures.
class directory_access {
public:
	virtual ~directory_access() = default;

	/// \return true when `path` is a directory (symlinks followed); non-existence is `false`, never an error
	virtual bool is_directory(const fs::path &path);

	/// \return true when the metadata of `path` (symlinks followed) can be read
	virtual bool exists(const fs::path &path);

	/// Lists the entries of the directory `path`, each as `path / name`.
	/// On failure `ec` is set and the returned list must be ignored.
	virtual std::vector<fs::path> read_directory(const fs::path &path, std::error_code &ec);
};

/// A directory matched (part of) the pattern but its contents could not be read.
class glob_error : public fs::filesystem_error {
public:
	glob_error(const fs::path &path, std::error_code ec);

	/// The directory that couldn't be read.
	const fs::path &path() const noexcept { return path1(); }
};

/// Either a matching entry or the error that kept part of the tree from being searched.
class glob_result {
public:
	glob_result(entry value) : content_(std::move(value)) {}
	glob_result(glob_error error) : content_(std::move(error)) {}

	bool ok() const noexcept { return std::holds_alternative<entry>(content_); }
	explicit operator bool() const noexcept { return ok(); }

	/// \throws glob_error when this result holds an error
	const entry &value() const;
	entry &value();

	/// Precondition: `!ok()`
	const glob_error &error() const { return std::get<glob_error>(content_); }

	const entry &operator*() const { return value(); }
	const entry *operator->() const { return &value(); }

private:
	std::variant<entry, glob_error> content_;
};

/// Lazily yields the paths matching a pattern, together with their capture groups, in
/// alphabetical order.
///
/// The filesystem is only touched from within `next()`, at most one directory listing per call;
/// stop pulling to cancel. Iterate again by calling `glob()` again.
class entries {
public:
	class iterator {
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = glob_result;
		using difference_type = std::ptrdiff_t;
		using pointer = const glob_result *;
		using reference = const glob_result &;

		iterator() = default;
		explicit iterator(entries *owner);

		reference operator*() const { return *current_; }
		pointer operator->() const { return &*current_; }
		iterator &operator++();
		void operator++(int) { ++*this; }

		bool operator==(const iterator &other) const noexcept { return owner_ == other.owner_; }

	private:
		entries *owner_ = nullptr;
		std::optional<glob_result> current_;
	};

	entries(pattern whole_pattern, std::vector<pattern> dir_patterns, bool require_dir, match_options options,
		std::optional<fs::path> scope, std::shared_ptr<directory_access> access);

	/// \return the next result, or nothing once the tree is exhausted
	std::optional<glob_result> next();

	iterator begin() { return iterator(this); }
	iterator end() { return iterator(); }

	const pattern &whole_pattern() const noexcept { return whole_pattern_; }
	const std::vector<pattern> &dir_patterns() const noexcept { return dir_patterns_; }
	bool require_dir() const noexcept { return require_dir_; }

private:
	// marks a todo path that was fully verified while filling the stack
	static constexpr std::size_t verified = static_cast<std::size_t>(-1);

	struct todo_item {
		fs::path path;
		std::size_t index;
	};

	void fill_todo(std::size_t idx, const fs::path &path);
	void add_todo(std::size_t idx, fs::path next_path);
	entry make_entry(const fs::path &path) const;

	pattern whole_pattern_;
	std::vector<pattern> dir_patterns_;
	bool require_dir_;
	match_options options_;
	std::vector<std::variant<todo_item, glob_error>> todo_;
	std::optional<fs::path> scope_;
	std::shared_ptr<directory_access> access_;
};

/// \param pathname string containing a path specification with optional capture groups
/// \return the lazy sequence of matching entries, using default `match_options`
/// \throws pattern_error
///
/// Patterns can be absolute (/media/(**/*).jpg) or relative to the current working directory
/// (../images/(*).png). A trailing separator only accepts directories.
entries glob(std::string_view pathname);

/// \param pathname string containing a path specification with optional capture groups
/// \param options passed unchanged to `pattern::matches()` for every path component
/// \param access filesystem to search; the real one when null
/// \throws pattern_error
entries glob_with(std::string_view pathname, const match_options &options, std::shared_ptr<directory_access> access = nullptr);

} // namespace capglob
