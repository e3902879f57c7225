#include <capglob/glob.h>
#include <capglob/version.h>

#include <clipp.h>
#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>


static int test_pattern_compiler(void)
{
	int rv = EXIT_SUCCESS;

	// pattern ">" byte offset of the syntax error, or "ok" when it compiles
	std::vector<std::string> teststrings{
		"a/**b" ">" "4",
		"a/bc**" ">" "3",
		"a/*****" ">" "4",
		"a/b**c**d" ">" "2",
		"a**b" ">" "0",
		"***" ">" "2",
		"abc[def" ">" "3",
		"abc[!def" ">" "3",
		"abc[" ">" "3",
		"abc[!" ">" "3",
		"abc[d" ">" "3",
		"abc[!d" ">" "3",
		"abc[]" ">" "3",
		"abc[!]" ">" "3",
		"a)b" ">" "1",
		"a(b(c)" ">" "1",
		"**/(**)/*.txt" ">" "ok",
		"(**)/(*).(jpg|png)" ">" "ok",
		"(**" ">" "0",
		"[]]" ">" "ok",
		"[!]]" ">" "ok",
		"[*?[]" ">" "ok",
		"a/(**)" ">" "ok",
	};
	for (const auto& s : teststrings) {
		size_t end = s.find(">");
		std::string src = s.substr(0, end);
		std::string expected = s.substr(end + 1);

		std::string actual = "ok";
		try {
			capglob::pattern p(src);
		}
		catch (const capglob::pattern_error& ex) {
			actual = std::to_string(ex.pos());
		}

		if (actual != expected) {
			std::cerr << "ERROR: compile(\"" << src << "\") --> " << actual << " instead of expected: " << expected << "\n";
			rv = EXIT_FAILURE;
		}
	}

	// escaped text must compile to a pattern that matches the text itself
	for (const char* s : { "one*two?", "[!]", "a[b]c", "(*)", "ünïcödé?" }) {
		auto escaped = capglob::pattern::escape(s);
		if (!capglob::pattern(escaped).matches(s)) {
			std::cerr << "ERROR: escape(\"" << s << "\") --> \"" << escaped << "\" doesn't match its source\n";
			rv = EXIT_FAILURE;
		}
	}

	// group boundaries around `**` step back over the separator it absorbed
	auto e = capglob::pattern("some/(**)/file.txt").captures("some/one/two/file.txt");
	if (!e || e->group(1) != "one/two") {
		std::cerr << "ERROR: captures(\"some/(**)/file.txt\") didn't yield group \"one/two\"\n";
		rv = EXIT_FAILURE;
	}

	return rv;
}


int main(int argc, const char** argv)
{
	using namespace clipp;

	bool ignore_case = false;
	bool literal_separator = false;
	bool literal_leading_dot = false;
	bool show_groups = false;
	std::string substitute_template;
	std::vector<std::string> patterns;
	enum class mode { none, help, version, glob, test };
	mode selected = mode::none;

	auto options = (
		repeatable(option("-i", "--input").set(selected, mode::glob) & values("patterns", patterns)) % "Patterns to match",
		option("-c", "--ignore-case").set(ignore_case) % "Match ASCII letters case-insensitively",
		option("--literal-separator").set(literal_separator) % "Wildcards and character classes never match a path separator",
		option("--literal-leading-dot").set(literal_leading_dot) % "Wildcards and character classes never match a leading '.'",
		option("-g", "--groups").set(show_groups) % "Print the captured groups, tab-separated, after each path",
		(option("-s", "--substitute") & value("template", substitute_template)) % "Render each match's groups into the template pattern"
	);
	auto cli = (
		(options
		| command("-h", "--help").set(selected, mode::help) % "Show this screen."
		| command("-t", "--test").set(selected, mode::test) % "Run the pattern compiler self test."
		| command("-v", "--version").set(selected, mode::version) % "Show version."
		),
		any_other(patterns).set(selected, mode::glob)
	);

	auto help = [cli]()
	{
		std::cerr << make_man_page(cli, "capglob")
			.prepend_section("DESCRIPTION", "    Find all the pathnames matching a glob pattern and extract the parts captured by its (...) groups")
			.append_section("LICENSE", "    MIT");
	};

	parse(argc, argv, cli);
	switch (selected)
	{
	default:
	case mode::none:
	case mode::help:
		help();
		return EXIT_SUCCESS;

	case mode::test:
		return test_pattern_compiler();

	case mode::version:
		std::cout << "capglob, version " << CAPGLOB_VERSION << std::endl;
		return EXIT_SUCCESS;

	case mode::glob:
		break;
	}

	if (patterns.empty())
	{
		help();
		return EXIT_SUCCESS;
	}

	capglob::match_options match_options{
		.case_sensitive = !ignore_case,
		.require_literal_separator = literal_separator,
		.require_literal_leading_dot = literal_leading_dot,
	};

	int rv = EXIT_SUCCESS;

	try
	{
		std::optional<capglob::pattern> target;
		if (!substitute_template.empty())
			target.emplace(substitute_template);

		for (const auto& pathname : patterns)
		{
			for (const auto& result : capglob::glob_with(pathname, match_options))
			{
				if (!result)
				{
					const auto& err = result.error();
					std::cerr << "capglob/filesystem error " << err.code().value() << ": " << err.code().message() << " (path: '" << err.path().string() << "')" << std::endl;
					rv = EXIT_FAILURE;
					continue;
				}

				const auto& match = result.value();
				std::cout << match;

				if (show_groups)
				{
					for (size_t n = 1; n <= match.group_count(); n++)
					{
						std::cout << "\t" << match.group(n).value_or("");
					}
				}

				if (target)
				{
					std::vector<std::string> groups;
					for (size_t n = 1; n <= match.group_count(); n++)
					{
						groups.push_back(*match.group(n));
					}
					std::cout << " -> " << target->substitute(groups);
				}

				std::cout << "\n";
			}
		}
	}
	catch (capglob::pattern_error& ex)
	{
		std::cerr << "capglob: " << ex.what() << std::endl;
		return EXIT_FAILURE;
	}
	catch (capglob::substitution_error& ex)
	{
		std::cerr << "capglob: " << ex.what() << std::endl;
		return EXIT_FAILURE;
	}
	catch (capglob::fs::filesystem_error& ex)
	{
		std::cerr << "capglob/filesystem error " << ex.code().value() << ": " << ex.code().message() << " :: " << ex.what() << " (path: '" << ex.path1().string() << "')" << std::endl;
		return EXIT_FAILURE;
	}

	return rv;
}
