#include "./common.hpp"

int main(int argc, const char** argv) {
	using std::string;

	using namespace deepgrep::regex;

	while(true) {
		string pattern;
		string replacement;
		string target;

		if(!read_line("input a pattern:", pattern)) break;
		if(!read_line("input a replacement string (\\1 .. \\9 refer to groups):", replacement)) break;
		if(!read_line("input a target string:", target)) break;

		fmt::print("pattern: \"{}\" -> replacement: \"{}\"\n", pattern, replacement);
		fmt::print("target: {}\n", target);

		auto [errc, count] = replace<char>(pattern, target, replacement);
		if(is_syntax_error(errc)) {
			fmt::print("error: {}\n", errc);
			continue;
		}
		print_status(errc);
		fmt::print("after replacing {} match(es): \n{}\n", count, target);
	}
	return 0;
}
