#include "minitest.hpp"

// deepgrep_tests [name-filter]
int main(int argc, const char** argv) {
	return mini::run_all(argc > 1 ? argv[1] : "");
}
