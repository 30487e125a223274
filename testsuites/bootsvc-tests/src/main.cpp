#include <fnmatch.h>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "testsuite.hpp"

std::vector<abstract_test_case *> &test_case_ptrs() {
	static std::vector<abstract_test_case *> singleton;
	return singleton;
}

void abstract_test_case::register_case(abstract_test_case *tcp) {
	test_case_ptrs().push_back(tcp);
}

int main(int argc, char **argv) {
	CLI::App app{"Boot services testsuite for bootsvc"};

	std::vector<std::string> globs;
	app.add_option("globs", globs, "tests to run");

	bool list = false;
	app.add_flag("-l,--list", list, "list tests instead of running them");

	CLI11_PARSE(app, argc, argv);

	if (list) {
		for(abstract_test_case *tcp : test_case_ptrs())
			std::cout << tcp->name() << std::endl;
		return EXIT_SUCCESS;
	}

	if (globs.empty()) {
		for(abstract_test_case *tcp : test_case_ptrs()) {
			std::cout << "bootsvc-tests: Running " << tcp->name() << std::endl;
			tcp->run();
		}
	} else {
		for(abstract_test_case *tcp : test_case_ptrs()) {
			for (const auto &glob : globs) {
				if (fnmatch(glob.c_str(), tcp->name(), 0) == 0) {
					std::cout << "bootsvc-tests: Running " << tcp->name() << std::endl;
					tcp->run();
				}
			}
		}
	}

	return EXIT_SUCCESS;
}
