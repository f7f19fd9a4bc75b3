#include <iostream>
#include <string>
#include "lz4jb_cli.h"


int main(int argc, char* argv[]) {
	const auto outputFunction = [](const std::string& message) {
		std::cerr << message;
	};

	Lz4Jb::Cli::Output output(outputFunction);
	return Lz4Jb::Cli::commandLineDriver(output, std::cout, argc, argv);
}
