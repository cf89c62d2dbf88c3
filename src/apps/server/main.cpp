#include "data/memoryStore.hpp"
#include "wordsmith/config.hpp"
#include "wordsmith/gameServer.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
	const std::string program = argc > 0 ? argv[0] : "wordsmith_server";

	wordsmith::app::ServerConfig config;
	try {
		config = wordsmith::app::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
	} catch (const std::invalid_argument& e) {
		std::cerr << e.what() << "\n" << wordsmith::app::usage(program);
		return 1;
	}

	wordsmith::app::GameServer server(config, std::make_shared<wordsmith::MemoryStore>());
	server.start();

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
