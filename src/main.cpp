#include "Tandem/CliParser.hpp"
#include "Tandem/Core.hpp"
#include "Tandem/Logger.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Tandem::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    }

    try {
        Tandem::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        TANDEM_LOG_CRITICAL("Main", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
