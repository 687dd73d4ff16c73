#include "Quorum/CliParser.hpp"
#include "Quorum/Core.hpp"
#include "Quorum/Errors.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser owns every CLI11 definition; parse errors and --help exit here.
    Quorum::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Quorum::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const Quorum::QuorumError& e) {
        std::cerr << "Error (" << e.getName() << "): " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
