#include "OpenBerl/CliParser.hpp"
#include "OpenBerl/Core.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <iostream>

namespace {

int dispatch(const OpenBerl::Commands& commands) {
    OpenBerl::Core core(commands);
    int exit_code = core.run();
    OpenBerl::Logger::getInstance().flush();
    return exit_code;
}

} // namespace

int main(int argc, char** argv) {
    // Quiet until the configuration's logging section is applied
    OpenBerl::Logger::getInstance().setConsoleLogLevel(OpenBerl::LogLevel::WARNING);

    OpenBerl::CliParser parser;
    auto app = parser.setupCli();
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    }

    try {
        return dispatch(parser.getCommands());
    } catch (const OpenBerl::ValidationError& e) {
        LOG_ERROR("main", std::string("Adapter rejected its settings: ") + e.what());
        std::cerr << "Invalid adapter settings: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        LOG_CRITICAL("main", std::string("Unhandled error: ") + e.what());
        std::cerr << "Error during execution: " << e.what() << std::endl;
    }

    OpenBerl::Logger::getInstance().flush();
    return 1;
}
