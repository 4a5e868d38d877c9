// =================================================================
// include/OpenBerl/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace OpenBerl {

// Parsed command-line state shared by all subcommands.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    std::string config_path;    // Pipeline YAML file

    // Options for 'run'
    std::string payload;
    std::string payload_file;
    std::string mode;           // Empty means the mode from the config file
    size_t preview_length = 200;

    // Shared options
    std::string log_dir;
    bool verbose = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    const Commands& getCommands() const;

private:
    void setupRunCommand(CLI::App& app);
    void setupValidateCommand(CLI::App& app);
    void setupAdaptersCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace OpenBerl
