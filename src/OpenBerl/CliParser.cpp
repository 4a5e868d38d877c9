// =================================================================
// src/OpenBerl/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "OpenBerl/CliParser.hpp"

namespace OpenBerl {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("OpenBerl: run AI adapter pipelines defined in YAML.");
    m_app->require_subcommand(1);
    // Shared options are also accepted after the subcommand name
    m_app->fallthrough();

    m_app->add_option("--log-dir", m_commands.log_dir, "Write rotating log files to this directory.");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug output on the console.");

    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupRunCommand(*m_app);
    setupValidateCommand(*m_app);
    setupAdaptersCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupRunCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("run", "Executes a pipeline on a payload and prints results and costs.");
    sub->add_option("config", m_commands.config_path, "Pipeline configuration file.")
        ->required()->check(CLI::ExistingFile);

    auto* payload = sub->add_option("-p,--payload", m_commands.payload, "Initial payload text.");
    auto* payload_file = sub->add_option("--payload-file", m_commands.payload_file, "Read the initial payload from a file.")
        ->check(CLI::ExistingFile);
    payload->excludes(payload_file);

    sub->add_option("-m,--mode", m_commands.mode, "Execution mode, overriding the configuration.")
        ->check(CLI::IsMember({"sequential", "parallel"}));
    sub->add_option("--preview", m_commands.preview_length, "Characters of each result to print (default: 200).");
}

void CliParser::setupValidateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("validate", "Loads a pipeline configuration and checks it without calling any backend.");
    sub->add_option("config", m_commands.config_path, "Pipeline configuration file.")
        ->required()->check(CLI::ExistingFile);
}

void CliParser::setupAdaptersCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("adapters", "Lists task type routing with adapter health and request counts.");
    sub->add_option("config", m_commands.config_path, "Pipeline configuration file.")
        ->required()->check(CLI::ExistingFile);
}

} // namespace OpenBerl
