// =================================================================
// include/OpenBerl/Core.hpp
// =================================================================
// Defines the command dispatcher behind the openberl executable.

#pragma once

#include "OpenBerl/CliParser.hpp"
#include <memory>
#include <string>

namespace OpenBerl {

class PipelineConfigLoader;
struct PipelineDefinition;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    ~Core();

    /**
     * @brief Runs the subcommand selected on the command line.
     * @return 0 on success, 1 on configuration or routing errors,
     *         2 when a pipeline ran but some step returned an error response.
     */
    int run();

private:
    int handleRun();
    int handleValidate();
    int handleAdapters();

    /**
     * @brief Parse the configuration file and apply its logging section plus CLI overrides
     */
    PipelineDefinition loadDefinition();

    /**
     * @brief Print adapter load results; returns the number of failed adapters
     */
    size_t reportLoadResults() const;

    std::string readPayload() const;

    const Commands& m_commands;
    std::unique_ptr<PipelineConfigLoader> m_loader;
};

} // namespace OpenBerl
