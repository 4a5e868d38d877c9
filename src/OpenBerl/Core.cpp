// =================================================================
// src/OpenBerl/Core.cpp
// =================================================================
// Implementation of the openberl subcommands.

#include "OpenBerl/Core.hpp"
#include "OpenBerl/PipelineConfig.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>

namespace OpenBerl {

namespace {

const std::string COLOR_RED = "\033[31m";
const std::string COLOR_GREEN = "\033[32m";
const std::string COLOR_RESET = "\033[0m";

std::string preview(const std::string& text, size_t length) {
    if (text.length() <= length) {
        return text;
    }
    return text.substr(0, length) + "...";
}

std::string modelInfoValue(const UmfResponse& response, const std::string& key) {
    auto it = response.model_info.find(key);
    return it == response.model_info.end() ? "-" : it->second;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands), m_loader(std::make_unique<PipelineConfigLoader>()) {}

Core::~Core() = default;

int Core::run() {
    try {
        if (m_commands.active_command == "run") {
            return handleRun();
        } else if (m_commands.active_command == "validate") {
            return handleValidate();
        } else if (m_commands.active_command == "adapters") {
            return handleAdapters();
        } else if (m_commands.active_command.empty()) {
            return 0;
        }
    } catch (const ConfigurationError& e) {
        std::cerr << COLOR_RED << "Configuration error: " << COLOR_RESET << e.what() << std::endl;
        return 1;
    } catch (const RoutingError& e) {
        std::cerr << COLOR_RED << "Routing error: " << COLOR_RESET << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

PipelineDefinition Core::loadDefinition() {
    PipelineDefinition definition = m_loader->parseConfigFile(m_commands.config_path);

    if (!m_commands.log_dir.empty()) {
        definition.logging.log_dir = m_commands.log_dir;
    }
    if (m_commands.verbose) {
        definition.logging.console_level = "debug";
    }

    try {
        PipelineConfigLoader::applyLoggingSettings(definition.logging);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
    return definition;
}

size_t Core::reportLoadResults() const {
    size_t failed = 0;
    for (const auto& result : m_loader->getLoadResults()) {
        if (result.success) {
            std::cout << COLOR_GREEN << "  [ok]   " << COLOR_RESET
                      << result.adapter_name << " (" << result.type << ")" << std::endl;
        } else {
            std::cout << COLOR_RED << "  [fail] " << COLOR_RESET
                      << result.adapter_name << " (" << result.type << "): "
                      << result.error_message << std::endl;
            failed++;
        }
    }
    return failed;
}

std::string Core::readPayload() const {
    if (m_commands.payload_file.empty()) {
        return m_commands.payload;
    }

    std::ifstream file(m_commands.payload_file);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot read payload file: " + m_commands.payload_file);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int Core::handleRun() {
    PipelineDefinition definition = loadDefinition();
    auto pipeline = m_loader->build(definition);

    for (const auto& result : m_loader->getLoadResults()) {
        if (!result.success) {
            std::cerr << "[WARN] Adapter " << result.adapter_name << " not loaded: "
                      << result.error_message << std::endl;
        }
    }

    ExecutionMode mode = m_commands.mode.empty()
        ? definition.execution_mode
        : stringToExecutionMode(m_commands.mode);

    std::cout << "Running pipeline " << pipeline->getName()
              << " (" << executionModeToString(mode) << ")..." << std::endl << std::endl;

    PipelineResult result = pipeline->execute(readPayload(), mode);

    for (const auto& [step_name, response] : result) {
        std::cout << (response.isError() ? COLOR_RED + "[error] " : COLOR_GREEN + "[done]  ")
                  << COLOR_RESET << step_name << std::endl;
        std::cout << "  Model:  " << modelInfoValue(response, "model") << std::endl;
        std::cout << "  Cost:   $" << std::fixed << std::setprecision(6)
                  << response.cost_info.estimated_cost << std::endl;
        if (response.metadata.contains("tokens_used")) {
            std::cout << "  Tokens: " << response.metadata["tokens_used"].dump() << std::endl;
        }
        std::cout << "  Time:   " << response.execution_time.count() << "ms" << std::endl;
        std::cout << "  Result: " << preview(payloadToString(response.result), m_commands.preview_length)
                  << std::endl << std::endl;
    }

    CostAnalysis analysis = pipeline->getCostAnalysis();
    std::cout << "--- Cost Analysis ---" << std::endl;
    std::cout << "Total cost: $" << std::fixed << std::setprecision(6) << analysis.total_cost << std::endl;
    for (const auto& [step_name, cost] : analysis.cost_by_step) {
        std::cout << "  " << step_name << ": $" << cost << std::endl;
    }
    for (const auto& suggestion : analysis.suggestions) {
        std::cout << "Suggestion: " << suggestion << std::endl;
    }

    Logger::getInstance().flush();
    return result.hasErrors() ? 2 : 0;
}

int Core::handleValidate() {
    PipelineDefinition definition = loadDefinition();
    auto pipeline = m_loader->build(definition);

    std::cout << "Pipeline: " << pipeline->getName()
              << " (" << executionModeToString(definition.execution_mode) << ")" << std::endl;
    std::cout << "Adapters:" << std::endl;
    size_t failed = reportLoadResults();

    pipeline->validate();

    bool routable = true;
    std::cout << "Steps:" << std::endl;
    for (const auto& step : pipeline->getSteps()) {
        auto adapters = pipeline->getRegistry().getAdapters(stringToTaskType(step.task_type));
        std::cout << "  " << step.name << " -> " << step.task_type;
        if (adapters.empty()) {
            std::cout << COLOR_RED << " (no adapter)" << COLOR_RESET;
            routable = false;
        } else {
            std::cout << " (" << adapters.size() << " adapter" << (adapters.size() == 1 ? "" : "s") << ")";
        }
        std::cout << std::endl;
    }

    if (failed > 0 || !routable) {
        std::cout << COLOR_RED << "Configuration has problems." << COLOR_RESET << std::endl;
        return 1;
    }

    std::cout << COLOR_GREEN << "Configuration is valid." << COLOR_RESET << std::endl;
    return 0;
}

int Core::handleAdapters() {
    PipelineDefinition definition = loadDefinition();
    auto pipeline = m_loader->build(definition);
    reportLoadResults();

    const AdapterRegistry& registry = pipeline->getRegistry();
    std::cout << std::endl << "Routing (" << registry.getAdapterCount() << " adapters):" << std::endl;

    for (TaskType task_type : registry.getRegisteredTaskTypes()) {
        std::cout << "  " << taskTypeToString(task_type) << ":" << std::endl;
        for (const auto& adapter : registry.getAdapters(task_type)) {
            bool healthy = adapter->healthCheck();
            std::cout << "    - " << std::left << std::setw(24) << adapter->getAdapterName()
                      << (healthy ? COLOR_GREEN + "healthy  " : COLOR_RED + "unhealthy")
                      << COLOR_RESET << "  requests: " << adapter->getRequestCount() << std::endl;
        }
    }

    return 0;
}

} // namespace OpenBerl
