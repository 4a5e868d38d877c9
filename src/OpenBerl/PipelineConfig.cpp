// =================================================================
// src/OpenBerl/PipelineConfig.cpp
// =================================================================
// Implementation of YAML pipeline loading with yaml-cpp.

#include "OpenBerl/PipelineConfig.hpp"
#include "OpenBerl/OpenAiAdapter.hpp"
#include "OpenBerl/CodeOptimizerAdapter.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>

namespace OpenBerl {

namespace {

/**
 * @brief Convert a YAML node to JSON, typing plain scalars as bool, integer, float or string
 */
nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yamlToJson(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                object[it->first.as<std::string>()] = yamlToJson(it->second);
            }
            return object;
        }

        case YAML::NodeType::Scalar:
            break;
    }

    // Quoted scalars carry the "!" tag and stay strings
    if (node.Tag() == "!") {
        return node.as<std::string>();
    }

    bool bool_value;
    if (YAML::convert<bool>::decode(node, bool_value)) {
        return bool_value;
    }
    long long int_value;
    if (YAML::convert<long long>::decode(node, int_value)) {
        return int_value;
    }
    double double_value;
    if (YAML::convert<double>::decode(node, double_value)) {
        return double_value;
    }
    return node.as<std::string>();
}

AdapterDefinition parseAdapter(const std::string& name, const YAML::Node& adapter_node) {
    AdapterDefinition definition;
    definition.name = name;

    if (!adapter_node.IsMap()) {
        throw ConfigurationError("Adapter '" + name + "' must be a mapping");
    }

    if (adapter_node["type"]) {
        definition.type = adapter_node["type"].as<std::string>();
    }
    if (adapter_node["api_key"]) {
        definition.api_key = adapter_node["api_key"].as<std::string>();
    }
    if (adapter_node["api_key_env"]) {
        definition.api_key_env = adapter_node["api_key_env"].as<std::string>();
    }

    AdapterConfig& config = definition.config;
    if (adapter_node["base_url"]) {
        config.base_url = adapter_node["base_url"].as<std::string>();
    }
    if (adapter_node["model"]) {
        config.model = adapter_node["model"].as<std::string>();
    }
    if (adapter_node["fallback_model"]) {
        config.fallback_model = adapter_node["fallback_model"].as<std::string>();
    }
    if (adapter_node["enable_caching"]) {
        config.enable_caching = adapter_node["enable_caching"].as<bool>();
    }
    if (adapter_node["max_cache_size"]) {
        config.max_cache_size = adapter_node["max_cache_size"].as<size_t>();
    }
    if (adapter_node["rate_limit"]) {
        config.rate_limit = adapter_node["rate_limit"].as<size_t>();
    }

    if (adapter_node["capabilities"]) {
        for (const auto& capability : adapter_node["capabilities"]) {
            definition.capabilities.push_back(capability.as<std::string>());
        }
    }

    if (adapter_node["custom_attributes"]) {
        for (YAML::const_iterator it = adapter_node["custom_attributes"].begin();
             it != adapter_node["custom_attributes"].end(); ++it) {
            config.custom_attributes[it->first.as<std::string>()] = it->second.as<std::string>();
        }
    }

    return definition;
}

PipelineStep parseStep(size_t index, const YAML::Node& step_node) {
    if (!step_node.IsMap()) {
        throw ConfigurationError("Step " + std::to_string(index + 1) + " must be a mapping");
    }
    if (!step_node["name"]) {
        throw ConfigurationError("Step " + std::to_string(index + 1) + " is missing a name");
    }

    PipelineStep step;
    step.name = step_node["name"].as<std::string>();
    if (step_node["task_type"]) {
        step.task_type = step_node["task_type"].as<std::string>();
    }
    if (step_node["params"]) {
        step.params = yamlToJson(step_node["params"]);
        if (step.params.is_null()) {
            step.params = nlohmann::json::object();
        }
        if (!step.params.is_object()) {
            throw ConfigurationError("Params of step '" + step.name + "' must be a mapping");
        }
    }
    return step;
}

PipelineDefinition parseRoot(const YAML::Node& root) {
    PipelineDefinition definition;

    if (!root.IsMap()) {
        throw ConfigurationError("Configuration root must be a mapping");
    }

    if (root["pipeline"]) {
        YAML::Node pipeline = root["pipeline"];
        if (pipeline["name"]) {
            definition.name = pipeline["name"].as<std::string>();
        }
        if (pipeline["execution_mode"]) {
            definition.execution_mode = stringToExecutionMode(pipeline["execution_mode"].as<std::string>());
        }
        if (pipeline["max_parallel_workers"]) {
            definition.options.max_parallel_workers = pipeline["max_parallel_workers"].as<size_t>();
        }
        if (pipeline["check_health"]) {
            definition.options.check_health = pipeline["check_health"].as<bool>();
        }
    }

    if (root["logging"]) {
        YAML::Node logging = root["logging"];
        if (logging["console_level"]) {
            definition.logging.console_level = logging["console_level"].as<std::string>();
        }
        if (logging["file_level"]) {
            definition.logging.file_level = logging["file_level"].as<std::string>();
        }
        if (logging["log_dir"]) {
            definition.logging.log_dir = logging["log_dir"].as<std::string>();
        }
    }

    if (root["adapters"]) {
        YAML::Node adapters = root["adapters"];
        for (YAML::const_iterator it = adapters.begin(); it != adapters.end(); ++it) {
            definition.adapters.push_back(parseAdapter(it->first.as<std::string>(), it->second));
        }
    } else {
        Logger::getInstance().warning("PipelineConfig", "No 'adapters' section in configuration");
    }

    if (root["steps"]) {
        YAML::Node steps = root["steps"];
        if (!steps.IsSequence()) {
            throw ConfigurationError("'steps' must be a list");
        }
        for (size_t i = 0; i < steps.size(); ++i) {
            definition.steps.push_back(parseStep(i, steps[i]));
        }
    }

    return definition;
}

} // namespace

PipelineConfigLoader::PipelineConfigLoader() {
    registerBuiltinFactories();
}

PipelineDefinition PipelineConfigLoader::parseConfigFile(const std::string& config_path) const {
    try {
        YAML::Node root = YAML::LoadFile(config_path);
        PipelineDefinition definition = parseRoot(root);
        Logger::getInstance().info("PipelineConfig", "Loaded configuration " + config_path,
            "Adapters: " + std::to_string(definition.adapters.size()) +
            ", Steps: " + std::to_string(definition.steps.size()));
        return definition;
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse configuration file " + config_path + ": " + e.what());
    }
}

PipelineDefinition PipelineConfigLoader::parseConfigString(const std::string& yaml_text) const {
    try {
        return parseRoot(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse configuration: " + std::string(e.what()));
    }
}

void PipelineConfigLoader::registerAdapterFactory(const std::string& type, AdapterFactory factory) {
    m_factories[type] = std::move(factory);
    Logger::getInstance().debug("PipelineConfig", "Registered adapter factory: " + type);
}

bool PipelineConfigLoader::hasAdapterFactory(const std::string& type) const {
    return m_factories.find(type) != m_factories.end();
}

std::vector<std::string> PipelineConfigLoader::getRegisteredTypes() const {
    std::vector<std::string> types;
    for (const auto& [type, factory] : m_factories) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

bool PipelineConfigLoader::validateAdapterDefinition(const AdapterDefinition& definition, std::string& error) const {
    if (definition.name.empty()) {
        error = "Adapter definition missing name";
        return false;
    }
    if (definition.type.empty()) {
        error = "Adapter '" + definition.name + "' missing type";
        return false;
    }
    if (!hasAdapterFactory(definition.type)) {
        error = "No factory registered for type: " + definition.type;
        return false;
    }
    for (const auto& capability : definition.capabilities) {
        if (!isKnownTaskType(capability)) {
            error = "Invalid capability '" + capability + "' in adapter: " + definition.name;
            return false;
        }
    }
    return true;
}

std::unique_ptr<Pipeline> PipelineConfigLoader::build(const PipelineDefinition& definition) {
    auto pipeline = std::make_unique<Pipeline>(definition.name, definition.options);
    m_load_results.clear();

    for (const auto& adapter_definition : definition.adapters) {
        AdapterLoadResult result;
        result.adapter_name = adapter_definition.name;
        result.type = adapter_definition.type;
        auto start_time = std::chrono::steady_clock::now();

        if (!validateAdapterDefinition(adapter_definition, result.error_message)) {
            Logger::getInstance().error("PipelineConfig", result.error_message);
            m_load_results.push_back(result);
            continue;
        }

        try {
            auto adapter = m_factories.at(adapter_definition.type)(adapter_definition);
            if (adapter) {
                pipeline->registerAdapter(adapter);
                result.success = true;
            } else {
                result.error_message = "Factory returned null adapter";
            }
        } catch (const std::exception& e) {
            result.error_message = e.what();
        }

        result.load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (result.success) {
            Logger::getInstance().info("PipelineConfig", "Loaded adapter: " + result.adapter_name,
                "Type: " + result.type + ", took " + std::to_string(result.load_time.count()) + "ms");
        } else {
            Logger::getInstance().error("PipelineConfig",
                "Failed to load adapter " + result.adapter_name + ": " + result.error_message);
        }
        m_load_results.push_back(result);
    }

    for (const auto& step : definition.steps) {
        pipeline->addStep(step.name, step.task_type, step.params);
    }

    return pipeline;
}

const std::vector<AdapterLoadResult>& PipelineConfigLoader::getLoadResults() const {
    return m_load_results;
}

std::string PipelineConfigLoader::resolveApiKey(const AdapterDefinition& definition) {
    if (!definition.api_key.empty()) {
        return definition.api_key;
    }
    if (definition.api_key_env.empty()) {
        return "";
    }

    const char* value = std::getenv(definition.api_key_env.c_str());
    if (value == nullptr) {
        throw ConfigurationError("Environment variable " + definition.api_key_env +
                                 " is not set for adapter " + definition.name);
    }
    return value;
}

AdapterConfig PipelineConfigLoader::makeAdapterConfig(const AdapterDefinition& definition) {
    AdapterConfig config = definition.config;
    config.capabilities.clear();
    for (const auto& capability : definition.capabilities) {
        try {
            config.capabilities.push_back(stringToTaskType(capability));
        } catch (const std::invalid_argument&) {
            throw ConfigurationError("Invalid capability '" + capability + "' in adapter: " + definition.name);
        }
    }
    return config;
}

void PipelineConfigLoader::applyLoggingSettings(const LoggingSettings& settings) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(Logger::parseLevel(settings.console_level));
    logger.setFileLogLevel(Logger::parseLevel(settings.file_level));
    if (!settings.log_dir.empty()) {
        logger.initialize(settings.log_dir);
    }
}

void PipelineConfigLoader::registerBuiltinFactories() {
    registerAdapterFactory("openai", [](const AdapterDefinition& definition) -> std::shared_ptr<Adapter> {
        return std::make_shared<OpenAiAdapter>(resolveApiKey(definition),
                                               makeAdapterConfig(definition),
                                               definition.name);
    });

    registerAdapterFactory("code_optimizer", [](const AdapterDefinition& definition) -> std::shared_ptr<Adapter> {
        return std::make_shared<CodeOptimizerAdapter>(makeAdapterConfig(definition), definition.name);
    });
}

} // namespace OpenBerl
