// =================================================================
// include/OpenBerl/PipelineConfig.hpp
// =================================================================
// YAML pipeline definitions and the adapter factory registry that builds them.

#pragma once

#include "OpenBerl/Pipeline.hpp"
#include "OpenBerl/AdapterRuntime.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <chrono>

namespace OpenBerl {

/**
 * @brief One adapter entry of the "adapters" section
 */
struct AdapterDefinition {
    std::string name;                       ///< Adapter name (map key)
    std::string type;                       ///< Factory type (openai, code_optimizer, ...)
    std::string api_key;                    ///< Literal credential
    std::string api_key_env;                ///< Environment variable holding the credential
    std::vector<std::string> capabilities;  ///< Task type names overriding the adapter's own
    AdapterConfig config;                   ///< Shared adapter settings (capabilities filled at build time)
};

/**
 * @brief The "logging" section
 */
struct LoggingSettings {
    std::string console_level = "info";     ///< Minimum console level
    std::string file_level = "debug";       ///< Minimum file level
    std::string log_dir;                    ///< Enables file logging when set
};

/**
 * @brief A complete pipeline definition parsed from YAML
 */
struct PipelineDefinition {
    std::string name;                                       ///< Generated when empty
    ExecutionMode execution_mode = ExecutionMode::SEQUENTIAL;
    PipelineOptions options;
    LoggingSettings logging;
    std::vector<AdapterDefinition> adapters;                ///< Document order
    std::vector<PipelineStep> steps;                        ///< Document order
};

/**
 * @brief Outcome of constructing one configured adapter
 */
struct AdapterLoadResult {
    bool success = false;                   ///< Whether the adapter was built and registered
    std::string adapter_name;               ///< Adapter name
    std::string type;                       ///< Factory type
    std::string error_message;              ///< Error message if failed
    std::chrono::milliseconds load_time{0}; ///< Time taken to build
};

/**
 * @brief Adapter factory function type
 */
using AdapterFactory = std::function<std::shared_ptr<Adapter>(const AdapterDefinition&)>;

/**
 * @brief Parses pipeline YAML and builds ready-to-run pipelines
 *
 * Built-in factories: "openai" (OpenAiAdapter) and "code_optimizer"
 * (CodeOptimizerAdapter). Further types can be added with registerAdapterFactory().
 */
class PipelineConfigLoader {
public:
    PipelineConfigLoader();
    virtual ~PipelineConfigLoader() = default;

    /**
     * @brief Parse a pipeline definition from a YAML file
     * @throws ConfigurationError if the file is missing, unparsable or malformed
     */
    virtual PipelineDefinition parseConfigFile(const std::string& config_path) const;

    /**
     * @brief Parse a pipeline definition from YAML text
     * @throws ConfigurationError if the text is unparsable or malformed
     */
    virtual PipelineDefinition parseConfigString(const std::string& yaml_text) const;

    /**
     * @brief Register a factory for an adapter type, replacing any existing one
     */
    virtual void registerAdapterFactory(const std::string& type, AdapterFactory factory);

    bool hasAdapterFactory(const std::string& type) const;
    std::vector<std::string> getRegisteredTypes() const;

    /**
     * @brief Check an adapter definition before building it
     * @param definition Definition to check
     * @param error Receives the reason when the definition is invalid
     * @return True if the definition can be built
     */
    bool validateAdapterDefinition(const AdapterDefinition& definition, std::string& error) const;

    /**
     * @brief Build a pipeline: adapters in document order, then steps
     *
     * Adapters that fail validation or construction are skipped and reported
     * through getLoadResults().
     */
    std::unique_ptr<Pipeline> build(const PipelineDefinition& definition);

    const std::vector<AdapterLoadResult>& getLoadResults() const;

    /**
     * @brief Literal api_key, else the value of api_key_env
     * @throws ConfigurationError if api_key_env names an unset variable
     */
    static std::string resolveApiKey(const AdapterDefinition& definition);

    /**
     * @brief Adapter settings with the capability names converted to task types
     */
    static AdapterConfig makeAdapterConfig(const AdapterDefinition& definition);

    /**
     * @brief Apply console/file levels and enable file logging when log_dir is set
     * @throws std::invalid_argument on unknown level names
     */
    static void applyLoggingSettings(const LoggingSettings& settings);

private:
    std::unordered_map<std::string, AdapterFactory> m_factories;
    std::vector<AdapterLoadResult> m_load_results;

    void registerBuiltinFactories();
};

} // namespace OpenBerl
