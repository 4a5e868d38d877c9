// =================================================================
// include/OpenBerl/Pipeline.hpp
// =================================================================
// Pipeline orchestrator: step definition, validation and execution.

#pragma once

#include "OpenBerl/Adapter.hpp"
#include "OpenBerl/AdapterRegistry.hpp"
#include "OpenBerl/AdapterSelector.hpp"
#include "OpenBerl/CostLedger.hpp"
#include "OpenBerl/ThreadPool.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <utility>

namespace OpenBerl {

/**
 * @brief How the steps of a pipeline are run
 */
enum class ExecutionMode {
    SEQUENTIAL,   ///< Steps in order, each result feeding the next step
    PARALLEL      ///< All steps at once on the same initial payload
};

std::string executionModeToString(ExecutionMode mode);

/**
 * @brief Parse "sequential" or "parallel"
 * @throws ConfigurationError on any other value
 */
ExecutionMode stringToExecutionMode(const std::string& str);

/**
 * @brief Lifecycle of the most recent execute() call
 */
enum class PipelineState {
    IDLE,         ///< Never executed
    VALIDATING,   ///< Checking the step list
    RUNNING,      ///< Steps in flight
    SUCCEEDED,    ///< All steps produced a response (possibly error-flagged)
    FAILED        ///< Aborted on a configuration or routing error
};

std::string pipelineStateToString(PipelineState state);

/**
 * @brief One named unit of work
 */
struct PipelineStep {
    std::string name;                                   ///< Unique within the pipeline
    std::string task_type;                              ///< Task type name as given, validated at execute()
    nlohmann::json params = nlohmann::json::object();   ///< Forwarded as request metadata
};

/**
 * @brief Pipeline construction options
 */
struct PipelineOptions {
    size_t max_parallel_workers = 0;   ///< Worker threads for parallel mode, 0 picks max(2, cores)
    bool check_health = true;          ///< Skip unhealthy adapters during selection
};

/**
 * @brief Ordered step name to response collection returned by execute()
 */
class PipelineResult {
public:
    using Entry = std::pair<std::string, UmfResponse>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void add(const std::string& step_name, UmfResponse response);

    bool contains(const std::string& step_name) const;

    /**
     * @brief Response of a step
     * @throws std::out_of_range if the step has no response
     */
    const UmfResponse& at(const std::string& step_name) const;

    /**
     * @brief Step names in declaration order
     */
    std::vector<std::string> stepNames() const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /**
     * @brief Whether any step produced an error-flagged response
     */
    bool hasErrors() const;

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

private:
    std::vector<Entry> m_entries;
};

/**
 * @brief Chains adapter calls into a linear workflow
 *
 * Steps are appended with addStep() and run by execute(). In sequential mode
 * the result of each step becomes the payload of the next; in parallel mode
 * every step receives the initial payload. Configuration and routing errors
 * abort the run; adapter failures come back as error-flagged responses.
 */
class Pipeline {
public:
    /**
     * @param name Pipeline name, generated as "pipeline_<8 hex>" when empty
     * @param options Worker count and selection settings
     */
    explicit Pipeline(const std::string& name = "", const PipelineOptions& options = PipelineOptions());

    virtual ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Make an adapter available for routing
     * @throws std::invalid_argument if adapter is null
     */
    void registerAdapter(std::shared_ptr<Adapter> adapter);

    /**
     * @brief Append a step
     * @param name Step name
     * @param task_type Task type name; validated when the pipeline runs
     * @param params Step parameters (object)
     * @return This pipeline, for chaining
     * @throws ConfigurationError while any execution is in progress, or for an
     *         empty name or non-object params
     */
    Pipeline& addStep(const std::string& name,
                      const std::string& task_type,
                      nlohmann::json params = nlohmann::json::object());

    Pipeline& addStep(const std::string& name,
                      TaskType task_type,
                      nlohmann::json params = nlohmann::json::object());

    /**
     * @brief Run the pipeline
     *
     * Several executions may overlap on one pipeline. Each works on a snapshot
     * of the steps taken when it starts, and all of them share the cost ledger.
     *
     * @param initial_payload Payload of the first step (of every step in parallel mode)
     * @param mode Sequential or parallel execution
     * @return One response per step, in declaration order
     * @throws ConfigurationError for an invalid step list or step parameters
     * @throws RoutingError when a step has no usable adapter
     */
    PipelineResult execute(const nlohmann::json& initial_payload,
                           ExecutionMode mode = ExecutionMode::SEQUENTIAL);

    /**
     * @brief Check the step list without selecting adapters
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    /**
     * @brief Cost totals, per-step costs and suggestions from the ledger
     */
    CostAnalysis getCostAnalysis() const;

    void resetCostTracking();

    /**
     * @brief State of the most recent state change of any execution
     *
     * With overlapping executions the last transition wins.
     */
    PipelineState getLastState() const;

    /**
     * @brief Number of executions currently in progress
     */
    size_t getActiveRuns() const;
    const std::string& getName() const;
    std::vector<PipelineStep> getSteps() const;
    const AdapterRegistry& getRegistry() const;
    const PipelineOptions& getOptions() const;

    /**
     * @brief Generate a name of the form "pipeline_<8 hex>"
     */
    static std::string generatePipelineName();

private:
    std::string m_name;
    PipelineOptions m_options;
    AdapterRegistry m_registry;
    AdapterSelector m_selector;
    CostLedger m_ledger;

    std::vector<PipelineStep> m_steps;
    mutable std::mutex m_steps_mutex;

    std::unique_ptr<ThreadPool> m_thread_pool;
    std::mutex m_pool_mutex;
    std::atomic<size_t> m_active_runs{0};
    std::atomic<PipelineState> m_last_state{PipelineState::IDLE};

    PipelineResult executeSequential(const std::vector<PipelineStep>& steps,
                                     const nlohmann::json& initial_payload);
    PipelineResult executeParallel(const std::vector<PipelineStep>& steps,
                                   const nlohmann::json& initial_payload);

    /**
     * @brief Build the request for a step: metadata, priority, timeout, retry policy and context
     */
    UmfRequest buildRequest(const PipelineStep& step, const nlohmann::json& payload) const;

    /**
     * @brief Execute one step, turning any escaping exception into an error response,
     *        and record its cost
     */
    UmfResponse runStep(const std::shared_ptr<Adapter>& adapter,
                        const UmfRequest& request,
                        const std::string& step_name);

    static void validateSteps(const std::vector<PipelineStep>& steps);

    /**
     * @brief Copy priority, timeout, retry policy and context from step params
     * @throws ConfigurationError for a value of the wrong type or out of range
     */
    static void applyStepParams(const PipelineStep& step, UmfRequest& request);

    ThreadPool& initializeThreadPool();
};

} // namespace OpenBerl
