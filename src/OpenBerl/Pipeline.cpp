// =================================================================
// src/OpenBerl/Pipeline.cpp
// =================================================================
// Implementation of the pipeline orchestrator.

#include "OpenBerl/Pipeline.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace OpenBerl {

namespace {

bool isBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
}

long elapsedMs(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

constexpr double MAX_TIMEOUT_SECONDS = 86400.0;
constexpr double MAX_BACKOFF_FACTOR = 60.0;
constexpr long long MAX_RETRIES = 100;

/**
 * @brief Counts an execution as active for the lifetime of the guard
 */
class ActiveRunGuard {
public:
    explicit ActiveRunGuard(std::atomic<size_t>& counter) : m_counter(counter) { ++m_counter; }
    ~ActiveRunGuard() { --m_counter; }

    ActiveRunGuard(const ActiveRunGuard&) = delete;
    ActiveRunGuard& operator=(const ActiveRunGuard&) = delete;

private:
    std::atomic<size_t>& m_counter;
};

double totalCost(const PipelineResult& result) {
    double total = 0.0;
    for (const auto& entry : result) {
        total += entry.second.cost_info.estimated_cost;
    }
    return total;
}

ConfigurationError invalidParam(const PipelineStep& step, const std::string& key) {
    return ConfigurationError("Invalid value for '" + key + "' in step '" + step.name + "': " +
                              step.params.at(key).dump());
}

long long integerParam(const PipelineStep& step, const std::string& key,
                       long long min_value, long long max_value) {
    const nlohmann::json& value = step.params.at(key);
    if (value.is_number_unsigned()) {
        auto number = value.get<unsigned long long>();
        if (max_value >= 0 && number <= static_cast<unsigned long long>(max_value)) {
            return static_cast<long long>(number);
        }
    } else if (value.is_number_integer()) {
        auto number = value.get<long long>();
        if (number >= min_value && number <= max_value) {
            return number;
        }
    }
    throw invalidParam(step, key);
}

double boundedParam(const PipelineStep& step, const std::string& key,
                    double min_value, double max_value) {
    const nlohmann::json& value = step.params.at(key);
    if (value.is_number()) {
        double number = value.get<double>();
        if (std::isfinite(number) && number >= min_value && number <= max_value) {
            return number;
        }
    }
    throw invalidParam(step, key);
}

} // namespace

std::string executionModeToString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::SEQUENTIAL: return "sequential";
        case ExecutionMode::PARALLEL: return "parallel";
    }
    return "unknown";
}

ExecutionMode stringToExecutionMode(const std::string& str) {
    if (str == "sequential") return ExecutionMode::SEQUENTIAL;
    if (str == "parallel") return ExecutionMode::PARALLEL;
    throw ConfigurationError("Unknown execution mode: " + str);
}

std::string pipelineStateToString(PipelineState state) {
    switch (state) {
        case PipelineState::IDLE: return "idle";
        case PipelineState::VALIDATING: return "validating";
        case PipelineState::RUNNING: return "running";
        case PipelineState::SUCCEEDED: return "succeeded";
        case PipelineState::FAILED: return "failed";
    }
    return "unknown";
}

// --- PipelineResult ---

void PipelineResult::add(const std::string& step_name, UmfResponse response) {
    m_entries.emplace_back(step_name, std::move(response));
}

bool PipelineResult::contains(const std::string& step_name) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&step_name](const Entry& entry) { return entry.first == step_name; });
}

const UmfResponse& PipelineResult::at(const std::string& step_name) const {
    for (const auto& entry : m_entries) {
        if (entry.first == step_name) {
            return entry.second;
        }
    }
    throw std::out_of_range("No result for step: " + step_name);
}

std::vector<std::string> PipelineResult::stepNames() const {
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        names.push_back(entry.first);
    }
    return names;
}

bool PipelineResult::hasErrors() const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [](const Entry& entry) { return entry.second.isError(); });
}

// --- Pipeline ---

Pipeline::Pipeline(const std::string& name, const PipelineOptions& options)
    : m_name(name.empty() ? generatePipelineName() : name),
      m_options(options),
      m_selector(m_registry, SelectorConfig{options.check_health}) {
    Logger::getInstance().debug("Pipeline", "Created pipeline " + m_name);
}

Pipeline::~Pipeline() = default;

void Pipeline::registerAdapter(std::shared_ptr<Adapter> adapter) {
    m_registry.registerAdapter(std::move(adapter));
}

Pipeline& Pipeline::addStep(const std::string& name, const std::string& task_type, nlohmann::json params) {
    if (isBlank(name)) {
        throw ConfigurationError("Step name must not be empty");
    }
    if (params.is_null()) {
        params = nlohmann::json::object();
    }
    if (!params.is_object()) {
        throw ConfigurationError("Parameters of step '" + name + "' must be an object");
    }

    std::lock_guard<std::mutex> lock(m_steps_mutex);
    if (m_active_runs > 0) {
        throw ConfigurationError("Cannot add step '" + name + "' while pipeline " + m_name + " is running");
    }
    m_steps.push_back(PipelineStep{name, task_type, std::move(params)});
    return *this;
}

Pipeline& Pipeline::addStep(const std::string& name, TaskType task_type, nlohmann::json params) {
    return addStep(name, taskTypeToString(task_type), std::move(params));
}

PipelineResult Pipeline::execute(const nlohmann::json& initial_payload, ExecutionMode mode) {
    // Counted under the steps lock so that addStep cannot slip in after the snapshot
    std::unique_lock<std::mutex> steps_lock(m_steps_mutex);
    ActiveRunGuard guard(m_active_runs);
    std::vector<PipelineStep> steps = m_steps;
    steps_lock.unlock();

    auto start_time = std::chrono::steady_clock::now();

    m_last_state = PipelineState::VALIDATING;
    try {
        validateSteps(steps);
    } catch (const ConfigurationError& e) {
        m_last_state = PipelineState::FAILED;
        Logger::getInstance().error("Pipeline", "Validation failed for " + m_name, e.what());
        throw;
    }

    m_last_state = PipelineState::RUNNING;
    Logger::getInstance().logPipelineStart(m_name, executionModeToString(mode), steps.size());

    try {
        PipelineResult result = (mode == ExecutionMode::PARALLEL)
            ? executeParallel(steps, initial_payload)
            : executeSequential(steps, initial_payload);

        m_ledger.recordExecution();
        m_last_state = PipelineState::SUCCEEDED;
        Logger::getInstance().logPipelineEnd(m_name, true, totalCost(result), elapsedMs(start_time));
        return result;
    } catch (const std::exception&) {
        m_last_state = PipelineState::FAILED;
        Logger::getInstance().logPipelineEnd(m_name, false, 0.0, elapsedMs(start_time));
        throw;
    }
}

void Pipeline::validate() const {
    validateSteps(getSteps());
}

CostAnalysis Pipeline::getCostAnalysis() const {
    return m_ledger.analyze();
}

void Pipeline::resetCostTracking() {
    m_ledger.reset();
}

PipelineState Pipeline::getLastState() const {
    return m_last_state.load();
}

size_t Pipeline::getActiveRuns() const {
    return m_active_runs.load();
}

const std::string& Pipeline::getName() const {
    return m_name;
}

std::vector<PipelineStep> Pipeline::getSteps() const {
    std::lock_guard<std::mutex> lock(m_steps_mutex);
    return m_steps;
}

const AdapterRegistry& Pipeline::getRegistry() const {
    return m_registry;
}

const PipelineOptions& Pipeline::getOptions() const {
    return m_options;
}

std::string Pipeline::generatePipelineName() {
    return "pipeline_" + generateRequestId().substr(0, 8);
}

PipelineResult Pipeline::executeSequential(const std::vector<PipelineStep>& steps,
                                           const nlohmann::json& initial_payload) {
    PipelineResult results;
    nlohmann::json current_payload = initial_payload;

    for (const auto& step : steps) {
        auto adapter = m_selector.select(step.task_type);
        UmfRequest request = buildRequest(step, current_payload);

        UmfResponse response = runStep(adapter, request, step.name);

        // Failed output is carried forward as-is
        current_payload = response.result;
        results.add(step.name, std::move(response));
    }

    return results;
}

PipelineResult Pipeline::executeParallel(const std::vector<PipelineStep>& steps,
                                         const nlohmann::json& initial_payload) {
    if (steps.size() <= 1) {
        return executeSequential(steps, initial_payload);
    }

    // Route every step before running any of them
    std::vector<std::shared_ptr<Adapter>> adapters;
    adapters.reserve(steps.size());
    for (const auto& step : steps) {
        adapters.push_back(m_selector.select(step.task_type));
    }

    ThreadPool& pool = initializeThreadPool();

    std::vector<std::future<UmfResponse>> futures;
    futures.reserve(steps.size());
    for (size_t i = 0; i < steps.size(); ++i) {
        UmfRequest request = buildRequest(steps[i], initial_payload);
        std::string step_name = steps[i].name;
        std::shared_ptr<Adapter> adapter = adapters[i];

        futures.push_back(pool.enqueue(
            [this, adapter, request, step_name]() {
                return runStep(adapter, request, step_name);
            }));
    }

    Logger::getInstance().debug("Pipeline", "Queued " + std::to_string(futures.size()) + " parallel steps",
        "busy workers: " + std::to_string(pool.busyWorkers()) +
        ", pending: " + std::to_string(pool.pendingJobs()));

    PipelineResult results;
    for (size_t i = 0; i < futures.size(); ++i) {
        results.add(steps[i].name, futures[i].get());
    }

    return results;
}

UmfRequest Pipeline::buildRequest(const PipelineStep& step, const nlohmann::json& payload) const {
    UmfRequest request(stringToTaskType(step.task_type), payload);

    request.metadata = step.params;
    request.metadata["pipeline_id"] = m_name;
    request.metadata["step_name"] = step.name;

    applyStepParams(step, request);
    return request;
}

void Pipeline::applyStepParams(const PipelineStep& step, UmfRequest& request) {
    const auto& params = step.params;
    if (params.contains("priority")) {
        request.priority = static_cast<int>(integerParam(step, "priority",
            std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
    }
    if (params.contains("timeout")) {
        double seconds = boundedParam(step, "timeout", 0.001, MAX_TIMEOUT_SECONDS);
        request.timeout = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }
    if (params.contains("max_retries")) {
        request.retry_policy.max_retries = static_cast<size_t>(integerParam(step, "max_retries", 0, MAX_RETRIES));
    }
    if (params.contains("backoff_factor")) {
        request.retry_policy.backoff_factor = boundedParam(step, "backoff_factor", 0.0, MAX_BACKOFF_FACTOR);
    }
    if (params.contains("context")) {
        if (!params["context"].is_array()) {
            throw invalidParam(step, "context");
        }
        for (const auto& entry : params["context"]) {
            request.context.push_back(entry);
        }
    }
}

UmfResponse Pipeline::runStep(const std::shared_ptr<Adapter>& adapter,
                              const UmfRequest& request,
                              const std::string& step_name) {
    auto start_time = std::chrono::steady_clock::now();

    UmfResponse response;
    try {
        response = adapter->execute(request);
    } catch (const std::exception& e) {
        response = UmfResponse::makeError(request, "Error in step '" + step_name + "': " + e.what());
        response.cost_info.error_message = e.what();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    m_ledger.recordStep(step_name, response.cost_info.estimated_cost, duration);

    Logger::getInstance().logStepExecution(step_name, adapter->getAdapterName(),
                                           response.cost_info.estimated_cost,
                                           static_cast<long>(duration.count()),
                                           response.isError());
    return response;
}

void Pipeline::validateSteps(const std::vector<PipelineStep>& steps) {
    if (steps.empty()) {
        throw ConfigurationError("Pipeline has no steps configured");
    }

    std::unordered_set<std::string> seen_names;
    for (const auto& step : steps) {
        if (isBlank(step.task_type)) {
            throw ConfigurationError("Invalid task type in step '" + step.name + "': '" + step.task_type + "'");
        }
        if (!isKnownTaskType(step.task_type)) {
            throw ConfigurationError("Unauthorized task type: " + step.task_type);
        }
        if (!seen_names.insert(step.name).second) {
            throw ConfigurationError("Duplicate step name: " + step.name);
        }

        UmfRequest scratch;
        applyStepParams(step, scratch);
    }
}

ThreadPool& Pipeline::initializeThreadPool() {
    std::lock_guard<std::mutex> lock(m_pool_mutex);
    if (m_thread_pool) {
        return *m_thread_pool;
    }

    size_t num_threads = m_options.max_parallel_workers;
    if (num_threads == 0) {
        num_threads = std::max<size_t>(2, std::thread::hardware_concurrency());
    }

    m_thread_pool = std::make_unique<ThreadPool>(num_threads);
    Logger::getInstance().debug("Pipeline",
        "Initialized thread pool with " + std::to_string(num_threads) + " workers");
    return *m_thread_pool;
}

} // namespace OpenBerl
