/**
 * @file compute_dispatcher.hpp
 * @brief Background compute dispatcher with correlated requests
 *
 * The ComputeDispatcher owns one long-lived worker thread and a bounded
 * request queue. It handles:
 * - Typed submissions returning a correlation id and a future
 * - Per-request listeners receiving progress, then one terminal message
 * - Deadlines for generational (legacy) requests, enforced by a watchdog
 * - Best-effort cancellation of one request, hard restart of the worker
 *
 * Design Pattern: Active object with per-request promises
 */

#ifndef RETIRECALC_COMPUTE_DISPATCHER_HPP
#define RETIRECALC_COMPUTE_DISPATCHER_HPP

#include "messages.hpp"
#include "../../retirecalc-engine/src/batch_orchestrator.hpp"
#include "../../retirecalc-engine/src/calculation.hpp"
#include "../../retirecalc-engine/src/errors.hpp"
#include "../../retirecalc-engine/src/generational_model.hpp"
#include "../../retirecalc-engine/src/guardrails.hpp"
#include "../../retirecalc-engine/src/plan_optimizer.hpp"
#include "../../retirecalc-engine/src/roth_optimizer.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace retirecalc {

/**
 * @brief Raised when the dispatcher cannot accept a request
 */
class DispatcherError : public CalcError {
public:
    explicit DispatcherError(const std::string& message)
        : CalcError("Dispatcher error: " + message) {}
};

/**
 * @brief Dispatcher configuration
 */
struct DispatcherConfig {
    size_t queue_capacity;                        ///< Waiting requests before submissions are rejected
    std::chrono::milliseconds legacy_timeout;     ///< Deadline for legacy requests, from submission

    DispatcherConfig()
        : queue_capacity(16),
          legacy_timeout(std::chrono::seconds(60)) {}
};

/**
 * @brief Dispatcher statistics
 */
struct DispatcherStats {
    size_t submitted;
    size_t completed;
    size_t failed;
    size_t cancelled;
    size_t timed_out;
    size_t rejected;
    double total_execution_time_ms;
    double average_execution_time_ms;   ///< Over completed requests

    DispatcherStats()
        : submitted(0), completed(0), failed(0), cancelled(0), timed_out(0), rejected(0),
          total_execution_time_ms(0.0), average_execution_time_ms(0.0) {}
};

/**
 * @brief Correlation id and eventual result of a submitted request
 */
template <typename T>
struct RequestHandle {
    uint64_t id;
    std::future<T> result;

    /**
     * @brief Block until the request settles
     *
     * @throws CancelledError, TimeoutError or the computation's own error
     */
    T get() { return result.get(); }
};

/**
 * @brief Single-worker dispatcher for engine computations
 *
 * Usage Example:
 *   @code
 *   ComputeDispatcher dispatcher;
 *
 *   auto handle = dispatcher.submit_batch(inputs, 12345, 1000,
 *       [](const Message& msg) {
 *           if (msg.type == MessageType::Progress) {
 *               std::cerr << msg.progress.message << "\n";
 *           }
 *       });
 *
 *   BatchSummary summary = handle.get();
 *   @endcode
 */
class ComputeDispatcher {
public:
    /**
     * @brief Start the worker and watchdog threads
     */
    explicit ComputeDispatcher(const DispatcherConfig& config = DispatcherConfig());

    /**
     * @brief Stops the dispatcher; pending requests fail with CancelledError
     */
    ~ComputeDispatcher();

    ComputeDispatcher(const ComputeDispatcher&) = delete;
    ComputeDispatcher& operator=(const ComputeDispatcher&) = delete;

    /**
     * @brief Monte Carlo batch ("run"); reports "monteCarlo" progress
     *
     * @throws DispatcherError If the queue is full or the dispatcher is stopped
     */
    RequestHandle<BatchSummary> submit_batch(const SimulationInputs& inputs, uint32_t base_seed,
                                             size_t num_paths,
                                             MessageListener listener = MessageListener());

    /**
     * @brief Full calculation pipeline ("run"); reports "monteCarlo" progress
     */
    RequestHandle<CalculationResult> submit_calculation(const SimulationInputs& inputs,
                                                        const CalculationSettings& settings,
                                                        MessageListener listener = MessageListener());

    /**
     * @brief Per-beneficiary payout simulation ("legacy")
     *
     * Fails with TimeoutError when it has not settled within the configured
     * legacy timeout of its submission.
     */
    RequestHandle<LegacyResult> submit_legacy(const LegacyParams& params,
                                              MessageListener listener = MessageListener());

    RequestHandle<GuardrailsResult> submit_guardrails(const std::vector<RunOutcome>& runs,
                                                      double spending_reduction = 0.10,
                                                      MessageListener listener = MessageListener());

    RequestHandle<RothConversionResult> submit_roth_optimizer(
        const RothOptimizerParams& params, MessageListener listener = MessageListener());

    RequestHandle<PlanOptimizationResult> submit_plan_optimizer(
        const SimulationInputs& inputs, uint32_t base_seed,
        const PlanOptimizerConfig& config = PlanOptimizerConfig(),
        MessageListener listener = MessageListener());

    /**
     * @brief Best-effort cancellation
     *
     * A queued request is dropped; a running request has its cancel flag set
     * and settles with CancelledError once it notices (batches and the plan
     * optimizer check the flag, other requests finish first and discard their
     * result).
     *
     * @return false if the id is unknown or already settled
     */
    bool cancel(uint64_t request_id);

    /**
     * @brief Hard cancellation
     *
     * Fails every pending request with CancelledError at once, waits for the
     * in-flight computation to stop and starts a fresh worker. A stopped
     * dispatcher is brought back up, watchdog included.
     */
    void restart();

    /**
     * @brief Stop the worker and watchdog (idempotent)
     */
    void stop();

    DispatcherState get_state() const;
    DispatcherStats get_stats() const;
    size_t queue_size() const;

private:
    struct Request;
    using RequestPtr = std::shared_ptr<Request>;

    DispatcherConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable watchdog_cv_;
    std::deque<RequestPtr> queue_;
    RequestPtr current_;
    std::map<uint64_t, std::pair<std::chrono::steady_clock::time_point, RequestPtr>> deadlines_;

    DispatcherState state_;
    DispatcherStats stats_;
    uint64_t next_id_;
    bool stopping_;
    bool watchdog_stop_;

    std::thread worker_;
    std::thread watchdog_;

    template <typename T>
    RequestHandle<T> enqueue(MessageType type, std::function<T(Request&)> job,
                             MessageListener listener, bool has_deadline);

    void worker_loop();
    void watchdog_loop();
    void execute(const RequestPtr& request);
    void expire(const RequestPtr& request);
    void settle_cancelled(const RequestPtr& request, const std::string& reason);
    void shutdown_worker(const std::string& reason);
    void start_worker();
    void start_watchdog();
    void transition_state(DispatcherState new_state);
    void transition_state_locked(DispatcherState new_state);
};

} // namespace retirecalc

#endif // RETIRECALC_COMPUTE_DISPATCHER_HPP
