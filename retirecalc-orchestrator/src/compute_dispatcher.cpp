/**
 * @file compute_dispatcher.cpp
 * @brief Implementation of ComputeDispatcher
 */

#include "compute_dispatcher.hpp"
#include "logger.hpp"
#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace retirecalc {

namespace {

ProgressEvent monte_carlo_progress(size_t completed, size_t total) {
    int percent = total > 0 ? static_cast<int>(completed * 100 / total) : 100;
    return ProgressEvent("monteCarlo", percent,
                         "Running Monte Carlo simulation... " + std::to_string(completed) +
                         " / " + std::to_string(total));
}

} // anonymous namespace

/**
 * @brief One queued or running request
 *
 * Exactly one thread wins claim() and settles the request: the worker on
 * completion or failure, the watchdog on timeout, or cancel()/restart().
 * The winner delivers the terminal message before fulfilling the promise.
 */
struct ComputeDispatcher::Request {
    uint64_t id;
    MessageType type;
    std::atomic<bool> cancel_flag;
    std::atomic<bool> settled;

    std::function<bool(Request&)> run;                  ///< Computes; true if it settled the request
    std::function<void(std::exception_ptr)> reject;

    std::mutex listener_mutex;
    MessageListener listener;

    Request(uint64_t request_id, MessageType request_type)
        : id(request_id), type(request_type), cancel_flag(false), settled(false) {}

    RequestContext context() const { return RequestContext(id, type); }

    bool claim() { return !settled.exchange(true); }

    void report(const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(listener_mutex);
        if (settled.load()) {
            return;
        }
        RequestContext ctx = context();
        ctx.phase = event.phase;
        Logger::get_instance().log_progress(ctx, event);

        Message msg(id, MessageType::Progress);
        msg.progress = event;
        deliver(msg);
    }

    // Terminal message; the listener is released afterwards
    void finish(const Message& msg) {
        std::lock_guard<std::mutex> lock(listener_mutex);
        deliver(msg);
        listener = nullptr;
    }

    bool fail(std::exception_ptr error, const std::string& message) {
        if (!claim()) {
            return false;
        }
        Message msg(id, MessageType::Error);
        msg.error = message;
        finish(msg);
        reject(error);
        return true;
    }

private:
    void deliver(const Message& msg) {
        if (!listener) {
            return;
        }
        try {
            listener(msg);
        } catch (const std::exception& e) {
            Logger::get_instance().log_warning(context(),
                std::string("Listener threw on '") + to_string(msg.type) + "': " + e.what());
        } catch (...) {
            Logger::get_instance().log_warning(context(),
                std::string("Listener threw a non-standard exception on '") +
                to_string(msg.type) + "'");
        }
    }
};

// ============================================================================
// Construction
// ============================================================================

ComputeDispatcher::ComputeDispatcher(const DispatcherConfig& config)
    : config_(config),
      state_(DispatcherState::STOPPED),
      next_id_(1),
      stopping_(false),
      watchdog_stop_(false) {

    if (config_.queue_capacity == 0) {
        throw std::invalid_argument("ComputeDispatcher: queue_capacity must be positive");
    }

    start_worker();
    start_watchdog();

    Logger::get_instance().log_dispatcher_start(config_.queue_capacity,
                                                static_cast<long long>(config_.legacy_timeout.count()));
}

ComputeDispatcher::~ComputeDispatcher() {
    stop();
}

// ============================================================================
// Submission
// ============================================================================

template <typename T>
RequestHandle<T> ComputeDispatcher::enqueue(MessageType type, std::function<T(Request&)> job,
                                            MessageListener listener, bool has_deadline) {
    auto promise = std::make_shared<std::promise<T>>();
    RequestHandle<T> handle;
    handle.result = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);

    if (stopping_ || state_ == DispatcherState::STOPPED) {
        stats_.rejected++;
        throw DispatcherError("not accepting requests in state " + state_to_string(state_));
    }
    if (queue_.size() >= config_.queue_capacity) {
        stats_.rejected++;
        throw DispatcherError("request queue is full (capacity " +
                              std::to_string(config_.queue_capacity) + ")");
    }

    auto request = std::make_shared<Request>(next_id_++, type);
    request->listener = std::move(listener);
    request->run = [job, promise](Request& r) {
        T value = job(r);
        if (r.cancel_flag.load()) {
            throw CancelledError("request " + std::to_string(r.id) + " was cancelled");
        }
        if (!r.claim()) {
            return false;
        }
        r.finish(Message(r.id, completion_type(r.type)));
        promise->set_value(std::move(value));
        return true;
    };
    request->reject = [promise](std::exception_ptr error) {
        promise->set_exception(error);
    };

    handle.id = request->id;
    queue_.push_back(request);
    stats_.submitted++;

    if (has_deadline) {
        deadlines_[request->id] = {std::chrono::steady_clock::now() + config_.legacy_timeout, request};
        watchdog_cv_.notify_all();
    }

    Logger::get_instance().log_request_queued(request->context(), queue_.size());
    queue_cv_.notify_one();
    return handle;
}

RequestHandle<BatchSummary> ComputeDispatcher::submit_batch(const SimulationInputs& inputs,
                                                            uint32_t base_seed, size_t num_paths,
                                                            MessageListener listener) {
    auto job = [inputs, base_seed, num_paths](Request& r) {
        BatchOptions options;
        options.cancel = &r.cancel_flag;
        options.on_progress = [&r](size_t completed, size_t total) {
            r.report(monte_carlo_progress(completed, total));
        };
        return run_batch(inputs, base_seed, num_paths, options);
    };
    return enqueue<BatchSummary>(MessageType::Run, job, std::move(listener), false);
}

RequestHandle<CalculationResult> ComputeDispatcher::submit_calculation(
    const SimulationInputs& inputs, const CalculationSettings& settings,
    MessageListener listener) {
    auto job = [inputs, settings](Request& r) {
        BatchOptions options;
        options.cancel = &r.cancel_flag;
        options.on_progress = [&r](size_t completed, size_t total) {
            r.report(monte_carlo_progress(completed, total));
        };
        return run_calculation(inputs, settings, options);
    };
    return enqueue<CalculationResult>(MessageType::Run, job, std::move(listener), false);
}

RequestHandle<LegacyResult> ComputeDispatcher::submit_legacy(const LegacyParams& params,
                                                             MessageListener listener) {
    auto job = [params](Request&) { return simulate_per_beneficiary_payout(params); };
    return enqueue<LegacyResult>(MessageType::Legacy, job, std::move(listener), true);
}

RequestHandle<GuardrailsResult> ComputeDispatcher::submit_guardrails(
    const std::vector<RunOutcome>& runs, double spending_reduction, MessageListener listener) {
    auto job = [runs, spending_reduction](Request&) {
        return analyze_guardrails(runs, spending_reduction);
    };
    return enqueue<GuardrailsResult>(MessageType::Guardrails, job, std::move(listener), false);
}

RequestHandle<RothConversionResult> ComputeDispatcher::submit_roth_optimizer(
    const RothOptimizerParams& params, MessageListener listener) {
    auto job = [params](Request&) { return optimize_roth_conversions(params); };
    return enqueue<RothConversionResult>(MessageType::RothOptimizer, job, std::move(listener),
                                         false);
}

RequestHandle<PlanOptimizationResult> ComputeDispatcher::submit_plan_optimizer(
    const SimulationInputs& inputs, uint32_t base_seed, const PlanOptimizerConfig& config,
    MessageListener listener) {
    auto job = [inputs, base_seed, config](Request& r) {
        PlanOptimizerConfig run_config = config;
        run_config.cancel = &r.cancel_flag;
        return optimize_plan(inputs, base_seed, run_config);
    };
    return enqueue<PlanOptimizationResult>(MessageType::Optimize, job, std::move(listener), false);
}

// ============================================================================
// Cancellation
// ============================================================================

bool ComputeDispatcher::cancel(uint64_t request_id) {
    RequestPtr queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(queue_.begin(), queue_.end(),
                               [request_id](const RequestPtr& r) { return r->id == request_id; });
        if (it != queue_.end()) {
            queued = *it;
            queue_.erase(it);
            deadlines_.erase(request_id);
        } else if (current_ && current_->id == request_id && !current_->settled.load()) {
            current_->cancel_flag = true;
            return true;
        } else {
            return false;
        }
    }

    settle_cancelled(queued, "Cancelled before start");
    return true;
}

void ComputeDispatcher::settle_cancelled(const RequestPtr& request, const std::string& reason) {
    CancelledError error("request " + std::to_string(request->id) + ": " + reason);
    if (!request->fail(std::make_exception_ptr(error), error.what())) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.cancelled++;
    }
    Logger::get_instance().log_request_cancelled(request->context(), reason);
}

void ComputeDispatcher::restart() {
    shutdown_worker("Dispatcher restarted");
    Logger::get_instance().log_dispatcher_stop("restart");
    start_worker();
    start_watchdog();
    Logger::get_instance().log_dispatcher_start(config_.queue_capacity,
                                                static_cast<long long>(config_.legacy_timeout.count()));
}

void ComputeDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == DispatcherState::STOPPED) {
            return;
        }
    }

    shutdown_worker("Dispatcher stopped");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        watchdog_stop_ = true;
    }
    watchdog_cv_.notify_all();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    transition_state(DispatcherState::STOPPED);
    Logger::get_instance().log_dispatcher_stop("stop");
}

// ============================================================================
// Accessors
// ============================================================================

DispatcherState ComputeDispatcher::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

DispatcherStats ComputeDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t ComputeDispatcher::queue_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// Worker
// ============================================================================

void ComputeDispatcher::start_worker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        transition_state_locked(DispatcherState::IDLE);
    }
    worker_ = std::thread(&ComputeDispatcher::worker_loop, this);
}

// No-op while the watchdog is running; stop() joins it and clears the thread
void ComputeDispatcher::start_watchdog() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (watchdog_.joinable() && !watchdog_stop_) {
            return;
        }
        watchdog_stop_ = false;
    }
    if (watchdog_.joinable()) {
        watchdog_.join();
    }
    watchdog_ = std::thread(&ComputeDispatcher::watchdog_loop, this);
}

void ComputeDispatcher::shutdown_worker(const std::string& reason) {
    std::deque<RequestPtr> pending;
    RequestPtr running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        transition_state_locked(DispatcherState::STOPPING);
        pending.swap(queue_);
        running = current_;
        if (running) {
            running->cancel_flag = true;
        }
    }
    queue_cv_.notify_all();

    for (const RequestPtr& request : pending) {
        settle_cancelled(request, reason);
    }
    if (running) {
        settle_cancelled(running, reason);
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const RequestPtr& request : pending) {
        deadlines_.erase(request->id);
    }
    if (running) {
        deadlines_.erase(running->id);
    }
}

void ComputeDispatcher::worker_loop() {
    for (;;) {
        RequestPtr request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }

            request = queue_.front();
            queue_.pop_front();
            if (request->settled.load()) {
                continue;  // timed out while waiting
            }
            current_ = request;
            transition_state_locked(DispatcherState::BUSY);
        }

        execute(request);

        std::lock_guard<std::mutex> lock(mutex_);
        current_.reset();
        deadlines_.erase(request->id);
        if (!stopping_) {
            transition_state_locked(DispatcherState::IDLE);
        }
    }
}

void ComputeDispatcher::execute(const RequestPtr& request) {
    Logger& logger = Logger::get_instance();
    const RequestContext ctx = request->context();
    logger.log_request_start(ctx);

    auto start_time = std::chrono::steady_clock::now();

    bool completed = false;
    bool cancelled = false;
    bool failed = false;
    std::string error_message;

    try {
        completed = request->run(*request);
    } catch (const CancelledError& e) {
        error_message = e.what();
        cancelled = request->fail(std::current_exception(), error_message);
    } catch (const std::exception& e) {
        error_message = e.what();
        failed = request->fail(std::current_exception(), error_message);
    } catch (...) {
        error_message = "non-standard exception";
        failed = request->fail(std::current_exception(), error_message);
    }

    auto end_time = std::chrono::steady_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed) {
            stats_.completed++;
            stats_.total_execution_time_ms += elapsed_ms;
            stats_.average_execution_time_ms =
                stats_.total_execution_time_ms / static_cast<double>(stats_.completed);
        } else if (cancelled) {
            stats_.cancelled++;
        } else if (failed) {
            stats_.failed++;
        }
    }

    // A request settled elsewhere (timeout, restart) was already logged there
    if (completed) {
        logger.log_request_complete(ctx, elapsed_ms);
    } else if (cancelled) {
        logger.log_request_cancelled(ctx, error_message);
    } else if (failed) {
        logger.log_request_failed(ctx, error_message);
    }
}

// ============================================================================
// Watchdog
// ============================================================================

void ComputeDispatcher::watchdog_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!watchdog_stop_) {
        if (deadlines_.empty()) {
            watchdog_cv_.wait(lock);
            continue;
        }

        auto earliest = std::min_element(
            deadlines_.begin(), deadlines_.end(),
            [](const auto& a, const auto& b) { return a.second.first < b.second.first; });
        if (watchdog_cv_.wait_until(lock, earliest->second.first) != std::cv_status::timeout) {
            continue;  // deadlines changed; recompute
        }

        auto now = std::chrono::steady_clock::now();
        std::vector<RequestPtr> expired;
        for (auto it = deadlines_.begin(); it != deadlines_.end();) {
            if (it->second.first <= now) {
                expired.push_back(it->second.second);
                it = deadlines_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (const RequestPtr& request : expired) {
            expire(request);
        }
        lock.lock();
    }
}

void ComputeDispatcher::expire(const RequestPtr& request) {
    const long long timeout_ms = static_cast<long long>(config_.legacy_timeout.count());
    request->cancel_flag = true;

    TimeoutError error("request " + std::to_string(request->id) + " (" + to_string(request->type) +
                       ") exceeded " + std::to_string(timeout_ms) + " ms");
    if (!request->fail(std::make_exception_ptr(error), error.what())) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.timed_out++;
        queue_.erase(std::remove(queue_.begin(), queue_.end(), request), queue_.end());
    }
    Logger::get_instance().log_request_timeout(request->context(), timeout_ms);
}

// ============================================================================
// State
// ============================================================================

void ComputeDispatcher::transition_state(DispatcherState new_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_state_locked(new_state);
}

void ComputeDispatcher::transition_state_locked(DispatcherState new_state) {
    if (state_ == new_state) {
        return;
    }
    Logger::get_instance().log_state_transition(state_, new_state);
    state_ = new_state;
}

} // namespace retirecalc
