/**
 * @file messages.hpp
 * @brief Message vocabulary between callers and the compute dispatcher
 *
 * Every request is tagged with a correlation id. While it runs, the request's
 * listener receives zero or more PROGRESS messages followed by exactly one
 * terminal message: the request type's completion message or ERROR.
 */

#ifndef RETIRECALC_MESSAGES_HPP
#define RETIRECALC_MESSAGES_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace retirecalc {

/**
 * @brief Wire names of request, progress and completion messages
 */
enum class MessageType {
    Run,                    ///< Monte Carlo batch or full calculation
    Progress,
    Complete,
    Error,
    Legacy,                 ///< Generational payout simulation
    LegacyComplete,
    Guardrails,
    GuardrailsComplete,
    RothOptimizer,
    RothOptimizerComplete,
    Optimize,               ///< Plan optimizer searches
    OptimizeComplete
};

inline std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::Run: return "run";
        case MessageType::Progress: return "progress";
        case MessageType::Complete: return "complete";
        case MessageType::Error: return "error";
        case MessageType::Legacy: return "legacy";
        case MessageType::LegacyComplete: return "legacy-complete";
        case MessageType::Guardrails: return "guardrails";
        case MessageType::GuardrailsComplete: return "guardrails-complete";
        case MessageType::RothOptimizer: return "roth-optimizer";
        case MessageType::RothOptimizerComplete: return "roth-optimizer-complete";
        case MessageType::Optimize: return "optimize";
        case MessageType::OptimizeComplete: return "optimize-complete";
        default: return "unknown";
    }
}

/**
 * @brief Completion message that answers a request type
 */
inline MessageType completion_type(MessageType request) {
    switch (request) {
        case MessageType::Run: return MessageType::Complete;
        case MessageType::Legacy: return MessageType::LegacyComplete;
        case MessageType::Guardrails: return MessageType::GuardrailsComplete;
        case MessageType::RothOptimizer: return MessageType::RothOptimizerComplete;
        case MessageType::Optimize: return MessageType::OptimizeComplete;
        default: return MessageType::Complete;
    }
}

/**
 * @brief Progress report for a running request
 */
struct ProgressEvent {
    std::string phase;      ///< e.g. "monteCarlo"
    int percent;            ///< 0-100
    std::string message;    ///< e.g. "Running Monte Carlo simulation... 300 / 1000"

    ProgressEvent() : percent(0) {}
    ProgressEvent(const std::string& p, int pct, const std::string& msg)
        : phase(p), percent(pct), message(msg) {}
};

/**
 * @brief One message delivered to a request listener
 */
struct Message {
    uint64_t request_id;
    MessageType type;
    ProgressEvent progress;  ///< Set for PROGRESS messages
    std::string error;       ///< Set for ERROR messages

    Message() : request_id(0), type(MessageType::Progress) {}
    Message(uint64_t id, MessageType t) : request_id(id), type(t) {}

    bool is_terminal() const { return type != MessageType::Progress; }
};

using MessageListener = std::function<void(const Message&)>;

/**
 * @brief Dispatcher worker state
 */
enum class DispatcherState {
    STOPPED,    ///< No worker thread
    IDLE,       ///< Worker waiting for requests
    BUSY,       ///< Worker executing a request
    STOPPING    ///< Shutting down or restarting
};

inline std::string state_to_string(DispatcherState state) {
    switch (state) {
        case DispatcherState::STOPPED: return "STOPPED";
        case DispatcherState::IDLE: return "IDLE";
        case DispatcherState::BUSY: return "BUSY";
        case DispatcherState::STOPPING: return "STOPPING";
        default: return "UNKNOWN";
    }
}

} // namespace retirecalc

#endif // RETIRECALC_MESSAGES_HPP
