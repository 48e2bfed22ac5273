#pragma once

/// @file alerter.h
/// @brief Security alert events and delivery
///
/// Alerts are raised for blocked or high-severity verdicts. Delivery must
/// never stall the decision path, so production wiring wraps the real
/// alerter in an AsyncAlerter.

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "security/types.h"

namespace promptguard::security {

/// @brief Compact, log-safe description of a severe verdict
struct SecurityAlertEvent {
    std::string timestamp;
    std::optional<std::string> session_id;
    std::optional<std::string> request_id;
    std::optional<std::string> source_ip;
    std::optional<SecuritySeverity> severity;
    double score = 0.0;
    std::vector<std::string> detected_patterns;  ///< At most kMaxReportedPatterns
    std::optional<InjectionType> injection_type;
    SecurityAction action_taken = SecurityAction::kAllow;
    std::string input_fingerprint;               ///< 8 hex characters
    std::string details;
};

/// @brief Render an alert event as JSON
nlohmann::json SerializeAlertEvent(const SecurityAlertEvent& event);

/// @brief Abstract base class for alert sinks
///
/// Implementations must be safe to call concurrently. Exceptions thrown by
/// Notify are caught and logged by the caller.
class SecurityAlerter {
public:
    virtual ~SecurityAlerter() = default;

    virtual void Notify(const SecurityAlertEvent& event) = 0;
};

/// @brief Writes alert events as JSON at warning level
class LoggingAlerter : public SecurityAlerter {
public:
    /// @param logger Target logger; defaults to GetLogger()
    explicit LoggingAlerter(std::shared_ptr<spdlog::logger> logger = nullptr);

    void Notify(const SecurityAlertEvent& event) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// @brief Configuration for asynchronous alert delivery
struct AsyncAlerterConfig {
    /// Events beyond this many pending ones are dropped
    size_t queue_capacity = 1024;
};

/// @brief Decorates an alerter with a bounded queue and a delivery thread
///
/// Example:
/// @code
///   auto alerter = std::make_shared<AsyncAlerter>(std::make_shared<LoggingAlerter>());
///   alerter->Start();
///   alerter->Notify(event);  // returns immediately
///   alerter->Stop();         // delivers what is still queued
/// @endcode
class AsyncAlerter : public SecurityAlerter {
public:
    explicit AsyncAlerter(std::shared_ptr<SecurityAlerter> delegate,
                          AsyncAlerterConfig config = {});
    ~AsyncAlerter() override;

    // Disable copy
    AsyncAlerter(const AsyncAlerter&) = delete;
    AsyncAlerter& operator=(const AsyncAlerter&) = delete;

    /// @brief Start the delivery thread
    absl::Status Start();

    /// @brief Deliver pending events and stop the delivery thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// @brief Enqueue an event; drops it when stopped or full
    void Notify(const SecurityAlertEvent& event) override;

    struct Stats {
        size_t enqueued = 0;
        size_t delivered = 0;
        size_t dropped = 0;
        size_t failed = 0;
    };
    Stats GetStats() const;

private:
    void DeliveryLoop();

    std::shared_ptr<SecurityAlerter> delegate_;
    AsyncAlerterConfig config_;

    std::queue<SecurityAlertEvent> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    Stats stats_;
    mutable std::mutex stats_mutex_;

    std::thread worker_;
    std::atomic<bool> running_{false};
};

}  // namespace promptguard::security
