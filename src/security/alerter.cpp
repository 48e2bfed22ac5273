/// @file alerter.cpp
/// @brief Alert serialization and delivery

#include "security/alerter.h"

#include <chrono>

#include "common/error.h"
#include "common/logging.h"
#include "security/audit.h"

namespace promptguard::security {

namespace {

using json = nlohmann::json;

template <typename T>
json OptionalString(const std::optional<T>& value, std::string (*convert)(T)) {
    return value.has_value() ? json(convert(*value)) : json(nullptr);
}

json OptionalString(const std::optional<std::string>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

}  // namespace

json SerializeAlertEvent(const SecurityAlertEvent& event) {
    json j;
    j["timestamp"] = event.timestamp;
    j["session_id"] = OptionalString(event.session_id);
    j["request_id"] = OptionalString(event.request_id);
    j["source_ip"] = OptionalString(event.source_ip);
    j["severity"] = OptionalString(event.severity, SeverityToString);
    j["score"] = event.score;
    j["detected_patterns"] = CapPatterns(event.detected_patterns);
    j["injection_type"] = OptionalString(event.injection_type, InjectionTypeToString);
    j["action_taken"] = ActionToString(event.action_taken);
    j["input_fingerprint"] = event.input_fingerprint;
    j["details"] = event.details;
    return j;
}

// ============================================================================
// LoggingAlerter
// ============================================================================

LoggingAlerter::LoggingAlerter(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : GetLogger()) {}

void LoggingAlerter::Notify(const SecurityAlertEvent& event) {
    logger_->warn("security_alert {}", DumpJson(SerializeAlertEvent(event)));
}

// ============================================================================
// AsyncAlerter
// ============================================================================

AsyncAlerter::AsyncAlerter(std::shared_ptr<SecurityAlerter> delegate,
                           AsyncAlerterConfig config)
    : delegate_(std::move(delegate)), config_(config) {}

AsyncAlerter::~AsyncAlerter() {
    Stop();
}

absl::Status AsyncAlerter::Start() {
    if (!delegate_) {
        return FailedPreconditionError("AsyncAlerter has no delegate");
    }
    if (config_.queue_capacity == 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "Alert queue capacity must be positive");
    }

    if (running_.load()) {
        return absl::OkStatus();
    }

    running_.store(true);
    worker_ = std::thread(&AsyncAlerter::DeliveryLoop, this);
    return absl::OkStatus();
}

void AsyncAlerter::Stop() {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncAlerter::Notify(const SecurityAlertEvent& event) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load() || queue_.size() >= config_.queue_capacity) {
            dropped = true;
        } else {
            queue_.push(event);
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (dropped) {
            stats_.dropped++;
        } else {
            stats_.enqueued++;
        }
    }

    if (dropped) {
        PROMPTGUARD_LOG_WARN("Security alert dropped (fingerprint={}, running={})",
                             event.input_fingerprint, running_.load());
    } else {
        queue_cv_.notify_one();
    }
}

AsyncAlerter::Stats AsyncAlerter::GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void AsyncAlerter::DeliveryLoop() {
    while (true) {
        SecurityAlertEvent event;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::seconds(1), [this] {
                return !queue_.empty() || !running_.load();
            });

            if (!running_.load() && queue_.empty()) {
                break;
            }

            if (queue_.empty()) {
                continue;
            }

            event = std::move(queue_.front());
            queue_.pop();
        }

        bool delivered = false;
        try {
            delegate_->Notify(event);
            delivered = true;
        } catch (const std::exception& e) {
            PROMPTGUARD_LOG_ERROR("Security alert delivery failed: {}", e.what());
        }

        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (delivered) {
            stats_.delivered++;
        } else {
            stats_.failed++;
        }
    }
}

}  // namespace promptguard::security
