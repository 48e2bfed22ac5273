#pragma once

/// @file detector.h
/// @brief Interface for prompt injection detectors

#include <string_view>

#include <absl/status/statusor.h>

#include "security/types.h"

namespace promptguard::security {

/// @brief Abstract base class for injection detectors
///
/// Implementations must be side-effect free and safe to call concurrently.
class InjectionDetector {
public:
    virtual ~InjectionDetector() = default;

    /// @brief Classify a prompt
    /// @param text Prompt text (may be empty)
    /// @param context Request metadata and optional retrieval parameters
    virtual absl::StatusOr<DetectionResult> Detect(
        std::string_view text, const DetectionContext& context) = 0;
};

}  // namespace promptguard::security
