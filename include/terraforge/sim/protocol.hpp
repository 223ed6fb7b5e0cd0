#pragma once

/**
 * @file protocol.hpp
 * @brief Request and response messages between a host and the compute core
 *
 * Per request the core emits zero or more ProgressResponse messages followed
 * by exactly one terminal message: ResultResponse, or ErrorResponse when the
 * request was rejected.
 */

#include "terraforge/sim/field_set.hpp"
#include "terraforge/sim/sim_params.hpp"
#include "terraforge/worldgen/brush.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace terraforge {

// ============================================================================
// Requests (host -> core)
// ============================================================================

struct InitializeRequest {
    uint32_t seed = 1;
    SimParams params;
};

/// Full regeneration keeping the current seed
struct RecomputeRequest {
    SimParams params;
};

struct EditRequest {
    int x = 0;
    int y = 0;
    worldgen::Brush brush;
};

using Request = std::variant<InitializeRequest, RecomputeRequest, EditRequest>;

[[nodiscard]] std::string_view requestName(const Request& request);

// ============================================================================
// Responses (core -> host)
// ============================================================================

enum class Phase : uint8_t {
    Height,
    Climate,
    Rivers,
};

/// "height", "climate" or "rivers"
[[nodiscard]] std::string_view phaseName(Phase phase);

struct ProgressResponse {
    Phase phase = Phase::Height;
    float fraction = 0.0f;  ///< 0 at phase start, 1 at phase end
};

/// Immutable copy of the layers as they stood when the request completed
struct ResultResponse {
    std::shared_ptr<const FieldSet> fields;
};

struct ErrorResponse {
    std::string message;
};

using Response = std::variant<ProgressResponse, ResultResponse, ErrorResponse>;

/// Result and error end a request; progress does not
[[nodiscard]] inline bool isTerminal(const Response& response) {
    return !std::holds_alternative<ProgressResponse>(response);
}

using ResponseSink = std::function<void(Response)>;

}  // namespace terraforge
