#pragma once

/// @file include/birkhoff/protocol.hpp
/// @brief Messages exchanged between the coordinator and the evaluation
///        workers.
///
/// # Module: Communication Codes
///
/// Every message is an envelope {schema_version, request_id, body}. The body
/// is one of five kinds:
///
/// | Kind             | Direction            | request_id            |
/// |------------------|----------------------|-----------------------|
/// | EvaluateRequest  | coordinator → worker | tag of the work item  |
/// | EvaluateResponse | worker → coordinator | echoed from request   |
/// | ErrorReport      | worker → coordinator | echoed from request   |
/// | Heartbeat        | worker → coordinator | 0                     |
/// | ShutdownRequest  | coordinator → worker | 0                     |
///
/// Retries of a work item reuse its request id, so whichever attempt answers
/// first satisfies it and every later answer is recognised as a duplicate.
/// Responses and error reports echo the attempt number of the request they
/// answer; an error report from a superseded attempt is stale and ignored.
/// A worker acknowledges a ShutdownRequest with a final Heartbeat.

#include "birkhoff/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace birkhoff::comm {

/// Bumped whenever a message layout changes. Messages carrying any other
/// version are discarded on receipt.
inline constexpr std::uint32_t SCHEMA_VERSION = 2;

/// Id reserved for messages that answer no request.
inline constexpr std::uint64_t NO_REQUEST = 0;

enum class MessageKind : std::uint8_t {
    EvaluateRequest  = 4,
    EvaluateResponse = 5,
    Heartbeat        = 7,
    ShutdownRequest  = 8,
    ErrorReport      = 10,
};

[[nodiscard]] const char* to_string(MessageKind kind) noexcept;

// ─── Bodies ───────────────────────────────────────────────────────────────────

struct EvaluateRequest {
    std::size_t   node_index;  ///< index into the round's work items
    Configuration position;
    std::uint32_t attempt;     ///< 1 for the first send, 2 for the first retry …
};

struct EvaluateResponse {
    double        potential;   ///< V(x)
    Displacement  gradient;    ///< ∇V(x)
    std::size_t   worker_id;
    std::uint32_t attempt;     ///< echoed from the request
};

struct Heartbeat {
    std::size_t worker_id;
    double      timestamp;     ///< seconds on the steady clock
};

struct ShutdownRequest {};

struct ErrorReport {
    std::size_t   worker_id;
    std::string   reason;
    std::uint32_t attempt;     ///< echoed from the request
};

using MessageBody = std::variant<EvaluateRequest, EvaluateResponse, Heartbeat,
                                 ShutdownRequest, ErrorReport>;

// ─── Envelope ─────────────────────────────────────────────────────────────────

struct Message {
    std::uint32_t schema_version = SCHEMA_VERSION;
    std::uint64_t request_id     = NO_REQUEST;
    MessageBody   body;

    [[nodiscard]] MessageKind kind() const noexcept;
};

[[nodiscard]] Message make_evaluate_request(std::uint64_t request_id,
                                            std::size_t node_index,
                                            Configuration position,
                                            std::uint32_t attempt);

[[nodiscard]] Message make_evaluate_response(std::uint64_t request_id,
                                             const PotentialValue& value,
                                             std::size_t worker_id,
                                             std::uint32_t attempt);

[[nodiscard]] Message make_error_report(std::uint64_t request_id,
                                        std::size_t worker_id,
                                        std::string reason,
                                        std::uint32_t attempt);

[[nodiscard]] Message make_heartbeat(std::size_t worker_id, double timestamp);

[[nodiscard]] Message make_shutdown_request();

/// Seconds on the steady clock; the time base of Heartbeat timestamps.
[[nodiscard]] double steady_seconds() noexcept;

/// One-line description for log output.
[[nodiscard]] std::string describe(const Message& msg);

} // namespace birkhoff::comm
