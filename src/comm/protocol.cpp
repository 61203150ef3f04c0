/// @file src/comm/protocol.cpp
/// @brief Message construction and description.

#include "birkhoff/protocol.hpp"

#include <fmt/format.h>

#include <chrono>

namespace birkhoff::comm {

const char* to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::EvaluateRequest:  return "EvaluateRequest";
        case MessageKind::EvaluateResponse: return "EvaluateResponse";
        case MessageKind::Heartbeat:        return "Heartbeat";
        case MessageKind::ShutdownRequest:  return "ShutdownRequest";
        case MessageKind::ErrorReport:      return "ErrorReport";
    }
    return "Unknown";
}

MessageKind Message::kind() const noexcept {
    // Variant alternatives are declared in the same order as below.
    static constexpr MessageKind kinds[] = {
        MessageKind::EvaluateRequest,
        MessageKind::EvaluateResponse,
        MessageKind::Heartbeat,
        MessageKind::ShutdownRequest,
        MessageKind::ErrorReport,
    };
    return kinds[body.index()];
}

Message make_evaluate_request(std::uint64_t request_id, std::size_t node_index,
                              Configuration position, std::uint32_t attempt) {
    return Message{SCHEMA_VERSION, request_id,
                   EvaluateRequest{node_index, std::move(position), attempt}};
}

Message make_evaluate_response(std::uint64_t request_id, const PotentialValue& value,
                               std::size_t worker_id, std::uint32_t attempt) {
    return Message{SCHEMA_VERSION, request_id,
                   EvaluateResponse{value.energy, value.gradient, worker_id, attempt}};
}

Message make_error_report(std::uint64_t request_id, std::size_t worker_id,
                          std::string reason, std::uint32_t attempt) {
    return Message{SCHEMA_VERSION, request_id,
                   ErrorReport{worker_id, std::move(reason), attempt}};
}

Message make_heartbeat(std::size_t worker_id, double timestamp) {
    return Message{SCHEMA_VERSION, NO_REQUEST, Heartbeat{worker_id, timestamp}};
}

Message make_shutdown_request() {
    return Message{SCHEMA_VERSION, NO_REQUEST, ShutdownRequest{}};
}

double steady_seconds() noexcept {
    return std::chrono::duration<double>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string describe(const Message& msg) {
    return fmt::format("{}(id={}, v{})", to_string(msg.kind()), msg.request_id,
                       msg.schema_version);
}

} // namespace birkhoff::comm
