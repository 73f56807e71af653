#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace graph_client {

enum class RequestStatus { Pending, Success, Error, Aborted };
enum class ErrorKind { Network, Http, Timeout, Aborted, Unknown };

const char* request_status_name(RequestStatus status);
const char* error_kind_name(ErrorKind kind);

// One fetch attempt. started/completed are epoch milliseconds.
struct RequestInfo {
    std::uint64_t generation = 0;
    std::string target;
    RequestStatus status = RequestStatus::Pending;
    std::int64_t started_at_ms = 0;
    std::optional<std::int64_t> completed_at_ms;
    std::optional<std::int64_t> duration_ms;
    std::optional<int> http_status;
    std::string error_message;
    std::optional<ErrorKind> error_kind;
};

// One-line summary for logs and the diagnostics panel.
std::string describe(const RequestInfo& info);

} // namespace graph_client
