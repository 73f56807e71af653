#include <graph_client/request_info.hpp>
#include <spdlog/fmt/fmt.h>

namespace graph_client {

const char* request_status_name(RequestStatus status) {
    switch (status) {
    case RequestStatus::Pending: return "pending";
    case RequestStatus::Success: return "success";
    case RequestStatus::Error: return "error";
    case RequestStatus::Aborted: return "aborted";
    }
    return "pending";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Network: return "network";
    case ErrorKind::Http: return "http";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Aborted: return "aborted";
    case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::string describe(const RequestInfo& info) {
    std::string out = fmt::format("#{} {} {}", info.generation, request_status_name(info.status), info.target);
    if (info.http_status) out += fmt::format(" http={}", *info.http_status);
    if (info.duration_ms) out += fmt::format(" {}ms", *info.duration_ms);
    if (info.error_kind) out += fmt::format(" [{}] {}", error_kind_name(*info.error_kind), info.error_message);
    return out;
}

} // namespace graph_client
