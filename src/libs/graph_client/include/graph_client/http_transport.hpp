#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace graph_client {

enum class TransportError {
    None,
    Network,
    Timeout,
    Aborted,
    Other
};

struct TransportResponse {
    TransportError error = TransportError::None;
    int status_code = 0;
    std::string body;
    std::string error_message;
};

struct TransportOptions {
    int timeout_seconds = 30;
};

using RequestId = std::uint64_t;

// Asynchronous GET seam. Completions may run on any thread; after cancel(id)
// the completion for that id is never delivered.
class HttpTransport {
public:
    using Completion = std::function<void(TransportResponse)>;

    virtual ~HttpTransport() = default;
    virtual RequestId get(const std::string& url, const TransportOptions& options, Completion completion) = 0;
    virtual void cancel(RequestId id) = 0;
};

} // namespace graph_client
