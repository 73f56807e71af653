#pragma once

#include <graph_client/http_transport.hpp>
#include <graph_client/pending_requests.hpp>
#include <memory>

namespace ix {
class HttpClient;
}

namespace graph_client {

// HttpTransport over IXWebSocket's asynchronous HttpClient (one worker thread).
// Call ix::initNetSystem() once before use.
class IxHttpTransport : public HttpTransport {
public:
    IxHttpTransport();
    ~IxHttpTransport() override;

    RequestId get(const std::string& url, const TransportOptions& options, Completion completion) override;
    void cancel(RequestId id) override;

private:
    std::unique_ptr<ix::HttpClient> client_;
    std::shared_ptr<PendingRequests> pending_;
};

} // namespace graph_client
