#include <graph_client/ix_http_transport.hpp>
#include <graph_util/log.hpp>
#include <ixwebsocket/IXHttpClient.h>
#include <utility>

namespace graph_client {

namespace {

TransportResponse to_transport_response(const ix::HttpResponsePtr& response) {
    TransportResponse out;
    if (!response) {
        out.error = TransportError::Other;
        out.error_message = "empty response";
        return out;
    }
    out.status_code = response->statusCode;
    out.error_message = response->errorMsg;
    switch (response->errorCode) {
    case ix::HttpErrorCode::Ok:
        out.error = TransportError::None;
        out.body = response->body;
        break;
    case ix::HttpErrorCode::Timeout:
        out.error = TransportError::Timeout;
        break;
    case ix::HttpErrorCode::Cancelled:
        out.error = TransportError::Aborted;
        break;
    case ix::HttpErrorCode::CannotConnect:
    case ix::HttpErrorCode::CannotCreateSocket:
    case ix::HttpErrorCode::SendError:
    case ix::HttpErrorCode::ReadError:
    case ix::HttpErrorCode::CannotReadStatusLine:
    case ix::HttpErrorCode::UrlMalformed:
        out.error = TransportError::Network;
        break;
    default:
        out.error = TransportError::Other;
        break;
    }
    return out;
}

} // namespace

IxHttpTransport::IxHttpTransport()
    : client_(std::make_unique<ix::HttpClient>(true))
    , pending_(std::make_shared<PendingRequests>())
{
}

IxHttpTransport::~IxHttpTransport() {
    // Flags every queued request so the worker skips or abandons them.
    pending_->clear();
    client_.reset();
}

RequestId IxHttpTransport::get(const std::string& url, const TransportOptions& options, Completion completion) {
    const RequestId id = pending_->add(std::move(completion));

    ix::HttpRequestArgsPtr args = client_->createRequest(url, ix::HttpClient::kGet);
    args->connectTimeout = options.timeout_seconds;
    args->transferTimeout = options.timeout_seconds;
    args->followRedirects = true;
    args->compress = true;
    pending_->set_abort(id, [args] { args->cancel = true; });

    std::weak_ptr<PendingRequests> weak = pending_;
    const bool queued = client_->performRequest(args, [weak, id](const ix::HttpResponsePtr& response) {
        auto pending = weak.lock();
        if (!pending) return;
        Completion done = pending->take(id);
        if (done) done(to_transport_response(response));
    });
    if (!queued) {
        graph_util::logger()->error("HTTP client refused request {}", url);
        if (Completion done = pending_->take(id)) {
            TransportResponse failed;
            failed.error = TransportError::Network;
            failed.error_message = "request could not be queued";
            done(std::move(failed));
        }
    }
    return id;
}

void IxHttpTransport::cancel(RequestId id) {
    pending_->cancel(id);
}

} // namespace graph_client
