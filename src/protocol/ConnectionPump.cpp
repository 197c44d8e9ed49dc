#include "cacheworker/protocol/ConnectionPump.h"
#include "cacheworker/common/Logger.h"

#include <exception>

namespace cacheworker {
namespace protocol {

ConnectionPump::ConnectionPump(std::unique_ptr<Transport> transport, Dispatcher dispatcher)
    : transport_(std::move(transport)),
      dispatcher_(std::move(dispatcher)),
      name_(transport_->name()),
      state_(kAwaitingRequest),
      advancing_(false),
      requestsServed_(0) {
}

ConnectionPump::~ConnectionPump() {
    LOG_DEBUG << "ConnectionPump::dtor[" << name_ << "] served=" << requestsServed_
              << " state=" << StateToString(state_);
}

const char* ConnectionPump::StateToString(State s) {
    switch (s) {
        case kAwaitingRequest: return "kAwaitingRequest";
        case kRequestReceived: return "kRequestReceived";
        case kDispatched: return "kDispatched";
        case kResponseWritten: return "kResponseWritten";
        case kClosed: return "kClosed";
        default: return "unknown";
    }
}

void ConnectionPump::OnData(const char* data, size_t len) {
    if (state_ == kClosed) {
        return;
    }
    input_.Append(data, len);
    Advance();
}

void ConnectionPump::OnData(network::Buffer* buf) {
    if (state_ == kClosed) {
        buf->RetrieveAll();
        return;
    }
    input_.Append(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();
    Advance();
}

// Decodes and dispatches buffered requests until one is in flight or the
// buffer runs dry. Synchronous completions re-enter through OnResponse, which
// only flips the state back; the loop here picks up the next request.
void ConnectionPump::Advance() {
    if (advancing_) {
        return;
    }
    advancing_ = true;
    while (state_ == kAwaitingRequest && input_.ReadableBytes() > 0) {
        HttpContext::Status status = HttpContext::Status::kNeedMore;
        try {
            status = context_.Feed(&input_);
        } catch (const std::exception& e) {
            input_.RetrieveAll();
            OnFault(std::string("decoder: ") + e.what());
            break;
        }
        if (status == HttpContext::Status::kError) {
            RejectMalformed(context_.error());
            break;
        }
        if (status == HttpContext::Status::kNeedMore) {
            break;
        }

        auto request = std::make_shared<HttpRequest>(context_.TakeRequest());
        state_ = kRequestReceived;
        current_ = request;

        LOG_DEBUG << "ConnectionPump[" << name_ << "] " << request->methodString() << " " << request->target();

        transport_->PauseReading();
        state_ = kDispatched;
        try {
            dispatcher_(shared_from_this(), current_);
        } catch (const std::exception& e) {
            OnFault(e.what());
        }
    }
    advancing_ = false;
}

void ConnectionPump::OnResponse(HttpResponse response) {
    if (state_ != kDispatched) {
        LOG_DEBUG << "ConnectionPump[" << name_ << "] dropping response in state " << StateToString(state_);
        return;
    }
    const bool keepAlive = current_->keepAlive();
    response.setVersion(current_->getVersion());
    WriteResponse(response, keepAlive);
    state_ = kResponseWritten;
    ++requestsServed_;
    current_.reset();

    if (!keepAlive) {
        Close(true);
        return;
    }
    state_ = kAwaitingRequest;
    transport_->ResumeReading();
    Advance();
}

void ConnectionPump::OnFault(const std::string& error) {
    if (state_ == kClosed) {
        return;
    }
    LOG_ERROR << "event=connection_fault conn=" << name_
              << " state=" << StateToString(state_)
              << " request=\"" << (current_ ? current_->methodString() + " " + current_->target() : std::string("-"))
              << "\" error=\"" << error << "\"";
    current_.reset();
    Close(false);
}

void ConnectionPump::OnDisconnected() {
    if (state_ != kClosed) {
        LOG_DEBUG << "ConnectionPump[" << name_ << "] peer disconnected in state " << StateToString(state_);
    }
    state_ = kClosed;
    current_.reset();
}

void ConnectionPump::WriteResponse(HttpResponse& response, bool keepAlive) {
    response.setCloseConnection(!keepAlive);
    network::Buffer out;
    response.appendHeadersToBuffer(&out);
    if (response.isFullyBuffered()) {
        out.Append(response.body());
        transport_->Send(out.RetrieveAllAsString());
    } else {
        transport_->Send(out.RetrieveAllAsString());
        transport_->Send(*response.payload());
    }
}

void ConnectionPump::RejectMalformed(const std::string& reason) {
    LOG_WARN << "ConnectionPump[" << name_ << "] malformed HTTP request (" << reason << "), closing";
    HttpResponse response = HttpResponse::PlainText(HttpResponse::k400BadRequest, "Malformed HTTP request");
    WriteResponse(response, false);
    context_.Reset();
    input_.RetrieveAll();
    Close(true);
}

void ConnectionPump::Close(bool graceful) {
    if (state_ == kClosed) {
        return;
    }
    state_ = kClosed;
    if (graceful) {
        // Keep reading so the peer's FIN is noticed after our half-close.
        transport_->ResumeReading();
        transport_->Shutdown();
    } else {
        transport_->ForceClose();
    }
}

} // namespace protocol
} // namespace cacheworker
