#include "cacheworker/protocol/HttpServer.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/network/EventLoop.h"

#include <exception>
#include <functional>

namespace cacheworker {
namespace protocol {

namespace {

class TcpTransport : public Transport {
public:
    explicit TcpTransport(const network::TcpConnectionPtr& conn)
        : conn_(conn), name_(conn->name()) {}

    void Send(const std::string& data) override {
        if (auto conn = conn_.lock()) conn->Send(data);
    }
    void Shutdown() override {
        if (auto conn = conn_.lock()) conn->Shutdown();
    }
    void ForceClose() override {
        if (auto conn = conn_.lock()) conn->ForceClose();
    }
    void PauseReading() override {
        if (auto conn = conn_.lock()) conn->PauseReading();
    }
    void ResumeReading() override {
        if (auto conn = conn_.lock()) conn->ResumeReading();
    }
    std::string name() const override { return name_; }

private:
    std::weak_ptr<network::TcpConnection> conn_;
    std::string name_;
};

} // namespace

HttpServer::HttpServer(network::EventLoop* loop,
                       const network::InetAddress& listenAddr,
                       const std::string& name,
                       network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option),
      workerThreads_(0) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::OnConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::OnMessage, this, std::placeholders::_1, std::placeholders::_2));
}

HttpServer::~HttpServer() = default;

void HttpServer::Start() {
    if (workerThreads_ > 0 && !workers_) {
        workers_.reset(new network::EventLoopThreadPool(server_.getLoop(), server_.name() + "-worker"));
        workers_->SetThreadNum(workerThreads_);
        workers_->Start();
    }
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << listenAddress().toIpPort()
             << " routes=" << router_.size() << " workers=" << workerThreads_;
    server_.Start();
}

void HttpServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_INFO << "HttpServer - new connection " << conn->name() << " from " << conn->peerAddress().toIpPort();
        network::EventLoop* ioLoop = conn->getLoop();
        auto pump = std::make_shared<ConnectionPump>(
            std::unique_ptr<Transport>(new TcpTransport(conn)),
            [this, ioLoop](const std::shared_ptr<ConnectionPump>& p, const ConnectionPump::RequestPtr& req) {
                OnRequest(p, req, ioLoop);
            });
        conn->SetContext(pump);
    } else {
        LOG_INFO << "HttpServer - connection " << conn->name() << " is down, in=" << conn->bytesRead()
                 << " out=" << conn->bytesWritten();
        auto* pump = std::any_cast<std::shared_ptr<ConnectionPump>>(conn->GetMutableContext());
        if (pump != nullptr && *pump) {
            (*pump)->OnDisconnected();
        }
    }
}

void HttpServer::OnMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf) {
    auto* pump = std::any_cast<std::shared_ptr<ConnectionPump>>(conn->GetMutableContext());
    if (pump == nullptr || !*pump) {
        LOG_ERROR << "HttpServer - connection " << conn->name() << " has no pump, dropping input";
        buf->RetrieveAll();
        conn->ForceClose();
        return;
    }
    // The pump may close the connection and reset its context; hold a reference.
    std::shared_ptr<ConnectionPump> guard = *pump;
    guard->OnData(buf);
}

void HttpServer::OnRequest(const std::shared_ptr<ConnectionPump>& pump,
                           const ConnectionPump::RequestPtr& request,
                           network::EventLoop* ioLoop) {
    auto task = [this, pump, request, ioLoop]() {
        try {
            auto response = std::make_shared<HttpResponse>(router_.Dispatch(*request));
            ioLoop->RunInLoop([pump, response]() {
                pump->OnResponse(std::move(*response));
            });
        } catch (const std::exception& e) {
            std::string error = e.what();
            ioLoop->RunInLoop([pump, error]() {
                pump->OnFault(error);
            });
        }
    };

    if (workers_) {
        workers_->GetNextLoop()->QueueInLoop(std::move(task));
    } else {
        task();
    }
}

} // namespace protocol
} // namespace cacheworker
