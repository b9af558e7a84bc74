// Copyright (c) 2025 The Unicity Foundation
// Loopback WebSocket server used by the transport tests

#include "network/infra/fake_robot_server.hpp"
#include <boost/beast/http.hpp>
#include <deque>

namespace almond {
namespace test {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// One accepted client. All handlers run on the server's single io thread.
class FakeRobotServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(FakeRobotServer& server, tcp::socket socket)
        : server_(server), ws_(std::move(socket)) {}

    void run() {
        // Read the upgrade request ourselves to see the target and headers
        http::async_read(ws_.next_layer(), buffer_, request_,
                         [self = shared_from_this()](const beast::error_code& ec, size_t) {
                             self->on_request(ec);
                         });
    }

    void send(const std::string& frame) {
        if (closed_) return;
        queue_.push_back(std::make_shared<std::string>(frame));
        if (!writing_) write_next();
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        ws_.async_close(websocket::close_code::normal,
                        [self = shared_from_this()](const beast::error_code&) {});
    }

private:
    void on_request(const beast::error_code& ec) {
        if (ec) return;
        server_.on_handshake(std::string(request_.target()),
                             std::string(request_[http::field::user_agent]));
        buffer_.consume(buffer_.size());
        ws_.async_accept(request_, [self = shared_from_this()](const beast::error_code& ec) {
            if (ec) return;
            self->ws_.text(true);
            self->do_read();
        });
    }

    void do_read() {
        ws_.async_read(buffer_, [self = shared_from_this()](const beast::error_code& ec, size_t) {
            self->on_read(ec);
        });
    }

    void on_read(const beast::error_code& ec) {
        if (ec) {
            closed_ = true;
            return;
        }
        std::string frame = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (auto reply = server_.on_frame(frame)) {
            send(*reply);
        }
        do_read();
    }

    void write_next() {
        writing_ = true;
        ws_.async_write(net::buffer(*queue_.front()),
                        [self = shared_from_this()](const beast::error_code& ec, size_t) {
                            self->queue_.pop_front();
                            if (ec || self->queue_.empty()) {
                                self->writing_ = false;
                                return;
                            }
                            self->write_next();
                        });
    }

    FakeRobotServer& server_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    std::deque<std::shared_ptr<std::string>> queue_;
    bool writing_ = false;
    bool closed_ = false;
};

FakeRobotServer::FakeRobotServer(FrameHandler handler)
    : acceptor_(io_context_), handler_(std::move(handler)) {}

FakeRobotServer::~FakeRobotServer() { stop(); }

bool FakeRobotServer::start() {
    boost::system::error_code ec;
    tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), 0);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return false;
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) return false;
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) return false;

    auto local = acceptor_.local_endpoint(ec);
    if (ec) return false;
    port_ = local.port();

    do_accept();
    io_thread_ = std::thread([this]() { io_context_.run(); });
    return true;
}

void FakeRobotServer::stop() {
    if (!io_thread_.joinable()) return;
    io_context_.stop();
    io_thread_.join();
    stalled_.clear();
}

void FakeRobotServer::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) return;

        auto session = std::make_shared<Session>(*this, std::move(socket));
        if (stall_handshake_) {
            stalled_.push_back(session);
        } else {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sessions_.push_back(session);
            }
            session->run();
        }
        do_accept();
    });
}

void FakeRobotServer::close_sessions() {
    net::post(io_context_, [this]() {
        std::vector<std::weak_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions = sessions_;
        }
        for (auto& weak : sessions) {
            if (auto session = weak.lock()) session->close();
        }
    });
}

void FakeRobotServer::push_to_all(const std::string& frame) {
    net::post(io_context_, [this, frame]() {
        std::vector<std::weak_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions = sessions_;
        }
        for (auto& weak : sessions) {
            if (auto session = weak.lock()) session->send(frame);
        }
    });
}

void FakeRobotServer::on_handshake(const std::string& target, const std::string& user_agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    handshake_targets_.push_back(target);
    user_agents_.push_back(user_agent);
}

std::optional<std::string> FakeRobotServer::on_frame(const std::string& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        received_frames_.push_back(frame);
    }
    if (!handler_) return std::nullopt;
    return handler_(frame);
}

size_t FakeRobotServer::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handshake_targets_.size();
}

std::vector<std::string> FakeRobotServer::handshake_targets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handshake_targets_;
}

std::vector<std::string> FakeRobotServer::user_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_agents_;
}

std::vector<std::string> FakeRobotServer::received_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_frames_;
}

} // namespace test
} // namespace almond
