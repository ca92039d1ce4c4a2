#include "signaling_server.hpp"
#include "utils/logger.hpp"
#include <csignal>

namespace monkeychat {

namespace {

std::string path_of(const std::string& resource) {
    return resource.substr(0, resource.find('?'));
}

} // namespace

WebSocketTransport::WebSocketTransport(WsServer& server, websocketpp::connection_hdl hdl, std::string remote)
    : server_(server)
    , hdl_(std::move(hdl))
    , remote_(std::move(remote))
{
}

bool WebSocketTransport::send_text(const std::string& message) {
    websocketpp::lib::error_code ec;
    try {
        server_.send(hdl_, message, websocketpp::frame::opcode::text, ec);
    } catch (const std::exception& e) {
        Logger::debug("WebSocketTransport", "Send to " + remote_ + " threw: " + e.what());
        return false;
    }

    if (ec) {
        Logger::debug("WebSocketTransport", "Send to " + remote_ + " failed: " + ec.message());
        return false;
    }
    return true;
}

SignalingServer::SignalingServer(const ServerSettings& settings, SignalingHub& hub, const IdentityResolver& resolver)
    : settings_(settings)
    , hub_(hub)
    , resolver_(resolver)
    , admin_api_(hub, resolver)
{
    Logger::info("SignalingServer", "Initialized on " + settings_.host + ":" + std::to_string(settings_.port));
}

SignalingServer::~SignalingServer() {
    stop();
}

bool SignalingServer::start() {
    if (running_) {
        Logger::warn("SignalingServer", "Server already running");
        return true;
    }

    try {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.set_error_channels(websocketpp::log::elevel::warn |
                                   websocketpp::log::elevel::rerror |
                                   websocketpp::log::elevel::fatal);

        server_.init_asio();
        server_.set_reuse_addr(true);
        server_.set_max_message_size(settings_.max_message_size);

        server_.set_validate_handler(
            [this](websocketpp::connection_hdl hdl) {
                return handle_validate(hdl);
            });

        server_.set_open_handler(
            [this](websocketpp::connection_hdl hdl) {
                handle_open(hdl);
            });

        server_.set_message_handler(
            [this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
                handle_message(hdl, msg);
            });

        server_.set_close_handler(
            [this](websocketpp::connection_hdl hdl) {
                handle_close(hdl);
            });

        server_.set_fail_handler(
            [this](websocketpp::connection_hdl hdl) {
                Logger::warn("SignalingServer", "WebSocket handshake failed");
                handle_close(hdl);
            });

        server_.set_http_handler(
            [this](websocketpp::connection_hdl hdl) {
                handle_http(hdl);
            });

        server_.listen(settings_.host, std::to_string(settings_.port));
        server_.start_accept();

    } catch (const std::exception& e) {
        Logger::error("SignalingServer", "Failed to start: " + std::string(e.what()));
        return false;
    }

    running_ = true;
    shutting_down_ = false;

    int thread_count = settings_.threads > 0 ? settings_.threads : 1;
    for (int i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this]() {
            try {
                server_.run();
            } catch (const std::exception& e) {
                Logger::error("SignalingServer", "I/O loop terminated: " + std::string(e.what()));
            }
        });
    }

    Logger::info("SignalingServer", "Started successfully on " + settings_.host + ":" +
                 std::to_string(settings_.port) + " with " + std::to_string(thread_count) + " thread(s)");
    return true;
}

void SignalingServer::shutdown_on_signals() {
    if (!running_) {
        Logger::warn("SignalingServer", "Signal handling requested before start()");
        return;
    }

    signals_ = std::make_unique<websocketpp::lib::asio::signal_set>(server_.get_io_service(), SIGINT, SIGTERM);
    signals_->async_wait(
        [this](const websocketpp::lib::asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            Logger::info("SignalingServer", "Received signal " + std::to_string(signal_number) + ", shutting down");
            request_shutdown();
        });
}

void SignalingServer::request_shutdown() {
    if (!running_ || shutting_down_.exchange(true)) {
        return;
    }

    Logger::info("SignalingServer", "Stopping signaling server...");

    websocketpp::lib::error_code ec;
    server_.stop_listening(ec);
    if (ec) {
        Logger::warn("SignalingServer", "Error stopping listener: " + ec.message());
    }

    std::vector<websocketpp::connection_hdl> handles;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& entry : sessions_) {
            handles.push_back(entry.first);
        }
    }

    for (auto& hdl : handles) {
        websocketpp::lib::error_code close_ec;
        server_.close(hdl, websocketpp::close::status::going_away, "Server shutting down", close_ec);
        if (close_ec) {
            Logger::debug("SignalingServer", "Error closing connection: " + close_ec.message());
        }
    }

    if (signals_) {
        try {
            signals_->cancel();
        } catch (const std::exception& e) {
            Logger::debug("SignalingServer", "Error cancelling signal wait: " + std::string(e.what()));
        }
    }
}

void SignalingServer::wait() {
    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == self) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    workers_.clear();

    std::map<websocketpp::connection_hdl, std::shared_ptr<SignalingSession>,
             std::owner_less<websocketpp::connection_hdl>> remaining;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        remaining.swap(sessions_);
    }
    for (auto& entry : remaining) {
        entry.second->handle_transport_closed();
    }

    if (running_.exchange(false)) {
        Logger::info("SignalingServer", "Stopped successfully");
    }
}

void SignalingServer::stop() {
    request_shutdown();
    wait();
}

size_t SignalingServer::get_connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool SignalingServer::handle_validate(websocketpp::connection_hdl hdl) {
    try {
        WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);
        std::string path = path_of(con->get_resource());
        if (path != WEBSOCKET_PATH) {
            Logger::warn("SignalingServer", "Rejecting WebSocket upgrade for " + path + " from " +
                         con->get_remote_endpoint());
            return false;
        }

        Logger::debug("SignalingServer", "WebSocket connection from origin: " + con->get_origin());
        return true;
    } catch (const std::exception& e) {
        Logger::error("SignalingServer", "Error validating upgrade: " + std::string(e.what()));
        return false;
    }
}

void SignalingServer::handle_open(websocketpp::connection_hdl hdl) {
    try {
        WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);
        std::string remote = con->get_remote_endpoint();

        Identity identity = resolver_.resolve(extract_query_token(con->get_resource()));
        auto transport = std::make_shared<WebSocketTransport>(server_, hdl, remote);
        auto session = hub_.open_session(transport, std::move(identity));

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[hdl] = session;
    } catch (const std::exception& e) {
        Logger::error("SignalingServer", "Error opening connection: " + std::string(e.what()));
    }
}

void SignalingServer::handle_close(websocketpp::connection_hdl hdl) {
    std::shared_ptr<SignalingSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(hdl);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    session->handle_transport_closed();

    Logger::info("SignalingServer", "Client disconnected. Total connections: " +
                 std::to_string(get_connection_count()));
}

void SignalingServer::handle_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
    std::shared_ptr<SignalingSession> session = find_session(hdl);
    if (!session) {
        Logger::warn("SignalingServer", "Message for unknown connection dropped");
        return;
    }

    try {
        session->handle_message(msg->get_payload());
    } catch (const std::exception& e) {
        Logger::error("SignalingServer", "Error handling message: " + std::string(e.what()));
    }
}

void SignalingServer::handle_http(websocketpp::connection_hdl hdl) {
    try {
        WsServer::connection_ptr con = server_.get_con_from_hdl(hdl);

        HttpRequest request;
        request.method = con->get_request().get_method();
        request.path = path_of(con->get_resource());
        request.body = con->get_request_body();
        request.headers["Authorization"] = con->get_request_header("Authorization");

        Logger::debug("SignalingServer", "HTTP " + request.method + " " + request.path + " from " +
                      con->get_remote_endpoint());

        HttpResponse response = admin_api_.handle(request);

        std::string origin = con->get_request_header("Origin");
        con->append_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
        con->append_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        con->append_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        con->append_header("Access-Control-Allow-Credentials", "true");
        con->append_header("Content-Type", response.content_type);
        for (const auto& header : response.headers) {
            con->append_header(header.first, header.second);
        }
        con->set_body(response.body);
        con->set_status(static_cast<websocketpp::http::status_code::value>(response.status));
    } catch (const std::exception& e) {
        Logger::error("SignalingServer", "Error handling HTTP request: " + std::string(e.what()));
    }
}

std::shared_ptr<SignalingSession> SignalingServer::find_session(websocketpp::connection_hdl hdl) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(hdl);
    return it == sessions_.end() ? nullptr : it->second;
}

} // namespace monkeychat
