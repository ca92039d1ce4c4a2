#pragma once
#include <string>
#include <memory>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include <atomic>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include "config_manager.hpp"
#include "identity.hpp"
#include "signaling_hub.hpp"
#include "signaling_session.hpp"
#include "admin_api.hpp"

namespace monkeychat {

using WsServer = websocketpp::server<websocketpp::config::asio>;

// Transport over one websocketpp connection handle
class WebSocketTransport : public Transport {
public:
    WebSocketTransport(WsServer& server, websocketpp::connection_hdl hdl, std::string remote);

    bool send_text(const std::string& message) override;
    std::string remote_endpoint() const override { return remote_; }

private:
    WsServer& server_;
    websocketpp::connection_hdl hdl_;
    std::string remote_;
};

class SignalingServer {
public:
    static constexpr const char* WEBSOCKET_PATH = "/ws";

    SignalingServer(const ServerSettings& settings, SignalingHub& hub, const IdentityResolver& resolver);
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    // Binds, starts accepting and spawns the worker threads
    bool start();

    // Stops accepting, closes every connection and stops the I/O loop; safe from any thread
    void request_shutdown();

    // Blocks until every worker thread has exited
    void wait();

    void stop();

    // SIGINT / SIGTERM call request_shutdown()
    void shutdown_on_signals();

    size_t get_connection_count() const;

private:
    bool handle_validate(websocketpp::connection_hdl hdl);
    void handle_open(websocketpp::connection_hdl hdl);
    void handle_close(websocketpp::connection_hdl hdl);
    void handle_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg);
    void handle_http(websocketpp::connection_hdl hdl);

    std::shared_ptr<SignalingSession> find_session(websocketpp::connection_hdl hdl);

    ServerSettings settings_;
    SignalingHub& hub_;
    const IdentityResolver& resolver_;
    AdminApi admin_api_;

    WsServer server_;
    std::unique_ptr<websocketpp::lib::asio::signal_set> signals_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutting_down_{false};

    mutable std::mutex sessions_mutex_;
    std::map<websocketpp::connection_hdl, std::shared_ptr<SignalingSession>,
             std::owner_less<websocketpp::connection_hdl>> sessions_;
};

} // namespace monkeychat
