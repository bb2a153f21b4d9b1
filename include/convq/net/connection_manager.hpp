// ============================================================================
// convq/net/connection_manager.hpp - Server Transport Lifecycle
// ============================================================================
//
// ConnectionManager accepts TCP connections and wires each one into the
// BroadcastHub. Per connection it runs two coroutines on the loop thread:
//
//   reader   frames -> Ping/Pong, JoinGroup/LeaveGroup, Request dispatch
//   writer   Outbox::Receive() -> event frames -> socket
//
// plus one heartbeat for the whole server: every ping interval each live
// connection is pinged, and one that has been silent for longer than the
// pong timeout is dropped. Any frame counts as a sign of life.
//
// A connection that closes, errors, times out or sends an oversized frame
// is removed from the hub with all of its memberships. That is a lifecycle
// event, logged at debug level, not an error.
//
// THREADING:
// ----------
// Start(), Stop() and Disconnect() must run on the loop thread (use
// LibuvExecutor::Post from elsewhere). ConnectionCount() and Connections()
// may be called from any thread.
//
// USAGE:
// ------
//   ConnectionManager::Options options;
//   options.port = 7300;
//   ConnectionManager server(*executor, hub, &dispatcher, options);
//   executor->Post([&] { server.Start(); });
//   executor->Run();
//
// ============================================================================

#pragma once

#include "convq/core/detached_task.hpp"
#include "convq/core/task.hpp"
#include "convq/hub/broadcast_hub.hpp"
#include "convq/io/libuv_executor.hpp"
#include "convq/io/periodic_timer.hpp"
#include "convq/io/tcp.hpp"
#include "convq/net/line_framer.hpp"
#include "convq/net/protocol.hpp"
#include "convq/net/request_handler.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace convq {

struct ConnectionManagerOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 0;  // 0 picks a free port; see Port()
    std::chrono::milliseconds ping_interval{30000};
    std::chrono::milliseconds pong_timeout{90000};
    size_t outbox_capacity = 256;
    size_t max_frame_bytes = kDefaultMaxFrameBytes;
};

class ConnectionManager {
   public:
    using Options = ConnectionManagerOptions;

    // `handler` may be null; requests are then answered with NotFound
    ConnectionManager(LibuvExecutor& executor, BroadcastHub& hub, RequestHandler* handler, Options options);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Binds, listens and starts accepting. Errc::BindFailed/ListenFailed.
    std::error_code Start();

    // Stops accepting and drops every connection. The loop has to keep
    // running briefly afterwards for the writers to observe their closed
    // outboxes and finish.
    void Stop();

    [[nodiscard]] bool IsRunning() const { return running_; }

    // Bound port, valid after Start()
    [[nodiscard]] uint16_t Port() const { return port_; }

    [[nodiscard]] size_t ConnectionCount() const;
    [[nodiscard]] std::vector<ConnectionId> Connections() const;

    // Drops one connection; false if unknown
    bool Disconnect(const ConnectionId& id);

    [[nodiscard]] const Options& GetOptions() const { return options_; }

   private:
    struct Session {
        ConnectionId id;
        std::unique_ptr<TcpStream> stream;
        std::shared_ptr<Outbox> outbox;
        LineFramer framer;
        std::chrono::steady_clock::time_point last_seen;
        ConnectionManager* owner = nullptr;  // cleared on Stop()
        bool closed = false;

        Session(ConnectionId session_id, std::unique_ptr<TcpStream> tcp, std::shared_ptr<Outbox> box, size_t max_frame)
            : id(std::move(session_id)), stream(std::move(tcp)), outbox(std::move(box)), framer(max_frame) {}
    };
    using SessionPtr = std::shared_ptr<Session>;

    Task<void> AcceptLoop();
    Task<void> HeartbeatLoop();
    static Task<void> ReadLoop(SessionPtr session);
    static Task<void> WriteLoop(SessionPtr session);

    void OnNewConnection(std::unique_ptr<TcpStream> stream);

    // false when the session should be closed
    bool HandleFrame(Session& session, const std::string& line);
    void HandleGroupChange(Session& session, const Message& message, bool join);
    void HandleRequest(Session& session, const Message& message);

    void SendFrame(Session& session, const Json& frame);
    void CloseSession(const SessionPtr& session, const char* reason);
    void Heartbeat();

    LibuvExecutor& executor_;
    BroadcastHub& hub_;
    RequestHandler* handler_;
    Options options_;

    std::unique_ptr<TcpListener> listener_;
    std::unique_ptr<PeriodicTimer> heartbeat_timer_;
    bool running_ = false;
    uint16_t port_ = 0;
    uint64_t next_id_ = 0;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<ConnectionId, SessionPtr> sessions_;
};

}  // namespace convq
