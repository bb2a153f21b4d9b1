// ============================================================================
// convq/net/reconnecting_client.hpp - Self-Healing Event Subscriber
// ============================================================================
//
// ReconnectingClient is the consumer side of the transport. It keeps one
// TCP connection to a ConnectionManager alive and, on every successful
// (re)connection:
//
//   1. re-joins every group it was asked to join,
//   2. re-fetches ListActiveTasks and replaces its local mirror with it,
//
// so a client that lost its connection ends up in the same state as one
// that never did. Events received afterwards keep the mirror current.
//
// STATES:
// -------
//
//   Disconnected -> Connecting -> Connected -> Reconnecting -> Connected ...
//                                                  |
//                                                  +-> Failed (attempts used up)
//   any -> Stopped (Stop())
//
// On an unexpected disconnect the client waits per its BackoffPolicy
// (3s, 6s, 12s... by default) between attempts and gives up after
// max_attempts consecutive failures, reporting Errc::ReconnectExhausted.
//
// THREADING:
// ----------
// Everything except State(), ActiveTasks() and ConnectionIdValue() runs on
// the loop thread, and so do the callbacks.
//
// ============================================================================

#pragma once

#include "convq/core/backoff.hpp"
#include "convq/core/result.hpp"
#include "convq/core/task.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/io/libuv_executor.hpp"
#include "convq/io/periodic_timer.hpp"
#include "convq/io/tcp.hpp"
#include "convq/net/line_framer.hpp"
#include "convq/net/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace convq {

enum class ClientState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Failed,
    Stopped,
};

std::string_view ToString(ClientState state);

struct ReconnectingClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    BackoffPolicy backoff;
    std::chrono::milliseconds ping_interval{30000};
    std::chrono::milliseconds pong_timeout{90000};
    size_t max_frame_bytes = kDefaultMaxFrameBytes;
};

class ReconnectingClient {
   public:
    using Options = ReconnectingClientOptions;

    // Event envelope as received ({type, taskId?, payload, timestamp})
    using EventCallback = std::function<void(const Json& event)>;
    using StateCallback = std::function<void(ClientState state)>;
    using FailureCallback = std::function<void(std::error_code error)>;
    using ResyncCallback = std::function<void(const std::vector<ConversionTask>& active)>;
    using ResponseCallback = std::function<void(Result<Json, RemoteError> response)>;

    ReconnectingClient(LibuvExecutor& executor, Options options);
    ~ReconnectingClient();

    ReconnectingClient(const ReconnectingClient&) = delete;
    ReconnectingClient& operator=(const ReconnectingClient&) = delete;

    // Set callbacks before Start()
    void OnEvent(EventCallback callback);
    void OnStateChange(StateCallback callback);
    void OnReconnectFailed(FailureCallback callback);
    void OnResync(ResyncCallback callback);

    void Start();

    // Clean shutdown: closes the connection, fails pending requests and
    // never reconnects
    void Stop();

    [[nodiscard]] ClientState State() const;
    [[nodiscard]] std::optional<std::string> ConnectionIdValue() const;

    // Remembered across reconnects; sent right away when connected
    void JoinGroup(const std::string& group);
    void LeaveGroup(const std::string& group);
    [[nodiscard]] std::vector<std::string> Groups() const;

    // Returns the request id, or 0 if not connected (the callback then runs
    // immediately with Errc::NotConnected). Pending requests fail with
    // NotConnected if the connection drops.
    uint64_t SendRequest(std::string_view op_name, Json args, ResponseCallback callback);

    // Local mirror of Pending/Converting tasks, keyed by id
    [[nodiscard]] std::map<TaskId, ConversionTask> ActiveTasks() const;

    // Successful connections so far (1 after the first connect)
    [[nodiscard]] uint64_t ConnectCount() const;

   private:
    struct Core;

    static Task<void> Run(std::shared_ptr<Core> core);
    static Task<void> HeartbeatLoop(std::shared_ptr<Core> core, std::shared_ptr<PeriodicTimer> timer,
                                    std::shared_ptr<TcpStream> stream);

    std::shared_ptr<Core> core_;
};

}  // namespace convq
