// ============================================================================
// convq/net/reconnecting_client.cpp - Self-Healing Event Subscriber
// ============================================================================

#include "convq/net/reconnecting_client.hpp"

#include "convq/core/detached_task.hpp"
#include "convq/core/error.hpp"
#include "convq/core/logging.hpp"
#include "convq/engine/task_status.hpp"

#include <mutex>
#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "client";

}  // namespace

std::string_view ToString(ClientState state) {
    switch (state) {
        case ClientState::Disconnected:
            return "Disconnected";
        case ClientState::Connecting:
            return "Connecting";
        case ClientState::Connected:
            return "Connected";
        case ClientState::Reconnecting:
            return "Reconnecting";
        case ClientState::Failed:
            return "Failed";
        case ClientState::Stopped:
            return "Stopped";
    }
    return "Unknown";
}

// ============================================================================
// Core - state shared between the client object and its coroutines
// ============================================================================
struct ReconnectingClient::Core {
    Core(LibuvExecutor& loop_executor, Options client_options)
        : executor(loop_executor), options(std::move(client_options)) {}

    LibuvExecutor& executor;
    Options options;

    // Loop thread only
    bool started = false;
    bool stopping = false;
    bool connected = false;
    std::shared_ptr<TcpStream> stream;
    std::shared_ptr<PeriodicTimer> heartbeat;
    std::shared_ptr<PeriodicTimer> retry_timer;
    std::chrono::steady_clock::time_point last_seen;
    std::map<uint64_t, ResponseCallback> pending;
    uint64_t next_request_id = 0;

    EventCallback on_event;
    StateCallback on_state;
    FailureCallback on_failure;
    ResyncCallback on_resync;

    // Readable from any thread
    mutable std::mutex mutex;
    ClientState state = ClientState::Disconnected;
    std::optional<std::string> connection_id;
    std::set<std::string> groups;
    std::map<TaskId, ConversionTask> mirror;
    uint64_t connects = 0;

    void SetState(ClientState next) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == next) return;
            state = next;
        }
        CONVQ_LOG_DEBUG(kComponent, "state -> " << ToString(next));
        if (on_state) on_state(next);
    }

    void Send(const Json& frame) {
        if (!connected || !stream) return;
        int status = stream->Send(EncodeFrame(frame));
        if (status < 0) {
            CONVQ_LOG_DEBUG(kComponent, "send failed: " << uv_strerror(status));
        }
    }

    uint64_t Request(std::string_view op_name, Json args, ResponseCallback callback) {
        uint64_t id = ++next_request_id;
        pending.emplace(id, std::move(callback));
        Send(MakeRequest(id, op_name, std::move(args)));
        return id;
    }

    void FailPending(const char* message) {
        auto failed = std::exchange(pending, {});
        for (auto& [id, callback] : failed) {
            if (callback) callback(Err(RemoteError{Errc::NotConnected, message}));
        }
    }

    void RequestResync() {
        Request(op::kListActiveTasks, Json::object(), [this](Result<Json, RemoteError> response) {
            if (response.IsErr()) {
                CONVQ_LOG_WARN(kComponent, "resync failed: " << response.Error().message);
                return;
            }
            std::vector<ConversionTask> active;
            const Json& tasks = response.Value();
            if (tasks.is_array()) {
                for (const auto& item : tasks) {
                    auto task = TaskFromJson(item);
                    if (task.IsOk() && IsActive(task.Value().status)) {
                        active.push_back(std::move(task).Value());
                    }
                }
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                mirror.clear();
                for (const auto& task : active) {
                    mirror.emplace(task.id, task);
                }
            }
            CONVQ_LOG_INFO(kComponent, "resynced " << active.size() << " active tasks");
            if (on_resync) on_resync(active);
        });
    }

    void ApplyEvent(EventKind kind, const Json& envelope) {
        if (kind == EventKind::SpaceStatusChanged) return;
        auto payload = envelope.find("payload");
        if (payload == envelope.end()) return;
        auto task = TaskFromJson(*payload);
        if (task.IsErr()) {
            CONVQ_LOG_DEBUG(kComponent, "event without a usable task payload");
            return;
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (kind == EventKind::Deleted || IsTerminal(task.Value().status)) {
            mirror.erase(task.Value().id);
        } else {
            mirror.insert_or_assign(task.Value().id, task.Value());
        }
    }

    void HandleResponse(const Json& body) {
        auto request_id = OptInt(body, "requestId");
        if (!request_id) return;
        auto it = pending.find(static_cast<uint64_t>(*request_id));
        if (it == pending.end()) return;
        ResponseCallback callback = std::move(it->second);
        pending.erase(it);
        if (!callback) return;

        if (OptBool(body, "ok").value_or(false)) {
            auto result = body.find("result");
            callback(Ok(result != body.end() ? *result : Json()));
        } else {
            auto error = body.find("error");
            callback(Err(error != body.end() ? RemoteErrorFromJson(*error) : RemoteError{}));
        }
    }

    void HandleFrame(const std::string& line) {
        last_seen = std::chrono::steady_clock::now();

        auto parsed = ParseMessage(line);
        if (parsed.IsErr()) {
            CONVQ_LOG_DEBUG(kComponent, "ignoring malformed frame");
            return;
        }
        const Message& message = parsed.Value();

        if (message.type == msg::kConnected) {
            std::lock_guard<std::mutex> lock(mutex);
            connection_id = OptString(message.body, "connectionId");
        } else if (message.type == msg::kPing) {
            Send(MakePong());
        } else if (message.type == msg::kPong) {
            // last_seen already updated
        } else if (message.type == msg::kGroupAck) {
            if (!OptBool(message.body, "success").value_or(false)) {
                CONVQ_LOG_WARN(kComponent, OptString(message.body, "op").value_or("group change") << " "
                                                                                            << OptString(message.body, "name").value_or("")
                                                                                            << " rejected");
            }
        } else if (message.type == msg::kResponse) {
            HandleResponse(message.body);
        } else if (message.type == msg::kError) {
            CONVQ_LOG_WARN(kComponent, "server error: " << OptString(message.body, "message").value_or(""));
        } else if (auto kind = EventKindFromTypeName(message.type)) {
            ApplyEvent(*kind, message.body);
            if (on_event) on_event(message.body);
        } else {
            CONVQ_LOG_DEBUG(kComponent, "ignoring frame of type " << message.type);
        }
    }
};

// ============================================================================
// Public API
// ============================================================================

ReconnectingClient::ReconnectingClient(LibuvExecutor& executor, Options options)
    : core_(std::make_shared<Core>(executor, std::move(options))) {}

ReconnectingClient::~ReconnectingClient() {
    Stop();
    // Coroutines still parked on a timer keep the core alive; they must not
    // call back into whoever owned this client.
    core_->on_event = nullptr;
    core_->on_state = nullptr;
    core_->on_failure = nullptr;
    core_->on_resync = nullptr;
}

void ReconnectingClient::OnEvent(EventCallback callback) {
    core_->on_event = std::move(callback);
}

void ReconnectingClient::OnStateChange(StateCallback callback) {
    core_->on_state = std::move(callback);
}

void ReconnectingClient::OnReconnectFailed(FailureCallback callback) {
    core_->on_failure = std::move(callback);
}

void ReconnectingClient::OnResync(ResyncCallback callback) {
    core_->on_resync = std::move(callback);
}

void ReconnectingClient::Start() {
    if (core_->started) return;
    core_->started = true;
    auto runner = MakeDetached(Run(core_));
    runner.Start();
}

void ReconnectingClient::Stop() {
    auto core = core_;
    if (core->stopping) return;
    core->stopping = true;

    // Each of these resumes the run loop inline if it is parked there
    if (auto timer = core->retry_timer) timer->Cancel();
    if (auto heartbeat = core->heartbeat) heartbeat->Cancel();
    if (auto stream = core->stream) stream->Close();

    core->FailPending("client stopped");
    core->SetState(ClientState::Stopped);
}

ClientState ReconnectingClient::State() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->state;
}

std::optional<std::string> ReconnectingClient::ConnectionIdValue() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->connection_id;
}

void ReconnectingClient::JoinGroup(const std::string& group) {
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->groups.insert(group);
    }
    core_->Send(MakeJoinGroup(group));
}

void ReconnectingClient::LeaveGroup(const std::string& group) {
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->groups.erase(group);
    }
    core_->Send(MakeLeaveGroup(group));
}

std::vector<std::string> ReconnectingClient::Groups() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return {core_->groups.begin(), core_->groups.end()};
}

uint64_t ReconnectingClient::SendRequest(std::string_view op_name, Json args, ResponseCallback callback) {
    if (!core_->connected) {
        if (callback) callback(Err(RemoteError{Errc::NotConnected, "not connected"}));
        return 0;
    }
    return core_->Request(op_name, std::move(args), std::move(callback));
}

std::map<TaskId, ConversionTask> ReconnectingClient::ActiveTasks() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->mirror;
}

uint64_t ReconnectingClient::ConnectCount() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->connects;
}

// ============================================================================
// Coroutines
// ============================================================================

Task<void> ReconnectingClient::Run(std::shared_ptr<Core> core) {
    Backoff backoff(core->options.backoff);
    const Options& options = core->options;

    while (!core->stopping) {
        core->SetState(core->connects == 0 && backoff.Attempts() == 0 ? ClientState::Connecting
                                                                       : ClientState::Reconnecting);

        auto stream = std::make_shared<TcpStream>(core->executor);
        core->stream = stream;
        int status = co_await stream->Connect(options.host, options.port);
        if (core->stopping) {
            break;
        }

        if (status == 0) {
            backoff.Reset();
            core->connected = true;
            core->last_seen = std::chrono::steady_clock::now();
            {
                std::lock_guard<std::mutex> lock(core->mutex);
                ++core->connects;
            }
            core->SetState(ClientState::Connected);
            CONVQ_LOG_INFO(kComponent, "connected to " << options.host << ":" << options.port);

            for (const auto& group : std::set<std::string>(core->groups)) {
                core->Send(MakeJoinGroup(group));
            }
            core->RequestResync();

            auto heartbeat = std::make_shared<PeriodicTimer>(options.ping_interval, core->executor.GetLoop());
            core->heartbeat = heartbeat;
            auto pinger = MakeDetached(HeartbeatLoop(core, heartbeat, stream));
            pinger.Start();

            LineFramer framer(options.max_frame_bytes);
            bool healthy = true;
            while (healthy && !core->stopping) {
                auto chunk = co_await stream->Read();
                if (chunk.empty()) {
                    break;
                }
                framer.Feed(std::string_view(chunk.data(), chunk.size()));
                while (true) {
                    auto frame = framer.NextFrame();
                    if (frame.IsErr()) {
                        CONVQ_LOG_WARN(kComponent, "server sent an oversized frame");
                        healthy = false;
                        break;
                    }
                    if (!frame.Value()) {
                        break;
                    }
                    core->HandleFrame(*frame.Value());
                }
            }

            core->connected = false;
            heartbeat->Cancel();
            core->heartbeat.reset();
            stream->Close();
            {
                std::lock_guard<std::mutex> lock(core->mutex);
                core->connection_id.reset();
            }
            core->FailPending("connection lost");
            if (core->stopping) {
                break;
            }
            CONVQ_LOG_WARN(kComponent, "connection lost, reconnecting");
        } else {
            CONVQ_LOG_WARN(kComponent, "connect to " << options.host << ":" << options.port
                                                      << " failed: " << uv_strerror(status));
        }
        core->stream.reset();

        auto delay = backoff.NextDelay();
        if (!delay) {
            core->SetState(ClientState::Failed);
            CONVQ_LOG_ERROR(kComponent, "reconnect failed after " << backoff.Attempts() << " attempts");
            if (core->on_failure) core->on_failure(make_error_code(Errc::ReconnectExhausted));
            co_return;
        }
        core->SetState(ClientState::Reconnecting);
        CONVQ_LOG_DEBUG(kComponent, "retry " << backoff.Attempts() << " in " << delay->count() << "ms");

        auto retry = std::make_shared<PeriodicTimer>(*delay, core->executor.GetLoop());
        core->retry_timer = retry;
        bool fired = co_await retry->Wait();
        retry->Cancel();
        core->retry_timer.reset();
        if (!fired) {
            break;
        }
    }
    core->stream.reset();
    core->SetState(ClientState::Stopped);
}

Task<void> ReconnectingClient::HeartbeatLoop(std::shared_ptr<Core> core, std::shared_ptr<PeriodicTimer> timer,
                                             std::shared_ptr<TcpStream> stream) {
    while (co_await timer->Wait()) {
        if (!stream->IsOpen()) {
            break;
        }
        if (std::chrono::steady_clock::now() - core->last_seen > core->options.pong_timeout) {
            CONVQ_LOG_WARN(kComponent, "no traffic for " << core->options.pong_timeout.count() << "ms, dropping connection");
            stream->Close();
            break;
        }
        int status = stream->Send(EncodeFrame(MakePing()));
        if (status < 0) {
            CONVQ_LOG_DEBUG(kComponent, "ping failed: " << uv_strerror(status));
            break;
        }
    }
}

}  // namespace convq
