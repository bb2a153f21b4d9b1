// ============================================================================
// convq/net/connection_manager.cpp - Server Transport Lifecycle
// ============================================================================

#include "convq/net/connection_manager.hpp"

#include "convq/core/logging.hpp"

#include <string_view>
#include <utility>

namespace convq {

namespace {

constexpr const char* kComponent = "server";

}  // namespace

ConnectionManager::ConnectionManager(LibuvExecutor& executor, BroadcastHub& hub, RequestHandler* handler,
                                     Options options)
    : executor_(executor), hub_(hub), handler_(handler), options_(std::move(options)) {}

ConnectionManager::~ConnectionManager() {
    Stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

std::error_code ConnectionManager::Start() {
    if (running_) return {};

    auto listener = std::make_unique<TcpListener>(executor_);
    if (auto ec = listener->Bind(options_.host, options_.port)) {
        return ec;
    }
    if (auto ec = listener->Listen()) {
        return ec;
    }

    listener_ = std::move(listener);
    port_ = listener_->Port();
    running_ = true;

    auto acceptor = MakeDetached(AcceptLoop());
    acceptor.Start();

    heartbeat_timer_ = std::make_unique<PeriodicTimer>(options_.ping_interval, executor_.GetLoop());
    auto heartbeat = MakeDetached(HeartbeatLoop());
    heartbeat.Start();

    CONVQ_LOG_INFO(kComponent, "listening on " << options_.host << ":" << port_);
    return {};
}

void ConnectionManager::Stop() {
    if (!running_) return;
    running_ = false;

    // Both resume their waiting coroutine inline, which then returns
    heartbeat_timer_->Cancel();
    listener_->Close();

    std::vector<SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    for (const auto& session : sessions) {
        session->owner = nullptr;
    }
    for (const auto& session : sessions) {
        CloseSession(session, "server stopping");
    }

    heartbeat_timer_.reset();
    listener_.reset();
    CONVQ_LOG_INFO(kComponent, "stopped, " << sessions.size() << " connections dropped");
}

size_t ConnectionManager::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::vector<ConnectionId> ConnectionManager::Connections() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<ConnectionId> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

bool ConnectionManager::Disconnect(const ConnectionId& id) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        session = it->second;
    }
    CloseSession(session, "disconnected");
    return true;
}

// ============================================================================
// Accepting
// ============================================================================

Task<void> ConnectionManager::AcceptLoop() {
    TcpListener& listener = *listener_;
    while (true) {
        auto stream = co_await listener.Accept();
        if (!stream) {
            break;
        }
        OnNewConnection(std::move(stream));
    }
    CONVQ_LOG_DEBUG(kComponent, "accept loop finished");
}

void ConnectionManager::OnNewConnection(std::unique_ptr<TcpStream> stream) {
    ConnectionId id = "c-" + std::to_string(++next_id_);
    auto outbox = std::make_shared<Outbox>(options_.outbox_capacity, &executor_);

    auto session = std::make_shared<Session>(id, std::move(stream), outbox, options_.max_frame_bytes);
    session->owner = this;
    session->last_seen = std::chrono::steady_clock::now();

    auto added = hub_.AddConnection(id, outbox);
    if (added.IsErr()) {
        CONVQ_LOG_ERROR(kComponent, "cannot register " << id << ": " << added.Error().message);
        session->stream->Close();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace(id, session);
    }

    SendFrame(*session, MakeConnected(id));
    CONVQ_LOG_DEBUG(kComponent, "connection " << id << " accepted");

    auto reader = MakeDetached(ReadLoop(session));
    reader.Start();
    auto writer = MakeDetached(WriteLoop(session));
    writer.Start();
}

// ============================================================================
// Per-connection Coroutines
// ============================================================================

Task<void> ConnectionManager::ReadLoop(SessionPtr session) {
    while (!session->closed) {
        auto chunk = co_await session->stream->Read();
        if (session->closed || !session->owner) {
            break;
        }
        ConnectionManager& owner = *session->owner;
        if (chunk.empty()) {
            owner.CloseSession(session, "peer closed");
            break;
        }

        session->framer.Feed(std::string_view(chunk.data(), chunk.size()));
        while (!session->closed) {
            auto frame = session->framer.NextFrame();
            if (frame.IsErr()) {
                owner.SendFrame(*session, MakeProtocolError(frame.Error(), "frame exceeds size limit"));
                owner.CloseSession(session, "frame too large");
                break;
            }
            if (!frame.Value()) {
                break;
            }
            if (!owner.HandleFrame(*session, *frame.Value())) {
                owner.CloseSession(session, "protocol violation");
                break;
            }
        }
    }
}

Task<void> ConnectionManager::WriteLoop(SessionPtr session) {
    while (true) {
        auto event = co_await session->outbox->Receive();
        if (!event || session->closed) {
            break;
        }
        std::string frame = EncodeFrame(EventToJson(**event));
        int written = co_await session->stream->Write(frame);
        if (written < 0) {
            if (session->owner) {
                session->owner->CloseSession(session, "write failed");
            }
            break;
        }
    }
}

// ============================================================================
// Frame Handling
// ============================================================================

bool ConnectionManager::HandleFrame(Session& session, const std::string& line) {
    session.last_seen = std::chrono::steady_clock::now();

    auto parsed = ParseMessage(line);
    if (parsed.IsErr()) {
        CONVQ_LOG_DEBUG(kComponent, session.id << " sent a malformed frame");
        SendFrame(session, MakeProtocolError(parsed.Error(), "malformed frame"));
        return true;
    }
    const Message& message = parsed.Value();

    if (message.type == msg::kPing) {
        SendFrame(session, MakePong());
    } else if (message.type == msg::kPong) {
        // last_seen already updated
    } else if (message.type == msg::kJoinGroup) {
        HandleGroupChange(session, message, true);
    } else if (message.type == msg::kLeaveGroup) {
        HandleGroupChange(session, message, false);
    } else if (message.type == msg::kRequest) {
        HandleRequest(session, message);
    } else {
        SendFrame(session, MakeProtocolError(make_error_code(Errc::ProtocolError),
                                             "unknown message type '" + message.type + "'"));
    }
    return true;
}

void ConnectionManager::HandleGroupChange(Session& session, const Message& message, bool join) {
    std::string_view op_name = join ? msg::kJoinGroup : msg::kLeaveGroup;
    auto group = OptString(message.body, "name");
    if (!group) {
        SendFrame(session, MakeGroupAck(op_name, "", EngineError::Validation("group name missing")));
        return;
    }

    auto changed = join ? hub_.Join(session.id, *group) : hub_.Leave(session.id, *group);
    std::optional<EngineError> error;
    if (changed.IsErr()) {
        error = changed.Error();
    }
    SendFrame(session, MakeGroupAck(op_name, *group, error));
}

void ConnectionManager::HandleRequest(Session& session, const Message& message) {
    auto request_id = OptInt(message.body, "requestId");
    if (!request_id || *request_id < 0) {
        SendFrame(session, MakeProtocolError(make_error_code(Errc::ProtocolError), "request without requestId"));
        return;
    }
    auto id = static_cast<uint64_t>(*request_id);

    auto op_name = OptString(message.body, "op");
    if (!op_name || op_name->empty()) {
        SendFrame(session, MakeErrorResponse(id, EngineError::Validation("request without op")));
        return;
    }
    if (!handler_) {
        SendFrame(session, MakeErrorResponse(id, EngineError::NotFound("operation", *op_name)));
        return;
    }

    Json args = Json::object();
    auto args_it = message.body.find("args");
    if (args_it != message.body.end() && args_it->is_object()) {
        args = *args_it;
    }

    auto result = handler_->Handle(*op_name, args);
    if (result.IsErr()) {
        SendFrame(session, MakeErrorResponse(id, result.Error()));
    } else {
        SendFrame(session, MakeOkResponse(id, std::move(result).Value()));
    }
}

void ConnectionManager::SendFrame(Session& session, const Json& frame) {
    if (session.closed) return;
    int status = session.stream->Send(EncodeFrame(frame));
    if (status < 0) {
        CONVQ_LOG_DEBUG(kComponent, "send to " << session.id << " failed: " << uv_strerror(status));
    }
}

// ============================================================================
// Liveness
// ============================================================================

Task<void> ConnectionManager::HeartbeatLoop() {
    PeriodicTimer& timer = *heartbeat_timer_;
    while (co_await timer.Wait()) {
        Heartbeat();
    }
}

void ConnectionManager::Heartbeat() {
    auto now = std::chrono::steady_clock::now();
    std::vector<SessionPtr> stale;
    std::vector<SessionPtr> live;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, session] : sessions_) {
            if (now - session->last_seen > options_.pong_timeout) {
                stale.push_back(session);
            } else {
                live.push_back(session);
            }
        }
    }

    for (const auto& session : stale) {
        CloseSession(session, "pong timeout");
    }
    for (const auto& session : live) {
        SendFrame(*session, MakePing());
    }
}

void ConnectionManager::CloseSession(const SessionPtr& session, const char* reason) {
    if (session->closed) return;
    session->closed = true;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session->id);
    }
    hub_.RemoveConnection(session->id);
    session->stream->Close();
    CONVQ_LOG_DEBUG(kComponent, "connection " << session->id << " closed: " << reason);
}

}  // namespace convq
