// ============================================================================
// convq/io/tcp.cpp - Async TCP Networking Implementation
// ============================================================================

#include "convq/io/tcp.hpp"

#include "convq/core/error.hpp"
#include "convq/core/logging.hpp"
#include "convq/io/libuv_executor.hpp"

#include <arpa/inet.h>

#include <cstring>

namespace convq {

namespace {

void FreeTcpHandle(uv_handle_t* handle) {
    delete reinterpret_cast<uv_tcp_t*>(handle);
}

// One in-flight write; owns the bytes until libuv is done with them
struct WriteRequest {
    uv_write_t req;
    std::string data;
    std::coroutine_handle<> waiter;
    int* result = nullptr;
};

void OnWriteDone(uv_write_t* req, int status) {
    auto* write_req = static_cast<WriteRequest*>(req->data);
    if (write_req->result != nullptr) {
        *write_req->result = status < 0 ? status : static_cast<int>(write_req->data.size());
    }
    auto waiter = write_req->waiter;
    delete write_req;
    if (waiter) {
        waiter.resume();
    }
}

}  // namespace

// ============================================================================
// TcpListener
// ============================================================================

TcpListener::TcpListener(LibuvExecutor& executor) : executor_(executor) {
    server_ = new uv_tcp_t;
    uv_tcp_init(executor_.GetLoop(), server_);
    server_->data = this;
}

TcpListener::~TcpListener() {
    Close();
}

std::error_code TcpListener::Bind(const std::string& host, uint16_t port) {
    sockaddr_in addr{};
    int result = uv_ip4_addr(host.c_str(), port, &addr);
    if (result == 0) {
        result = uv_tcp_bind(server_, reinterpret_cast<const sockaddr*>(&addr), 0);
    }
    if (result != 0) {
        CONVQ_LOG_ERROR("tcp", "bind " << host << ":" << port << " failed: " << uv_strerror(result));
        return make_error_code(Errc::BindFailed);
    }
    return {};
}

std::error_code TcpListener::Listen(int backlog) {
    int result = uv_listen(reinterpret_cast<uv_stream_t*>(server_), backlog, OnConnection);
    if (result != 0) {
        CONVQ_LOG_ERROR("tcp", "listen failed: " << uv_strerror(result));
        return make_error_code(Errc::ListenFailed);
    }
    return {};
}

uint16_t TcpListener::Port() const {
    if (closed_) return 0;
    sockaddr_storage storage{};
    int len = sizeof(storage);
    if (uv_tcp_getsockname(server_, reinterpret_cast<sockaddr*>(&storage), &len) != 0) {
        return 0;
    }
    if (storage.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
    }
    if (storage.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
    }
    return 0;
}

void TcpListener::Close() {
    if (closed_) return;
    closed_ = true;
    uv_close(reinterpret_cast<uv_handle_t*>(server_), FreeTcpHandle);

    // Connections accepted but never handed out are dropped
    while (!pending_connections_.empty()) {
        pending_connections_.pop();
    }

    if (accept_waiter_) {
        auto waiter = accept_waiter_;
        accept_waiter_ = nullptr;
        waiter.resume();
    }
}

void TcpListener::OnConnection(uv_stream_t* server, int status) {
    auto* self = static_cast<TcpListener*>(server->data);
    if (status < 0) {
        CONVQ_LOG_WARN("tcp", "incoming connection error: " << uv_strerror(status));
        return;
    }

    auto stream = std::make_unique<TcpStream>(self->executor_);
    stream->InitFromAccept(server);
    if (!stream->IsOpen()) {
        return;
    }
    self->pending_connections_.push(std::move(stream));

    if (self->accept_waiter_) {
        auto waiter = self->accept_waiter_;
        self->accept_waiter_ = nullptr;
        waiter.resume();
    }
}

bool TcpListener::AcceptAwaitable::await_ready() const noexcept {
    return listener_.closed_ || !listener_.pending_connections_.empty();
}

void TcpListener::AcceptAwaitable::await_suspend(std::coroutine_handle<> handle) {
    listener_.accept_waiter_ = handle;
}

std::unique_ptr<TcpStream> TcpListener::AcceptAwaitable::await_resume() {
    if (listener_.closed_ || listener_.pending_connections_.empty()) {
        return nullptr;
    }
    auto stream = std::move(listener_.pending_connections_.front());
    listener_.pending_connections_.pop();
    return stream;
}

// ============================================================================
// TcpStream - Lifecycle
// ============================================================================

TcpStream::TcpStream(LibuvExecutor& executor) : executor_(executor) {
    socket_ = new uv_tcp_t;
    std::memset(socket_, 0, sizeof(*socket_));
}

TcpStream::~TcpStream() {
    if (closed_) return;
    closed_ = true;
    if (initialized_) {
        if (reading_) {
            uv_read_stop(reinterpret_cast<uv_stream_t*>(socket_));
        }
        uv_close(reinterpret_cast<uv_handle_t*>(socket_), FreeTcpHandle);
    } else {
        delete socket_;
    }
}

void TcpStream::InitFromAccept(uv_stream_t* server) {
    uv_tcp_init(server->loop, socket_);
    socket_->data = this;
    initialized_ = true;

    int result = uv_accept(server, reinterpret_cast<uv_stream_t*>(socket_));
    if (result != 0) {
        CONVQ_LOG_WARN("tcp", "accept failed: " << uv_strerror(result));
        Close();
    }
}

void TcpStream::Close() {
    if (closed_) return;
    closed_ = true;

    if (!initialized_) {
        delete socket_;
        socket_ = nullptr;
        ResumeReader();
        return;
    }

    if (reading_) {
        uv_read_stop(reinterpret_cast<uv_stream_t*>(socket_));
        reading_ = false;
    }
    uv_close(reinterpret_cast<uv_handle_t*>(socket_), OnClose);
    ResumeReader();
}

void TcpStream::OnClose(uv_handle_t* handle) {
    FreeTcpHandle(handle);
}

void TcpStream::ResumeReader() {
    if (read_waiter_) {
        auto waiter = read_waiter_;
        read_waiter_ = nullptr;
        waiter.resume();
    }
}

// ============================================================================
// TcpStream - Connect
// ============================================================================

bool TcpStream::ConnectAwaitable::await_suspend(std::coroutine_handle<> handle) {
    if (stream_.closed_ || stream_.initialized_) {
        sync_error_ = UV_EINVAL;
        return false;
    }

    uv_tcp_init(stream_.executor_.GetLoop(), stream_.socket_);
    stream_.socket_->data = &stream_;
    stream_.initialized_ = true;

    sockaddr_in addr{};
    int result = uv_ip4_addr(host_.c_str(), port_, &addr);
    if (result != 0) {
        sync_error_ = result;
        return false;
    }

    stream_.connect_waiter_ = handle;
    stream_.connect_req_.data = &stream_;
    result = uv_tcp_connect(&stream_.connect_req_, stream_.socket_, reinterpret_cast<const sockaddr*>(&addr), OnConnect);
    if (result != 0) {
        stream_.connect_waiter_ = nullptr;
        sync_error_ = result;
        return false;
    }
    return true;
}

void TcpStream::OnConnect(uv_connect_t* req, int status) {
    auto* self = static_cast<TcpStream*>(req->data);
    self->connect_result_ = status;
    if (status < 0) {
        self->eof_ = true;
    }

    if (self->connect_waiter_) {
        auto waiter = self->connect_waiter_;
        self->connect_waiter_ = nullptr;
        waiter.resume();
    }
}

// ============================================================================
// TcpStream - Read
// ============================================================================

bool TcpStream::ReadAwaitable::await_ready() const noexcept {
    return !stream_.read_buffer_.empty() || stream_.eof_ || stream_.closed_ || !stream_.initialized_;
}

void TcpStream::ReadAwaitable::await_suspend(std::coroutine_handle<> handle) {
    stream_.read_waiter_ = handle;
    stream_.reading_ = true;
    int result = uv_read_start(reinterpret_cast<uv_stream_t*>(stream_.socket_), AllocBuffer, OnRead);
    if (result != 0) {
        stream_.reading_ = false;
        stream_.eof_ = true;
        // Resumed through the executor: we are still inside await_suspend
        stream_.read_waiter_ = nullptr;
        stream_.executor_.Schedule(handle);
    }
}

std::vector<char> TcpStream::ReadAwaitable::await_resume() {
    if (stream_.reading_ && !stream_.closed_) {
        uv_read_stop(reinterpret_cast<uv_stream_t*>(stream_.socket_));
    }
    stream_.reading_ = false;

    std::vector<char> result;
    std::swap(result, stream_.read_buffer_);
    return result;
}

void TcpStream::AllocBuffer(uv_handle_t* handle, size_t suggested, uv_buf_t* buf) {
    auto* self = static_cast<TcpStream*>(handle->data);
    // Appends, so bytes from several callbacks before the reader resumes survive
    size_t size = suggested > 0 ? suggested : 4096;
    size_t current = self->read_buffer_.size();
    self->read_buffer_.resize(current + size);
    buf->base = self->read_buffer_.data() + current;
    buf->len = size;
}

void TcpStream::OnRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* self = static_cast<TcpStream*>(stream->data);

    size_t unused = buf != nullptr ? buf->len : 0;
    if (nread > 0) {
        unused -= static_cast<size_t>(nread);
    }
    self->read_buffer_.resize(self->read_buffer_.size() - unused);

    if (nread == 0) {
        return;  // EAGAIN; keep waiting
    }
    if (nread < 0) {
        if (nread != UV_EOF) {
            CONVQ_LOG_DEBUG("tcp", "read error: " << uv_strerror(static_cast<int>(nread)));
        }
        self->eof_ = true;
        uv_read_stop(stream);
        self->reading_ = false;
    }
    self->ResumeReader();
}

// ============================================================================
// TcpStream - Write
// ============================================================================

int TcpStream::StartWrite(std::string data, std::coroutine_handle<> waiter, int* result) {
    if (!IsOpen()) {
        return UV_ENOTCONN;
    }

    auto* write_req = new WriteRequest;
    write_req->data = std::move(data);
    write_req->waiter = waiter;
    write_req->result = result;
    write_req->req.data = write_req;

    uv_buf_t buf = uv_buf_init(write_req->data.data(), static_cast<unsigned int>(write_req->data.size()));
    int status = uv_write(&write_req->req, reinterpret_cast<uv_stream_t*>(socket_), &buf, 1, OnWriteDone);
    if (status != 0) {
        delete write_req;
    }
    return status;
}

bool TcpStream::WriteAwaitable::await_suspend(std::coroutine_handle<> handle) {
    int status = stream_.StartWrite(std::string(data_), handle, &bytes_written_);
    if (status != 0) {
        bytes_written_ = status;
        return false;
    }
    return true;
}

int TcpStream::Send(std::string data) {
    return StartWrite(std::move(data), nullptr, nullptr);
}

}  // namespace convq
