// ============================================================================
// convq/io/tcp.hpp - Async TCP Networking
// ============================================================================
//
// TcpListener and TcpStream wrap libuv TCP handles as awaitables for the
// connection manager (server side) and the reconnecting client.
//
// END OF STREAM:
// --------------
// Read() yields an empty buffer once the peer has closed, the connection
// failed, or Close() was called locally. A coroutine blocked in Read() when
// Close() is called is resumed from inside Close().
//
// USAGE:
// ------
//   TcpListener listener(executor);
//   if (auto ec = listener.Bind("127.0.0.1", 0)) { ... }
//   listener.Listen();
//   while (auto stream = co_await listener.Accept()) {
//       auto bytes = co_await stream->Read();
//       if (bytes.empty()) break;            // peer gone
//       co_await stream->Write("pong\n");
//   }
//
// All members are loop-thread only.
//
// ============================================================================

#pragma once

#include <uv.h>

#include <coroutine>
#include <cstdint>
#include <memory>
#include <queue>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace convq {

class TcpStream;
class LibuvExecutor;

// ============================================================================
// TcpListener
// ============================================================================
class TcpListener {
   public:
    explicit TcpListener(LibuvExecutor& executor);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Errc::BindFailed on failure (details are logged)
    std::error_code Bind(const std::string& host, uint16_t port);

    // Errc::ListenFailed on failure
    std::error_code Listen(int backlog = 128);

    // Port actually bound (useful after binding port 0); 0 if unbound
    [[nodiscard]] uint16_t Port() const;

    // Stop accepting. A pending Accept() resumes with nullptr.
    void Close();

    [[nodiscard]] bool IsClosed() const { return closed_; }

    class AcceptAwaitable {
       public:
        explicit AcceptAwaitable(TcpListener& listener) : listener_(listener) {}

        bool await_ready() const noexcept;
        void await_suspend(std::coroutine_handle<> handle);
        std::unique_ptr<TcpStream> await_resume();

       private:
        TcpListener& listener_;
    };

    // Yields the next connection, or nullptr once the listener is closed
    AcceptAwaitable Accept() { return AcceptAwaitable(*this); }

   private:
    static void OnConnection(uv_stream_t* server, int status);

    LibuvExecutor& executor_;
    uv_tcp_t* server_;  // Heap-allocated so the close callback outlives us
    std::queue<std::unique_ptr<TcpStream>> pending_connections_;
    std::coroutine_handle<> accept_waiter_;
    bool closed_ = false;
};

// ============================================================================
// TcpStream
// ============================================================================
class TcpStream {
   public:
    explicit TcpStream(LibuvExecutor& executor);
    ~TcpStream();

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    class ConnectAwaitable {
       public:
        ConnectAwaitable(TcpStream& stream, std::string host, uint16_t port)
            : stream_(stream), host_(std::move(host)), port_(port) {}

        bool await_ready() const noexcept { return false; }
        bool await_suspend(std::coroutine_handle<> handle);
        // 0 on success, negative libuv error code otherwise
        int await_resume() const { return sync_error_ != 0 ? sync_error_ : stream_.connect_result_; }

       private:
        TcpStream& stream_;
        std::string host_;
        uint16_t port_;
        int sync_error_ = 0;
    };

    ConnectAwaitable Connect(std::string host, uint16_t port) { return ConnectAwaitable(*this, std::move(host), port); }

    class ReadAwaitable {
       public:
        explicit ReadAwaitable(TcpStream& stream) : stream_(stream) {}

        bool await_ready() const noexcept;
        void await_suspend(std::coroutine_handle<> handle);
        std::vector<char> await_resume();

       private:
        TcpStream& stream_;
    };

    // Whatever bytes are available next; empty means end of stream
    ReadAwaitable Read() { return ReadAwaitable(*this); }

    class WriteAwaitable {
       public:
        WriteAwaitable(TcpStream& stream, std::string_view data) : stream_(stream), data_(data) {}

        bool await_ready() const noexcept { return false; }
        bool await_suspend(std::coroutine_handle<> handle);
        // Bytes written, or a negative libuv error code
        int await_resume() const { return bytes_written_; }

       private:
        TcpStream& stream_;
        std::string_view data_;
        int bytes_written_ = 0;
    };

    WriteAwaitable Write(std::string_view data) { return WriteAwaitable(*this, data); }

    // Queue a write without waiting for it. Returns 0 or a negative libuv
    // error code; later failures surface as end of stream on Read().
    int Send(std::string data);

    void Close();

    [[nodiscard]] bool IsOpen() const { return initialized_ && !closed_ && !eof_; }

    void InitFromAccept(uv_stream_t* server);

   private:
    static void OnConnect(uv_connect_t* req, int status);
    static void OnRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
    static void AllocBuffer(uv_handle_t* handle, size_t suggested, uv_buf_t* buf);
    static void OnClose(uv_handle_t* handle);

    int StartWrite(std::string data, std::coroutine_handle<> waiter, int* result);

    void ResumeReader();

    LibuvExecutor& executor_;
    uv_tcp_t* socket_;  // Heap-allocated so the close callback outlives us
    bool initialized_ = false;
    bool closed_ = false;  // Close() called; handle is closing
    bool eof_ = false;     // peer closed or read error
    bool reading_ = false;

    std::vector<char> read_buffer_;
    std::coroutine_handle<> read_waiter_;

    uv_connect_t connect_req_{};
    std::coroutine_handle<> connect_waiter_;
    int connect_result_ = 0;
};

}  // namespace convq
