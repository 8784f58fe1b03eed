#pragma once
#include "transport.hpp"
#include "../framing.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

namespace toolwire {

/// Reads framed JSON-RPC from a file descriptor (stdin by default) and
/// writes to another (stdout). Reading happens on the thread that calls
/// start(); writes go through a queue drained by a writer thread.
class StdioTransport : public ITransport {
public:
    struct Options {
        Framing framing = Framing::Newline;
        size_t max_frame = FrameDecoder::kDefaultMaxFrame;
        std::shared_ptr<spdlog::logger> logger;
    };

    /// Use the process stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Use the given descriptors, which the transport then owns (for testing).
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void stop_reading() override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void deliver(const std::string& frame, const MessageCallback& on_message,
                 const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Options opts_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<bool> reading_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;
    bool writer_stop_{false};

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in the read loop
};

} // namespace toolwire
