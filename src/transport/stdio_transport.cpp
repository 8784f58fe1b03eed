#include "toolwire/transport/stdio_transport.hpp"
#include "toolwire/codec.hpp"
#include "toolwire/error.hpp"
#include "toolwire/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace toolwire {

namespace {

void report(const ErrorCallback& on_error, std::exception_ptr e,
            spdlog::logger& logger) {
    if (on_error) {
        on_error(std::move(e));
        return;
    }
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        logger.warn("Transport error with no handler installed: {}", ex.what());
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(Options{}) {
}

StdioTransport::StdioTransport(Options opts)
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, std::move(opts)) {
    owns_fds_ = false;
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true),
      opts_(std::move(opts)), logger_(log::or_default(opts_.logger)) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ")
                                + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    // Messages queued before start() go out as soon as they arrive.
    writer_thread_ = std::thread([this]() { write_loop(); });
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (reading_.exchange(true)) {
        return; // already running
    }
    connected_ = true;
    logger_->debug("Reading {} frames from fd {}",
                   opts_.framing == Framing::Newline ? "newline" : "Content-Length", read_fd_);
    read_loop(on_message, on_error);
    reading_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    FrameDecoder decoder(opts_.framing, opts_.max_frame);
    char chunk[4096];
    bool eof = false;

    while (true) {
        // poll() lets stop_reading() interrupt a blocking read.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::make_exception_ptr(McpTransportError(
                       std::string("poll failed: ") + std::strerror(errno))), *logger_);
            break;
        }

        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            report(on_error, std::make_exception_ptr(McpTransportError(
                       std::string("Read error: ") + std::strerror(errno))), *logger_);
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }

        decoder.feed(std::string_view(chunk, static_cast<size_t>(n)));
        while (true) {
            std::optional<std::string> frame;
            try {
                frame = decoder.next();
            } catch (const McpParseError&) {
                report(on_error, std::current_exception(), *logger_);
                continue;
            }
            if (!frame) break;
            deliver(*frame, on_message, on_error);
        }
    }

    if (eof) {
        logger_->info("End of input on fd {}", read_fd_);
        try {
            if (auto last = decoder.finish()) deliver(*last, on_message, on_error);
        } catch (const McpParseError&) {
            report(on_error, std::current_exception(), *logger_);
        }
        connected_ = false;
    }
}

void StdioTransport::deliver(const std::string& frame, const MessageCallback& on_message,
                             const ErrorCallback& on_error) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(frame);
    } catch (const McpParseError&) {
        report(on_error, std::current_exception(), *logger_);
        return;
    }
    on_message(std::move(msg));
}

void StdioTransport::write_loop() {
    bool broken = false;
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || writer_stop_;
            });
            // Stop only once everything queued has been written.
            if (write_queue_.empty()) break;
            frame = std::move(write_queue_.front());
            write_queue_.pop();
        }
        if (broken) continue;

        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                logger_->error("Write error on fd {}: {}", write_fd_, std::strerror(errno));
                broken = true;
                connected_ = false;
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    std::string frame = encode_frame(Codec::serialize(msg), opts_.framing);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(frame));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // A full pipe already holds a pending wakeup.
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            logger_->warn("Failed to wake reader: {}", std::strerror(errno));
        }
    }
}

void StdioTransport::stop_reading() {
    wake_reader();
}

void StdioTransport::shutdown() {
    if (!shutdown_requested_.exchange(true)) {
        wake_reader();
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            writer_stop_ = true;
        }
        write_cv_.notify_all();
    }
    if (writer_thread_.joinable() && writer_thread_.get_id() != std::this_thread::get_id()) {
        writer_thread_.join();
    }
    connected_ = false;
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace toolwire
