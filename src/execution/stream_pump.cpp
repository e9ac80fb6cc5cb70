#include "execution/stream_pump.hpp"

#include <array>
#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace hardened {

StreamPump::StreamPump(UniqueFd source, StreamSink &sink, int cancel_fd, std::function<void()> on_finished)
    : source_(std::move(source)), sink_(sink), cancel_fd_(cancel_fd), on_finished_(std::move(on_finished)) {}

StreamPump::~StreamPump() { join(); }

void StreamPump::start() { thread_ = std::thread([this] { run(); }); }

void StreamPump::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::exception_ptr StreamPump::error() const noexcept { return error_; }

void StreamPump::run() noexcept {
    try {
        pump();
    } catch (const std::exception &) {
        if (!error_) {
            error_ = std::current_exception();
        }
    }

    source_.reset();

    if (on_finished_) {
        on_finished_();
    }
}

void StreamPump::pump() {
    std::array<char, kChunkSize> buffer{};

    while (true) {
        std::array<pollfd, 2> polls{};
        polls[0].fd = source_.get();
        polls[0].events = POLLIN;
        polls[1].fd = cancel_fd_;
        polls[1].events = POLLIN;

        if (::poll(polls.data(), polls.size(), -1) == -1) {
            if (errno == EINTR) {
                continue;
            }

            throw std::system_error(errno, std::generic_category(), "poll failed");
        }

        if ((polls[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            const ssize_t bytes = ::read(source_.get(), buffer.data(), buffer.size());
            if (bytes > 0) {
                deliver(buffer.data(), static_cast<std::size_t>(bytes));
                continue;
            }

            if (bytes == 0) {
                return;
            }

            if (errno != EINTR && errno != EAGAIN) {
                throw std::system_error(errno, std::generic_category(), "read failed");
            }

            continue;
        }

        if ((polls[0].revents & POLLNVAL) != 0) {
            throw std::system_error(EBADF, std::generic_category(), "stream descriptor is not open");
        }

        if ((polls[1].revents & (POLLIN | POLLHUP)) != 0) {
            drain_buffered();
            return;
        }
    }
}

void StreamPump::drain_buffered() {
    const int flags = ::fcntl(source_.get(), F_GETFL);
    if (flags == -1 || ::fcntl(source_.get(), F_SETFL, flags | O_NONBLOCK) == -1) {
        throw std::system_error(errno, std::generic_category(), "fcntl failed");
    }

    std::array<char, kChunkSize> buffer{};

    while (true) {
        const ssize_t bytes = ::read(source_.get(), buffer.data(), buffer.size());
        if (bytes > 0) {
            deliver(buffer.data(), static_cast<std::size_t>(bytes));
            continue;
        }

        if (bytes == 0 || errno == EAGAIN) {
            return;
        }

        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "read failed");
        }
    }
}

void StreamPump::deliver(const char *data, std::size_t size) noexcept {
    // after a failing callback the stream is still drained so the child never blocks
    if (error_) {
        return;
    }

    try {
        sink_.consume(std::string_view(data, size));
    } catch (...) {
        error_ = std::current_exception();
    }
}

} // namespace hardened
