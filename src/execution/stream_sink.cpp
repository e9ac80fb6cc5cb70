#include "execution/stream_sink.hpp"

#include <cerrno>
#include <type_traits>
#include <utility>
#include <variant>

#include <unistd.h>

namespace hardened {

StreamSink::StreamSink(StreamKind kind, StreamPolicy policy, bool capture, int passthrough_fd)
    : kind_(kind), policy_(std::move(policy)), capture_(capture), passthrough_fd_(passthrough_fd) {}

void StreamSink::consume(std::string_view chunk) {
    if (chunk.empty()) {
        return;
    }

    if (capture_) {
        captured_.append(chunk);
    }

    std::visit(
        [&](auto &active) {
            using Policy = std::decay_t<decltype(active)>;

            if constexpr (std::is_same_v<Policy, stream::Passthrough>) {
                forward(chunk);
            } else if constexpr (std::is_same_v<Policy, stream::Callback>) {
                if (active.callback) {
                    active.callback(chunk);
                }
            }
        },
        policy_);
}

StreamKind StreamSink::kind() const noexcept { return kind_; }

bool StreamSink::capturing() const noexcept { return capture_; }

std::optional<std::string> StreamSink::take_captured() {
    if (!capture_) {
        return std::nullopt;
    }

    return std::move(captured_);
}

void StreamSink::forward(std::string_view chunk) {
    if (passthrough_broken_) {
        return;
    }

    while (!chunk.empty()) {
        const ssize_t written = ::write(passthrough_fd_, chunk.data(), chunk.size());
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }

            // the parent's own stream is gone; keep draining the child regardless
            passthrough_broken_ = true;
            return;
        }

        chunk.remove_prefix(static_cast<std::size_t>(written));
    }
}

int default_passthrough_fd(StreamKind kind) noexcept {
    return kind == StreamKind::Stdout ? STDOUT_FILENO : STDERR_FILENO;
}

} // namespace hardened
