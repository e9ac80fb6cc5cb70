#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/command_spec.hpp"

namespace hardened {

// Routes drained chunks of one child stream according to its policy and, when the
// caller asked for it, also keeps a copy of every byte.
class StreamSink {
  public:
    StreamSink(StreamKind kind, StreamPolicy policy, bool capture, int passthrough_fd);

    void consume(std::string_view chunk);

    [[nodiscard]] StreamKind kind() const noexcept;
    [[nodiscard]] bool capturing() const noexcept;
    [[nodiscard]] std::optional<std::string> take_captured();

  private:
    StreamKind kind_;
    StreamPolicy policy_;
    bool capture_;
    int passthrough_fd_;
    bool passthrough_broken_{false};
    std::string captured_;

    void forward(std::string_view chunk);
};

[[nodiscard]] int default_passthrough_fd(StreamKind kind) noexcept;

} // namespace hardened
