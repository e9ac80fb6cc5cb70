#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <thread>

#include "execution/file_descriptor.hpp"
#include "execution/stream_sink.hpp"

namespace hardened {

// Drains one pipe on its own thread until EOF, handing every chunk to a sink.
// When the cancel descriptor becomes readable, whatever is already buffered in the
// pipe is read without blocking and the pump stops.
class StreamPump {
  public:
    static constexpr std::size_t kChunkSize = 4096;

    StreamPump(UniqueFd source, StreamSink &sink, int cancel_fd, std::function<void()> on_finished);
    ~StreamPump();

    StreamPump(const StreamPump &) = delete;
    StreamPump &operator=(const StreamPump &) = delete;

    void start();
    void join();

    // First failure seen by the pump: an exception thrown by a callback or a read error.
    [[nodiscard]] std::exception_ptr error() const noexcept;

  private:
    UniqueFd source_;
    StreamSink &sink_;
    int cancel_fd_;
    std::function<void()> on_finished_;
    std::exception_ptr error_;
    std::thread thread_;

    void run() noexcept;
    void pump();
    void drain_buffered();
    void deliver(const char *data, std::size_t size) noexcept;
};

} // namespace hardened
