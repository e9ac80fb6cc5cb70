#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "execution/stream_sink.hpp"

using hardened::default_passthrough_fd;
using hardened::StreamKind;
using hardened::StreamSink;
namespace stream = hardened::stream;

namespace {

std::string read_all(int fd) {
    std::string content;
    char buffer[256];
    for (;;) {
        const ssize_t bytes = read(fd, buffer, sizeof(buffer));
        if (bytes <= 0) {
            break;
        }
        content.append(buffer, static_cast<std::size_t>(bytes));
    }
    return content;
}

void test_capture_policy_keeps_bytes_only_when_requested() {
    StreamSink capturing(StreamKind::Stdout, stream::Capture{}, true, -1);
    capturing.consume("abc");
    capturing.consume("");
    capturing.consume("def");
    assert(capturing.capturing());
    assert(capturing.take_captured() == std::optional<std::string>("abcdef"));

    StreamSink not_capturing(StreamKind::Stderr, stream::Capture{}, false, -1);
    not_capturing.consume("ignored");
    assert(!not_capturing.take_captured().has_value());
}

void test_callback_sees_chunks_in_order_and_capture_still_collects() {
    std::vector<std::string> seen;
    StreamSink sink(StreamKind::Stderr,
                    stream::Callback{[&seen](std::string_view chunk) { seen.emplace_back(chunk); }},
                    true,
                    -1);

    sink.consume("one");
    sink.consume("two");

    assert((seen == std::vector<std::string>{"one", "two"}));
    assert(sink.take_captured() == std::optional<std::string>("onetwo"));
    assert(sink.kind() == StreamKind::Stderr);
}

void test_passthrough_writes_to_descriptor() {
    int fds[2];
    assert(pipe(fds) == 0);

    {
        StreamSink sink(StreamKind::Stdout, stream::Passthrough{}, true, fds[1]);
        sink.consume("hello ");
        sink.consume("world");
        assert(sink.take_captured() == std::optional<std::string>("hello world"));
    }

    close(fds[1]);
    assert(read_all(fds[0]) == "hello world");
    close(fds[0]);
}

void test_passthrough_to_closed_descriptor_keeps_capturing() {
    int fds[2];
    assert(pipe(fds) == 0);
    close(fds[0]);
    close(fds[1]);

    // fds[1] is no longer open, so every write fails with EBADF
    StreamSink sink(StreamKind::Stdout, stream::Passthrough{}, true, fds[1]);
    sink.consume("first");
    sink.consume("second");
    assert(sink.take_captured() == std::optional<std::string>("firstsecond"));
}

void test_discard_drops_everything_not_captured() {
    StreamSink sink(StreamKind::Stdout, stream::Discard{}, false, -1);
    sink.consume("gone");
    assert(!sink.take_captured().has_value());
}

void test_default_passthrough_targets() {
    assert(default_passthrough_fd(StreamKind::Stdout) == STDOUT_FILENO);
    assert(default_passthrough_fd(StreamKind::Stderr) == STDERR_FILENO);
}

} // namespace

int main() {
    test_capture_policy_keeps_bytes_only_when_requested();
    test_callback_sees_chunks_in_order_and_capture_still_collects();
    test_passthrough_writes_to_descriptor();
    test_passthrough_to_closed_descriptor_keeps_capturing();
    test_discard_drops_everything_not_captured();
    test_default_passthrough_targets();
    return 0;
}
