#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "wslgate/gateway/frame.hpp"
#include "wslgate/gateway/protocol.hpp"

namespace wslgate::gateway {

namespace net = boost::asio;
using boost::asio::awaitable;

/// Handles one wire line: parse, dispatch, build the reply.
/// Returns nullopt for notifications and blank lines.
auto handle_message(Protocol& protocol, std::string_view line)
    -> awaitable<std::optional<ResponseFrame>>;

/// Newline-delimited JSON-RPC over a pair of file descriptors.
///
/// The input may be a pipe, a terminal or a regular file (`serve < frames`).
/// Every request is dispatched in its own coroutine, so a slow tool call
/// does not hold up the ones behind it. Replies go through a single writer
/// so frames never interleave on the output descriptor.
class StdioServer {
public:
    /// Takes ownership of both descriptors.
    StdioServer(net::io_context& ioc, std::shared_ptr<Protocol> protocol,
                int in_fd, int out_fd);

    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /// Serves until end of input and all in-flight requests have replied.
    auto run() -> awaitable<void>;

    /// Stops reading; pending replies are still flushed.
    void stop();

private:
    auto read_loop() -> awaitable<void>;
    auto read_some(std::string& buffer) -> awaitable<boost::system::error_code>;
    auto write_loop() -> awaitable<void>;
    auto serve_request(std::string line) -> awaitable<void>;

    void enqueue(std::string frame);
    void notify_writer();

    net::io_context& ioc_;
    std::shared_ptr<Protocol> protocol_;
    int in_fd_;
    std::optional<net::posix::stream_descriptor> input_;  // unset for regular files
    net::posix::stream_descriptor output_;

    std::deque<std::string> outbox_;
    net::steady_timer outbox_signal_;
    size_t in_flight_ = 0;
    bool input_closed_ = false;
};

} // namespace wslgate::gateway
