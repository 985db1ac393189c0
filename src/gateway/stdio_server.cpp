#include "wslgate/gateway/stdio_server.hpp"

#include "wslgate/core/logger.hpp"
#include "wslgate/core/utils.hpp"

#include <array>
#include <cerrno>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <sys/stat.h>
#include <unistd.h>

namespace wslgate::gateway {

auto handle_message(Protocol& protocol, std::string_view line)
    -> awaitable<std::optional<ResponseFrame>> {
    if (utils::trim(line).empty()) {
        co_return std::nullopt;
    }

    auto frame = parse_frame(line);
    if (!frame) {
        LOG_WARN("Bad frame: {}", frame.error().what());
        co_return make_error_response(nullptr, frame.error());
    }

    auto result = co_await protocol.dispatch(*frame);

    if (frame->is_notification()) {
        if (!result) {
            LOG_DEBUG("Notification {} failed: {}", frame->method, result.error().what());
        }
        co_return std::nullopt;
    }

    if (!result) {
        LOG_WARN("Request {} failed: {}", frame->method, result.error().what());
        co_return make_error_response(*frame->id, result.error());
    }
    co_return make_response(*frame->id, std::move(*result));
}

StdioServer::StdioServer(net::io_context& ioc, std::shared_ptr<Protocol> protocol,
                         int in_fd, int out_fd)
    : ioc_(ioc)
    , protocol_(std::move(protocol))
    , in_fd_(in_fd)
    , output_(ioc, out_fd)
    , outbox_signal_(ioc) {
    // epoll rejects regular files, so those are read directly.
    struct stat st {};
    if (::fstat(in_fd, &st) == 0 && S_ISREG(st.st_mode)) {
        LOG_DEBUG("Input fd {} is a regular file", in_fd);
    } else {
        input_.emplace(ioc, in_fd);
    }
}

StdioServer::~StdioServer() {
    if (!input_) ::close(in_fd_);
}

auto StdioServer::run() -> awaitable<void> {
    LOG_INFO("Serving JSON-RPC on stdio");
    net::co_spawn(ioc_, read_loop(), net::detached);
    co_await write_loop();
    LOG_INFO("Input closed, server stopping");
}

void StdioServer::stop() {
    if (input_closed_) return;
    input_closed_ = true;
    if (input_) {
        boost::system::error_code ec;
        input_->cancel(ec);
    }
    notify_writer();
}

auto StdioServer::read_some(std::string& buffer)
    -> awaitable<boost::system::error_code> {
    std::array<char, 4096> chunk{};
    boost::system::error_code ec;

    if (input_) {
        auto n = co_await input_->async_read_some(
            net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
        buffer.append(chunk.data(), n);
        co_return ec;
    }

    // Reads from a regular file do not block. Yield after each one so
    // dispatched requests keep making progress.
    auto n = ::read(in_fd_, chunk.data(), chunk.size());
    if (n > 0) {
        buffer.append(chunk.data(), static_cast<size_t>(n));
    } else if (n == 0) {
        ec = net::error::eof;
    } else if (errno != EINTR) {
        ec.assign(errno, boost::system::system_category());
    }
    co_await net::post(ioc_, net::use_awaitable);
    co_return ec;
}

auto StdioServer::read_loop() -> awaitable<void> {
    std::string buffer;
    while (!input_closed_) {
        auto newline = buffer.find('\n');
        if (newline == std::string::npos) {
            auto ec = co_await read_some(buffer);
            if (!ec) continue;

            if (ec != net::error::eof && ec != net::error::operation_aborted) {
                LOG_WARN("stdin read failed: {}", ec.message());
            }
            // A final line without a newline is still a message.
            if (ec == net::error::eof && !buffer.empty()) {
                ++in_flight_;
                net::co_spawn(ioc_, serve_request(std::move(buffer)), net::detached);
            }
            break;
        }

        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        ++in_flight_;
        net::co_spawn(ioc_, serve_request(std::move(line)), net::detached);
    }

    input_closed_ = true;
    notify_writer();
}

auto StdioServer::serve_request(std::string line) -> awaitable<void> {
    try {
        auto reply = co_await handle_message(*protocol_, line);
        if (reply) enqueue(serialize_frame(*reply));
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error while serving request: {}", e.what());
        enqueue(serialize_frame(make_error_response(nullptr, -32603, "Internal error")));
    }
    --in_flight_;
    notify_writer();
}

void StdioServer::enqueue(std::string frame) {
    outbox_.push_back(std::move(frame));
    notify_writer();
}

void StdioServer::notify_writer() {
    outbox_signal_.cancel();
}

auto StdioServer::write_loop() -> awaitable<void> {
    for (;;) {
        while (!outbox_.empty()) {
            auto frame = std::move(outbox_.front());
            outbox_.pop_front();
            frame.push_back('\n');

            boost::system::error_code ec;
            co_await net::async_write(output_, net::buffer(frame),
                                      net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_ERROR("stdout write failed: {}", ec.message());
                stop();
                co_return;
            }
        }

        if (input_closed_ && in_flight_ == 0) {
            co_return;
        }

        // Wait for notification (timer cancel) from a producer.
        outbox_signal_.expires_at(net::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await outbox_signal_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

} // namespace wslgate::gateway
