#pragma once

#include "collector/network/http_parser.hpp"
#include "collector/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <memory>

namespace collector::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

struct HttpServerOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::uint64_t payload_limit = 100ULL * 1024 * 1024;
};

/**
 * @brief One client connection driven by the io_context
 *
 * Reading and parsing happen on the event loop. The parsed request is handed
 * to the worker pool; its response is posted back to the loop and written.
 * If the worker does not answer within the request timeout a 503 is written
 * instead and the late response is dropped.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   HttpRequestHandler handler,
                   asio::thread_pool& workers,
                   const HttpServerOptions& options);

    void start();

private:
    void do_read();
    void dispatch(HttpRequest request);
    void do_write(const HttpResponse& response);
    void handle_error(const Error& error);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    asio::thread_pool& workers_;
    asio::steady_timer deadline_;
    std::chrono::milliseconds request_timeout_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
    bool answered_ = false;  // touched only on the event loop
};

/**
 * @brief Event-driven HTTP/1.1 server on one io_context
 *
 * No thread per connection: the acceptor and all connection I/O share the
 * caller's io_context, request handlers run on the supplied thread pool.
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context,
                   uint16_t port,
                   asio::thread_pool& workers,
                   HttpServerOptions options = {});

    void set_handler(HttpRequestHandler handler);

    // Stops accepting; connections already open finish normally.
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    asio::thread_pool& workers_;
    HttpServerOptions options_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace collector::network
