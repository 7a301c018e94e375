#include "collector/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace collector::network {

HttpConnection::HttpConnection(tcp::socket socket,
                               HttpRequestHandler handler,
                               asio::thread_pool& workers,
                               const HttpServerOptions& options)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , workers_(workers)
    , deadline_(socket_.get_executor())
    , request_timeout_(options.request_timeout)
    , parser_(options.payload_limit) {}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error());
                return;
            }

            if (parse_result.value()) {
                dispatch(parser_.take_request());
            } else {
                do_read();
            }
        });
}

void HttpConnection::dispatch(HttpRequest request) {
    auto self = shared_from_this();

    spdlog::debug("{} {} ({} body bytes)",
                  HttpMethodUtils::to_string(request.method), request.url, request.body.size());

    deadline_.expires_after(request_timeout_);
    deadline_.async_wait([this, self](boost::system::error_code ec) {
        if (ec || answered_) {
            return;
        }
        answered_ = true;
        spdlog::warn("Request exceeded {} ms, answering 503", request_timeout_.count());
        auto response = create_error_response(HttpStatus::SERVICE_UNAVAILABLE,
                                              "Request timed out, resubmit the chunk");
        response.set_header("Retry-After", "1");
        do_write(response);
    });

    asio::post(workers_, [this, self, request = std::move(request)]() {
        HttpResponse response;
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            spdlog::error("Handler threw exception: {}", e.what());
            response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                             "Internal server error");
        }

        asio::post(socket_.get_executor(), [this, self, response = std::move(response)]() {
            if (answered_) {
                spdlog::debug("Dropping late response with status {}", response.status_code);
                return;
            }
            answered_ = true;
            deadline_.cancel();
            do_write(response);
        });
    });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        });
}

void HttpConnection::handle_error(const Error& error) {
    spdlog::warn("Rejected request: {}", describe(error));

    const auto status = error.code == ErrorCode::PayloadTooLarge
        ? HttpStatus::PAYLOAD_TOO_LARGE
        : HttpStatus::BAD_REQUEST;
    answered_ = true;
    do_write(create_error_response(status, error.message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    response.set_header("Connection", "close");
    return response;
}

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               uint16_t port,
                               asio::thread_pool& workers,
                               HttpServerOptions options)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , workers_(workers)
    , options_(options)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on port {}", port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing acceptor failed: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_, workers_, options_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            if (acceptor_.is_open()) {
                do_accept();
            }
        });
}

} // namespace collector::network
