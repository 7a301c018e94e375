#include <gtest/gtest.h>
#include "collector/network/http_server_asio.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <future>
#include <thread>

using namespace collector::network;
using namespace std::chrono_literals;

namespace {

class HttpServerAsioTest : public ::testing::Test {
protected:
    void start(HttpRequestHandler handler, std::chrono::milliseconds timeout) {
        HttpServerOptions options;
        options.request_timeout = timeout;
        server_ = std::make_unique<HttpServerAsio>(io_context_, 0, workers_, options);
        server_->set_handler(std::move(handler));
        loop_ = std::thread([this] { io_context_.run(); });
    }

    void TearDown() override {
        release_.set_value();
        workers_.join();
        if (server_) {
            server_->stop();
        }
        io_context_.stop();
        if (loop_.joinable()) {
            loop_.join();
        }
    }

    // Sends one request and reads until the server closes the connection.
    std::string round_trip(const std::string& request) {
        asio::io_context client;
        tcp::socket socket(client);
        socket.connect(tcp::endpoint(asio::ip::address_v4::loopback(), server_->get_port()));
        asio::write(socket, asio::buffer(request));

        std::string response;
        boost::system::error_code ec;
        asio::read(socket, asio::dynamic_buffer(response), ec);
        EXPECT_EQ(ec, asio::error::eof);
        return response;
    }

    asio::io_context io_context_;
    asio::thread_pool workers_{2};
    std::unique_ptr<HttpServerAsio> server_;
    std::thread loop_;
    std::promise<void> release_;
};

HttpResponse ok() {
    HttpResponse response(HttpStatus::OK);
    response.set_body(std::string("done"));
    return response;
}

} // namespace

TEST_F(HttpServerAsioTest, AnswersFromWorkerPool) {
    start([](const HttpRequest& request) {
        EXPECT_EQ(request.url, "/api/v4/measurements/u1");
        EXPECT_EQ(request.body_as_string(), "abc");
        return ok();
    }, 5s);

    auto response = round_trip("PUT /api/v4/measurements/u1 HTTP/1.1\r\nContent-Length: 3\r\n\r\nabc");
    EXPECT_EQ(response.rfind("HTTP/1.1 200", 0), 0u) << response;
    EXPECT_NE(response.find("done"), std::string::npos);
}

TEST_F(HttpServerAsioTest, SlowHandlerGetsRetryableTimeout) {
    auto released = release_.get_future().share();
    std::atomic<int> calls{0};
    start([released, &calls](const HttpRequest& request) {
        ++calls;
        if (request.url == "/slow") {
            released.wait_for(10s);
        }
        return ok();
    }, 100ms);

    auto timed_out = round_trip("PUT /slow HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(timed_out.rfind("HTTP/1.1 503", 0), 0u) << timed_out;
    EXPECT_NE(timed_out.find("Retry-After: 1\r\n"), std::string::npos) << timed_out;

    // The other pool thread is still free while the slow handler runs.
    auto other = round_trip("GET /fast HTTP/1.1\r\n\r\n");
    EXPECT_EQ(other.rfind("HTTP/1.1 200", 0), 0u) << other;
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(HttpServerAsioTest, MalformedRequestIsRejectedOnTheLoop) {
    std::atomic<bool> called{false};
    start([&called](const HttpRequest&) {
        called = true;
        return ok();
    }, 5s);

    auto response = round_trip("BREW /pot HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 400", 0), 0u) << response;
    EXPECT_FALSE(called.load());
}
