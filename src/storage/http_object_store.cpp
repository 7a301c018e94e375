#include "collector/storage/http_object_store.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace collector::storage {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {

std::chrono::system_clock::time_point parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return {};
    }
    return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

ObjectInfo to_object_info(const json& resource) {
    ObjectInfo info;
    info.name = resource.at("name").get<std::string>();
    // The JSON API reports sizes as decimal strings.
    const auto& size = resource.at("size");
    info.size = size.is_string() ? std::stoull(size.get<std::string>()) : size.get<std::uint64_t>();
    if (resource.contains("updated")) {
        info.updated = parse_timestamp(resource.at("updated").get<std::string>());
    }
    return info;
}

collector::Error unexpected_reply(const std::string& what, unsigned status, const std::string& body) {
    return collector::Error{ErrorCode::StorageFailure,
        what + " failed with HTTP " + std::to_string(status) + ": " + body.substr(0, 200)};
}

template<typename T>
collector::Result<T> parse_reply(const std::string& what, const std::string& body,
                                 T (*convert)(const json&)) {
    try {
        return collector::Ok(convert(json::parse(body)));
    } catch (const std::exception& e) {
        return collector::Err<T>(ErrorCode::StorageFailure,
            what + " returned an unreadable object resource: " + e.what());
    }
}

} // namespace

HttpObjectStore::HttpObjectStore(HttpObjectStoreOptions options) : options_(std::move(options)) {
    if (options_.use_tls) {
        tls_ = std::make_unique<ssl::context>(ssl::context::tlsv12_client);
        tls_->set_default_verify_paths();
        if (!options_.ca_file.empty()) {
            tls_->load_verify_file(options_.ca_file);
        }
        tls_->set_verify_mode(ssl::verify_peer);
    }
}

std::string HttpObjectStore::encode_component(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string HttpObjectStore::object_path(const std::string& name) const {
    return "/storage/v1/b/" + encode_component(options_.bucket) + "/o/" + encode_component(name);
}

template<typename Stream>
HttpObjectStore::Reply HttpObjectStore::exchange(Stream& stream, const std::string& method,
                                                 const std::string& target, std::string body,
                                                 const std::string& content_type) {
    http::request<http::string_body> request{http::string_to_verb(method), target, 11};
    request.set(http::field::host, options_.host);
    request.set(http::field::user_agent, "collector");
    if (!options_.access_token.empty()) {
        request.set(http::field::authorization, "Bearer " + options_.access_token);
    }
    if (!content_type.empty()) {
        request.set(http::field::content_type, content_type);
    }
    request.body() = std::move(body);
    request.prepare_payload();

    beast::get_lowest_layer(stream).expires_after(options_.timeout);
    http::write(stream, request);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    http::read(stream, buffer, parser);

    beast::error_code ec;
    if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
        stream.shutdown(ec);
        // Object stores commonly drop the connection instead of answering close_notify.
        if (ec && ec != boost::asio::ssl::error::stream_truncated && ec != boost::asio::error::eof) {
            spdlog::debug("TLS shutdown with {}: {}", options_.host, ec.message());
        }
    } else {
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    auto response = parser.release();
    spdlog::debug("{} {} -> {}", method, target, response.result_int());
    return Reply{response.result_int(), std::move(response.body())};
}

collector::Result<HttpObjectStore::Reply> HttpObjectStore::send(const std::string& method,
                                                                const std::string& target,
                                                                std::string body,
                                                                const std::string& content_type) {
    try {
        boost::asio::io_context ioc;
        tcp::resolver resolver(ioc);
        const auto endpoints = resolver.resolve(options_.host, options_.port);

        if (!tls_) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(options_.timeout);
            stream.connect(endpoints);
            return collector::Ok(exchange(stream, method, target, std::move(body), content_type));
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, *tls_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), options_.host.c_str())) {
            return collector::Err<Reply>(ErrorCode::StorageFailure,
                "Cannot set TLS server name " + options_.host);
        }
        stream.set_verify_callback(ssl::host_name_verification(options_.host));

        beast::get_lowest_layer(stream).expires_after(options_.timeout);
        beast::get_lowest_layer(stream).connect(endpoints);
        stream.handshake(ssl::stream_base::client);
        return collector::Ok(exchange(stream, method, target, std::move(body), content_type));
    } catch (const boost::system::system_error& e) {
        return collector::Err<Reply>(ErrorCode::StorageFailure,
            method + " " + target + " failed: " + e.what());
    }
}

collector::Result<ObjectInfo> HttpObjectStore::put(const std::string& name,
                                                   const std::vector<std::uint8_t>& content) {
    const std::string target = "/upload/storage/v1/b/" + encode_component(options_.bucket) +
                               "/o?uploadType=media&name=" + encode_component(name);
    auto reply = send("POST", target, std::string(content.begin(), content.end()),
                      "application/octet-stream");
    if (reply.is_error()) {
        return collector::Err<ObjectInfo>(reply.error());
    }
    if (reply.value().status != 200) {
        return collector::Err<ObjectInfo>(unexpected_reply("Upload of " + name,
                                                           reply.value().status, reply.value().body));
    }
    return parse_reply<ObjectInfo>("Upload of " + name, reply.value().body, &to_object_info);
}

collector::Result<ObjectInfo> HttpObjectStore::compose(const std::vector<std::string>& sources,
                                                       const std::string& destination) {
    json request;
    request["sourceObjects"] = json::array();
    for (const auto& source : sources) {
        request["sourceObjects"].push_back({{"name", source}});
    }
    request["destination"] = {{"contentType", "application/octet-stream"}};

    auto reply = send("POST", object_path(destination) + "/compose", request.dump(), "application/json");
    if (reply.is_error()) {
        return collector::Err<ObjectInfo>(reply.error());
    }
    if (reply.value().status != 200) {
        return collector::Err<ObjectInfo>(unexpected_reply("Compose into " + destination,
                                                           reply.value().status, reply.value().body));
    }
    return parse_reply<ObjectInfo>("Compose into " + destination, reply.value().body, &to_object_info);
}

collector::Result<std::optional<ObjectInfo>> HttpObjectStore::stat(const std::string& name) {
    auto reply = send("GET", object_path(name), {}, {});
    if (reply.is_error()) {
        return collector::Err<std::optional<ObjectInfo>>(reply.error());
    }
    if (reply.value().status == 404) {
        return collector::Ok(std::optional<ObjectInfo>{});
    }
    if (reply.value().status != 200) {
        return collector::Err<std::optional<ObjectInfo>>(
            unexpected_reply("Metadata of " + name, reply.value().status, reply.value().body));
    }
    auto info = parse_reply<ObjectInfo>("Metadata of " + name, reply.value().body, &to_object_info);
    if (info.is_error()) {
        return collector::Err<std::optional<ObjectInfo>>(info.error());
    }
    return collector::Ok(std::optional<ObjectInfo>(info.value()));
}

collector::Result<void> HttpObjectStore::remove(const std::string& name) {
    auto reply = send("DELETE", object_path(name), {}, {});
    if (reply.is_error()) {
        return collector::Err<void>(reply.error());
    }
    const auto status = reply.value().status;
    if (status != 200 && status != 204 && status != 404) {
        return collector::Err<void>(unexpected_reply("Delete of " + name, status, reply.value().body));
    }
    return collector::Ok();
}

collector::Result<std::vector<ObjectInfo>> HttpObjectStore::list(const std::string& prefix) {
    std::vector<ObjectInfo> objects;
    std::string page_token;

    do {
        std::string target = "/storage/v1/b/" + encode_component(options_.bucket) +
                             "/o?prefix=" + encode_component(prefix) +
                             "&maxResults=" + std::to_string(options_.paging_size);
        if (!page_token.empty()) {
            target += "&pageToken=" + encode_component(page_token);
        }

        auto reply = send("GET", target, {}, {});
        if (reply.is_error()) {
            return collector::Err<std::vector<ObjectInfo>>(reply.error());
        }
        if (reply.value().status != 200) {
            return collector::Err<std::vector<ObjectInfo>>(
                unexpected_reply("Listing " + prefix, reply.value().status, reply.value().body));
        }

        try {
            const auto page = json::parse(reply.value().body);
            if (page.contains("items")) {
                for (const auto& item : page.at("items")) {
                    objects.push_back(to_object_info(item));
                }
            }
            page_token = page.value("nextPageToken", std::string{});
        } catch (const std::exception& e) {
            return collector::Err<std::vector<ObjectInfo>>(ErrorCode::StorageFailure,
                "Listing " + prefix + " returned an unreadable page: " + e.what());
        }
    } while (!page_token.empty());

    return collector::Ok(std::move(objects));
}

} // namespace collector::storage
