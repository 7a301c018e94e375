#pragma once

#include "collector/storage/object_store.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace collector::storage {

struct HttpObjectStoreOptions {
    std::string host = "localhost";
    std::string port = "443";
    bool use_tls = true;
    std::string ca_file;             ///< Trusted in addition to the system store
    std::string bucket;
    std::string access_token;        ///< Sent as a bearer token when non-empty
    std::size_t paging_size = 1000;  ///< maxResults of one list page
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief ObjectStore over the Google Cloud Storage JSON API
 *
 * HTTP/1.1 with Boost.Beast, one connection per call. Connections use TLS with
 * peer and host name verification unless use_tls is off (an emulator or a local
 * proxy).
 */
class HttpObjectStore : public ObjectStore {
public:
    explicit HttpObjectStore(HttpObjectStoreOptions options);

    collector::Result<ObjectInfo> put(const std::string& name,
                                      const std::vector<std::uint8_t>& content) override;

    collector::Result<ObjectInfo> compose(const std::vector<std::string>& sources,
                                          const std::string& destination) override;

    collector::Result<std::optional<ObjectInfo>> stat(const std::string& name) override;

    collector::Result<void> remove(const std::string& name) override;

    collector::Result<std::vector<ObjectInfo>> list(const std::string& prefix) override;

    static std::string encode_component(const std::string& value);

private:
    struct Reply {
        unsigned status = 0;
        std::string body;
    };

    collector::Result<Reply> send(const std::string& method,
                                  const std::string& target,
                                  std::string body,
                                  const std::string& content_type);

    template<typename Stream>
    Reply exchange(Stream& stream, const std::string& method, const std::string& target,
                   std::string body, const std::string& content_type);

    std::string object_path(const std::string& name) const;

    HttpObjectStoreOptions options_;
    std::unique_ptr<boost::asio::ssl::context> tls_;
};

} // namespace collector::storage
