#include "collector/config/config.hpp"
#include "collector/events/components.hpp"
#include "collector/events/event_bus.hpp"
#include "collector/events/events.hpp"
#include "collector/metadata/database_factory.hpp"
#include "collector/network/http_router.hpp"
#include "collector/network/http_server_asio.hpp"
#include "collector/pipeline/handoff_channel.hpp"
#include "collector/pipeline/persistence_worker.hpp"
#include "collector/server/cleanup_scheduler.hpp"
#include "collector/server/upload_routes.hpp"
#include "collector/storage/storage_builder.hpp"
#include "collector/upload/coordinator.hpp"
#include "collector/upload/session_store.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>

using collector::network::HttpContext;
using collector::network::HttpMethodUtils;
using collector::network::HttpRequest;
using collector::network::HttpResponse;
using collector::network::HttpRouter;
using collector::network::HttpServerAsio;

namespace asio = boost::asio;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --config <file> [-p|--port <port>]\n";
}

void log_descriptor(const collector::codec::CompletedUploadDescriptor& descriptor) {
    std::string files;
    for (const auto& file : descriptor.files) {
        if (!files.empty()) {
            files += ", ";
        }
        files += file.path + " (" + collector::codec::to_string(file.type) + ")";
    }
    spdlog::info("[Persisted] device={} measurement={} type={} os={} files=[{}]",
                 descriptor.device_id, descriptor.measurement_id,
                 descriptor.device_type, descriptor.os_version, files);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::optional<uint16_t> port_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto loaded = collector::config::load_config(config_path);
    if (loaded.is_error()) {
        spdlog::error("{}", collector::describe(loaded.error()));
        return 1;
    }
    auto config = loaded.value();
    if (port_override) {
        config.port = *port_override;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto storage = collector::storage::build_storage(config.storage);
    if (storage.is_error()) {
        spdlog::error("Storage setup failed: {}", collector::describe(storage.error()));
        return 1;
    }
    auto database = collector::metadata::open_database(config.metadata);
    if (database.is_error()) {
        spdlog::error("Metadata database setup failed: {}", collector::describe(database.error()));
        return 1;
    }

    collector::events::EventBus event_bus;
    collector::events::LoggerComponent logger(event_bus);

    collector::pipeline::HandoffChannel handoff;
    collector::pipeline::PersistenceWorker persistence(handoff, log_descriptor);
    persistence.start();

    collector::upload::UploadSessionStore sessions(config.expiration);
    collector::upload::UploadCoordinator coordinator(sessions,
                                                     storage.value().backend,
                                                     storage.value().cleanup,
                                                     database.value(),
                                                     handoff,
                                                     event_bus,
                                                     config.payload_limit);

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });
    collector::server::UploadRoutes routes(coordinator, config.endpoint);
    routes.register_routes(router);
    for (const auto& route : router.list_routes()) {
        spdlog::debug("Route {}", route);
    }

    asio::io_context io_context;
    asio::thread_pool workers(config.workers);

    collector::network::HttpServerOptions options;
    options.request_timeout = config.chunk_timeout;
    options.payload_limit = config.payload_limit;

    std::optional<HttpServerAsio> server;
    try {
        server.emplace(io_context, config.port, workers, options);
    } catch (const boost::system::system_error& e) {
        spdlog::error("Cannot listen on port {}: {}", config.port, e.what());
        persistence.stop();
        return 1;
    }
    server->set_handler([&router](const HttpRequest& request) {
        return router.handle_request(request);
    });

    collector::server::CleanupScheduler cleanup(io_context, workers, coordinator, config.cleanup_interval);
    cleanup.start();

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(collector::events::ServerShuttingDownEvent{
            "signal " + std::to_string(signal_number)});
        cleanup.stop();
        server->stop();
        io_context.stop();
    });

    event_bus.emit(collector::events::ServerStartedEvent{
        server->get_port(), config.endpoint, collector::config::to_string(config.storage.type)});

    io_context.run();

    workers.join();
    persistence.stop();
    spdlog::info("Processed {} descriptors, rejected {}", persistence.processed(), persistence.rejected());
    return 0;
}
