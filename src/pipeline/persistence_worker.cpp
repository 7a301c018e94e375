#include "collector/pipeline/persistence_worker.hpp"

#include "collector/codec/descriptor_codec.hpp"

#include <spdlog/spdlog.h>

namespace collector::pipeline {

PersistenceWorker::PersistenceWorker(HandoffChannel& channel, Sink sink)
    : channel_(channel), sink_(std::move(sink)) {}

PersistenceWorker::~PersistenceWorker() {
    stop();
}

void PersistenceWorker::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this] { run(); });
    spdlog::debug("Persistence worker started");
}

void PersistenceWorker::stop() {
    channel_.shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (running_.exchange(false)) {
        spdlog::debug("Persistence worker stopped after {} descriptors ({} rejected)",
                      processed_.load(), rejected_.load());
    }
}

void PersistenceWorker::run() {
    while (auto payload = channel_.pop()) {
        handle(*payload);
    }
}

void PersistenceWorker::handle(const Payload& payload) {
    auto descriptor = codec::DescriptorCodec::decode(payload);
    if (descriptor.is_error()) {
        ++rejected_;
        spdlog::error("Dropping handoff payload of {} bytes: {}", payload.size(), describe(descriptor.error()));
        return;
    }

    try {
        sink_(descriptor.value());
        ++processed_;
    } catch (const std::exception& e) {
        ++rejected_;
        spdlog::error("Persistence of {}:{} failed: {}",
                      descriptor.value().device_id, descriptor.value().measurement_id, e.what());
    }
}

} // namespace collector::pipeline
