#include <gtest/gtest.h>
#include "collector/codec/descriptor_codec.hpp"
#include "collector/pipeline/persistence_worker.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

using namespace collector::pipeline;
using collector::codec::CompletedUploadDescriptor;
using collector::codec::DescriptorCodec;
using collector::codec::FileType;
using collector::codec::StoredFile;

namespace {

Payload encoded(const std::string& measurement) {
    CompletedUploadDescriptor descriptor;
    descriptor.device_id = "device-1";
    descriptor.measurement_id = measurement;
    descriptor.device_type = "Pixel 7";
    descriptor.os_version = "Android 14";
    descriptor.files.insert(StoredFile{"files/" + measurement, FileType::Measurement});
    return DescriptorCodec::encode(descriptor);
}

} // namespace

TEST(PersistenceWorker, DeliversDescriptorsInOrder) {
    HandoffChannel channel;
    std::mutex mutex;
    std::vector<std::string> seen;
    PersistenceWorker worker(channel, [&](const CompletedUploadDescriptor& d) {
        std::lock_guard lock(mutex);
        seen.push_back(d.measurement_id);
    });

    worker.start();
    EXPECT_TRUE(worker.is_running());
    channel.push(encoded("1"));
    channel.push(encoded("2"));
    channel.push(encoded("3"));
    worker.stop();

    EXPECT_FALSE(worker.is_running());
    EXPECT_EQ(worker.processed(), 3u);
    EXPECT_EQ(seen, (std::vector<std::string>{"1", "2", "3"}));
}

TEST(PersistenceWorker, DropsUndecodablePayloadAndContinues) {
    HandoffChannel channel;
    std::size_t delivered = 0;
    PersistenceWorker worker(channel, [&](const CompletedUploadDescriptor&) { ++delivered; });

    channel.push({0xDE, 0xAD});
    channel.push(encoded("1"));
    worker.start();
    worker.stop();

    EXPECT_EQ(worker.rejected(), 1u);
    EXPECT_EQ(worker.processed(), 1u);
    EXPECT_EQ(delivered, 1u);
}

TEST(PersistenceWorker, SurvivesThrowingSink) {
    HandoffChannel channel;
    PersistenceWorker worker(channel, [](const CompletedUploadDescriptor& d) {
        if (d.measurement_id == "bad") {
            throw std::runtime_error("database unavailable");
        }
    });

    worker.start();
    channel.push(encoded("bad"));
    channel.push(encoded("good"));
    worker.stop();

    EXPECT_EQ(worker.rejected(), 1u);
    EXPECT_EQ(worker.processed(), 1u);
}

TEST(PersistenceWorker, StopWithoutStartIsHarmless) {
    HandoffChannel channel;
    PersistenceWorker worker(channel, [](const CompletedUploadDescriptor&) {});
    worker.stop();
    EXPECT_FALSE(worker.is_running());
    EXPECT_TRUE(channel.is_shutdown());
}
