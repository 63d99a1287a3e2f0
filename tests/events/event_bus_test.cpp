#include <gtest/gtest.h>
#include "mpu/events/event_bus.hpp"
#include "mpu/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mpu::events;

TEST(EventBus, DeliversPartEventToSubscriber) {
    EventBus bus;

    std::uint32_t received_index = 0;
    std::uint64_t received_bytes = 0;

    bus.subscribe<PartUploadedEvent>([&](const PartUploadedEvent& e) {
        received_index = e.part_index;
        received_bytes = e.bytes;
    });

    PartUploadedEvent event;
    event.upload_id = "upload-1";
    event.part_index = 3;
    event.bytes = 4096;
    bus.emit(event);

    EXPECT_EQ(received_index, 3u);
    EXPECT_EQ(received_bytes, 4096u);
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int uploaded = 0;
    int failed = 0;

    bus.subscribe<PartUploadedEvent>([&](const PartUploadedEvent&) { uploaded++; });
    bus.subscribe<PartFailedEvent>([&](const PartFailedEvent&) { failed++; });

    bus.emit(PartUploadedEvent{});
    bus.emit(PartFailedEvent{});
    bus.emit(PartUploadedEvent{});

    EXPECT_EQ(uploaded, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { count++; });

    bus.emit(UploadCompletedEvent{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<UploadCompletedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 0u);

    bus.emit(UploadCompletedEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<UploadAbortedEvent>([](const UploadAbortedEvent&) {
        throw std::runtime_error("subscriber bug");
    });
    bus.subscribe<UploadAbortedEvent>([&](const UploadAbortedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(UploadAbortedEvent{}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, ConcurrentEmitFromWorkers) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<PartUploadedEvent>([&bytes](const PartUploadedEvent& e) {
        bytes += e.bytes;
    });

    std::vector<std::thread> workers;
    for (std::uint32_t i = 1; i <= 16; ++i) {
        workers.emplace_back([&bus, i]() {
            PartUploadedEvent event;
            event.part_index = i;
            event.bytes = 100;
            bus.emit(event);
        });
    }

    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 1600u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<UploadInitiatedEvent>([](const UploadInitiatedEvent&) {});
    bus.subscribe<PartRetryScheduledEvent>([](const PartRetryScheduledEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<UploadInitiatedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<PartRetryScheduledEvent>(), 0u);
}
