#include <catch2/catch_test_macros.hpp>
#include "tallow/engine/event_queue.hpp"
#include <chrono>
#include <thread>

using namespace tallow::transfer;
using namespace tallow::transfer::engine;
using namespace std::chrono_literals;

namespace {
    TransferEvent EventWithChunks(uint32_t chunks_done) {
        TransferEvent event;
        event.chunks_done = chunks_done;
        event.total_chunks = 100;
        event.status = models::TransferStatus::Transferring;
        return event;
    }
}

TEST_CASE("EventQueue - FIFO delivery", "[events]") {
    EventQueue queue(8);
    REQUIRE_FALSE(queue.Poll().has_value());

    queue.Publish(EventWithChunks(1));
    queue.Publish(EventWithChunks(2));
    REQUIRE(queue.Size() == 2);
    REQUIRE(queue.Poll()->chunks_done == 1);
    REQUIRE(queue.Poll()->chunks_done == 2);
    REQUIRE(queue.Size() == 0);
}

TEST_CASE("EventQueue - Full queue drops the oldest event", "[events]") {
    EventQueue queue(3);
    for (uint32_t i = 1; i <= 5; ++i) {
        queue.Publish(EventWithChunks(i));
    }
    REQUIRE(queue.Size() == 3);
    REQUIRE(queue.DroppedCount() == 2);
    REQUIRE(queue.Poll()->chunks_done == 3);
}

TEST_CASE("EventQueue - WaitNext", "[events]") {
    EventQueue queue(4);

    SECTION("Times out when nothing arrives") {
        REQUIRE_FALSE(queue.WaitNext(20ms).has_value());
    }

    SECTION("Wakes up for a publish from another thread") {
        std::thread publisher([&] {
            std::this_thread::sleep_for(10ms);
            queue.Publish(EventWithChunks(7));
        });
        auto event = queue.WaitNext(2s);
        publisher.join();
        REQUIRE(event.has_value());
        REQUIRE(event->chunks_done == 7);
    }
}

TEST_CASE("ProgressMeter - Rate limiting", "[events]") {
    const auto start = ProgressMeter::SteadyClock::now();
    ProgressMeter meter(200ms);
    meter.Reset(start, 0, 0);

    SECTION("Nothing without new chunks") {
        REQUIRE_FALSE(meter.Sample(start + 1s, 0, 0).has_value());
    }

    SECTION("At most once per interval") {
        REQUIRE_FALSE(meter.Sample(start + 50ms, 1, 1000).has_value());
        REQUIRE_FALSE(meter.Sample(start + 150ms, 3, 3000).has_value());
        auto rate = meter.Sample(start + 200ms, 4, 4000);
        REQUIRE(rate.has_value());
        REQUIRE(*rate > 19000.0);
        REQUIRE(*rate < 21000.0);
        REQUIRE_FALSE(meter.Sample(start + 300ms, 5, 5000).has_value());
        REQUIRE(meter.Sample(start + 400ms, 5, 5000).has_value());
    }

    SECTION("At most once per chunk with a zero interval") {
        ProgressMeter eager(0ms);
        eager.Reset(start, 0, 0);
        REQUIRE(eager.Sample(start + 1ms, 1, 10).has_value());
        REQUIRE_FALSE(eager.Sample(start + 2ms, 1, 10).has_value());
        REQUIRE(eager.Sample(start + 3ms, 2, 20).has_value());
    }
}
