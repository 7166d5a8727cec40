// test_buffer_pool.cpp - Tests for the lock-free scratch buffer pool

#include <catch2/catch_all.hpp>
#include <tagwire/buffer_pool.h>

#include <thread>
#include <vector>

using namespace tagwire;

TEST_CASE("BufferPool reuses returned buffers", "[buffer_pool][reuse]") {
    BufferPool pool(4, 64);

    {
        auto lease = pool.acquire();
        REQUIRE(lease->empty());
        REQUIRE(lease->capacity() >= 64);
        lease->push_back(0x42);
    }
    REQUIRE(pool.stats().created == 1);

    auto again = pool.acquire();
    REQUIRE(again->empty());
    REQUIRE(pool.stats().reused == 1);
    REQUIRE(pool.stats().created == 1);
}

TEST_CASE("BufferPool keeps at most capacity idle buffers", "[buffer_pool][capacity]") {
    BufferPool pool(2, 16);
    {
        auto a = pool.acquire();
        auto b = pool.acquire();
        auto c = pool.acquire();
    }
    auto stats = pool.stats();
    REQUIRE(stats.created == 3);
    REQUIRE(stats.discarded == 1);
}

TEST_CASE("BufferPool discards oversized buffers", "[buffer_pool][capacity]") {
    BufferPool pool(2, 16);
    {
        auto lease = pool.acquire();
        lease->reserve(TAGWIRE_MAX_RETAINED_BUFFER + 1);
    }
    REQUIRE(pool.stats().discarded == 1);

    (void)pool.acquire();
    REQUIRE(pool.stats().created == 2);
}

TEST_CASE("PooledBuffer take and move", "[buffer_pool][lease]") {
    BufferPool pool(2, 16);

    SECTION("take moves the contents out") {
        auto lease = pool.acquire();
        lease->assign({1, 2, 3});
        ByteBuffer out = lease.take();
        REQUIRE(out == ByteBuffer{1, 2, 3});
        REQUIRE(lease->empty());
    }

    SECTION("moved-from lease does not return twice") {
        {
            auto first = pool.acquire();
            auto second = std::move(first);
            second->push_back(1);
        }
        auto x = pool.acquire();
        auto y = pool.acquire();
        auto stats = pool.stats();
        REQUIRE(stats.created == 2);
        REQUIRE(stats.reused == 1);
    }
}

TEST_CASE("BufferPool concurrent use", "[buffer_pool][concurrency]") {
    BufferPool pool(8, 32);
    constexpr int threads = 4;
    constexpr int rounds = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&pool, t] {
            for (int i = 0; i < rounds; ++i) {
                auto lease = pool.acquire();
                lease->assign(static_cast<std::size_t>(i % 32 + 1), static_cast<uint8_t>(t));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    auto stats = pool.stats();
    REQUIRE(stats.created + stats.reused == threads * rounds);
    REQUIRE(stats.created <= threads);
}
