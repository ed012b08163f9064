#include <catch2/catch.hpp>
#include <locus/executor.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace locus;

TEST_CASE("InlineExecutor runs tasks immediately", "[executor]") {
    InlineExecutor ex;
    int runs = 0;
    ex.post([&] { ++runs; });
    REQUIRE(runs == 1);
}

TEST_CASE("SerialQueue runs tasks in order on one worker thread", "[executor]") {
    std::vector<int> order;
    std::vector<std::thread::id> threads;
    {
        SerialQueue q;
        for (int i = 0; i < 20; ++i) {
            q.post([&, i] {
                order.push_back(i);
                threads.push_back(std::this_thread::get_id());
            });
        }
    } // destructor drains the queue

    REQUIRE(order.size() == 20);
    for (int i = 0; i < 20; ++i) REQUIRE(order[i] == i);
    for (const auto& id : threads) {
        REQUIRE(id == threads.front());
        REQUIRE(id != std::this_thread::get_id());
    }
}

TEST_CASE("SerialQueue survives a throwing task", "[executor]") {
    std::atomic<int> runs{0};
    {
        SerialQueue q;
        q.post([] { throw std::runtime_error("boom"); });
        q.post([&] { ++runs; });
    }
    REQUIRE(runs == 1);
}

TEST_CASE("ManualExecutor holds tasks until pumped", "[executor]") {
    ManualExecutor ex;
    int runs = 0;
    ex.post([&] { ++runs; });
    ex.post([&] { ++runs; });
    REQUIRE(runs == 0);
    REQUIRE(ex.run_pending() == 2);
    REQUIRE(runs == 2);
    REQUIRE(ex.run_pending() == 0);
}

TEST_CASE("ManualExecutor runs cross-thread posts on the pumping thread", "[executor]") {
    ManualExecutor main_loop;
    std::thread::id ran_on;
    bool done = false;
    {
        SerialQueue worker;
        worker.post([&] {
            main_loop.post([&] {
                ran_on = std::this_thread::get_id();
                done = true;
            });
        });
        while (!done) {
            main_loop.wait_and_run(std::chrono::milliseconds(20));
        }
    }
    REQUIRE(ran_on == std::this_thread::get_id());
}
