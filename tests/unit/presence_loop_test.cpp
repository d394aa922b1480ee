#include "handlers/PresenceLoop.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using Yturl::PresenceLoop;
using namespace std::chrono_literals;

void TestFiresImmediatelyAndRepeats() {
    std::atomic<int> count{0};
    PresenceLoop loop([&count] { ++count; }, 20ms);

    // No waiting for the first tick
    assert(count == 1);

    assert(YturlTest::waitFor([&count] { return count >= 3; }));
}

void TestCancelStopsFurtherCalls() {
    std::atomic<int> count{0};
    PresenceLoop loop([&count] { ++count; }, 5ms);
    assert(YturlTest::waitFor([&count] { return count >= 2; }));

    loop.cancel();
    int seen = count;
    std::this_thread::sleep_for(40ms);
    assert(count == seen);

    // Second cancel and the destructor are no-ops
    loop.cancel();
}

void TestThrowingActionKeepsLooping() {
    std::atomic<int> count{0};
    PresenceLoop loop([&count] {
        ++count;
        throw std::runtime_error("Too Many Requests");
    }, 5ms);

    assert(YturlTest::waitFor([&count] { return count >= 3; }));
}

void TestDestructorStops() {
    std::atomic<int> count{0};
    {
        PresenceLoop loop([&count] { ++count; }, 5ms);
        std::this_thread::sleep_for(15ms);
    }
    int seen = count;
    std::this_thread::sleep_for(30ms);
    assert(count == seen);
}

} // namespace

int main() {
    TestFiresImmediatelyAndRepeats();
    TestCancelStopsFurtherCalls();
    TestThrowingActionKeepsLooping();
    TestDestructorStops();

    std::cout << "presence_loop_test: pass\n";
    return 0;
}
