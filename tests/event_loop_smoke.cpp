#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>
#include "draughts/event_loop.hpp"

int main() {
  using namespace draughts;
  using namespace std::chrono_literals;

  // Due timers run in arming order; posted tasks go first
  {
    EventLoop loop;
    std::vector<int> order;
    loop.schedule_once(0ms, [&] { order.push_back(1); });
    loop.schedule_once(0ms, [&] { order.push_back(2); });
    loop.post([&] { order.push_back(0); });
    assert(loop.pending() == 3);
    assert(loop.poll() == 3);
    assert((order == std::vector<int>{0, 1, 2}));
    assert(loop.pending() == 0);
  }

  // Timers armed from a callback run in the same poll when already due
  {
    EventLoop loop;
    int hits = 0;
    loop.schedule_once(0ms, [&] {
      ++hits;
      loop.schedule_once(0ms, [&] { ++hits; });
    });
    assert(loop.poll() == 2);
    assert(hits == 2);
  }

  // Cancelled timers never fire
  {
    EventLoop loop;
    bool fired = false;
    const TimerId id = loop.schedule_once(0ms, [&] { fired = true; });
    loop.cancel(id);
    assert(loop.poll() == 0);
    assert(!fired);
  }

  // Future timers wait for their deadline
  {
    EventLoop loop;
    std::vector<int> order;
    loop.schedule_once(30ms, [&] { order.push_back(2); });
    loop.schedule_once(0ms, [&] { order.push_back(1); });
    loop.poll();
    assert((order == std::vector<int>{1}));
    assert(loop.run_until_idle(2000ms));
    assert((order == std::vector<int>{1, 2}));
  }

  // Outstanding work keeps the loop alive until the worker posts back
  {
    EventLoop loop;
    std::atomic<bool> done{false};
    loop.work_started();
    assert(loop.outstanding_work() == 1);
    std::thread t([&] {
      std::this_thread::sleep_for(20ms);
      loop.post([&] { done = true; });
      loop.work_finished();
    });
    assert(loop.run_until_idle(5000ms));
    assert(done);
    assert(loop.outstanding_work() == 0);
    t.join();
  }

  // Timeout and stop
  {
    EventLoop loop;
    loop.schedule_once(10000ms, [] {});
    assert(!loop.run_until_idle(20ms));
    assert(loop.pending() == 1);

    loop.post([&] { loop.stop(); });
    assert(!loop.run_until_idle(5000ms));
    assert(loop.pending() == 1);
  }

  return 0;
}
