#include <atomic>
#include <cassert>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "event_queue.h"

using whisper::core::EventQueue;
using whisper::core::ScopedTimer;

int main() {
  std::uint64_t now = 1000;
  EventQueue queue([&now]() { return now; });

  // Posted tasks run in order; tasks posted while running also run.
  {
    std::vector<int> order;
    queue.Post([&]() {
      order.push_back(1);
      queue.Post([&]() { order.push_back(3); });
    });
    queue.Post([&]() { order.push_back(2); });
    assert(queue.RunPending() == 3);
    assert((order == std::vector<int>{1, 2, 3}));
  }

  // Timers fire at their deadline, earliest first.
  {
    std::vector<std::string> fired;
    ScopedTimer late = queue.Schedule(200, [&]() { fired.push_back("late"); });
    ScopedTimer early = queue.Schedule(50, [&]() { fired.push_back("early"); });
    assert(queue.pending_timers() == 2);
    assert(queue.NextDeadline().has_value());
    assert(*queue.NextDeadline() == 1050);
    queue.RunPending();
    assert(fired.empty());
    now = 1100;
    queue.RunPending();
    assert((fired == std::vector<std::string>{"early"}));
    assert(!early.pending());
    assert(late.pending());
    now = 1200;
    queue.RunPending();
    assert(fired.size() == 2 && fired[1] == "late");
  }

  // A canceled timer never fires, whether canceled or destroyed.
  {
    int fired = 0;
    ScopedTimer t = queue.Schedule(10, [&]() { ++fired; });
    t.Cancel();
    assert(!t.pending());
    {
      ScopedTimer scoped = queue.Schedule(10, [&]() { ++fired; });
    }
    now += 100;
    queue.RunPending();
    assert(fired == 0);
    assert(queue.pending_timers() == 0);
  }

  // Moving a timer transfers ownership; reassigning cancels the old one.
  {
    int a = 0;
    int b = 0;
    ScopedTimer first = queue.Schedule(10, [&]() { ++a; });
    ScopedTimer moved = std::move(first);
    assert(!first.pending());
    assert(moved.pending());
    moved = queue.Schedule(10, [&]() { ++b; });
    now += 10;
    queue.RunPending();
    assert(a == 0);
    assert(b == 1);
  }

  // A timer can cancel another timer due at the same instant.
  {
    int fired = 0;
    ScopedTimer second;
    ScopedTimer first = queue.Schedule(5, [&]() { second.Cancel(); });
    second = queue.Schedule(5, [&]() { ++fired; });
    now += 5;
    queue.RunPending();
    assert(fired == 0);
  }

  // Handles outliving the queue are harmless.
  {
    ScopedTimer orphan;
    {
      std::uint64_t t = 0;
      EventQueue short_lived([&t]() { return t; });
      orphan = short_lived.Schedule(1, []() {});
    }
    orphan.Cancel();
    assert(!orphan.pending());
  }

  // Run dispatches cross-thread posts until stopped.
  {
    EventQueue live;
    std::atomic<int> count{0};
    std::thread runner([&]() { live.Run(); });
    for (int i = 0; i < 100; ++i) {
      live.Post([&]() { count.fetch_add(1); });
    }
    live.Post([&]() { live.Stop(); });
    runner.join();
    assert(count.load() == 100);
  }

  return 0;
}
