#ifndef WHISPER_CORE_EVENT_QUEUE_H
#define WHISPER_CORE_EVENT_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace whisper::core {

class EventQueue;

// Owned handle of a scheduled task. Destroying or canceling it guarantees
// the task will not run afterwards.
class ScopedTimer {
 public:
  ScopedTimer() = default;
  ~ScopedTimer();

  ScopedTimer(ScopedTimer&& other) noexcept;
  ScopedTimer& operator=(ScopedTimer&& other) noexcept;
  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  void Cancel();
  bool pending() const;

 private:
  friend class EventQueue;
  ScopedTimer(std::weak_ptr<void> owner, std::uint64_t id);

  std::weak_ptr<void> owner_;
  std::uint64_t id_{0};
};

// Serialized task queue. Every transport event, completion and timer of a
// session runs here, one at a time.
class EventQueue {
 public:
  using Task = std::function<void()>;
  using Clock = std::function<std::uint64_t()>;

  // Defaults to platform::NowSteadyMs.
  EventQueue();
  explicit EventQueue(Clock clock);
  ~EventQueue();

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // Thread-safe.
  void Post(Task task);
  ScopedTimer Schedule(std::uint64_t delay_ms, Task task);

  // Runs queued tasks and due timers until none are left. Returns the
  // number of tasks executed.
  std::size_t RunPending();

  // Blocks the calling thread and dispatches until Stop. A stopped queue
  // stays stopped.
  void Run();
  void Stop();

  std::uint64_t Now() const;
  std::optional<std::uint64_t> NextDeadline() const;
  std::size_t pending_timers() const;

 private:
  friend class ScopedTimer;
  struct Shared;

  bool PopReady(Task& out);
  static void CancelTimer(const std::shared_ptr<Shared>& shared,
                          std::uint64_t id);

  Clock clock_;
  std::shared_ptr<Shared> shared_;
};

}  // namespace whisper::core

#endif  // WHISPER_CORE_EVENT_QUEUE_H
