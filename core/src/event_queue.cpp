#include "event_queue.h"

#include <chrono>

#include "platform_log.h"
#include "platform_time.h"

namespace whisper::core {

namespace pfl = whisper::platform::log;

struct EventQueue::Shared {
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<Task> ready;
  // (deadline, id) orders timers; ids break ties in scheduling order.
  std::map<std::pair<std::uint64_t, std::uint64_t>, Task> timers;
  std::unordered_map<std::uint64_t, std::uint64_t> deadlines;
  std::uint64_t next_timer_id{1};
  bool stop{false};
};

ScopedTimer::ScopedTimer(std::weak_ptr<void> owner, std::uint64_t id)
    : owner_(std::move(owner)), id_(id) {}

ScopedTimer::~ScopedTimer() {
  Cancel();
}

ScopedTimer::ScopedTimer(ScopedTimer&& other) noexcept
    : owner_(std::move(other.owner_)), id_(other.id_) {
  other.id_ = 0;
}

ScopedTimer& ScopedTimer::operator=(ScopedTimer&& other) noexcept {
  if (this != &other) {
    Cancel();
    owner_ = std::move(other.owner_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void ScopedTimer::Cancel() {
  if (id_ == 0) {
    return;
  }
  auto owner = owner_.lock();
  if (owner) {
    EventQueue::CancelTimer(
        std::static_pointer_cast<EventQueue::Shared>(owner), id_);
  }
  owner_.reset();
  id_ = 0;
}

bool ScopedTimer::pending() const {
  if (id_ == 0) {
    return false;
  }
  auto owner = owner_.lock();
  if (!owner) {
    return false;
  }
  auto shared = std::static_pointer_cast<EventQueue::Shared>(owner);
  std::lock_guard<std::mutex> lock(shared->mutex);
  return shared->deadlines.count(id_) != 0;
}

EventQueue::EventQueue() : EventQueue(Clock(&platform::NowSteadyMs)) {}

EventQueue::EventQueue(Clock clock)
    : clock_(std::move(clock)), shared_(std::make_shared<Shared>()) {}

EventQueue::~EventQueue() {
  Stop();
}

void EventQueue::Post(Task task) {
  if (!task) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->ready.push_back(std::move(task));
  }
  shared_->cv.notify_one();
}

ScopedTimer EventQueue::Schedule(std::uint64_t delay_ms, Task task) {
  if (!task) {
    return ScopedTimer();
  }
  const std::uint64_t deadline = clock_() + delay_ms;
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    id = shared_->next_timer_id++;
    shared_->timers.emplace(std::make_pair(deadline, id), std::move(task));
    shared_->deadlines.emplace(id, deadline);
  }
  shared_->cv.notify_one();
  return ScopedTimer(std::weak_ptr<void>(shared_), id);
}

void EventQueue::CancelTimer(const std::shared_ptr<Shared>& shared,
                             std::uint64_t id) {
  std::lock_guard<std::mutex> lock(shared->mutex);
  const auto it = shared->deadlines.find(id);
  if (it == shared->deadlines.end()) {
    return;
  }
  shared->timers.erase(std::make_pair(it->second, id));
  shared->deadlines.erase(it);
}

bool EventQueue::PopReady(Task& out) {
  const std::uint64_t now = clock_();
  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (!shared_->ready.empty()) {
    out = std::move(shared_->ready.front());
    shared_->ready.pop_front();
    return true;
  }
  if (!shared_->timers.empty()) {
    auto it = shared_->timers.begin();
    if (it->first.first <= now) {
      out = std::move(it->second);
      shared_->deadlines.erase(it->first.second);
      shared_->timers.erase(it);
      return true;
    }
  }
  return false;
}

std::size_t EventQueue::RunPending() {
  std::size_t executed = 0;
  Task task;
  while (PopReady(task)) {
    task();
    task = nullptr;
    ++executed;
  }
  return executed;
}

void EventQueue::Run() {
  pfl::Log(pfl::Level::kDebug, "event_queue", "run loop started");
  while (true) {
    RunPending();
    std::unique_lock<std::mutex> lock(shared_->mutex);
    if (shared_->stop) {
      break;
    }
    if (!shared_->ready.empty()) {
      continue;
    }
    if (shared_->timers.empty()) {
      shared_->cv.wait(lock);
      continue;
    }
    const std::uint64_t deadline = shared_->timers.begin()->first.first;
    const std::uint64_t now = clock_();
    if (deadline > now) {
      shared_->cv.wait_for(lock, std::chrono::milliseconds(deadline - now));
    }
  }
  pfl::Log(pfl::Level::kDebug, "event_queue", "run loop stopped");
}

void EventQueue::Stop() {
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->stop = true;
  }
  shared_->cv.notify_all();
}

std::uint64_t EventQueue::Now() const {
  return clock_();
}

std::optional<std::uint64_t> EventQueue::NextDeadline() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (shared_->timers.empty()) {
    return std::nullopt;
  }
  return shared_->timers.begin()->first.first;
}

std::size_t EventQueue::pending_timers() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->timers.size();
}

}  // namespace whisper::core
