#include "util/scheduler.hpp"

#include <kj/debug.h>
#include <algorithm>

namespace util {

Scheduler::Scheduler() : thread_([this] { ThreadBody(); }) {}

Scheduler::~Scheduler() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    quitting_ = true;
  }
  wakeup_.notify_all();
  thread_.join();
}

Scheduler::TaskId Scheduler::Schedule(int64_t delay_millis,
                                      std::function<void()> task) {
  auto delay = std::chrono::milliseconds(std::max<int64_t>(0, delay_millis));
  std::lock_guard<std::mutex> lck(mutex_);
  TaskId id = ++last_id_;
  queue_.emplace(std::chrono::steady_clock::now() + delay, id);
  tasks_.emplace(id, std::move(task));
  wakeup_.notify_all();
  return id;
}

bool Scheduler::Cancel(TaskId id) {
  std::lock_guard<std::mutex> lck(mutex_);
  return tasks_.erase(id) > 0;
}

size_t Scheduler::Pending() {
  std::lock_guard<std::mutex> lck(mutex_);
  return tasks_.size();
}

void Scheduler::ThreadBody() {
  std::unique_lock<std::mutex> lck(mutex_);
  while (!quitting_) {
    if (queue_.empty()) {
      wakeup_.wait(lck);
      continue;
    }
    Entry next = queue_.top();
    if (tasks_.count(next.second) == 0) {
      // Cancelled.
      queue_.pop();
      continue;
    }
    if (std::chrono::steady_clock::now() < next.first) {
      wakeup_.wait_until(lck, next.first);
      continue;
    }
    queue_.pop();
    std::function<void()> task = std::move(tasks_.at(next.second));
    tasks_.erase(next.second);
    lck.unlock();
    try {
      task();
    } catch (std::exception& ex) {
      KJ_LOG(ERROR, "Scheduled task failed", next.second, ex.what());
    } catch (kj::Exception& ex) {
      KJ_LOG(ERROR, "Scheduled task failed", next.second, ex.getDescription());
    }
    lck.lock();
  }
}

}  // namespace util
