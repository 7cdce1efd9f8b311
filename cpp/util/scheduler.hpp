#ifndef UTIL_SCHEDULER_HPP
#define UTIL_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <kj/common.h>

namespace util {

// Runs delayed tasks on a single background thread. Tasks run in deadline
// order, outside of the scheduler lock, so a task may schedule or cancel
// other tasks (itself included).
class Scheduler {
 public:
  using TaskId = uint64_t;

  Scheduler();
  ~Scheduler();
  KJ_DISALLOW_COPY(Scheduler);

  // Runs task after delay_millis. Never returns 0.
  TaskId Schedule(int64_t delay_millis, std::function<void()> task);

  // Returns true if the task had not started yet and will not run.
  bool Cancel(TaskId id);

  // Number of tasks still waiting to run.
  size_t Pending();

 private:
  using Deadline = std::chrono::steady_clock::time_point;
  using Entry = std::pair<Deadline, TaskId>;

  void ThreadBody();

  std::mutex mutex_;
  std::condition_variable wakeup_;
  bool quitting_ = false;
  TaskId last_id_ = 0;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue_;
  std::unordered_map<TaskId, std::function<void()>> tasks_;
  std::thread thread_;
};

}  // namespace util

#endif
