// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace dagsync {
namespace util {

/**
 * TaskScheduler - named one-shot and repeating tasks on an io_context
 *
 * Every periodic activity of the ledger core (gossip cache cleanup, ack
 * monitor, sync session monitor, periodic re-sync, settle delays, ack
 * waits) is registered here instead of living in its own sleep loop.
 *
 * Threading: all methods and all task callbacks run on the io_context
 * thread. The scheduler is NOT thread-safe; the reactor serializes access.
 *
 * A task that throws is logged and keeps its schedule.
 */
class TaskScheduler {
public:
  using TaskId = uint64_t;
  using Task = std::function<void()>;

  static constexpr TaskId INVALID_TASK = 0;

  explicit TaskScheduler(boost::asio::io_context &io);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;

  // Run fn every period (first run after one period)
  TaskId ScheduleRepeating(const std::string &name,
                           std::chrono::milliseconds period, Task fn);

  // Run fn once after delay
  TaskId ScheduleOnce(const std::string &name, std::chrono::milliseconds delay,
                      Task fn);

  // Returns false if the task already fired (one-shot) or never existed
  bool Cancel(TaskId id);
  void CancelAll();

  // Queue fn for execution on the reactor without delay
  void Post(Task fn);

  size_t ActiveTaskCount() const { return tasks_.size(); }

  boost::asio::io_context &io_context() { return io_; }

private:
  struct Entry {
    TaskId id{INVALID_TASK};
    std::string name;
    std::chrono::milliseconds period{0};
    bool repeating{false};
    Task fn;
    std::unique_ptr<boost::asio::steady_timer> timer;
  };

  TaskId Add(const std::string &name, std::chrono::milliseconds period,
             bool repeating, Task fn);
  void Arm(const std::shared_ptr<Entry> &entry);
  void Fire(const std::shared_ptr<Entry> &entry);

  boost::asio::io_context &io_;
  std::map<TaskId, std::shared_ptr<Entry>> tasks_;
  TaskId next_id_{1};
};

} // namespace util
} // namespace dagsync
