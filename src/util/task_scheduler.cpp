// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/task_scheduler.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <exception>

namespace dagsync {
namespace util {

TaskScheduler::TaskScheduler(boost::asio::io_context &io) : io_(io) {}

TaskScheduler::~TaskScheduler() { CancelAll(); }

TaskScheduler::TaskId TaskScheduler::ScheduleRepeating(
    const std::string &name, std::chrono::milliseconds period, Task fn) {
  return Add(name, period, true, std::move(fn));
}

TaskScheduler::TaskId TaskScheduler::ScheduleOnce(
    const std::string &name, std::chrono::milliseconds delay, Task fn) {
  return Add(name, delay, false, std::move(fn));
}

TaskScheduler::TaskId TaskScheduler::Add(const std::string &name,
                                         std::chrono::milliseconds period,
                                         bool repeating, Task fn) {
  if (!fn) {
    LOG_ERROR("Attempted to schedule empty task: {}", name);
    return INVALID_TASK;
  }
  // A zero period would spin the reactor
  if (repeating && period.count() <= 0) {
    LOG_ERROR("Refusing to schedule repeating task '{}' with period {}ms", name,
              period.count());
    return INVALID_TASK;
  }

  auto entry = std::make_shared<Entry>();
  entry->id = next_id_++;
  entry->name = name;
  entry->period = period;
  entry->repeating = repeating;
  entry->fn = std::move(fn);
  entry->timer = std::make_unique<boost::asio::steady_timer>(io_);

  tasks_[entry->id] = entry;
  Arm(entry);

  LOG_TRACE("Scheduled {} task '{}' (id={}, period={}ms)",
            repeating ? "repeating" : "one-shot", name, entry->id, period.count());
  return entry->id;
}

void TaskScheduler::Arm(const std::shared_ptr<Entry> &entry) {
  entry->timer->expires_after(entry->period);
  std::weak_ptr<Entry> weak = entry;
  entry->timer->async_wait([this, weak](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    // Entry gone means the task was cancelled (or the scheduler destroyed)
    auto e = weak.lock();
    if (!e || tasks_.find(e->id) == tasks_.end()) {
      return;
    }
    Fire(e);
  });
}

void TaskScheduler::Fire(const std::shared_ptr<Entry> &entry) {
  if (!entry->repeating) {
    tasks_.erase(entry->id);
  }

  try {
    entry->fn();
  } catch (const std::exception &e) {
    LOG_ERROR("Task '{}' (id={}) threw: {}", entry->name, entry->id, e.what());
  }

  // The callback may have cancelled its own task
  if (entry->repeating && tasks_.find(entry->id) != tasks_.end()) {
    Arm(entry);
  }
}

bool TaskScheduler::Cancel(TaskId id) {
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return false;
  }
  it->second->timer->cancel();
  LOG_TRACE("Cancelled task '{}' (id={})", it->second->name, id);
  tasks_.erase(it);
  return true;
}

void TaskScheduler::CancelAll() {
  for (auto &[id, entry] : tasks_) {
    entry->timer->cancel();
  }
  tasks_.clear();
}

void TaskScheduler::Post(Task fn) {
  if (!fn) {
    return;
  }
  boost::asio::post(io_, [fn = std::move(fn)]() {
    try {
      fn();
    } catch (const std::exception &e) {
      LOG_ERROR("Posted task threw: {}", e.what());
    }
  });
}

} // namespace util
} // namespace dagsync
