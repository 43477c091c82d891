#include "parity_scheduler.hpp"

#include "internal/util/errors.hpp"

namespace optiraid::parity {

void ParityScheduler::Enqueue(const ParityTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("parity scheduler is shut down");
    }
    if (!in_flight_.insert(task.set_index).second) {
      throw util::InvalidState("set " + std::to_string(task.set_index) + " already has parity in flight");
    }
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<ParityTask> ParityScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ParityTask task = queue_.front();
  queue_.pop();
  return task;
}

void ParityScheduler::Complete(std::uint64_t set_index) {
  std::lock_guard lock(mutex_);
  in_flight_.erase(set_index);
}

std::size_t ParityScheduler::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

void ParityScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace optiraid::parity
