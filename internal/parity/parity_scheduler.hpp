#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <set>

#include "parity_task.hpp"

namespace optiraid::parity {

/*
  Thread-safe blocking queue for parity workers.

  At most one task per set may be queued or running.
*/
class ParityScheduler {
 public:
  // Throws util::InvalidState when the set already has a task in flight.
  void Enqueue(const ParityTask& task);

  // blocking wait
  std::optional<ParityTask> Dequeue();

  // Called by the worker once a task finished, successfully or not.
  void Complete(std::uint64_t set_index);

  std::size_t InFlight() const;

  void Shutdown();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<ParityTask>  queue_;
  std::set<std::uint64_t> in_flight_;
  bool                    shutdown_ = false;
};

} // namespace optiraid::parity
