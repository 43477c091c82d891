#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

#include "parity_task.hpp"

namespace optiraid::parity {

/*
  Hands completed parity tasks back in set-index order, whatever order the
  workers finish them in.
*/
class OrderedCompletionQueue {
 public:
  explicit OrderedCompletionQueue(std::uint64_t first_index = 0);

  void Push(ParityCompletion completion);

  // The next completion in order, if it has arrived.
  std::optional<ParityCompletion> TryPopNext();

  // Blocks until the next completion in order arrives.
  ParityCompletion WaitNext();

  std::uint64_t NextIndex() const;

 private:
  mutable std::mutex                        mutex_;
  std::condition_variable                   cv_;
  std::map<std::uint64_t, ParityCompletion> ready_;
  std::uint64_t                             next_;
};

} // namespace optiraid::parity
