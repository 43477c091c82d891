#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "completion_queue.hpp"
#include "parity_codec.hpp"
#include "parity_scheduler.hpp"

namespace optiraid::parity {

/*
  Background worker that generates parity for closed sets.

  Failures are not handled here: they travel to the builder inside the
  completion, which keeps the set PARITY_PENDING.
*/
class ParityWorker {
 public:
  ParityWorker(std::shared_ptr<ParityScheduler> scheduler, std::shared_ptr<ParityCodec> codec, std::shared_ptr<OrderedCompletionQueue> completions);
  ~ParityWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ParityScheduler>        scheduler_;
  std::shared_ptr<ParityCodec>            codec_;
  std::shared_ptr<OrderedCompletionQueue> completions_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace optiraid::parity
