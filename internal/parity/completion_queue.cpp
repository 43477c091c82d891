#include "completion_queue.hpp"

namespace optiraid::parity {

OrderedCompletionQueue::OrderedCompletionQueue(std::uint64_t first_index) : next_(first_index) {
}

void OrderedCompletionQueue::Push(ParityCompletion completion) {
  {
    std::lock_guard lock(mutex_);
    const auto      index = completion.set_index;
    ready_.insert_or_assign(index, std::move(completion));
  }
  cv_.notify_all();
}

std::optional<ParityCompletion> OrderedCompletionQueue::TryPopNext() {
  std::lock_guard lock(mutex_);
  auto            it = ready_.find(next_);
  if (it == ready_.end()) return std::nullopt;

  auto completion = std::move(it->second);
  ready_.erase(it);
  ++next_;
  return completion;
}

ParityCompletion OrderedCompletionQueue::WaitNext() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return ready_.contains(next_); });

  auto it         = ready_.find(next_);
  auto completion = std::move(it->second);
  ready_.erase(it);
  ++next_;
  return completion;
}

std::uint64_t OrderedCompletionQueue::NextIndex() const {
  std::lock_guard lock(mutex_);
  return next_;
}

} // namespace optiraid::parity
