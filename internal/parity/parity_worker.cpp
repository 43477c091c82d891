#include "parity_worker.hpp"

#include "internal/observability/logging.hpp"

namespace optiraid::parity {

ParityWorker::ParityWorker(std::shared_ptr<ParityScheduler> scheduler, std::shared_ptr<ParityCodec> codec,
                           std::shared_ptr<OrderedCompletionQueue> completions)
    : scheduler_(std::move(scheduler)), codec_(std::move(codec)), completions_(std::move(completions)) {
}

ParityWorker::~ParityWorker() {
  Stop();
}

void ParityWorker::Start() {
  running_ = true;
  thread_  = std::thread(&ParityWorker::Run, this);
}

void ParityWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void ParityWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    ParityCompletion completion;
    completion.set_index = task->set_index;
    try {
      completion.result = codec_->Generate(task->request);
    } catch (const std::exception& e) {
      OPTIRAID_LOG_ERROR("parity generation failed", {observability::IntField("set", static_cast<std::int64_t>(task->set_index)),
                                                      observability::StringField("error", e.what())});
      completion.error = std::current_exception();
    }

    scheduler_->Complete(task->set_index);
    completions_->Push(std::move(completion));
  }
}

} // namespace optiraid::parity
