#include "redirect_sweeper.hpp"

#include "redirect_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace hosting::redirect {

RedirectSweeper::RedirectSweeper(std::shared_ptr<RedirectTable> table, std::chrono::milliseconds interval)
    : table_(std::move(table)), interval_(interval) {}

RedirectSweeper::~RedirectSweeper() {
  Stop();
}

void RedirectSweeper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_ = std::thread(&RedirectSweeper::Run, this);
}

void RedirectSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void RedirectSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [&] { return !running_; }))
      break;

    lock.unlock();
    const auto removed = table_->SweepExpired();
    if (removed > 0) {
      HOSTING_LOG_DEBUG("Swept expired redirects", {observability::IntField("removed", static_cast<std::int64_t>(removed))});
    }
    observability::Metrics::Instance().SetRedirectEntries(table_->Size());
    lock.lock();
  }
}

} // namespace hosting::redirect
