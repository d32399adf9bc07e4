#include "frontier.hpp"

namespace netcrawl::crawl {

void Frontier::Push(const FrontierEntry& entry) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(entry);
    ++pending_;
  }
  cv_.notify_one();
}

std::optional<FrontierEntry> Frontier::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  FrontierEntry entry = queue_.front();
  queue_.pop();
  return entry;
}

void Frontier::Done() {
  bool idle = false;
  {
    std::lock_guard lock(mutex_);
    if (pending_ > 0) --pending_;
    idle = pending_ == 0;
  }
  if (idle) idle_cv_.notify_all();
}

bool Frontier::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return shutdown_ || pending_ == 0; });
  return pending_ == 0;
}

void Frontier::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

std::size_t Frontier::Pending() const {
  std::lock_guard lock(mutex_);
  return pending_;
}

std::size_t Frontier::Queued() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace netcrawl::crawl
