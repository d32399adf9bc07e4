#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "frontier_entry.hpp"

namespace netcrawl::crawl {

/*
  Thread-safe blocking queue for crawl workers.

  pending = queued + in flight. An entry stays pending from Push() until the
  worker that popped it calls Done(), so an empty queue alone does not mean
  the crawl is over: a visit in flight may still enqueue neighbors.
*/
class Frontier {
 public:
  void Push(const FrontierEntry& entry);

  // blocking wait; nullopt once shut down
  std::optional<FrontierEntry> Pop();

  void Done();

  // Blocks until pending reaches zero or Shutdown(). True when drained.
  bool WaitIdle();

  // Wakes every waiter. Entries still queued are abandoned.
  void Shutdown();

  std::size_t Pending() const;
  std::size_t Queued() const;

 private:
  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::condition_variable   idle_cv_;
  std::queue<FrontierEntry> queue_;
  std::size_t               pending_  = 0;
  bool                      shutdown_ = false;
};

} // namespace netcrawl::crawl
