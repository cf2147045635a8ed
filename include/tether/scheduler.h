#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <vector>

namespace tether {

class computed_node;
class watcher;

// The update queue of a context. Watchers are deduplicated by identity and
// run in registration order; a watcher that already ran in the current pass
// is deferred to the next one.
class scheduler_t {
public:
  void queue_watcher(std::shared_ptr<watcher> w);
  void queue_computed(std::shared_ptr<computed_node> c);

  // Runs one pass: dirty computed nodes with subscribers first, then the
  // pending watchers. Returns false if nothing was pending or a flush is
  // already in progress.
  bool flush();

  bool empty() const { return queue.empty() and computeds.empty(); }
  bool flushing() const { return is_flushing; }
  auto pending() const { return queue.size(); }

  // Drops everything that is queued, including deferred watchers.
  void clear();

  // Invoked whenever the queue turns non-empty outside of a flush.
  std::function<void()> on_schedule;

private:
  void insert_in_pass(std::shared_ptr<watcher> w);

  std::vector<std::shared_ptr<computed_node>> computeds;
  std::vector<std::shared_ptr<watcher>> queue;
  std::vector<std::shared_ptr<watcher>> deferred;
  std::set<std::uint64_t> queued_ids;
  std::set<std::uint64_t> deferred_ids;
  std::set<std::uint64_t> flushed_ids;
  std::size_t index = 0;
  bool is_flushing = false;
  bool running_watchers = false;
};

} // namespace tether
