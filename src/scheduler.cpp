#include <tether/computed.h>
#include <tether/log.h>
#include <tether/scheduler.h>
#include <tether/watcher.h>

#include <algorithm>

namespace tether {

namespace {

const auto by_id = [](const auto &lhs, const auto &rhs) {
  return lhs->id() < rhs->id();
};

} // namespace

void scheduler_t::queue_watcher(std::shared_ptr<watcher> w) {
  if (not w->active())
    return;

  const auto id = w->id();
  if (queued_ids.contains(id) or deferred_ids.contains(id))
    return;

  if (is_flushing) {
    // Ran already in this pass: postpone to the next one, so a callback
    // can never retrigger itself within the same flush.
    if (flushed_ids.contains(id)) {
      event("defer #{}", id);
      deferred_ids.insert(id);
      deferred.push_back(std::move(w));
      return;
    }

    insert_in_pass(std::move(w));
    return;
  }

  event("queue #{}", id);
  const auto was_empty = empty();
  queued_ids.insert(id);
  queue.push_back(std::move(w));
  if (was_empty and on_schedule)
    on_schedule();
}

void scheduler_t::insert_in_pass(std::shared_ptr<watcher> w) {
  queued_ids.insert(w->id());

  // Queued while computed nodes resolve: the sort before the watcher loop
  // puts it in place.
  if (not running_watchers) {
    queue.push_back(std::move(w));
    return;
  }

  // Keep the part of the queue that did not run yet ordered by id.
  const auto start = std::min(index + 1, queue.size());
  const auto first = queue.begin() + static_cast<std::ptrdiff_t>(start);
  const auto it = std::upper_bound(first, queue.end(), w, by_id);
  queue.insert(it, std::move(w));
}

void scheduler_t::queue_computed(std::shared_ptr<computed_node> c) {
  const auto was_empty = empty();
  computeds.push_back(std::move(c));
  if (was_empty and not is_flushing and on_schedule)
    on_schedule();
}

bool scheduler_t::flush() {
  if (is_flushing or empty())
    return false;

  is_flushing = true;
  auto _ = scope_guard{[this] {
    is_flushing = false;
    running_watchers = false;
    index = 0;
    flushed_ids.clear();
  }};

  event("flush: {} computed, {} watcher(s)", computeds.size(), queue.size());

  // Derived values first, so that watchers only ever observe fresh ones.
  for (auto &c : std::exchange(computeds, {})) {
    if (c->dirty() and c->has_subscribers())
      c->refresh();
  }

  std::ranges::stable_sort(queue, by_id);
  running_watchers = true;
  for (index = 0; index < queue.size(); ++index) {
    // Copy, because the queue may grow while the watcher runs.
    auto w = queue[index];
    queued_ids.erase(w->id());
    flushed_ids.insert(w->id());

    // Unsubscribed after it was queued: dropped silently.
    if (w->active())
      w->run();
  }

  queue = std::exchange(deferred, {});
  queued_ids = std::exchange(deferred_ids, {});
  if (not empty() and on_schedule)
    on_schedule();

  return true;
}

void scheduler_t::clear() {
  computeds.clear();
  queue.clear();
  deferred.clear();
  queued_ids.clear();
  deferred_ids.clear();
}

} // namespace tether
