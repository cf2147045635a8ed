#pragma once

#include <tether/dependency.h>
#include <tether/errors.h>
#include <tether/scheduler.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace tether {

// Owns evaluators that have no other owner (free-standing watchers, the
// watchers and computed nodes of an instance).
class scope_t {
  std::vector<std::shared_ptr<evaluator_t>> evaluators;

public:
  void add(std::shared_ptr<evaluator_t> evaluator);
  auto size() const { return evaluators.size(); }
  auto begin() const { return evaluators.begin(); }
  auto end() const { return evaluators.end(); }
  void clear() { evaluators.clear(); }
};

// An execution context: the active-evaluator stack, the update queue and the
// next-tick callbacks. Independent contexts never cross-attribute
// dependencies.
class context_t {
public:
  context_t();
  ~context_t();

  context_t(const context_t &) = delete;
  context_t &operator=(const context_t &) = delete;

  // The topmost evaluator, or an empty pointer outside of any tracked
  // evaluation (and inside an untracked frame).
  std::weak_ptr<evaluator_t> active() const;
  void push(std::weak_ptr<evaluator_t> evaluator);
  void pop();
  auto depth() const { return stack.size(); }

  scheduler_t &scheduler() { return queue; }
  const scheduler_t &scheduler() const { return queue; }
  scope_t &scope() { return default_scope; }

  std::uint64_t next_id() { return ++last_id; }

  void next_tick(std::function<void()> callback);

  // One flush pass followed by the next-tick callbacks queued before it.
  void tick();

  // Ticks until idle. Returns the number of passes.
  std::size_t drain();

  bool idle() const { return queue.empty() and callbacks.empty(); }

  void report(const reported_error &e);
  const std::vector<reported_error> &errors() const { return recorded; }
  void clear_errors() { recorded.clear(); }

  std::size_t max_flush_passes = 100;
  error_handler_t on_error;

private:
  std::vector<std::weak_ptr<evaluator_t>> stack;
  scheduler_t queue;
  scope_t default_scope;
  std::vector<std::function<void()>> callbacks;
  std::vector<reported_error> recorded;
  std::uint64_t last_id = 0;
};

// The context used when none is given explicitly (one per thread).
context_t &default_context();

// Runs `thunk` with `evaluator` as the active subscriber, after dropping the
// dependencies recorded by its previous run.
template <typename F>
decltype(auto) run_tracked(context_t &ctx, evaluator_t &evaluator, F &&thunk) {
  evaluator.clear_deps();
  ctx.push(evaluator.weak_from_this());
  auto _ = scope_guard{[&] { ctx.pop(); }};
  return FWD(thunk)();
}

// Runs `thunk` without attributing reads to the current evaluator.
template <typename F> decltype(auto) untracked(context_t &ctx, F &&thunk) {
  ctx.push({});
  auto _ = scope_guard{[&] { ctx.pop(); }};
  return FWD(thunk)();
}

} // namespace tether
