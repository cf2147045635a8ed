#pragma once

#include <tether/errors.h>
#include <tether/utility.h>

#include <memory>
#include <string>
#include <vector>

namespace tether {

class context_t;
struct dep_t;
struct evaluator_t;

using deps_t = insertion_order_set<std::weak_ptr<dep_t>, std::owner_less<>>;
using subscribers_t =
    insertion_order_set<std::weak_ptr<evaluator_t>, std::owner_less<>>;

// Anything that can be the active subscriber during a tracked read:
// computed nodes and watchers.
struct evaluator_t : std::enable_shared_from_this<evaluator_t> {
  explicit evaluator_t(context_t &ctx, error_handler_t on_error = {});
  virtual ~evaluator_t();

  evaluator_t(const evaluator_t &) = delete;
  evaluator_t &operator=(const evaluator_t &) = delete;

  // Called when one of the observed dependencies changed.
  virtual void notify() = 0;

  // Drops all outgoing edges, both sides.
  void clear_deps();

  // Detaches the evaluator from the graph for good.
  void dispose();
  auto disposed() const { return is_disposed; }

  auto dependency_count() const { return deps.size(); }
  context_t &context() const { return *ctx; }

  // Routes the exception currently being handled to the error reporter.
  void report(std::string origin) const;

protected:
  context_t *ctx;
  error_handler_t on_error;
  bool is_disposed = false;

private:
  friend struct dep_t;
  deps_t deps;
};

// The subscriber set of a single reactive key (or of a computed node).
struct dep_t : std::enable_shared_from_this<dep_t> {
  subscribers_t subscribers;
  std::string label;

  explicit dep_t(std::string label = {}) : label{std::move(label)} {}

  // Subscribes the context's active evaluator, if any.
  void depend(const context_t &ctx);

  void notify();

  auto has_subscribers() const { return not subscribers.empty(); }
};

} // namespace tether
