#pragma once

#include <tether/dependency.h>
#include <tether/value.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tether {

class scope_t;

struct watch_options {
  // Any change reachable from the watched value counts, and the callback
  // fires on every run even if the top-level reference is the same.
  bool deep = false;
  // Invoke the callback once at registration, with undefined as old value.
  bool immediate = false;
  // React inline with the triggering write instead of at the next flush.
  bool sync = false;
};

using watch_source_t = std::function<value()>;
using watch_callback_t = std::function<void(const value &, const value &)>;

class watcher : public evaluator_t {
public:
  watcher(context_t &ctx, std::string expression, watch_source_t source,
          watch_callback_t callback, watch_options options = {},
          error_handler_t on_error = {});

  // Initial evaluation; establishes the first dependencies and fires the
  // immediate callback. Call once, after the watcher is owned by a
  // shared_ptr.
  void start();

  // Re-evaluates and dispatches the callback if the value changed.
  void run();

  // Removes the watcher from the graph. Idempotent.
  void stop();

  void notify() override;

  auto id() const { return registration_id; }
  auto active() const { return not disposed(); }
  auto running() const { return is_running; }
  const value &last() const { return last_value; }
  const std::string &expression() const { return label; }
  const watch_options &options() const { return opts; }

private:
  bool evaluate(value &result);
  void dispatch(const value &next, const value &previous);

  std::string label;
  watch_source_t source;
  watch_callback_t callback;
  watch_options opts;
  value last_value;
  std::uint64_t registration_id;
  bool is_running = false;
};

// Handle returned by watch(). Calling it stops the watcher; calling it again
// does nothing.
class unsubscribe_t {
  std::weak_ptr<watcher> target;

public:
  unsubscribe_t() = default;
  explicit unsubscribe_t(std::weak_ptr<watcher> target)
      : target{std::move(target)} {}

  void operator()() const;
  bool active() const;
};

// Registers a free-standing watcher owned by `scope` (the context's default
// scope if null).
unsubscribe_t watch(context_t &ctx, watch_source_t source,
                    watch_callback_t callback, watch_options options = {},
                    scope_t *scope = nullptr);

} // namespace tether
