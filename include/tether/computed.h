#pragma once

#include <tether/dependency.h>
#include <tether/value.h>

#include <functional>
#include <memory>
#include <string>

namespace tether {

// A memoized derived value. Upstream changes only mark it dirty; the getter
// runs again on the next read (or at the start of the next flush, if
// something is subscribed to it).
class computed_node : public evaluator_t {
public:
  using getter_t = std::function<value()>;
  using setter_t = std::function<void(const value &)>;

  computed_node(context_t &ctx, std::string name, getter_t getter,
                setter_t setter = {}, error_handler_t on_error = {});

  // Returns the cached value, recalculating first if dirty, and subscribes
  // the active evaluator to this node.
  value read();

  // Brings the cached value up to date without subscribing anyone.
  void refresh();

  // Throws no_setter_error if the node is getter-only.
  void write(const value &v);

  void notify() override;

  auto dirty() const { return is_dirty; }
  auto has_setter() const { return static_cast<bool>(setter); }
  auto has_subscribers() const { return subscribers->has_subscribers(); }
  auto evaluations() const { return evaluation_count; }
  const std::string &name() const { return label; }

  // The last cached value, without recalculation or tracking.
  const value &cached() const { return cache; }

private:
  void recalculate();

  std::string label;
  getter_t getter;
  setter_t setter;
  value cache;
  std::shared_ptr<dep_t> subscribers;
  int evaluation_count = 0;
  bool is_dirty = true;
  bool is_evaluating = false;
};

std::shared_ptr<computed_node>
make_computed(context_t &ctx, std::string name, computed_node::getter_t getter,
              computed_node::setter_t setter = {});

} // namespace tether
