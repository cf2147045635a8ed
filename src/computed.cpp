#include <tether/computed.h>
#include <tether/context.h>
#include <tether/log.h>

namespace tether {

computed_node::computed_node(context_t &ctx, std::string name, getter_t getter,
                             setter_t setter, error_handler_t on_error)
    : evaluator_t{ctx, std::move(on_error)}, label{std::move(name)},
      getter{std::move(getter)}, setter{std::move(setter)},
      subscribers{std::make_shared<dep_t>(label)} {}

value computed_node::read() {
  if (is_evaluating)
    throw cycle_error{
        std::format("computed property \"{}\" depends on itself", label)};

  // Get the value before linking, so that the active evaluator is not
  // counted as a subscriber while we recalculate.
  refresh();
  subscribers->depend(*ctx);

  return cache;
}

void computed_node::refresh() {
  if (is_dirty and not disposed())
    recalculate();
}

void computed_node::recalculate() {
  is_evaluating = true;
  auto _ = scope_guard{[this] { is_evaluating = false; }};

  ++evaluation_count;
  try {
    cache = run_tracked(*ctx, *this, getter);
  } catch (...) {
    report(std::format("getter of computed \"{}\"", label));
    cache = undefined;
  }

  is_dirty = false;
  event("recalculate({}) = {}", label, cache);
}

void computed_node::write(const value &v) {
  if (not setter)
    throw no_setter_error{label};

  try {
    // A setter only writes; it never subscribes the caller to anything.
    untracked(*ctx, [&] { setter(v); });
  } catch (...) {
    report(std::format("setter of computed \"{}\"", label));
  }
}

void computed_node::notify() {
  // Already dirty: whoever subscribed to us has been told, because reading
  // a dirty node makes it clean.
  if (disposed() or is_dirty)
    return;

  is_dirty = true;
  event("invalidate({})", label);

  if (not has_subscribers())
    return;

  ctx->scheduler().queue_computed(
      std::static_pointer_cast<computed_node>(shared_from_this()));
  subscribers->notify();
}

std::shared_ptr<computed_node>
make_computed(context_t &ctx, std::string name, computed_node::getter_t getter,
              computed_node::setter_t setter) {
  return std::make_shared<computed_node>(ctx, std::move(name), std::move(getter),
                                         std::move(setter));
}

} // namespace tether
