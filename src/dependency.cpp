#include <tether/context.h>
#include <tether/dependency.h>
#include <tether/log.h>

namespace tether {

evaluator_t::evaluator_t(context_t &ctx, error_handler_t on_error)
    : ctx{&ctx}, on_error{std::move(on_error)} {}

evaluator_t::~evaluator_t() { clear_deps(); }

void evaluator_t::clear_deps() {
  const auto self = weak_from_this();
  for (auto &dep : std::exchange(deps, {})) {
    if (auto p = dep.lock())
      p->subscribers.erase(self);
  }
}

void evaluator_t::dispose() {
  is_disposed = true;
  clear_deps();
}

void evaluator_t::report(std::string origin) const {
  auto e = capture_error(std::move(origin));
  if (on_error)
    on_error(e);
  else
    ctx->report(e);
}

void dep_t::depend(const context_t &ctx) {
  const auto active = ctx.active();
  auto evaluator = active.lock();
  if (not evaluator or evaluator->disposed())
    return;

  if (subscribers.insert(active)) {
    event("depend({})", label);
  }
  evaluator->deps.insert(weak_from_this());
}

void dep_t::notify() {
  event("notify({}) -> {} subscriber(s)", label, subscribers.size());

  // Copy, because notifying might add or remove subscribers.
  auto observers = subscribers;
  for (auto &observer : observers) {
    if (not subscribers.contains(observer))
      continue;

    if (auto p = observer.lock())
      p->notify();
    else
      subscribers.erase(observer);
  }
}

} // namespace tether
