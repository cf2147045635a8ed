#include <tether/context.h>
#include <tether/log.h>
#include <tether/store.h>
#include <tether/watcher.h>

namespace tether {

watcher::watcher(context_t &ctx, std::string expression, watch_source_t source,
                 watch_callback_t callback, watch_options options,
                 error_handler_t on_error)
    : evaluator_t{ctx, std::move(on_error)}, label{std::move(expression)},
      source{std::move(source)}, callback{std::move(callback)}, opts{options},
      registration_id{ctx.next_id()} {}

void watcher::start() {
  auto initial = value{};
  if (not evaluate(initial))
    initial = undefined;

  last_value = initial;
  event("watch({}) #{} = {}", label, registration_id, last_value);

  if (opts.immediate)
    dispatch(last_value, undefined);
}

bool watcher::evaluate(value &result) {
  try {
    result = run_tracked(*ctx, *this, [this] {
      auto v = source();
      if (opts.deep) {
        // Wrapping only has an effect the first time a container is seen.
        wrap(v, *ctx);
        traverse(v);
      }
      return v;
    });
    return true;
  } catch (...) {
    report(std::format("source of watcher \"{}\"", label));
    return false;
  }
}

void watcher::run() {
  if (disposed())
    return;

  is_running = true;
  auto _ = scope_guard{[this] { is_running = false; }};

  auto next = value{};
  if (not evaluate(next))
    return;

  if (same_value(next, last_value) and not opts.deep)
    return;

  auto previous = std::exchange(last_value, next);
  dispatch(next, previous);
}

void watcher::dispatch(const value &next, const value &previous) {
  if (disposed() or not callback)
    return;

  event("dispatch({}) {} => {}", label, previous, next);
  try {
    callback(next, previous);
  } catch (...) {
    report(std::format("callback of watcher \"{}\"", label));
  }
}

void watcher::notify() {
  if (disposed())
    return;

  // A sync watcher that triggers itself goes through the queue instead of
  // recursing.
  if (opts.sync and not is_running) {
    run();
    return;
  }

  ctx->scheduler().queue_watcher(
      std::static_pointer_cast<watcher>(shared_from_this()));
}

void watcher::stop() {
  if (disposed())
    return;

  event("stop({}) #{}", label, registration_id);
  dispose();
}

void unsubscribe_t::operator()() const {
  if (auto w = target.lock())
    w->stop();
}

bool unsubscribe_t::active() const {
  auto w = target.lock();
  return w and w->active();
}

unsubscribe_t watch(context_t &ctx, watch_source_t source,
                    watch_callback_t callback, watch_options options,
                    scope_t *scope) {
  auto w = std::make_shared<watcher>(ctx, "<function>", std::move(source),
                                     std::move(callback), options);
  (scope ? *scope : ctx.scope()).add(w);
  w->start();
  return unsubscribe_t{w};
}

} // namespace tether
