#include <tether/context.h>
#include <tether/log.h>

#include <algorithm>

namespace tether {

void scope_t::add(std::shared_ptr<evaluator_t> evaluator) {
  std::erase_if(evaluators, [](auto &e) { return e->disposed(); });
  evaluators.push_back(std::move(evaluator));
}

context_t::context_t() = default;

context_t::~context_t() {
  // Evaluators in the default scope may still sit in the queue; drop the
  // queue first so nothing runs against a dying context.
  queue.clear();
  default_scope.clear();
}

std::weak_ptr<evaluator_t> context_t::active() const {
  if (stack.empty())
    return {};

  return stack.back();
}

void context_t::push(std::weak_ptr<evaluator_t> evaluator) {
  stack.push_back(std::move(evaluator));
}

void context_t::pop() { stack.pop_back(); }

void context_t::next_tick(std::function<void()> callback) {
  const auto was_idle = idle();
  callbacks.push_back(std::move(callback));
  if (was_idle and queue.on_schedule)
    queue.on_schedule();
}

void context_t::tick() {
  queue.flush();

  for (auto &callback : std::exchange(callbacks, {})) {
    try {
      callback();
    } catch (...) {
      report(capture_error("next_tick callback"));
    }
  }
}

std::size_t context_t::drain() {
  auto passes = std::size_t{0};
  while (not idle()) {
    if (passes == max_flush_passes) {
      auto message = std::format(
          "still not idle after {} flush passes, possible infinite update "
          "loop; dropping {} pending watcher(s)",
          passes, queue.pending());
      auto exception = std::make_exception_ptr(flush_limit_error{message});
      report({"drain", std::move(message), std::move(exception)});
      queue.clear();
      callbacks.clear();
      break;
    }

    tick();
    ++passes;
  }

  return passes;
}

void context_t::report(const reported_error &e) {
  if (on_error) {
    on_error(e);
    return;
  }

  log(log_level::warn, "error in {}: {}", e.origin, e.message);
  recorded.push_back(e);
}

context_t &default_context() {
  thread_local context_t ctx;
  return ctx;
}

} // namespace tether
