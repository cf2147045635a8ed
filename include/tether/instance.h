#pragma once

#include <tether/computed.h>
#include <tether/config.h>
#include <tether/context.h>
#include <tether/store.h>
#include <tether/utility.h>
#include <tether/value.h>
#include <tether/watcher.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tether {

class reactive_instance;

enum class lifecycle_state {
  created,
  mounted,
  updated,
  destroyed,
};

enum class hook_stage {
  created,
  before_mount,
  mounted,
  before_update,
  updated,
  before_destroy,
  destroyed,
};

std::string_view to_string(lifecycle_state state);
std::string_view to_string(hook_stage stage);

using hook_t = std::function<void(reactive_instance &)>;
using getter_fn = std::function<value(reactive_instance &)>;
using setter_fn = std::function<void(reactive_instance &, const value &)>;
using method_fn =
    std::function<value(reactive_instance &, const std::vector<value> &)>;
using handler_fn =
    std::function<void(reactive_instance &, const value &, const value &)>;
using render_fn = std::function<value(reactive_instance &)>;

struct computed_def {
  getter_fn get;
  setter_fn set = {};
};

struct watch_def {
  std::string source;
  handler_fn handler;
  watch_options options = {};
};

struct definition {
  entries_t data;
  std::vector<std::pair<std::string, computed_def>> computed;
  std::vector<std::pair<std::string, method_fn>> methods;
  std::vector<watch_def> watch;
  std::vector<std::pair<hook_stage, hook_t>> hooks;
  config_t config;
};

std::shared_ptr<reactive_instance> construct(definition def,
                                             context_t &ctx = default_context());

// What a name of an instance refers to.
struct raw_property {};
using property_t =
    std::variant<raw_property, std::shared_ptr<computed_node>, method_fn>;

class reactive_instance
    : public std::enable_shared_from_this<reactive_instance> {
  struct private_tag {};

public:
  reactive_instance(private_tag, context_t &ctx, config_t config);
  ~reactive_instance();

  reactive_instance(const reactive_instance &) = delete;
  reactive_instance &operator=(const reactive_instance &) = delete;

  friend std::shared_ptr<reactive_instance> construct(definition def,
                                                      context_t &ctx);

  // Data keys read the store, computed names read the computed node.
  value get(std::string_view key);
  void set(std::string_view key, value v);
  bool has(std::string_view key) const { return registry.contains(key); }

  value call(std::string_view method, const std::vector<value> &args = {});

  // Watches a dot-separated path ("user.name", "items.0") starting at a
  // data key or computed name.
  unsubscribe_t watch(std::string_view path, watch_callback_t callback,
                      watch_options options = {});
  unsubscribe_t watch(getter_fn source, watch_callback_t callback,
                      watch_options options = {});
  // Number of live watchers registered under `expression`.
  std::size_t watchers(std::string_view expression) const;

  void on(hook_stage stage, hook_t hook);
  void on_created(hook_t hook) { on(hook_stage::created, std::move(hook)); }
  void on_before_mount(hook_t hook) {
    on(hook_stage::before_mount, std::move(hook));
  }
  void on_mounted(hook_t hook) { on(hook_stage::mounted, std::move(hook)); }
  void on_before_update(hook_t hook) {
    on(hook_stage::before_update, std::move(hook));
  }
  void on_updated(hook_t hook) { on(hook_stage::updated, std::move(hook)); }
  void on_before_destroy(hook_t hook) {
    on(hook_stage::before_destroy, std::move(hook));
  }
  void on_destroyed(hook_t hook) { on(hook_stage::destroyed, std::move(hook)); }

  // Attaches the presentation layer: `render` is re-evaluated whenever the
  // state it reads changes, and `commit` receives each new output.
  void mount(render_fn render, watch_callback_t commit);

  void destroy();

  lifecycle_state state() const { return current_state; }
  bool destroyed() const { return current_state == lifecycle_state::destroyed; }

  store &data() { return *root; }
  context_t &context() { return *ctx; }
  std::shared_ptr<computed_node> computed(std::string_view name) const;

  const std::vector<reported_error> &errors() const { return recorded; }
  void report(const reported_error &e);

private:
  void define(definition &def);
  void fire(hook_stage stage);
  unsubscribe_t add_watcher(std::string expression, watch_source_t source,
                            watch_callback_t callback, watch_options options);
  watch_source_t path_source(std::string_view path);
  value resolve(const std::vector<std::string> &segments, bool strict,
                std::string_view path);
  error_handler_t reporter();
  void teardown();

  context_t *ctx;
  config_t config;
  object_ref root;
  insertion_order_map<std::string, property_t> registry;
  insertion_order_map<std::string, std::vector<std::shared_ptr<watcher>>>
      expressions;
  insertion_order_map<hook_stage, std::vector<hook_t>> hooks;
  scope_t owned;
  std::shared_ptr<watcher> render_watcher;
  std::vector<reported_error> recorded;
  lifecycle_state current_state = lifecycle_state::created;
  bool is_destroying = false;
};

} // namespace tether
