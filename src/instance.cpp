#include <tether/instance.h>
#include <tether/log.h>
#include <tether/path.h>

#include <algorithm>

namespace tether {

std::string_view to_string(lifecycle_state state) {
  switch (state) {
  default:
    return "unknown";
  case lifecycle_state::created:
    return "created";
  case lifecycle_state::mounted:
    return "mounted";
  case lifecycle_state::updated:
    return "updated";
  case lifecycle_state::destroyed:
    return "destroyed";
  }
}

std::string_view to_string(hook_stage stage) {
  switch (stage) {
  default:
    return "unknown";
  case hook_stage::created:
    return "created";
  case hook_stage::before_mount:
    return "before_mount";
  case hook_stage::mounted:
    return "mounted";
  case hook_stage::before_update:
    return "before_update";
  case hook_stage::updated:
    return "updated";
  case hook_stage::before_destroy:
    return "before_destroy";
  case hook_stage::destroyed:
    return "destroyed";
  }
}

std::shared_ptr<reactive_instance> construct(definition def, context_t &ctx) {
  auto instance = std::make_shared<reactive_instance>(
      reactive_instance::private_tag{}, ctx, std::move(def.config));
  instance->define(def);
  instance->fire(hook_stage::created);
  return instance;
}

reactive_instance::reactive_instance(private_tag, context_t &ctx,
                                     config_t config)
    : ctx{&ctx}, config{std::move(config)} {}

reactive_instance::~reactive_instance() {
  // Only unlink from the graph; hooks fire on an explicit destroy().
  if (not destroyed())
    teardown();
}

void reactive_instance::define(definition &def) {
  for (auto &[stage, hook] : def.hooks)
    hooks[stage].push_back(std::move(hook));

  auto declare = [&](const std::string &name, property_t property) {
    if (not registry.emplace(name, std::move(property)))
      throw definition_error{
          std::format("property \"{}\" is defined more than once", name)};
  };

  for (auto &[key, v] : def.data)
    declare(key, raw_property{});
  root = store::make_root(*ctx, std::move(def.data));

  for (auto &[name, c] : def.computed) {
    if (not c.get)
      throw definition_error{
          std::format("computed property \"{}\" has no getter", name)};

    auto setter = computed_node::setter_t{};
    if (c.set)
      setter = [this, set = std::move(c.set)](const value &v) { set(*this, v); };

    auto node = std::make_shared<computed_node>(
        *ctx, name, [this, get = std::move(c.get)] { return get(*this); },
        std::move(setter), reporter());
    declare(name, node);
    owned.add(node);
  }

  for (auto &[name, method] : def.methods) {
    if (not method)
      throw definition_error{std::format("method \"{}\" is empty", name)};

    declare(name, std::move(method));
  }

  for (auto &w : def.watch) {
    auto callback = watch_callback_t{};
    if (w.handler)
      callback = [this, handler = std::move(w.handler)](const value &next,
                                                        const value &previous) {
        handler(*this, next, previous);
      };

    watch(w.source, std::move(callback), w.options);
  }
}

value reactive_instance::get(std::string_view key) {
  auto property = registry.find(key);
  if (not property)
    throw unknown_key_error{std::string{key}};

  if (auto node = std::get_if<std::shared_ptr<computed_node>>(property))
    return (*node)->read();

  if (std::holds_alternative<method_fn>(*property))
    throw type_error{std::format("\"{}\" is a method, use call()", key)};

  return root->get(key);
}

void reactive_instance::set(std::string_view key, value v) {
  auto property = registry.find(key);
  if (not property)
    throw unknown_key_error{std::string{key}};

  if (auto node = std::get_if<std::shared_ptr<computed_node>>(property)) {
    (*node)->write(v);
    return;
  }

  if (std::holds_alternative<method_fn>(*property))
    throw type_error{std::format("\"{}\" is a method and cannot be set", key)};

  root->set(key, std::move(v));
}

value reactive_instance::call(std::string_view method,
                              const std::vector<value> &args) {
  auto property = registry.find(method);
  if (not property)
    throw unknown_key_error{std::string{method}};

  auto fn = std::get_if<method_fn>(property);
  if (not fn)
    throw type_error{std::format("\"{}\" is not a method", method)};

  // Copy, the method may redefine nothing but it may destroy us.
  auto f = *fn;
  return f(*this, args);
}

std::shared_ptr<computed_node>
reactive_instance::computed(std::string_view name) const {
  auto property = registry.find(name);
  if (not property)
    return nullptr;

  auto node = std::get_if<std::shared_ptr<computed_node>>(property);
  return node ? *node : nullptr;
}

value reactive_instance::resolve(const std::vector<std::string> &segments,
                                 bool strict, std::string_view path) {
  auto property = registry.find(segments.front());
  if (not property or std::holds_alternative<method_fn>(*property)) {
    if (strict)
      throw invalid_path_error{
          std::string{path},
          std::format("\"{}\" is not a property", segments.front())};
    return undefined;
  }

  return resolve_path(get(segments.front()), segments, 1, strict, path);
}

watch_source_t reactive_instance::path_source(std::string_view path) {
  auto segments = std::vector<std::string>{};
  try {
    segments = split_path(path);
  } catch (const invalid_path_error &e) {
    if (config.strict_paths)
      throw;

    log(log_level::warn, "{}, watching undefined", e.what());
    return [] { return value{}; };
  }

  if (config.strict_paths)
    untracked(*ctx, [&] { resolve(segments, true, path); });

  return [this, segments = std::move(segments), path = std::string{path}] {
    return resolve(segments, false, path);
  };
}

unsubscribe_t reactive_instance::watch(std::string_view path,
                                       watch_callback_t callback,
                                       watch_options options) {
  auto source = path_source(path);
  return add_watcher(std::string{path}, std::move(source), std::move(callback),
                     options);
}

unsubscribe_t reactive_instance::watch(getter_fn source,
                                       watch_callback_t callback,
                                       watch_options options) {
  return add_watcher(
      "<function>", [this, source = std::move(source)] { return source(*this); },
      std::move(callback), options);
}

unsubscribe_t reactive_instance::add_watcher(std::string expression,
                                             watch_source_t source,
                                             watch_callback_t callback,
                                             watch_options options) {
  if (destroyed() or is_destroying) {
    log(log_level::debug, "watch({}) on a destroyed instance ignored",
        expression);
    return {};
  }

  auto w = std::make_shared<watcher>(*ctx, expression, std::move(source),
                                     std::move(callback), options, reporter());
  owned.add(w);
  auto &list = expressions[expression];
  std::erase_if(list, [](auto &existing) { return not existing->active(); });
  list.push_back(w);
  w->start();

  return unsubscribe_t{w};
}

std::size_t reactive_instance::watchers(std::string_view expression) const {
  auto list = expressions.find(expression);
  if (not list)
    return 0;

  return static_cast<std::size_t>(
      std::ranges::count_if(*list, [](auto &w) { return w->active(); }));
}

void reactive_instance::on(hook_stage stage, hook_t hook) {
  hooks[stage].push_back(std::move(hook));
}

void reactive_instance::fire(hook_stage stage) {
  auto list = hooks.find(stage);
  if (not list)
    return;

  event("fire({}) {} hook(s)", to_string(stage), list->size());

  // Copy, because hooks may register more hooks.
  const auto callbacks = *list;
  untracked(*ctx, [&] {
    for (auto &hook : callbacks) {
      try {
        hook(*this);
      } catch (...) {
        report(capture_error(std::format("{} hook", to_string(stage))));
      }
    }
  });
}

void reactive_instance::mount(render_fn render, watch_callback_t commit) {
  if (destroyed() or is_destroying)
    throw lifecycle_error{"cannot mount a destroyed instance"};
  if (render_watcher)
    throw lifecycle_error{"instance is already mounted"};

  fire(hook_stage::before_mount);

  auto update = [this, commit](const value &next, const value &previous) {
    fire(hook_stage::before_update);
    try {
      commit(next, previous);
    } catch (...) {
      report(capture_error("render commit"));
    }
    current_state = lifecycle_state::updated;
    fire(hook_stage::updated);
  };

  render_watcher = std::make_shared<watcher>(
      *ctx, "<render>",
      [this, render = std::move(render)] { return render(*this); },
      std::move(update), watch_options{}, reporter());
  owned.add(render_watcher);
  render_watcher->start();

  try {
    commit(render_watcher->last(), undefined);
  } catch (...) {
    report(capture_error("render commit"));
  }

  current_state = lifecycle_state::mounted;
  fire(hook_stage::mounted);
}

void reactive_instance::destroy() {
  if (destroyed() or is_destroying)
    return;

  is_destroying = true;
  fire(hook_stage::before_destroy);
  teardown();
  current_state = lifecycle_state::destroyed;
  is_destroying = false;
  fire(hook_stage::destroyed);
}

void reactive_instance::teardown() {
  event("teardown: {} evaluator(s)", owned.size());
  for (auto &evaluator : owned)
    evaluator->dispose();

  owned.clear();
  expressions.clear();
}

void reactive_instance::report(const reported_error &e) {
  if (config.on_error) {
    config.on_error(e);
    return;
  }

  if (ctx->on_error) {
    ctx->on_error(e);
    return;
  }

  log(log_level::warn, "error in {}: {}", e.origin, e.message);
  recorded.push_back(e);
}

error_handler_t reactive_instance::reporter() {
  return [this](const reported_error &e) { report(e); };
}

} // namespace tether
