#include "common.h"

#include <stdexcept>
#include <string>
#include <vector>

using tether::reported_error;

static suite<"errors"> _ = [] {
  "failing_callback_does_not_stop_siblings"_test = [] {
    context_t ctx;
    auto vm = construct({.data = {{"count", 0}}}, ctx);

    auto before = recorder{};
    auto after = recorder{};
    vm->watch("count", before.callback());
    vm->watch("count", [](const value &, const value &) {
      throw std::runtime_error{"callback failed"};
    });
    vm->watch("count", after.callback());

    vm->set("count", 1);
    ctx.tick();
    expect(before.count() == 1_i);
    expect(after.count() == 1_i);
    expect(vm->errors().size() == 1_ul);
    expect(vm->errors()[0].origin == "callback of watcher \"count\""s);
    expect(vm->errors()[0].message == "callback failed"s);

    vm->set("count", 2);
    ctx.tick();
    expect(after.count() == 2_i) << "the failing watcher stays registered";
    expect(vm->errors().size() == 2_ul);
  };

  "failing_source"_test = [] {
    context_t ctx;
    auto vm = construct({.data = {{"count", 0}}}, ctx);

    auto rec = recorder{};
    vm->watch(
        [](reactive_instance &self) -> value {
          if (number(self, "count") == 1)
            throw std::runtime_error{"bad source"};
          return self.get("count");
        },
        rec.callback());

    vm->set("count", 1);
    ctx.tick();
    expect(rec.count() == 0_i);
    expect(vm->errors().size() == 1_ul);

    vm->set("count", 2);
    ctx.tick();
    expect(rec.count() == 1_i)
        << "reads before the throw keep the watcher subscribed";
    expect(rec.calls[0].second == value{0});
  };

  "failing_hook"_test = [] {
    context_t ctx;
    auto order = std::vector<std::string>{};
    auto vm = construct(
        {
            .hooks =
                {
                    {hook_stage::created,
                     [](reactive_instance &) {
                       throw std::runtime_error{"hook failed"};
                     }},
                    {hook_stage::created,
                     [&](reactive_instance &) { order.push_back("second"); }},
                },
        },
        ctx);

    expect(that % order == std::vector<std::string>{"second"});
    expect(vm->errors().size() == 1_ul);
    expect(vm->errors()[0].origin == "created hook"s);
    expect(vm->state() == lifecycle_state::created);
  };

  "custom_handler"_test = [] {
    context_t ctx;
    auto handled = std::vector<reported_error>{};
    auto vm = construct(
        {
            .data = {{"count", 0}},
            .config = {.on_error =
                           [&](const reported_error &e) {
                             handled.push_back(e);
                           }},
        },
        ctx);

    vm->watch("count", [](const value &, const value &) {
      throw std::logic_error{"handled elsewhere"};
    });
    vm->set("count", 1);
    ctx.tick();

    expect(handled.size() == 1_ul);
    expect(vm->errors().empty()) << "a custom handler replaces recording";
    expect(throws<std::logic_error>(
        [&] { std::rethrow_exception(handled[0].exception); }));
  };

  "context_handler"_test = [] {
    context_t ctx;
    auto handled = 0;
    ctx.on_error = [&](const reported_error &) { ++handled; };

    auto vm = construct({.data = {{"count", 0}}}, ctx);
    vm->watch("count", [](const value &, const value &) {
      throw std::runtime_error{"no instance handler"};
    });
    vm->set("count", 1);
    ctx.tick();

    expect(handled == 1_i)
        << "without config.on_error the context's handler is used";
    expect(vm->errors().empty());
  };

  "non_strict_paths"_test = [] {
    context_t ctx;
    auto vm = construct({.data = {{"user", make_object({{"name", "Ada"}})}}},
                        ctx);

    auto rec = recorder{};
    vm->watch("user.age", rec.callback(), {.immediate = true});
    vm->watch("nobody.home", rec.callback(), {.immediate = true});
    vm->watch("user..name", rec.callback(), {.immediate = true});
    expect(rec.count() == 3_i);
    expect(rec.calls[0].first.is_undefined());
    expect(rec.calls[1].first.is_undefined());
    expect(rec.calls[2].first.is_undefined());
    expect(vm->errors().empty()) << "unresolvable paths are not errors";
  };

  "strict_paths"_test = [] {
    context_t ctx;
    auto make = [&](std::vector<tether::watch_def> watch = {}) {
      return construct(
          {
              .data = {{"user", make_object({{"name", "Ada"}})},
                       {"tags", make_array({"x"})}},
              .watch = std::move(watch),
              .config = {.strict_paths = true},
          },
          ctx);
    };

    auto vm = make();
    expect(nothrow([&] { vm->watch("user.name", {}); }));
    expect(nothrow([&] { vm->watch("tags.0", {}); }));
    expect(throws<tether::invalid_path_error>(
        [&] { vm->watch("user.age", {}); }));
    expect(throws<tether::invalid_path_error>(
        [&] { vm->watch("tags.1", {}); }));
    expect(throws<tether::invalid_path_error>(
        [&] { vm->watch("tags.first", {}); }));
    expect(throws<tether::invalid_path_error>(
        [&] { vm->watch("user.name.first", {}); }));
    expect(throws<tether::invalid_path_error>([&] { vm->watch("", {}); }));

    try {
      vm->watch("nobody", {});
    } catch (const tether::invalid_path_error &e) {
      expect(e.path() == "nobody"s);
    }

    expect(throws<tether::invalid_path_error>(
        [&] { make({{.source = "user.nickname", .handler = {}}}); }))
        << "definition watch entries are validated at construction";
  };

  "definition_errors"_test = [] {
    context_t ctx;
    expect(throws<tether::definition_error>([&] {
      construct(
          {
              .data = {{"count", 0}},
              .computed = {{"count", {.get = [](reactive_instance &) {
                                        return value{};
                                      }}}},
          },
          ctx);
    })) << "a computed cannot shadow a data key";

    expect(throws<tether::definition_error>(
        [&] { construct({.computed = {{"empty", {}}}}, ctx); }));

    expect(throws<tether::definition_error>(
        [&] { construct({.methods = {{"nothing", {}}}}, ctx); }));
  };

  "methods"_test = [] {
    context_t ctx;
    auto vm = construct(
        {
            .data = {{"count", 0}},
            .methods =
                {
                    {"increment",
                     [](reactive_instance &self, const std::vector<value> &args) {
                       auto by = args.empty() ? 1.0 : args[0].as_number();
                       self.set("count", number(self, "count") + by);
                       return self.get("count");
                     }},
                },
        },
        ctx);

    expect(vm->call("increment") == value{1});
    expect(vm->call("increment", {5}) == value{6});
    expect(vm->get("count") == value{6});

    expect(throws<tether::type_error>([&] { vm->get("increment"); }));
    expect(throws<tether::type_error>([&] { vm->set("increment", 1); }));
    expect(throws<tether::type_error>([&] { vm->call("count"); }));
    expect(throws<tether::unknown_key_error>([&] { vm->call("missing"); }));
  };
};
