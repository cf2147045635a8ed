#include "common.h"

#include <stdexcept>
#include <string>
#include <vector>

using tether::hook_t;

static suite<"lifecycle"> _ = [] {
  auto log_hook = [](std::vector<std::string> &log, std::string name) {
    return hook_t{[&log, name](reactive_instance &) { log.push_back(name); }};
  };

  "created"_test = [=] {
    context_t ctx;
    auto seen = value{};
    auto order = std::vector<std::string>{};
    auto vm = construct(
        {
            .data = {{"count", 3}},
            .hooks =
                {
                    {hook_stage::created,
                     [&](reactive_instance &self) {
                       seen = self.get("count");
                       order.push_back("first");
                     }},
                    {hook_stage::created, log_hook(order, "second")},
                },
        },
        ctx);

    expect(seen == value{3}) << "created hooks see the initialized state";
    expect(that % order == std::vector<std::string>{"first", "second"});
    expect(vm->state() == lifecycle_state::created);

    auto late = false;
    vm->on_created([&](reactive_instance &) { late = true; });
    expect(not late) << "the created stage has already passed";
  };

  "mount"_test = [=] {
    context_t ctx;
    auto log = std::vector<std::string>{};
    auto vm = construct(
        {
            .data = {{"name", "world"}},
            .hooks = {{hook_stage::before_mount, log_hook(log, "before_mount")},
                      {hook_stage::mounted, log_hook(log, "mounted")}},
        },
        ctx);
    vm->on_before_update(log_hook(log, "before_update"));
    vm->on_updated(log_hook(log, "updated"));

    auto output = std::vector<std::string>{};
    vm->mount(
        [](reactive_instance &self) {
          return value{"hello " + self.get("name").as_string()};
        },
        [&](const value &next, const value &) {
          log.push_back("commit");
          output.push_back(next.as_string());
        });

    expect(that % log ==
           std::vector<std::string>{"before_mount", "commit", "mounted"});
    expect(vm->state() == lifecycle_state::mounted);
    expect(that % output == std::vector<std::string>{"hello world"});

    log.clear();
    vm->set("name", "there");
    expect(log.empty()) << "re-renders are scheduled, not inline";
    ctx.tick();
    expect(that % log ==
           std::vector<std::string>{"before_update", "commit", "updated"});
    expect(vm->state() == lifecycle_state::updated);
    expect(that % output ==
           std::vector<std::string>{"hello world", "hello there"});

    log.clear();
    vm->set("name", "there");
    ctx.drain();
    expect(log.empty()) << "an unchanged state does not re-render";
  };

  "mount_errors"_test = [] {
    context_t ctx;
    auto vm = construct({.data = {{"x", 0}}}, ctx);
    auto render = [](reactive_instance &self) { return self.get("x"); };
    auto commit = [](const value &, const value &) {};

    vm->mount(render, commit);
    expect(throws<tether::lifecycle_error>([&] { vm->mount(render, commit); }))
        << "an instance is mounted once";

    auto other = construct({.data = {{"x", 0}}}, ctx);
    other->destroy();
    expect(throws<tether::lifecycle_error>(
        [&] { other->mount(render, commit); }));
  };

  "failing_commit"_test = [] {
    context_t ctx;
    auto vm = construct({.data = {{"x", 0}}}, ctx);
    vm->mount([](reactive_instance &self) { return self.get("x"); },
              [](const value &next, const value &) {
                if (next == value{1})
                  throw std::runtime_error{"cannot commit"};
              });

    vm->set("x", 1);
    ctx.tick();
    expect(vm->state() == lifecycle_state::updated)
        << "a failed commit still completes the update";
    expect(vm->errors().size() == 1_ul);
    expect(vm->errors()[0].origin == "render commit"s);
  };

  "destroy"_test = [=] {
    context_t ctx;
    auto log = std::vector<std::string>{};
    auto vm = construct(
        {
            .data = {{"x", 0}},
            .hooks = {{hook_stage::before_destroy,
                       [&](reactive_instance &self) {
                         log.push_back("before_destroy");
                         expect(not self.destroyed())
                             << "the instance is still usable here";
                         expect(self.watchers("x") == 1_ul);
                       }},
                      {hook_stage::destroyed, log_hook(log, "destroyed")}},
        },
        ctx);

    auto rec = recorder{};
    vm->watch("x", rec.callback());
    vm->set("x", 1);

    vm->destroy();
    expect(that % log ==
           std::vector<std::string>{"before_destroy", "destroyed"});
    expect(vm->state() == lifecycle_state::destroyed);
    expect(vm->watchers("x") == 0_ul);

    vm->destroy();
    expect(log.size() == 2_ul) << "destroy is idempotent";

    ctx.drain();
    expect(rec.count() == 0_i) << "enqueued reactions are dropped";

    expect(not vm->watch("x", rec.callback()).active())
        << "watching after destroy registers nothing";
  };

  "destroy_from_a_callback"_test = [] {
    context_t ctx;
    auto vm = construct({.data = {{"x", 0}}}, ctx);

    auto later = recorder{};
    vm->watch("x", [&](const value &, const value &) { vm->destroy(); });
    vm->watch("x", later.callback());

    vm->set("x", 1);
    ctx.tick();
    expect(vm->destroyed());
    expect(later.count() == 0_i)
        << "watchers queued in the same pass are silenced";
  };

  "hook_names"_test = [] {
    using tether::to_string;
    expect(to_string(hook_stage::before_update) == "before_update"s);
    expect(to_string(lifecycle_state::mounted) == "mounted"s);
  };
};
