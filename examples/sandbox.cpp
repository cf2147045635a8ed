#include <tether/tether.h>

#include <print>

#include <string>

using namespace tether;

int main() {
  set_log_level(log_level::info);

  auto vm = construct({
      .data = {{"first_name", "Anita"},
               {"last_name", "Laera"},
               {"nick_name", ""},
               {"display_full", true}},
      .computed = {{"full_name",
                    {.get =
                         [](reactive_instance &self) {
                           std::print("calc full_name\n");
                           auto nick = self.get("nick_name");
                           if (nick.truthy())
                             return nick;

                           return value{self.get("first_name").as_string() +
                                        " " +
                                        self.get("last_name").as_string()};
                         }}}},
      .hooks = {{hook_stage::mounted,
                 [](reactive_instance &) { std::print("mounted\n"); }},
                {hook_stage::destroyed,
                 [](reactive_instance &) { std::print("destroyed\n"); }}},
  });

  vm->mount(
      [](reactive_instance &self) {
        std::print("render\n");
        if (not self.get("display_full").truthy())
          return value{"<hidden>"};

        return self.get("full_name");
      },
      [](const value &next, const value &) { std::print(">> {}\n", next); });

  auto &ctx = vm->context();
  auto set = [&](std::string_view key, value v) {
    vm->set(key, std::move(v));
    ctx.drain();
  };

  // "Anita Laera"
  set("first_name", "Missi");
  // full_name >> render >> "Missi Laera"
  set("last_name", "Valkering");
  // full_name >> render >> "Missi Valkering"
  set("first_name", "Erik");
  // full_name >> render >> "Erik Valkering"
  set("nick_name", "Erik Valkering");
  // full_name >> render
  set("nick_name", "Erik Engelbertus Johannes Valkering");
  // full_name >> render >> "Erik Engelbertus Johannes Valkering"
  set("display_full", false);
  // render >> "<hidden>"
  set("nick_name", "Ciri");

  vm->destroy();
}
