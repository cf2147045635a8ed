#pragma once

#include <tether/tether.h>

#include <boost/ut.hpp>

#include <cmath>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

using namespace boost::ut;
using namespace std::string_literals;

using tether::construct;
using tether::context_t;
using tether::hook_stage;
using tether::insertion_order_map;
using tether::lifecycle_state;
using tether::make_array;
using tether::make_object;
using tether::reactive_instance;
using tether::same_value;
using tether::scope_t;
using tether::store;
using tether::undefined;
using tether::value;

auto to_vector(auto &&rng) {
  using T = std::ranges::range_value_t<decltype(rng)>;

  auto r = std::vector<T>{};
  for (auto &&x : rng)
    r.push_back(x);

  return r;
}

// Records every (new, old) pair a watcher callback receives.
struct recorder {
  std::vector<std::pair<value, value>> calls;

  auto callback() {
    return [this](const value &next, const value &previous) {
      calls.emplace_back(next, previous);
    };
  }

  auto count() const { return static_cast<int>(calls.size()); }
};

inline auto number(reactive_instance &self, std::string_view key) {
  return self.get(key).as_number();
}

#define CONCAT2(a, b) a##b
#define CONCAT(a, b) CONCAT2(a, b)
#define _ CONCAT(placeholder_, __LINE__)
