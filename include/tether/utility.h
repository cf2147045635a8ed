#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#define FWD(x) std::forward<decltype(x)>(x)

namespace tether {

template <typename F> struct scope_guard {
  F f;
  ~scope_guard() { f(); };
};

template <typename F> scope_guard(F) -> scope_guard<F>;

// Small associative containers that keep keys in insertion order.
// The graph is small and iteration order is observable (hooks, watchers,
// subscribers), so a flat vector beats a tree here.
template <typename Key, typename Value, typename Comparator = std::less<>>
class insertion_order_map {
  std::vector<std::pair<Key, Value>> nodes;

  static auto equal(const auto &lhs, const auto &rhs) {
    auto cmp = Comparator{};
    return not cmp(lhs, rhs) and not cmp(rhs, lhs);
  }

  inline auto find_node(this auto &&self, const auto &key) {
    return std::ranges::find_if(
        FWD(self).nodes, [&](auto &k) { return equal(k, key); },
        &std::pair<Key, Value>::first);
  }

public:
  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  decltype(auto) begin(this auto &&self) { return FWD(self).nodes.begin(); }
  decltype(auto) end(this auto &&self) { return FWD(self).nodes.end(); }

  inline auto &operator[](const auto &key) {
    auto it = find_node(key);
    if (it != nodes.end()) {
      return it->second;
    }

    return nodes.emplace_back(Key(key), Value{}).second;
  }

  inline auto contains(const auto &key) const {
    return find_node(key) != nodes.end();
  }

  // Pointer to the mapped value, const when the map is.
  inline auto find(this auto &&self, const auto &key) {
    auto it = self.find_node(key);
    return it == self.nodes.end() ? nullptr : std::addressof(it->second);
  }

  inline auto emplace(Key key, Value value) {
    if (contains(key))
      return false;

    nodes.emplace_back(std::move(key), std::move(value));
    return true;
  }

  inline auto erase(const auto &key) {
    auto it = find_node(key);
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }

  void clear() { nodes.clear(); }
};

template <typename T, typename Comparator = std::less<T>>
struct insertion_order_set {
  std::vector<T> nodes;

  auto size() const { return nodes.size(); }
  auto empty() const { return nodes.empty(); }
  auto begin() const { return nodes.begin(); }
  auto end() const { return nodes.end(); }
  auto contains(const T &value) const {
    return std::ranges::find_if(nodes, [&](auto &k) {
             auto cmp = Comparator{};
             return not cmp(k, value) and not cmp(value, k);
           }) != nodes.end();
  }
  auto insert(const T &value) {
    if (contains(value))
      return false;

    nodes.push_back(value);
    return true;
  }
  auto erase(const T &value) {
    auto it = std::ranges::find_if(nodes, [&](auto &k) {
      auto cmp = Comparator{};
      return not cmp(k, value) and not cmp(value, k);
    });
    if (it == nodes.end())
      return false;

    nodes.erase(it);
    return true;
  }
  void clear() { nodes.clear(); }
};

} // namespace tether
