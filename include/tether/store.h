#pragma once

#include <tether/dependency.h>
#include <tether/utility.h>
#include <tether/value.h>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether {

using entries_t = std::vector<std::pair<std::string, value>>;

// Keyed values with one dependency per reactive key.
//
// A store becomes reactive when it is wrapped into a context: the keys it
// holds at that moment get a dependency each, and nested objects and arrays
// are wrapped recursively. Keys added later are stored but never tracked.
//
// The root store of an instance is sealed: reads and writes of keys it was
// not constructed with raise unknown_key_error. Nested (unsealed) stores
// treat a missing key as undefined.
class store : public std::enable_shared_from_this<store> {
public:
  struct slot_t {
    value current;
    std::shared_ptr<dep_t> dep;
  };

  explicit store(entries_t entries = {}, bool sealed = false);

  // A sealed store, already wrapped into `ctx`.
  static object_ref make_root(context_t &ctx, entries_t entries);

  value get(std::string_view key) const;
  void set(std::string_view key, value v);

  // Reads without subscribing; missing keys are undefined.
  value peek(std::string_view key) const;
  bool has(std::string_view key) const { return slots.contains(key); }
  bool tracked(std::string_view key) const;

  // Notifies the subscribers of `key` without changing it, for mutations
  // made to opaque state behind the key.
  void notify(std::string_view key);

  std::vector<std::string> keys() const;
  auto size() const { return slots.size(); }

  // Writes are still applied while locked, but nobody is notified.
  void lock() { is_locked = true; }
  void unlock() { is_locked = false; }
  auto locked() const { return is_locked; }
  auto sealed() const { return is_sealed; }

  // Binds this store and everything reachable from it to `ctx`. Only the
  // first wrap of a store has an effect.
  void wrap(context_t &ctx);
  auto wrapped() const { return ctx != nullptr; }

private:
  const slot_t &slot(std::string_view key) const;

  insertion_order_map<std::string, slot_t> slots;
  context_t *ctx = nullptr;
  bool is_sealed;
  bool is_locked = false;
};

// A reactive list. Structure and elements share a single dependency.
class reactive_array : public std::enable_shared_from_this<reactive_array> {
public:
  explicit reactive_array(std::vector<value> items = {});

  value get(std::size_t i) const;
  std::size_t size() const;
  const std::vector<value> &peek() const { return items; }

  // i == size() appends, larger indices throw std::out_of_range.
  void set(std::size_t i, value v);
  void push_back(value v);
  void pop_back();
  void erase(std::size_t i);
  void clear();

  void notify();

  void wrap(context_t &ctx);
  auto wrapped() const { return ctx != nullptr; }

private:
  void depend() const;
  void changed();

  std::vector<value> items;
  std::shared_ptr<dep_t> dep;
  context_t *ctx = nullptr;
};

value make_object(std::initializer_list<std::pair<std::string, value>> entries);
value make_array(std::initializer_list<value> items);

// Wraps nested objects and arrays of `v` into `ctx`.
void wrap(const value &v, context_t &ctx);

// Reads every key and element reachable from `v`, so that the active
// evaluator subscribes to all of them.
void traverse(const value &v);

} // namespace tether
