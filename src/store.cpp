#include <tether/context.h>
#include <tether/log.h>
#include <tether/store.h>

#include <set>
#include <stdexcept>

namespace tether {

store::store(entries_t entries, bool sealed) : is_sealed{sealed} {
  for (auto &[key, v] : entries)
    slots[key] = slot_t{std::move(v), nullptr};
}

object_ref store::make_root(context_t &ctx, entries_t entries) {
  auto root = std::make_shared<store>(std::move(entries), true);
  root->wrap(ctx);
  return root;
}

const store::slot_t &store::slot(std::string_view key) const {
  if (auto s = slots.find(key))
    return *s;

  throw unknown_key_error{std::string{key}};
}

value store::get(std::string_view key) const {
  if (not is_sealed and not slots.contains(key))
    return undefined;

  auto &s = slot(key);
  if (s.dep and ctx)
    s.dep->depend(*ctx);

  return s.current;
}

value store::peek(std::string_view key) const {
  if (auto s = slots.find(key))
    return s->current;

  return undefined;
}

bool store::tracked(std::string_view key) const {
  auto s = slots.find(key);
  return s and s->dep;
}

void store::set(std::string_view key, value v) {
  auto s = slots.find(key);
  if (not s) {
    if (is_sealed)
      throw unknown_key_error{std::string{key}};

    // Added after the store was wrapped: stored, but never tracked.
    event("set({}) untracked", key);
    slots.emplace(std::string{key}, slot_t{std::move(v), nullptr});
    return;
  }

  if (same_value(s->current, v))
    return;

  if (ctx)
    tether::wrap(v, *ctx);

  event("set({}) {} => {}", key, s->current, v);
  s->current = std::move(v);

  if (is_locked or not s->dep)
    return;

  auto dep = s->dep;
  dep->notify();
}

void store::notify(std::string_view key) {
  auto &s = slot(key);
  if (is_locked or not s.dep)
    return;

  auto dep = s.dep;
  dep->notify();
}

std::vector<std::string> store::keys() const {
  auto result = std::vector<std::string>{};
  for (auto &[key, s] : slots)
    result.push_back(key);

  return result;
}

void store::wrap(context_t &ctx) {
  if (this->ctx)
    return;

  this->ctx = &ctx;
  for (auto &[key, s] : slots) {
    s.dep = std::make_shared<dep_t>(key);
    tether::wrap(s.current, ctx);
  }
}

reactive_array::reactive_array(std::vector<value> items)
    : items{std::move(items)} {}

void reactive_array::depend() const {
  if (dep and ctx)
    dep->depend(*ctx);
}

void reactive_array::changed() {
  if (not dep)
    return;

  auto d = dep;
  d->notify();
}

value reactive_array::get(std::size_t i) const {
  depend();
  if (i >= items.size())
    return undefined;

  return items[i];
}

std::size_t reactive_array::size() const {
  depend();
  return items.size();
}

void reactive_array::set(std::size_t i, value v) {
  if (i == items.size()) {
    push_back(std::move(v));
    return;
  }

  if (i > items.size())
    throw std::out_of_range{std::format(
        "array index {} is past the end (size {})", i, items.size())};

  if (same_value(items[i], v))
    return;

  if (ctx)
    tether::wrap(v, *ctx);

  items[i] = std::move(v);
  changed();
}

void reactive_array::push_back(value v) {
  if (ctx)
    tether::wrap(v, *ctx);

  items.push_back(std::move(v));
  changed();
}

void reactive_array::pop_back() {
  if (items.empty())
    return;

  items.pop_back();
  changed();
}

void reactive_array::erase(std::size_t i) {
  if (i >= items.size())
    throw std::out_of_range{std::format(
        "array index {} is past the end (size {})", i, items.size())};

  items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
  changed();
}

void reactive_array::clear() {
  if (items.empty())
    return;

  items.clear();
  changed();
}

void reactive_array::notify() { changed(); }

void reactive_array::wrap(context_t &ctx) {
  if (this->ctx)
    return;

  this->ctx = &ctx;
  dep = std::make_shared<dep_t>("[]");
  for (auto &item : items)
    tether::wrap(item, ctx);
}

value make_object(
    std::initializer_list<std::pair<std::string, value>> entries) {
  return std::make_shared<store>(entries_t{entries});
}

value make_array(std::initializer_list<value> items) {
  return std::make_shared<reactive_array>(std::vector<value>{items});
}

void wrap(const value &v, context_t &ctx) {
  if (v.is_object())
    v.as_object()->wrap(ctx);
  else if (v.is_array())
    v.as_array()->wrap(ctx);
}

namespace {

void traverse(const value &v, std::set<const void *> &seen) {
  if (v.is_object()) {
    auto &o = v.as_object();
    if (not seen.insert(o.get()).second)
      return;

    for (auto &key : o->keys())
      traverse(o->get(key), seen);
  } else if (v.is_array()) {
    auto &a = v.as_array();
    if (not seen.insert(a.get()).second)
      return;

    const auto n = a->size();
    for (auto i = std::size_t{0}; i < n; ++i)
      traverse(a->get(i), seen);
  }
}

} // namespace

void traverse(const value &v) {
  auto seen = std::set<const void *>{};
  traverse(v, seen);
}

} // namespace tether
