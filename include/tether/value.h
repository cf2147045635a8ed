#pragma once

#include <format>

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tether {

struct undefined_t {
  bool operator==(const undefined_t &) const = default;
};

inline constexpr auto undefined = undefined_t{};

class store;
class reactive_array;

using object_ref = std::shared_ptr<store>;
using array_ref = std::shared_ptr<reactive_array>;

// The dynamically typed value held by stores, computed nodes and watchers.
// Objects and arrays are held by reference: copying a value aliases the
// container, and equality on them is identity.
class value {
public:
  using variant_t = std::variant<undefined_t, std::nullptr_t, bool, double,
                                 std::string, object_ref, array_ref>;

  value() = default;
  value(undefined_t) {}
  value(std::nullptr_t) : data{nullptr} {}
  value(bool b) : data{b} {}
  value(const char *s) : data{std::string{s}} {}
  value(std::string s) : data{std::move(s)} {}
  value(std::string_view s) : data{std::string{s}} {}
  value(object_ref o) : data{std::move(o)} {}
  value(array_ref a) : data{std::move(a)} {}

  template <typename T>
    requires(std::is_arithmetic_v<T> and not std::same_as<T, bool>)
  value(T n) : data{static_cast<double>(n)} {}

  auto is_undefined() const { return data.index() == 0; }
  auto is_null() const { return data.index() == 1; }
  auto is_bool() const { return data.index() == 2; }
  auto is_number() const { return data.index() == 3; }
  auto is_string() const { return data.index() == 4; }
  auto is_object() const { return data.index() == 5; }
  auto is_array() const { return data.index() == 6; }

  bool as_bool() const;
  double as_number() const;
  const std::string &as_string() const;
  const object_ref &as_object() const;
  const array_ref &as_array() const;

  bool truthy() const;
  std::string_view kind() const;

  const variant_t &variant() const { return data; }

  // Strict equality, see same_value().
  friend bool operator==(const value &lhs, const value &rhs);

private:
  variant_t data;
};

// Strict value/identity equality: the kinds must match, NaN equals NaN,
// objects and arrays compare by reference.
bool same_value(const value &lhs, const value &rhs);

// JSON-like rendering, used for logging and std::format.
std::string to_string(const value &v);

} // namespace tether

template <> struct std::formatter<tether::value> : std::formatter<std::string> {
  auto format(const tether::value &v, auto &ctx) const {
    return std::formatter<std::string>::format(tether::to_string(v), ctx);
  }
};
