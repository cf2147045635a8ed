#include <tether/errors.h>
#include <tether/store.h>
#include <tether/value.h>

#include <format>

#include <cmath>
#include <set>

namespace tether {

namespace {

[[noreturn]] void mismatch(const value &v, std::string_view expected) {
  throw type_error{
      std::format("expected {}, got {} ({})", expected, v.kind(), v)};
}

auto format_number(double n) {
  if (std::isnan(n))
    return std::string{"NaN"};
  if (std::isinf(n))
    return std::string{n < 0 ? "-Infinity" : "Infinity"};
  if (n == std::trunc(n) and std::abs(n) < 1e15)
    return std::format("{}", static_cast<long long>(n));

  return std::format("{}", n);
}

void append(std::string &out, const value &v, std::set<const void *> &seen) {
  switch (v.variant().index()) {
  default:
  case 0:
    out += "undefined";
    break;
  case 1:
    out += "null";
    break;
  case 2:
    out += v.as_bool() ? "true" : "false";
    break;
  case 3:
    out += format_number(v.as_number());
    break;
  case 4:
    out += std::format("\"{}\"", v.as_string());
    break;
  case 5: {
    auto &o = v.as_object();
    if (not seen.insert(o.get()).second) {
      out += "{...}";
      break;
    }

    out += "{";
    auto first = true;
    for (auto &key : o->keys()) {
      out += first ? "" : ", ";
      out += std::format("{}: ", key);
      append(out, o->peek(key), seen);
      first = false;
    }
    out += "}";
    seen.erase(o.get());
    break;
  }
  case 6: {
    auto &a = v.as_array();
    if (not seen.insert(a.get()).second) {
      out += "[...]";
      break;
    }

    out += "[";
    auto first = true;
    for (auto &item : a->peek()) {
      out += first ? "" : ", ";
      append(out, item, seen);
      first = false;
    }
    out += "]";
    seen.erase(a.get());
    break;
  }
  }
}

} // namespace

bool value::as_bool() const {
  if (not is_bool())
    mismatch(*this, "bool");

  return std::get<bool>(data);
}

double value::as_number() const {
  if (not is_number())
    mismatch(*this, "number");

  return std::get<double>(data);
}

const std::string &value::as_string() const {
  if (not is_string())
    mismatch(*this, "string");

  return std::get<std::string>(data);
}

const object_ref &value::as_object() const {
  if (not is_object())
    mismatch(*this, "object");

  return std::get<object_ref>(data);
}

const array_ref &value::as_array() const {
  if (not is_array())
    mismatch(*this, "array");

  return std::get<array_ref>(data);
}

bool value::truthy() const {
  switch (data.index()) {
  default:
  case 0:
  case 1:
    return false;
  case 2:
    return std::get<bool>(data);
  case 3: {
    const auto n = std::get<double>(data);
    return n != 0 and not std::isnan(n);
  }
  case 4:
    return not std::get<std::string>(data).empty();
  case 5:
  case 6:
    return true;
  }
}

std::string_view value::kind() const {
  switch (data.index()) {
  default:
  case 0:
    return "undefined";
  case 1:
    return "null";
  case 2:
    return "bool";
  case 3:
    return "number";
  case 4:
    return "string";
  case 5:
    return "object";
  case 6:
    return "array";
  }
}

bool same_value(const value &lhs, const value &rhs) {
  if (lhs.variant().index() != rhs.variant().index())
    return false;

  if (lhs.is_number()) {
    const auto a = lhs.as_number();
    const auto b = rhs.as_number();
    // NaN is equal to itself here, otherwise every write of NaN would be
    // a change.
    return a == b or (std::isnan(a) and std::isnan(b));
  }

  return lhs.variant() == rhs.variant();
}

bool operator==(const value &lhs, const value &rhs) {
  return same_value(lhs, rhs);
}

std::string to_string(const value &v) {
  auto out = std::string{};
  auto seen = std::set<const void *>{};
  append(out, v, seen);
  return out;
}

} // namespace tether
