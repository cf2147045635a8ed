#include <tether/errors.h>
#include <tether/path.h>
#include <tether/store.h>

#include <charconv>

namespace tether {

std::vector<std::string> split_path(std::string_view path) {
  if (path.empty())
    throw invalid_path_error{std::string{path}, "empty path"};

  auto segments = std::vector<std::string>{};
  auto begin = std::size_t{0};
  while (true) {
    const auto end = path.find('.', begin);
    const auto segment = path.substr(begin, end - begin);
    if (segment.empty())
      throw invalid_path_error{std::string{path}, "empty segment"};

    segments.emplace_back(segment);
    if (end == std::string_view::npos)
      break;

    begin = end + 1;
  }

  return segments;
}

namespace {

auto parse_index(const std::string &segment, std::size_t &index) {
  const auto last = segment.data() + segment.size();
  const auto [ptr, ec] = std::from_chars(segment.data(), last, index);
  return ec == std::errc{} and ptr == last;
}

} // namespace

value resolve_path(const value &root, const std::vector<std::string> &segments,
                   std::size_t first, bool strict, std::string_view path) {
  auto fail = [&](const std::string &reason) -> value {
    if (strict)
      throw invalid_path_error{std::string{path}, reason};
    return undefined;
  };

  auto current = root;
  for (auto i = first; i < segments.size(); ++i) {
    const auto &segment = segments[i];

    if (current.is_object()) {
      const auto &o = current.as_object();
      if (not o->has(segment))
        return fail("no key \"" + segment + "\"");

      current = o->get(segment);
    } else if (current.is_array()) {
      const auto &a = current.as_array();
      auto index = std::size_t{0};
      if (not parse_index(segment, index))
        return fail("\"" + segment + "\" is not an array index");
      if (index >= a->size())
        return fail("index " + segment + " is out of range");

      current = a->get(index);
    } else {
      return fail("cannot read \"" + segment + "\" of " +
                  std::string{current.kind()});
    }
  }

  return current;
}

} // namespace tether
