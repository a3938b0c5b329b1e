#include "browse/parsed_path.hpp"
#include "volume/constants.hpp"

namespace wallace::browse {

std::optional<ParsedPath> ParsedPath::from_components(const std::vector<std::string_view>& components) {
  std::vector<std::string_view> parts;
  for (std::string_view c : components) {
    if (!c.empty()) {
      parts.push_back(c);
    }
  }

  if (parts.empty()) {
    return root();
  }
  if (parts[0] != volume::constants::kObjectsDir) {
    return std::nullopt;
  }

  switch (parts.size()) {
    case 1:
      return objects();
    case 2:
      if (auto hash = volume::Hash::parse(parts[1])) {
        return object(*hash);
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

std::optional<ParsedPath> ParsedPath::parse(std::string_view path) {
  std::vector<std::string_view> components;
  std::size_t start = 0;
  for (;;) {
    std::size_t slash = path.find('/', start);
    if (slash == std::string_view::npos) {
      components.push_back(path.substr(start));
      break;
    }
    components.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return from_components(components);
}

ParsedPath ParsedPath::from_string(std::string_view path) {
  auto parsed = parse(path);
  if (!parsed) {
    throw InvalidPath(std::string(path));
  }
  return *parsed;
}

std::string ParsedPath::to_string() const {
  switch (kind) {
    case Kind::Objects:
      return std::string("/") + volume::constants::kObjectsDir;
    case Kind::ObjectsObject:
      return std::string("/") + volume::constants::kObjectsDir + "/" + hash->to_string();
    default:
      return "/";
  }
}

} // namespace wallace::browse
