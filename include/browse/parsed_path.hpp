#ifndef WALLACE_BROWSE_PARSED_PATH_HPP
#define WALLACE_BROWSE_PARSED_PATH_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "volume/hash.hpp"

namespace wallace::browse {

class InvalidPath : public std::runtime_error {
public:
  explicit InvalidPath(const std::string& path)
    : std::runtime_error("Invalid path: '" + path + "'") {}
};

// Browsable paths that address objects. Paths are UTF-8 and always use '/'.
//   /                 Root
//   /objects          Objects
//   /objects/<hex>    ObjectsObject
struct ParsedPath {
  enum class Kind {
    Root,
    Objects,
    ObjectsObject
  };

  Kind kind = Kind::Root;
  // Set only for ObjectsObject
  std::optional<volume::Hash> hash;

  static ParsedPath root() { return ParsedPath{Kind::Root, std::nullopt}; }
  static ParsedPath objects() { return ParsedPath{Kind::Objects, std::nullopt}; }
  static ParsedPath object(const volume::Hash& hash) { return ParsedPath{Kind::ObjectsObject, hash}; }

  // Empty components are ignored
  static std::optional<ParsedPath> from_components(const std::vector<std::string_view>& components);
  static std::optional<ParsedPath> parse(std::string_view path);
  // Like parse, throws InvalidPath
  static ParsedPath from_string(std::string_view path);

  std::string to_string() const;

  bool operator==(const ParsedPath& other) const {
    return kind == other.kind && hash == other.hash;
  }
  bool operator!=(const ParsedPath& other) const { return !(*this == other); }
};

} // namespace wallace::browse

#endif // WALLACE_BROWSE_PARSED_PATH_HPP
