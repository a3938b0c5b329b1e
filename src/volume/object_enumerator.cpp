#include "volume/object_enumerator.hpp"
#include <utility>
#include <boost/log/trivial.hpp>

namespace wallace::volume {

ObjectEnumerator::ObjectEnumerator(fsutil::DirectoryStream stream)
  : stream_(std::move(stream)) {}

std::optional<Hash> ObjectEnumerator::next() {
  while (auto entry = stream_.next()) {
    if (auto hash = Hash::parse(entry->name)) {
      return hash;
    }
    if (entry->name != "." && entry->name != "..") {
      BOOST_LOG_TRIVIAL(debug) << "Volume: Skipping foreign " << fsutil::entry_type_to_string(entry->type)
                               << " in objects directory: " << entry->name;
    }
  }
  return std::nullopt;
}

} // namespace wallace::volume
