#include "volume/union.hpp"
#include <exception>
#include <utility>
#include <boost/log/trivial.hpp>

namespace wallace::volume {

std::optional<ObjectReader> union_get(const std::vector<const Volume*>& volumes, const Hash& hash) {
  BOOST_LOG_TRIVIAL(debug) << "Union: Looking up " << hash << " in " << volumes.size() << " volumes";

  for (const Volume* volume : volumes) {
    if (auto reader = volume->get(hash)) {
      BOOST_LOG_TRIVIAL(debug) << "Union: Found " << hash << " in " << volume->root_path().string();
      return reader;
    }
  }
  return std::nullopt;
}


//==============================================
// UNION ENUMERATION
//==============================================

UnionEnumerator::UnionEnumerator(std::vector<const Volume*> volumes)
  : volumes_(std::move(volumes)) {}

std::optional<Hash> UnionEnumerator::next() {
  while (index_ < volumes_.size()) {
    try {
      if (!current_) {
        current_.emplace(volumes_[index_]->all());
      }
      if (auto hash = current_->next()) {
        return hash;
      }
    } catch (const std::exception& e) {
      // The caller decides how to report it
      BOOST_LOG_TRIVIAL(debug) << "Union: Listing " << volumes_[index_]->root_path().string()
                               << " failed: " << e.what();
      advance();
      throw;
    }
    advance();
  }
  return std::nullopt;
}

void UnionEnumerator::advance() {
  current_.reset();
  ++index_;
}

UnionEnumerator union_all(const std::vector<const Volume*>& volumes) {
  return UnionEnumerator(volumes);
}

} // namespace wallace::volume
