#include "volume/object_reader.hpp"
#include "volume/constants.hpp"
#include "volume/volume_error.hpp"
#include <unistd.h>
#include <utility>
#include <vector>

namespace wallace::volume {

ObjectReader::ObjectReader(fsutil::FileHandle file, std::uint64_t size)
  : file_(std::move(file))
  , size_(size) {}

std::size_t ObjectReader::read(void* buffer, std::size_t size) {
  return file_.read(buffer, size);
}

std::uint64_t ObjectReader::seek(std::int64_t offset, int whence) {
  return file_.seek(offset, whence);
}

std::uint64_t ObjectReader::copy_to(std::ostream& output) {
  std::vector<char> buffer(constants::kBufferSize);
  std::uint64_t total_bytes = 0;

  for (;;) {
    std::size_t n = file_.read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    output.write(buffer.data(), static_cast<std::streamsize>(n));
    total_bytes += n;
  }

  if (!output.good()) {
    throw VolumeError("ObjectReader: failed to write to output stream");
  }
  return total_bytes;
}

std::string ObjectReader::read_all() {
  seek(0, SEEK_SET);
  std::string data;
  data.reserve(static_cast<std::size_t>(size_));

  std::vector<char> buffer(constants::kBufferSize);
  for (;;) {
    std::size_t n = file_.read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    data.append(buffer.data(), n);
  }
  return data;
}

} // namespace wallace::volume
