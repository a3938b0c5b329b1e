#ifndef WALLACE_VOLUME_CONSTANTS_HPP
#define WALLACE_VOLUME_CONSTANTS_HPP

#include <cstddef>
#include <sys/types.h>

namespace wallace::volume::constants {

// Reserved subdirectory of a volume root that holds the object files
inline constexpr const char* kObjectsDir = "objects";

// ---- Hash sizes ----
inline constexpr std::size_t kHashRawLen = 32;  // SHA-256
inline constexpr std::size_t kHashHexLen = 64;

// Descriptor-to-path bridge for linkat(2) without CAP_DAC_READ_SEARCH
inline constexpr const char* kProcSelfFd = "/proc/self/fd/";

// Mode given to inserted files
inline constexpr mode_t kReadOnlyMode = 0400;
// Mode for the anonymous temporary file behind insert_from_stream
inline constexpr mode_t kTempFileMode = 0600;
// Mode for the volume root and its objects directory
inline constexpr mode_t kDirectoryMode = 0777;

inline constexpr std::size_t kBufferSize = 8192;

} // namespace wallace::volume::constants

#endif // WALLACE_VOLUME_CONSTANTS_HPP
