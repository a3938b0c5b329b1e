#ifndef WALLACE_FSUTIL_SYSCALLS_HPP
#define WALLACE_FSUTIL_SYSCALLS_HPP

#include <string>
#include <sys/types.h>
#include "file_handle.hpp"

// Directory-relative file system calls that std::filesystem does not offer.
// Every function throws std::system_error with the errno of the failed call.

namespace wallace::fsutil {

// ---- OPENING ----
// openat(2) relative to an open directory
FileHandle open_relative(const FileHandle& dir, const std::string& name, int flags, mode_t mode = 0);
// open(2) of a caller supplied path
FileHandle open_path(const std::string& path, int flags, mode_t mode = 0);


// ---- LINKING AND RENAMING ----
// linkat(2) between two open directories; fails with file_exists if new_name exists
void link_relative(const FileHandle& old_dir, const std::string& old_name,
                   const FileHandle& new_dir, const std::string& new_name,
                   bool follow_symlinks);
// linkat(2) from an absolute path such as /proc/self/fd/<n>
void link_absolute(const std::string& old_path,
                   const FileHandle& new_dir, const std::string& new_name,
                   bool follow_symlinks);
// renameat(2); replaces an existing destination as the platform does
void rename_relative(const FileHandle& old_dir, const std::string& old_name,
                     const FileHandle& new_dir, const std::string& new_name);


// ---- DESCRIPTOR FLAGS ----
// F_GETFD / F_SETFD (FD_CLOEXEC)
int get_fd_flags(const FileHandle& file);
void set_fd_flags(const FileHandle& file, int flags);
// F_GETFL / F_SETFL (O_NONBLOCK and the other status flags)
int get_status_flags(const FileHandle& file);
void set_status_flags(const FileHandle& file, int flags);


// ---- NODE CREATION ----
// mkdir(2); unlike std::filesystem::create_directory an existing entry is an error
void make_directory(const std::string& path, mode_t mode);
// mknod(2), used for fifos and sockets
void make_node(const std::string& path, mode_t mode, dev_t dev = 0);

} // namespace wallace::fsutil

#endif // WALLACE_FSUTIL_SYSCALLS_HPP
