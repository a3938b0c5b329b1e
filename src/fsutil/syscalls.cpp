#include "fsutil/syscalls.hpp"
#include "fsutil/fs_error.hpp"
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace wallace::fsutil {

namespace {

int link_flags(bool follow_symlinks) {
  return follow_symlinks ? AT_SYMLINK_FOLLOW : 0;
}

} // namespace

//==============================================
// OPENING
//==============================================

FileHandle open_relative(const FileHandle& dir, const std::string& name, int flags, mode_t mode) {
  int fd = ::openat(dir.get(), name.c_str(), flags, mode);
  if (fd == -1) {
    throw_last_os_error("openat " + name);
  }
  return FileHandle(fd);
}

FileHandle open_path(const std::string& path, int flags, mode_t mode) {
  int fd = ::open(path.c_str(), flags, mode);
  if (fd == -1) {
    throw_last_os_error("open " + path);
  }
  return FileHandle(fd);
}


//==============================================
// LINKING AND RENAMING
//==============================================

void link_relative(const FileHandle& old_dir, const std::string& old_name,
                   const FileHandle& new_dir, const std::string& new_name,
                   bool follow_symlinks) {
  BOOST_LOG_TRIVIAL(trace) << "fsutil: linkat " << old_name << " -> " << new_name;
  if (::linkat(old_dir.get(), old_name.c_str(), new_dir.get(), new_name.c_str(),
               link_flags(follow_symlinks)) == -1) {
    throw_last_os_error("linkat " + old_name + " -> " + new_name);
  }
}

void link_absolute(const std::string& old_path,
                   const FileHandle& new_dir, const std::string& new_name,
                   bool follow_symlinks) {
  // The source must not depend on the working directory
  if (old_path.empty() || old_path.front() != '/') {
    throw std::invalid_argument("link_absolute: path is not absolute: " + old_path);
  }
  BOOST_LOG_TRIVIAL(trace) << "fsutil: linkat " << old_path << " -> " << new_name;
  if (::linkat(AT_FDCWD, old_path.c_str(), new_dir.get(), new_name.c_str(),
               link_flags(follow_symlinks)) == -1) {
    throw_last_os_error("linkat " + old_path + " -> " + new_name);
  }
}

void rename_relative(const FileHandle& old_dir, const std::string& old_name,
                     const FileHandle& new_dir, const std::string& new_name) {
  BOOST_LOG_TRIVIAL(trace) << "fsutil: renameat " << old_name << " -> " << new_name;
  if (::renameat(old_dir.get(), old_name.c_str(), new_dir.get(), new_name.c_str()) == -1) {
    throw_last_os_error("renameat " + old_name + " -> " + new_name);
  }
}


//==============================================
// DESCRIPTOR FLAGS
//==============================================

int get_fd_flags(const FileHandle& file) {
  int flags = ::fcntl(file.get(), F_GETFD);
  if (flags == -1) {
    throw_last_os_error("fcntl F_GETFD");
  }
  return flags;
}

void set_fd_flags(const FileHandle& file, int flags) {
  if (::fcntl(file.get(), F_SETFD, flags) == -1) {
    throw_last_os_error("fcntl F_SETFD");
  }
}

int get_status_flags(const FileHandle& file) {
  int flags = ::fcntl(file.get(), F_GETFL);
  if (flags == -1) {
    throw_last_os_error("fcntl F_GETFL");
  }
  return flags;
}

void set_status_flags(const FileHandle& file, int flags) {
  if (::fcntl(file.get(), F_SETFL, flags) == -1) {
    throw_last_os_error("fcntl F_SETFL");
  }
}


//==============================================
// NODE CREATION
//==============================================

void make_directory(const std::string& path, mode_t mode) {
  if (::mkdir(path.c_str(), mode) == -1) {
    throw_last_os_error("mkdir " + path);
  }
}

void make_node(const std::string& path, mode_t mode, dev_t dev) {
  if (::mknod(path.c_str(), mode, dev) == -1) {
    throw_last_os_error("mknod " + path);
  }
}

} // namespace wallace::fsutil
