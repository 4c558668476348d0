#include "FileSystem.hpp"

bool LocalFileSystem::is_directory(const fs::path& path) const {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

std::error_code LocalFileSystem::create_dir_all(const fs::path& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  return ec;
}

std::error_code LocalFileSystem::copy(const fs::path& from,
                                      const fs::path& to) {
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  return ec;
}

std::error_code LocalFileSystem::remove(const fs::path& path) {
  std::error_code ec;
  if (!fs::remove(path, ec) && !ec) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  }
  return ec;
}
