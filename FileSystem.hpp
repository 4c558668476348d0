#pragma once

#include <system_error>

#include "types.hpp"

// The only mutations the executor is allowed to make. Each call reports the
// OS error instead of throwing.
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  virtual bool is_directory(const fs::path& path) const = 0;
  virtual std::error_code create_dir_all(const fs::path& path) = 0;
  // Overwrites an existing regular file at `to`.
  virtual std::error_code copy(const fs::path& from, const fs::path& to) = 0;
  virtual std::error_code remove(const fs::path& path) = 0;
};

class LocalFileSystem : public FileSystem {
 public:
  bool is_directory(const fs::path& path) const override;
  std::error_code create_dir_all(const fs::path& path) override;
  std::error_code copy(const fs::path& from, const fs::path& to) override;
  std::error_code remove(const fs::path& path) override;
};
