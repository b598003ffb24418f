#pragma once

#include <filesystem>
#include <string>

namespace sbu::common {

/// RAII owner of a directory tree; removes it recursively on destruction.
/// Class abbreviation: sd
class ScopedDirectory {
 public:
  /// Adopt (and create if needed) pathDir.
  explicit ScopedDirectory(std::filesystem::path pathDir);

  /// Create a fresh, uniquely named directory under pathParent (mkdtemp).
  static ScopedDirectory createUnique(const std::filesystem::path& pathParent,
                                      const std::string& sPrefix);

  ~ScopedDirectory();

  ScopedDirectory(const ScopedDirectory&) = delete;
  ScopedDirectory& operator=(const ScopedDirectory&) = delete;
  ScopedDirectory(ScopedDirectory&& other) noexcept;
  ScopedDirectory& operator=(ScopedDirectory&& other) = delete;

  const std::filesystem::path& path() const { return _pathDir; }

 private:
  struct Adopt {};
  ScopedDirectory(Adopt, std::filesystem::path pathDir);

  std::filesystem::path _pathDir;
};

}  // namespace sbu::common
