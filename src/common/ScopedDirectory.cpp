#include "common/ScopedDirectory.hpp"

#include "common/Logger.hpp"

#include <stdlib.h>

#include <cerrno>
#include <system_error>
#include <vector>

namespace sbu::common {

ScopedDirectory::ScopedDirectory(std::filesystem::path pathDir) : _pathDir(std::move(pathDir)) {
  std::filesystem::create_directories(_pathDir);
}

ScopedDirectory::ScopedDirectory(Adopt, std::filesystem::path pathDir)
    : _pathDir(std::move(pathDir)) {}

ScopedDirectory ScopedDirectory::createUnique(const std::filesystem::path& pathParent,
                                              const std::string& sPrefix) {
  std::filesystem::create_directories(pathParent);

  std::string sTemplate = (pathParent / (sPrefix + "XXXXXX")).string();
  std::vector<char> vBuf(sTemplate.begin(), sTemplate.end());
  vBuf.push_back('\0');
  if (::mkdtemp(vBuf.data()) == nullptr) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp " + sTemplate);
  }
  return ScopedDirectory(Adopt{}, std::filesystem::path(vBuf.data()));
}

ScopedDirectory::ScopedDirectory(ScopedDirectory&& other) noexcept
    : _pathDir(std::move(other._pathDir)) {
  other._pathDir.clear();
}

ScopedDirectory::~ScopedDirectory() {
  if (_pathDir.empty()) return;

  std::error_code ec;
  std::filesystem::remove_all(_pathDir, ec);
  if (ec) {
    Logger::get()->warn("Failed to remove {}: {}", _pathDir.string(), ec.message());
  }
}

}  // namespace sbu::common
