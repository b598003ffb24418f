#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sbu::storage {

/// Largest key batch a single deleteByKeys() call accepts.
inline constexpr size_t kMaxDeleteBatch = 1000;

/// Public artifact bucket.
class IArtifactStore {
 public:
  virtual ~IArtifactStore() = default;

  /// Upload each file as "<sDestinationPrefix>/<basename>", publicly readable.
  /// Returns public URLs in input order. The first failure throws StorageError;
  /// objects uploaded before it are left in place.
  virtual std::vector<std::string> upload(const std::vector<std::filesystem::path>& vFiles,
                                          const std::string& sDestinationPrefix) = 0;

  /// Delete the keys in one batch. Throws StorageError when the batch exceeds
  /// kMaxDeleteBatch or the store rejects any key.
  virtual void deleteByKeys(const std::vector<std::string>& vKeys) = 0;
};

}  // namespace sbu::storage
