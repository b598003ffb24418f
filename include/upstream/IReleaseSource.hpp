#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sbu::upstream {

/// Source of published stable releases.
class IReleaseSource {
 public:
  virtual ~IReleaseSource() = default;

  /// All published releases of sOwner/sRepo. Throws UpstreamFetchError on
  /// transport, auth, rate-limit or decoding failures. Never retries.
  virtual std::vector<common::UpstreamRelease> fetchReleases(const std::string& sOwner,
                                                             const std::string& sRepo) = 0;
};

}  // namespace sbu::upstream
