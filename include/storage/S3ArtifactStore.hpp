#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/HttpClient.hpp"
#include "storage/AwsSigV4Signer.hpp"
#include "storage/IArtifactStore.hpp"

namespace sbu::storage {

/// Bucket location and credentials.
/// Class abbreviation: s3s
struct S3Settings {
  std::string sBucket;
  std::string sRegion = "us-east-1";
  /// Path-style endpoint for S3-compatible stores, e.g. "http://minio:9000".
  /// Unset = AWS virtual-hosted style.
  std::optional<std::string> oEndpoint;
  std::string sAccessKeyId;
  std::string sSecretAccessKey;
  std::optional<std::string> oSessionToken;
  std::chrono::seconds durTimeout{60};
};

/// S3 REST implementation (PutObject, DeleteObjects) signed with SigV4.
/// Class abbreviation: s3
class S3ArtifactStore : public IArtifactStore {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  S3ArtifactStore(common::HttpClient& hcClient, S3Settings s3sSettings,
                  Clock fnNow = std::chrono::system_clock::now);
  ~S3ArtifactStore() override;

  std::vector<std::string> upload(const std::vector<std::filesystem::path>& vFiles,
                                  const std::string& sDestinationPrefix) override;
  void deleteByKeys(const std::vector<std::string>& vKeys) override;

  /// Public URL of an object key.
  std::string objectUrl(const std::string& sKey) const;

  /// DeleteObjects request body for vKeys (quiet mode).
  static std::string buildDeleteBody(const std::vector<std::string>& vKeys);

  /// Keys reported in <Error> elements of a DeleteObjects response.
  /// Throws StorageError("delete_failed") on a malformed body.
  static std::vector<std::string> parseDeleteErrors(const std::string& sResponseBody);

 private:
  /// Host header value and canonical URI for a key ("" = bucket root).
  std::pair<std::string, std::string> locate(const std::string& sKey) const;

  /// scheme://host[:port] requests are sent to.
  std::string origin() const;

  /// Sign and send one request.
  common::HttpResponse send(const std::string& sMethod, const std::string& sKey,
                            const std::string& sQuery, const std::string& sBody,
                            std::map<std::string, std::string> mapHeaders);

  common::HttpClient& _hcClient;
  S3Settings _s3sSettings;
  AwsSigV4Signer _sigSigner;
  Clock _fnNow;
};

}  // namespace sbu::storage
