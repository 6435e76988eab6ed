#pragma once

#include <string>

namespace hosting::provisioning {

struct StoredCertificate {
  std::string path;
  std::string content_tag;
  std::string material;
};

/*
  PEM files for the proxy's TLS listeners.

  Files are content addressed (<id>-<content tag>.pem), so replacing the
  material of a certificate produces a new path and the running proxy keeps
  reading the old file until the new configuration is live.
*/
class CertificateCache {
 public:
  explicit CertificateCache(std::string directory);

  // Throws std::runtime_error when the file cannot be written.
  StoredCertificate Write(const std::string& certificate_id, const std::string& material) const;

  void Remove(const std::string& path) const;

  // Non-cryptographic hash of the material, used to name files and detect
  // replacement.
  static std::string ContentTag(const std::string& material);

  const std::string& Directory() const {
    return directory_;
  }

 private:
  std::string directory_;
};

} // namespace hosting::provisioning
