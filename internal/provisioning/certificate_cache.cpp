#include "certificate_cache.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace hosting::provisioning {

namespace fs = std::filesystem;

CertificateCache::CertificateCache(std::string directory) : directory_(std::move(directory)) {
}

std::string CertificateCache::ContentTag(const std::string& material) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016zx", std::hash<std::string>{}(material));
  return buf;
}

StoredCertificate CertificateCache::Write(const std::string& certificate_id, const std::string& material) const {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("cannot create " + directory_ + ": " + ec.message());
  }

  StoredCertificate stored;
  stored.content_tag = ContentTag(material);
  stored.material    = material;
  stored.path        = (fs::path(directory_) / (certificate_id + "-" + stored.content_tag + ".pem")).string();

  const auto tmp = stored.path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp);
    }
    out.write(material.data(), static_cast<std::streamsize>(material.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("cannot write " + tmp);
    }
  }
  // private key material
  fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, ec);
  if (ec) {
    HOSTING_LOG_WARN("Failed to restrict certificate file", {observability::StringField("path", tmp), observability::StringField("error", ec.message())});
  }

  fs::rename(tmp, stored.path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("cannot store certificate " + certificate_id);
  }
  return stored;
}

void CertificateCache::Remove(const std::string& path) const {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    HOSTING_LOG_WARN("Failed to remove certificate file", {observability::StringField("path", path), observability::StringField("error", ec.message())});
  }
}

} // namespace hosting::provisioning
