#include "artifact_store.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace hosting::proxy {

namespace fs = std::filesystem;

ArtifactStore::ArtifactStore(std::string directory, std::string name)
    : directory_(std::move(directory)), name_(std::move(name)) {}

std::string ArtifactStore::Stage(std::uint64_t version, const std::string& text) {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("cannot create " + directory_ + ": " + ec.message());
  }

  const auto path = (fs::path(directory_) / (name_ + "-" + std::to_string(version) + ".conf")).string();
  const auto tmp  = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp);
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("cannot write " + tmp);
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("cannot stage " + path);
  }
  return path;
}

void ArtifactStore::Activate(const std::string& path) {
  const auto active = fs::path(ActivePath());
  const auto link   = fs::path(active.string() + ".next");

  std::error_code ec;
  fs::remove(link, ec);
  fs::create_symlink(fs::path(path).filename(), link, ec);
  if (ec) {
    throw std::runtime_error("cannot link " + link.string() + ": " + ec.message());
  }
  fs::rename(link, active, ec);
  if (ec) {
    throw std::runtime_error("cannot activate " + path + ": " + ec.message());
  }
}

void ArtifactStore::Prune(const std::vector<std::string>& keep) {
  const auto prefix = name_ + "-";

  std::vector<fs::path> stale;
  std::error_code       ec;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto file = it->path().filename().string();
    if (file.compare(0, prefix.size(), prefix) != 0) continue;

    bool kept = false;
    for (const auto& k : keep) {
      kept = kept || fs::path(k).filename() == it->path().filename();
    }
    if (!kept) {
      stale.push_back(it->path());
    }
  }

  for (const auto& path : stale) {
    Discard(path.string());
  }
}

void ArtifactStore::Discard(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    HOSTING_LOG_WARN("Failed to remove artifact", {observability::StringField("path", path), observability::StringField("error", ec.message())});
  }
}

std::string ArtifactStore::ActivePath() const {
  return (fs::path(directory_) / (name_ + ".conf")).string();
}

std::optional<std::string> ArtifactStore::ActiveTarget() const {
  std::error_code ec;
  const auto      target = fs::read_symlink(ActivePath(), ec);
  if (ec) {
    return std::nullopt;
  }
  return (fs::path(directory_) / target).string();
}

} // namespace hosting::proxy
