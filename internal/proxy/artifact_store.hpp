#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hosting::proxy {

/*
  Versioned configuration artifacts on disk.

      <dir>/<name>-<version>.conf   staged artifacts
      <dir>/<name>.conf             symlink to the active one

  The proxy is always pointed at the symlink, so activating an artifact is
  a single rename and never exposes a half-written file.
*/
class ArtifactStore {
 public:
  explicit ArtifactStore(std::string directory, std::string name = "nginx");

  // Writes a new artifact and returns its path. Throws std::runtime_error.
  std::string Stage(std::uint64_t version, const std::string& text);

  // Points the active symlink at path.
  void Activate(const std::string& path);

  // Removes every staged artifact not listed in keep.
  void Prune(const std::vector<std::string>& keep);

  void Discard(const std::string& path);

  std::string ActivePath() const;

  // Artifact the active symlink points at, if any.
  std::optional<std::string> ActiveTarget() const;

  const std::string& Directory() const {
    return directory_;
  }

 private:
  std::string directory_;
  std::string name_;
};

} // namespace hosting::proxy
