#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace hosting::confgen {

/*
  Helpers shared by record validation and artifact generation.

  Every function throws util::ValidationError on input that cannot be
  expressed safely in the generated configuration.
*/

// "m4d/S1" -> "/m4d/S1/"
std::string NormalizePathPrefix(const std::string& prefix);

struct Origin {
  std::string scheme;
  std::string authority;
  std::string path;  // always ends with '/'

  std::string Url() const {
    return scheme + "://" + authority + path;
  }
};

// http(s)://host[:port][/path]
Origin ParseOrigin(const std::string& base_url);

// nginx "rewrite" regex and replacement for a path rewrite rule. The rule
// only replaces a part of the path, so the rest of the URL is carried over.
std::pair<std::string, std::string> TransformRewriteRule(const std::string& request_pattern, const std::string& mapped_path);

// Bare tokens (paths, host names, ids) must not break out of a directive.
bool IsSafeToken(std::string_view value);

} // namespace hosting::confgen
