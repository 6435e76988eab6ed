#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace hosting::redirect {

struct RedirectEntry {
  // <scope>redir-<uuid>/
  std::string key;
  std::string upstream;

  // session prefix the key was minted under
  std::string scope;

  util::TimePoint expires_at;
};

// Outcome of a request-time lookup.
struct Resolution {
  std::string upstream;
  std::string remainder;
  bool        redirected = false;
};

} // namespace hosting::redirect
