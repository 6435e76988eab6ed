#include "directives.hpp"

#include <cctype>
#include <regex>

#include "internal/util/errors.hpp"

namespace hosting::confgen {

using util::ValidationError;

bool IsSafeToken(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) {
      return false;
    }
    switch (c) {
      case ';':
      case '{':
      case '}':
      case '"':
      case '\'':
      case '\\':
      case '$':
      case '#':
        return false;
      default:
        break;
    }
  }
  return true;
}

std::string NormalizePathPrefix(const std::string& prefix) {
  std::string normalized = prefix;
  if (normalized.empty() || normalized.front() != '/') {
    normalized.insert(normalized.begin(), '/');
  }
  if (normalized.back() != '/') {
    normalized.push_back('/');
  }
  if (normalized.find("//") != std::string::npos) {
    throw ValidationError("path prefix contains an empty segment: " + prefix);
  }
  if (normalized.find("/../") != std::string::npos || normalized.find("/./") != std::string::npos) {
    throw ValidationError("path prefix contains a relative segment: " + prefix);
  }
  if (!IsSafeToken(normalized) || normalized.find_first_of("?*~") != std::string::npos) {
    throw ValidationError("path prefix contains invalid characters: " + prefix);
  }
  return normalized;
}

Origin ParseOrigin(const std::string& base_url) {
  const auto scheme_end = base_url.find("://");
  if (scheme_end == std::string::npos) {
    throw ValidationError("origin must be an absolute http(s) URL: " + base_url);
  }

  Origin origin;
  origin.scheme = base_url.substr(0, scheme_end);
  for (auto& c : origin.scheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (origin.scheme != "http" && origin.scheme != "https") {
    throw ValidationError("origin scheme must be http or https: " + base_url);
  }

  const auto rest      = base_url.substr(scheme_end + 3);
  const auto path_from = rest.find('/');
  origin.authority     = rest.substr(0, path_from);
  origin.path          = path_from == std::string::npos ? "/" : rest.substr(path_from);

  if (origin.authority.empty() || origin.authority.find('@') != std::string::npos) {
    throw ValidationError("origin must name a host: " + base_url);
  }
  if (origin.path.find_first_of("?#") != std::string::npos) {
    throw ValidationError("origin must not carry a query or fragment: " + base_url);
  }
  if (origin.path.back() != '/') {
    origin.path.push_back('/');
  }
  if (!IsSafeToken(origin.authority) || !IsSafeToken(origin.path)) {
    throw ValidationError("origin contains invalid characters: " + base_url);
  }
  return origin;
}

std::pair<std::string, std::string> TransformRewriteRule(const std::string& request_pattern, const std::string& mapped_path) {
  if (request_pattern.empty()) {
    throw ValidationError("path rewrite rule has an empty request pattern");
  }
  if (request_pattern.find('"') != std::string::npos || mapped_path.find('"') != std::string::npos) {
    throw ValidationError("path rewrite rule must not contain double quotes: " + request_pattern);
  }

  // ECMAScript regex is a subset of the PCRE syntax nginx uses, so checking
  // it here is enough to catch patterns nginx would reject.
  unsigned groups = 0;
  try {
    std::regex compiled(request_pattern, std::regex::ECMAScript);
    groups = compiled.mark_count();
  } catch (const std::regex_error& e) {
    throw ValidationError("path rewrite rule pattern does not compile: " + request_pattern + " (" + e.what() + ")");
  }

  std::string regex   = request_pattern;
  std::string replace = mapped_path;

  if (regex.front() != '^') {
    regex   = "^(.*)" + regex;
    replace = "${1}" + replace;
    ++groups;
  }
  if (regex.back() != '$') {
    regex += "([^?#]*/)?";
    replace += "$" + std::to_string(groups + 1);
    ++groups;
  } else {
    // the whole path is matched below, drop the anchor here
    regex.pop_back();
  }
  regex += "([^/]*(?:#[^?/]*)?(?:\\?.*)?)$";
  replace += "$" + std::to_string(groups + 1);

  return {regex, replace};
}

} // namespace hosting::confgen
