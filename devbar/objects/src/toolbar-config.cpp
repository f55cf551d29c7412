#include "devbar/toolbar-config.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "devbar/request-scope.hpp"
#include "devbar/string-equal-ignore-case.hpp"

namespace devbar {

namespace {

// 'prefix' matches whole path segments: "/static" covers "/static" and "/static/app.js" but not "/staticfoo".
bool PathHasPrefix(std::string_view path, std::string_view prefix) noexcept {
  while (prefix.size() > 1 && prefix.ends_with('/')) {
    prefix.remove_suffix(1);
  }
  if (!path.starts_with(prefix)) {
    return false;
  }
  return path.size() == prefix.size() || prefix == "/" || path[prefix.size()] == '/';
}

}  // namespace

void ToolbarConfig::validate() const {
  if (insertBefore.empty()) {
    throw std::invalid_argument("insertBefore must not be empty");
  }
  if (!apiPath.starts_with('/')) {
    throw std::invalid_argument("apiPath must start with '/'");
  }
  if (decoderChunkSize == 0) {
    throw std::invalid_argument("decoderChunkSize must be > 0");
  }
  if (maxRequestHistory == 0) {
    throw std::invalid_argument("maxRequestHistory must be > 0");
  }
  if (std::ranges::any_of(excludedPathPrefixes, [](const std::string &prefix) { return !prefix.starts_with('/'); })) {
    throw std::invalid_argument("excluded path prefixes must start with '/'");
  }
}

bool ToolbarConfig::shouldShowToolbar(const RequestScope &scope) const {
  if (!enabled) {
    return false;
  }
  if (!allowedHosts.empty()) {
    const std::string_view host = scope.host();
    if (std::ranges::none_of(allowedHosts,
                             [host](const std::string &allowed) { return CaseInsensitiveEqual(allowed, host); })) {
      return false;
    }
  }
  return !showToolbarCallback || showToolbarCallback(scope);
}

bool ToolbarConfig::isExcludedPath(std::string_view path) const noexcept {
  if (PathHasPrefix(path, apiPath)) {
    return true;
  }
  return std::ranges::any_of(excludedPathPrefixes,
                             [path](const std::string &prefix) { return PathHasPrefix(path, prefix); });
}

}  // namespace devbar
