#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/request-scope.hpp"

namespace devbar {

struct ToolbarConfig {
  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  // Whether the toolbar should handle this request at all (enabled flag, allowed hosts, user callback).
  [[nodiscard]] bool shouldShowToolbar(const RequestScope &scope) const;

  // Whether 'path' belongs to the toolbar itself or to one of the excluded prefixes.
  [[nodiscard]] bool isExcludedPath(std::string_view path) const noexcept;

  // Master switch. When false, the middleware does not buffer anything and calls the application with the
  // original transport.
  bool enabled{true};

  // Marker before which the toolbar fragment is injected.
  std::string insertBefore{"</body>"};

  // URL prefix of the toolbar's own endpoints, never intercepted.
  std::string apiPath{"/_debug_toolbar"};

  // Additional path prefixes whose responses are streamed through untouched.
  std::vector<std::string> excludedPathPrefixes;

  // Maximum number of body bytes (encoded, and decoded) buffered for a single response. Larger responses are
  // streamed through without injection. 0 => no limit.
  std::size_t maxBodyBytes{16UL * 1024UL * 1024UL};

  // Minimal chunk size of buffer growths during decompression.
  std::size_t decoderChunkSize{32UL * 1024UL};

  // Number of request records kept in the toolbar history.
  std::size_t maxRequestHistory{50};

  // If non-empty, only requests whose Host matches one of these (case-insensitive) are handled.
  std::vector<std::string> allowedHosts;

  // Append a Server-Timing header with the recorded timings to handled responses.
  bool addServerTimingHeader{true};

  // Optional user predicate, evaluated after the other checks.
  std::function<bool(const RequestScope &)> showToolbarCallback;
};

}  // namespace devbar
