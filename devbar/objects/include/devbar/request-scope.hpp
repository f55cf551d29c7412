#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "devbar/http-header.hpp"
#include "devbar/response-event.hpp"

namespace devbar {

// Description of the incoming request, as handed by the hosting server.
struct RequestScope {
  // Host header value without port, or empty.
  [[nodiscard]] std::string_view host() const noexcept;

  std::string method{"GET"};
  std::string path{"/"};
  std::string query;
  std::string scheme{"http"};
  http::HeaderList headers;
  std::string clientHost;
  std::uint16_t clientPort{};
};

// The wrapped application: produces response events through 'send'.
using Application = std::function<void(const RequestScope &, const Send &)>;

}  // namespace devbar
