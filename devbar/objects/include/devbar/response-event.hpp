#pragma once

#include <functional>
#include <string>
#include <variant>

#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"

namespace devbar {

// Start of a response: status line and header fields.
struct ResponseStart {
  http::StatusCode status{http::StatusCodeOK};
  http::HeaderList headers;

  bool operator==(const ResponseStart &) const = default;
};

// A chunk of response body. 'moreBody' false marks the last chunk.
struct ResponseBody {
  std::string body;
  bool moreBody{false};

  bool operator==(const ResponseBody &) const = default;
};

// Any other message of the hosting protocol (trailers, extensions...), forwarded as is.
struct ResponseOther {
  std::string type;
  std::string payload;

  bool operator==(const ResponseOther &) const = default;
};

using ResponseEvent = std::variant<ResponseStart, ResponseBody, ResponseOther>;

// Downstream transport. May throw if the connection is dead, exceptions are propagated unchanged.
using Send = std::function<void(ResponseEvent)>;

}  // namespace devbar
