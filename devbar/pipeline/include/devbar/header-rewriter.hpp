#pragma once

#include <span>

#include "devbar/http-header.hpp"
#include "devbar/injection-engine.hpp"

namespace devbar {

class HeaderRewriter {
 public:
  // Headers of a rewritten response: every Content-Length field is replaced by a single one matching the new body.
  // The framing of the original body (Transfer-Encoding) no longer applies and is dropped, Content-Encoding is
  // dropped if the codings were removed. 'extraHeaders' are appended last. Other fields keep their order.
  static http::HeaderList Rewrite(const http::HeaderList &original, const InjectionResult &result,
                                  std::span<const http::Header> extraHeaders = {});
};

}  // namespace devbar
