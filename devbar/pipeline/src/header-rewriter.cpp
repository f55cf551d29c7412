#include "devbar/header-rewriter.hpp"

#include <span>
#include <string>

#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/injection-engine.hpp"

namespace devbar {

http::HeaderList HeaderRewriter::Rewrite(const http::HeaderList &original, const InjectionResult &result,
                                         std::span<const http::Header> extraHeaders) {
  http::HeaderList headers = original;
  http::EraseHeaders(headers, http::ContentLength);
  http::EraseHeaders(headers, http::TransferEncoding);
  if (result.encodingRemoved) {
    http::EraseHeaders(headers, http::ContentEncoding);
  }
  headers.reserve(headers.size() + 1U + extraHeaders.size());
  headers.push_back({std::string(http::ContentLength), std::to_string(result.contentLength)});
  headers.insert(headers.end(), extraHeaders.begin(), extraHeaders.end());
  return headers;
}

}  // namespace devbar
