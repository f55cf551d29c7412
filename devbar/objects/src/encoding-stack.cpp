#include "devbar/encoding-stack.hpp"

#include <string_view>

#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/http-list.hpp"
#include "devbar/string-equal-ignore-case.hpp"

namespace devbar {

EncodingStack EncodingStack::Parse(std::string_view headerValue) {
  EncodingStack stack;
  while (!headerValue.empty()) {
    const std::string_view token = http::PopListElement(headerValue);
    if (!token.empty() && !CaseInsensitiveEqual(token, http::identity)) {
      stack._tokens.push_back(ToLowerCopy(token));
    }
  }
  return stack;
}

EncodingStack EncodingStack::FromHeaders(const http::HeaderList &headers) {
  return Parse(http::JoinHeaderValues(headers, http::ContentEncoding));
}

}  // namespace devbar
