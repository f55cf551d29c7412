#include "devbar/eligibility-gate.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/http-list.hpp"
#include "devbar/response-event.hpp"
#include "devbar/string-equal-ignore-case.hpp"

namespace devbar {

std::string_view EligibilityStr(Eligibility eligibility) noexcept {
  switch (eligibility) {
    case Eligibility::eligible:
      return "eligible";
    case Eligibility::disabled:
      return "disabled";
    case Eligibility::excludedPath:
      return "excluded path";
    case Eligibility::noBody:
      return "response without body";
    case Eligibility::notHtml:
      return "not html";
    case Eligibility::tooLarge:
      return "too large";
    default:
      return "unknown";
  }
}

bool IsHtmlContentType(std::string_view contentType) noexcept {
  const std::string_view mediaType = http::PopListElement(contentType, ';');
  return CaseInsensitiveEqual(mediaType, http::ContentTypeTextHtml) ||
         CaseInsensitiveEqual(mediaType, http::ContentTypeApplicationXhtml);
}

std::optional<std::size_t> DeclaredContentLength(const http::HeaderList &headers) noexcept {
  const auto value = http::FindHeaderValue(headers, http::ContentLength);
  if (!value) {
    return std::nullopt;
  }
  const std::string_view trimmed = http::TrimOws(*value);
  std::size_t length{};
  const auto [ptr, errc] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), length);
  if (errc != std::errc{} || ptr != trimmed.data() + trimmed.size() || trimmed.empty()) {
    return std::nullopt;
  }
  return length;
}

Eligibility EligibilityGate::evaluate(std::string_view requestMethod, std::string_view requestPath,
                                      const ResponseStart &start) const noexcept {
  if (!_config->enabled) {
    return Eligibility::disabled;
  }
  if (_config->isExcludedPath(requestPath)) {
    return Eligibility::excludedPath;
  }
  if (http::StatusHasNoBody(start.status) || requestMethod == http::MethodHead) {
    return Eligibility::noBody;
  }
  const auto contentType = http::FindHeaderValue(start.headers, http::ContentType);
  if (!contentType || !IsHtmlContentType(*contentType)) {
    return Eligibility::notHtml;
  }
  if (_config->maxBodyBytes != 0) {
    const auto declaredLength = DeclaredContentLength(start.headers);
    if (declaredLength && *declaredLength > _config->maxBodyBytes) {
      return Eligibility::tooLarge;
    }
  }
  return Eligibility::eligible;
}

}  // namespace devbar
