#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "devbar/http-header.hpp"
#include "devbar/response-event.hpp"
#include "devbar/toolbar-config.hpp"

namespace devbar {

enum class Eligibility : std::uint8_t {
  eligible,
  disabled,
  excludedPath,
  noBody,
  notHtml,
  tooLarge,
};

std::string_view EligibilityStr(Eligibility eligibility) noexcept;

// Whether the media type of 'contentType' (parameters ignored, case-insensitive) is text/html or
// application/xhtml+xml.
bool IsHtmlContentType(std::string_view contentType) noexcept;

// Value of the first Content-Length header if it is a valid decimal number.
std::optional<std::size_t> DeclaredContentLength(const http::HeaderList &headers) noexcept;

// Decides from the response start alone whether a response is buffered for injection.
class EligibilityGate {
 public:
  explicit EligibilityGate(const ToolbarConfig &config) noexcept : _config(&config) {}

  // Responses to HEAD requests are treated like statuses without body.
  [[nodiscard]] Eligibility evaluate(std::string_view requestMethod, std::string_view requestPath,
                                     const ResponseStart &start) const noexcept;

 private:
  const ToolbarConfig *_config;
};

}  // namespace devbar
