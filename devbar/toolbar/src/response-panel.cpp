#include "devbar/response-panel.hpp"

#include <string>
#include <string_view>

#include "devbar/panel.hpp"
#include "devbar/request-context.hpp"

namespace devbar {

namespace {

constexpr std::string_view kMetadataKeys[][2] = {
    {"status_code", "status_code"},
    {"response_content_type", "content_type"},
    {"response_body_bytes", "body_bytes"},
    {"response_headers", "headers"},
};

}  // namespace

std::string ResponsePanel::navSubtitle(const RequestContext &context) const {
  return std::string(context.metadata("status_code").value_or(std::string_view{}));
}

PanelStats ResponsePanel::generateStats(RequestContext &context) const {
  PanelStats stats;
  for (const auto &[metadataKey, statKey] : kMetadataKeys) {
    if (const auto value = context.metadata(metadataKey)) {
      stats.emplace(statKey, *value);
    }
  }
  return stats;
}

}  // namespace devbar
