#pragma once

#include <string>
#include <string_view>

#include "devbar/panel.hpp"
#include "devbar/request-context.hpp"

namespace devbar {

// Status, headers and size of the response, as produced by the application.
class ResponsePanel final : public Panel {
 public:
  static constexpr std::string_view kPanelId = "ResponsePanel";

  [[nodiscard]] std::string_view panelId() const noexcept override { return kPanelId; }

  [[nodiscard]] std::string_view navTitle() const noexcept override { return "Response"; }

  [[nodiscard]] std::string navSubtitle(const RequestContext &context) const override;

  PanelStats generateStats(RequestContext &context) const override;
};

}  // namespace devbar
