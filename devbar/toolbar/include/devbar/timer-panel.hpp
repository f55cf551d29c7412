#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "devbar/panel.hpp"
#include "devbar/request-context.hpp"

namespace devbar {

// Wall-clock time spent handling the request.
class TimerPanel final : public Panel {
 public:
  static constexpr std::string_view kPanelId = "TimerPanel";

  [[nodiscard]] std::string_view panelId() const noexcept override { return kPanelId; }

  [[nodiscard]] std::string_view navTitle() const noexcept override { return "Time"; }

  [[nodiscard]] std::string navSubtitle(const RequestContext &context) const override;

  PanelStats generateStats(RequestContext &context) const override;

  [[nodiscard]] std::vector<Timing> generateServerTiming(const RequestContext &context) const override;
};

}  // namespace devbar
