#include "devbar/timer-panel.hpp"

#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/panel.hpp"
#include "devbar/request-context.hpp"
#include "devbar/timedef.hpp"

namespace devbar {

namespace {

constexpr std::string_view kTotalTiming = "total";

}  // namespace

std::string TimerPanel::navSubtitle(const RequestContext &context) const {
  const auto total = context.timing(kTotalTiming);
  return total ? std::format("{:.2f}ms", total->count()) : std::string();
}

PanelStats TimerPanel::generateStats(RequestContext &context) const {
  const Milliseconds total = context.elapsed();
  context.recordTiming(kTotalTiming, total);

  PanelStats stats;
  stats.emplace("total_time_ms", std::format("{:.2f}", total.count()));
  stats.emplace("timings_count", std::to_string(context.timings().size()));
  return stats;
}

std::vector<Timing> TimerPanel::generateServerTiming(const RequestContext &context) const {
  std::vector<Timing> ret;
  if (const auto total = context.timing(kTotalTiming)) {
    ret.push_back({std::string(kTotalTiming), *total});
  }
  return ret;
}

}  // namespace devbar
