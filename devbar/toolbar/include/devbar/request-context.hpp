#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/timedef.hpp"

namespace devbar {

// Statistics produced by a panel, rendered as text.
using PanelStats = std::map<std::string, std::string, std::less<>>;

struct Timing {
  std::string name;
  Milliseconds duration;

  bool operator==(const Timing &) const = default;
};

// Per-request state shared by the toolbar and its panels.
// A RequestContext is owned by the task handling the request and is not thread safe.
class RequestContext {
 public:
  // Context with a new random request id (32 lower case hex chars).
  RequestContext();

  explicit RequestContext(std::string requestId);

  [[nodiscard]] const std::string &requestId() const noexcept { return _requestId; }

  [[nodiscard]] SteadyTimePoint startTime() const noexcept { return _startTime; }

  // Time elapsed since the creation of the context.
  [[nodiscard]] Milliseconds elapsed() const noexcept;

  void setMetadata(std::string_view key, std::string value);

  [[nodiscard]] std::optional<std::string_view> metadata(std::string_view key) const;

  [[nodiscard]] const std::map<std::string, std::string, std::less<>> &allMetadata() const noexcept {
    return _metadata;
  }

  void storePanelData(std::string_view panelId, std::string_view key, std::string value);

  // Merges 'stats' into the data of 'panelId', overwriting existing keys.
  void recordStats(std::string_view panelId, PanelStats stats);

  // Data of 'panelId', empty if the panel did not record anything.
  [[nodiscard]] const PanelStats &panelData(std::string_view panelId) const;

  [[nodiscard]] const std::map<std::string, PanelStats, std::less<>> &allPanelData() const noexcept {
    return _panelData;
  }

  // Records (or replaces) a named duration. Timings keep their first recording order.
  void recordTiming(std::string_view name, Milliseconds duration);

  [[nodiscard]] std::optional<Milliseconds> timing(std::string_view name) const;

  [[nodiscard]] const std::vector<Timing> &timings() const noexcept { return _timings; }

 private:
  std::string _requestId;
  SteadyTimePoint _startTime;
  std::map<std::string, std::string, std::less<>> _metadata;
  std::map<std::string, PanelStats, std::less<>> _panelData;
  std::vector<Timing> _timings;
};

}  // namespace devbar
