#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "devbar/request-context.hpp"

namespace devbar {

// A toolbar plugin. It receives the lifecycle callbacks of every handled request and returns a bag of statistics.
// The same instance serves concurrent requests: per-request state belongs to the RequestContext.
class Panel {
 public:
  Panel() noexcept = default;

  Panel(const Panel &) = delete;
  Panel(Panel &&) noexcept = delete;
  Panel &operator=(const Panel &) = delete;
  Panel &operator=(Panel &&) noexcept = delete;

  virtual ~Panel() = default;

  // Unique identifier, used as key of the panel data.
  [[nodiscard]] virtual std::string_view panelId() const noexcept = 0;

  // Title displayed in the toolbar bar.
  [[nodiscard]] virtual std::string_view navTitle() const noexcept = 0;

  // Short text displayed under the title, possibly empty.
  [[nodiscard]] virtual std::string navSubtitle([[maybe_unused]] const RequestContext &context) const { return {}; }

  // Called when the request enters the toolbar, before the application.
  virtual void processRequest([[maybe_unused]] RequestContext &context) const {}

  // Called once the response is known, before generateStats.
  virtual void processResponse([[maybe_unused]] RequestContext &context) const {}

  virtual PanelStats generateStats(RequestContext &context) const = 0;

  // Entries for the Server-Timing header.
  [[nodiscard]] virtual std::vector<Timing> generateServerTiming(
      [[maybe_unused]] const RequestContext &context) const {
    return {};
  }

  [[nodiscard]] bool enabled() const noexcept { return _enabled; }

  void setEnabled(bool enabled) noexcept { _enabled = enabled; }

 private:
  bool _enabled{true};
};

}  // namespace devbar
