#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/panel.hpp"
#include "devbar/request-context.hpp"
#include "devbar/request-scope.hpp"
#include "devbar/toolbar-config.hpp"
#include "devbar/toolbar-storage.hpp"

namespace devbar {

// Panel orchestrator: opens the context of each request, dispatches the lifecycle hooks to the panels in order,
// keeps the history and renders the fragment injected in HTML responses.
// All methods can be called concurrently for different requests.
class DebugToolbar {
 public:
  // Toolbar with the default panels (TimerPanel, ResponsePanel), none if disabled.
  // Throws std::invalid_argument if 'config' is invalid.
  explicit DebugToolbar(ToolbarConfig config = {});

  // Toolbar with the given panels, in dispatch order.
  DebugToolbar(ToolbarConfig config, std::vector<std::unique_ptr<Panel>> panels);

  [[nodiscard]] const ToolbarConfig &config() const noexcept { return _config; }

  [[nodiscard]] std::span<const std::unique_ptr<Panel>> panels() const noexcept { return _panels; }

  // Panel with given id, nullptr if none.
  [[nodiscard]] Panel *panel(std::string_view panelId) const noexcept;

  // Creates the context of a new request, records the request metadata and calls processRequest of each panel.
  [[nodiscard]] RequestContext processRequest(const RequestScope &scope) const;

  // Calls processResponse then generateStats of each enabled panel, and stores the request in the history.
  void processResponse(RequestContext &context);

  // Value of the Server-Timing header for this request, such as "total;dur=12.34". Empty if there is no timing.
  [[nodiscard]] std::string serverTimingHeader(const RequestContext &context) const;

  // HTML fragment injected in the page.
  [[nodiscard]] std::string renderFragment(const RequestContext &context) const;

  [[nodiscard]] ToolbarStorage &storage() noexcept { return _storage; }
  [[nodiscard]] const ToolbarStorage &storage() const noexcept { return _storage; }

 private:
  ToolbarConfig _config;
  std::vector<std::unique_ptr<Panel>> _panels;
  ToolbarStorage _storage;
};

}  // namespace devbar
