#include "devbar/debug-toolbar.hpp"

#include <format>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "devbar/panel.hpp"
#include "devbar/request-context.hpp"
#include "devbar/request-scope.hpp"
#include "devbar/response-panel.hpp"
#include "devbar/timer-panel.hpp"
#include "devbar/toolbar-config.hpp"

namespace devbar {

namespace {

std::vector<std::unique_ptr<Panel>> DefaultPanels(bool enabled) {
  std::vector<std::unique_ptr<Panel>> panels;
  if (enabled) {
    panels.push_back(std::make_unique<TimerPanel>());
    panels.push_back(std::make_unique<ResponsePanel>());
  }
  return panels;
}

void AppendHtmlEscaped(std::string &out, std::string_view text) {
  for (char ch : text) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
}

std::string HtmlEscaped(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  AppendHtmlEscaped(out, text);
  return out;
}

}  // namespace

DebugToolbar::DebugToolbar(ToolbarConfig config) : DebugToolbar(config, DefaultPanels(config.enabled)) {}

DebugToolbar::DebugToolbar(ToolbarConfig config, std::vector<std::unique_ptr<Panel>> panels)
    : _config(std::move(config)), _panels(std::move(panels)), _storage(_config.maxRequestHistory) {
  _config.validate();
}

Panel *DebugToolbar::panel(std::string_view panelId) const noexcept {
  for (const auto &pPanel : _panels) {
    if (pPanel->panelId() == panelId) {
      return pPanel.get();
    }
  }
  return nullptr;
}

RequestContext DebugToolbar::processRequest(const RequestScope &scope) const {
  RequestContext context;
  context.setMetadata("method", scope.method);
  context.setMetadata("path", scope.path);
  context.setMetadata("query_string", scope.query);
  context.setMetadata("scheme", scope.scheme);
  context.setMetadata("host", std::string(scope.host()));
  if (!scope.clientHost.empty()) {
    context.setMetadata("client_host", scope.clientHost);
    context.setMetadata("client_port", std::to_string(scope.clientPort));
  }

  for (const auto &pPanel : _panels) {
    if (pPanel->enabled()) {
      pPanel->processRequest(context);
    }
  }
  return context;
}

void DebugToolbar::processResponse(RequestContext &context) {
  for (const auto &pPanel : _panels) {
    if (pPanel->enabled()) {
      pPanel->processResponse(context);
    }
  }
  for (const auto &pPanel : _panels) {
    if (pPanel->enabled()) {
      context.recordStats(pPanel->panelId(), pPanel->generateStats(context));
    }
  }
  _storage.storeFromContext(context);
}

std::string DebugToolbar::serverTimingHeader(const RequestContext &context) const {
  std::string header;
  for (const auto &pPanel : _panels) {
    if (!pPanel->enabled()) {
      continue;
    }
    for (const Timing &timing : pPanel->generateServerTiming(context)) {
      if (!header.empty()) {
        header.append(", ");
      }
      std::format_to(std::back_inserter(header), "{};dur={:.2f}", timing.name, timing.duration.count());
    }
  }
  return header;
}

std::string DebugToolbar::renderFragment(const RequestContext &context) const {
  const std::string apiPath = HtmlEscaped(_config.apiPath);
  const std::string &requestId = context.requestId();
  const double totalMs = context.timing("total").value_or(context.elapsed()).count();

  std::string panelsHtml;
  for (const auto &pPanel : _panels) {
    if (!pPanel->enabled()) {
      continue;
    }
    panelsHtml.append(R"(<button class="toolbar-panel-btn" data-panel-id=")");
    AppendHtmlEscaped(panelsHtml, pPanel->panelId());
    panelsHtml.append(R"("><span class="panel-title">)");
    AppendHtmlEscaped(panelsHtml, pPanel->navTitle());
    panelsHtml.append("</span>");
    const std::string subtitle = pPanel->navSubtitle(context);
    if (!subtitle.empty()) {
      panelsHtml.append(R"(<span class="panel-subtitle">)");
      AppendHtmlEscaped(panelsHtml, subtitle);
      panelsHtml.append("</span>");
    }
    panelsHtml.append("</button>");
  }

  return std::format(
      R"(<link rel="stylesheet" href="{0}/static/toolbar.css">)"
      R"(<div id="debug-toolbar" data-request-id="{1}">)"
      R"(<div class="toolbar-bar">)"
      R"(<span class="toolbar-brand" title="Click to toggle">Debug Toolbar</span>)"
      R"(<span class="toolbar-time">{2:.2f}ms</span>)"
      R"(<div class="toolbar-panels">{3}</div>)"
      R"(<span class="toolbar-request-id">)"
      R"(<a href="{0}/{1}" class="toolbar-history-link" title="View request details">{4}</a>)"
      R"(</span>)"
      R"(<a href="{0}/" class="toolbar-history-link" title="View request history">History</a>)"
      R"(</div>)"
      R"(<div class="toolbar-details"></div>)"
      R"(</div>)"
      R"(<script src="{0}/static/toolbar.js"></script>)",
      apiPath, HtmlEscaped(requestId), totalMs, panelsHtml, HtmlEscaped(std::string_view(requestId).substr(0, 8)));
}

}  // namespace devbar
