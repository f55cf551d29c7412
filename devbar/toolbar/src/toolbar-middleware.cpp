#include "devbar/toolbar-middleware.hpp"

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "devbar/debug-toolbar.hpp"
#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/log.hpp"
#include "devbar/request-context.hpp"
#include "devbar/request-scope.hpp"
#include "devbar/response-event.hpp"
#include "devbar/response-interceptor.hpp"
#include "devbar/toolbar-config.hpp"

namespace devbar {

namespace {

void RecordResponseMetadata(RequestContext &context, http::StatusCode status, const http::HeaderList &headers,
                            std::size_t bodyBytes) {
  std::string headersStr;
  for (const http::Header &header : headers) {
    headersStr.append(header.name).append(http::HeaderSep).append(header.value).push_back('\n');
  }
  context.setMetadata("status_code", std::to_string(status));
  context.setMetadata("response_content_type",
                      std::string(http::FindHeaderValue(headers, http::ContentType).value_or(std::string_view{})));
  context.setMetadata("response_body_bytes", std::to_string(bodyBytes));
  context.setMetadata("response_headers", std::move(headersStr));
}

}  // namespace

void ToolbarMiddleware::operator()(const RequestScope &scope, const Application &app, const Send &send,
                                   const CancellationCheck &isCancelled) const {
  const ToolbarConfig &config = _toolbar->config();
  if (!config.shouldShowToolbar(scope) || config.isExcludedPath(scope.path)) {
    app(scope, send);
    return;
  }

  RequestContext context = _toolbar->processRequest(scope);
  bool responseProcessed = false;

  ResponseInterceptor interceptor(
      config, scope.method, scope.path, send,
      [this, &config, &context, &responseProcessed](std::string_view plainBody, const ResponseStart &start) {
        RecordResponseMetadata(context, start.status, start.headers, plainBody.size());
        responseProcessed = true;
        _toolbar->processResponse(context);

        RenderedToolbar rendered{.fragment = _toolbar->renderFragment(context), .extraHeaders = {}};
        if (config.addServerTimingHeader) {
          std::string serverTiming = _toolbar->serverTimingHeader(context);
          if (!serverTiming.empty()) {
            rendered.extraHeaders.push_back({std::string(http::ServerTiming), std::move(serverTiming)});
          }
        }
        return rendered;
      },
      *_registry);

  const auto checkCancelled = [&interceptor, &isCancelled]() {
    if (isCancelled && isCancelled() && interceptor.phase() != ResponseInterceptor::Phase::Cancelled) {
      interceptor.cancel();
    }
  };
  const Send wrapper = [&interceptor, &checkCancelled](ResponseEvent event) {
    checkCancelled();
    interceptor.onEvent(std::move(event));
  };

  try {
    app(scope, wrapper);
  } catch (const std::exception &ex) {
    log::debug("Application failed for {}: {}", scope.path, ex.what());
    checkCancelled();
    try {
      if (interceptor.flushOriginal()) {
        log::debug("Buffered response for {} sent unmodified", scope.path);
      }
    } catch (const std::exception &sendEx) {
      log::debug("Unable to send the buffered response for {}: {}", scope.path, sendEx.what());
    }
    throw;
  }

  checkCancelled();
  if (interceptor.flushOriginal()) {
    log::debug("Application returned before the last body chunk for {}, response sent unmodified", scope.path);
  }

  if (responseProcessed || interceptor.phase() == ResponseInterceptor::Phase::Cancelled) {
    return;
  }
  RecordResponseMetadata(context, interceptor.status(), interceptor.responseHeaders(),
                         interceptor.bodyBytesReceived());
  try {
    _toolbar->processResponse(context);
  } catch (const std::exception &ex) {
    log::debug("Toolbar processing failed for {}: {}", scope.path, ex.what());
  }
}

}  // namespace devbar
