#pragma once

#include <functional>

#include "devbar/codec-registry.hpp"
#include "devbar/debug-toolbar.hpp"
#include "devbar/request-scope.hpp"
#include "devbar/response-event.hpp"

namespace devbar {

// Polled before each event is sent downstream. Returning true means the client went away.
using CancellationCheck = std::function<bool()>;

// Request-level entry point: wraps an Application so that its HTML responses carry the toolbar.
class ToolbarMiddleware {
 public:
  explicit ToolbarMiddleware(DebugToolbar &toolbar, const CodecRegistry &registry = CodecRegistry::Global()) noexcept
      : _toolbar(&toolbar), _registry(&registry) {}

  // Runs 'app' for 'scope', sending the (possibly rewritten) response to 'send'.
  // Requests the toolbar does not handle are forwarded with the original 'send'. If 'app' throws before the
  // buffered response was sent, the original response is sent and the exception rethrown.
  void operator()(const RequestScope &scope, const Application &app, const Send &send,
                  const CancellationCheck &isCancelled = {}) const;

 private:
  DebugToolbar *_toolbar;
  const CodecRegistry *_registry;
};

}  // namespace devbar
