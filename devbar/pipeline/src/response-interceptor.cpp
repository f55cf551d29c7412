#include "devbar/response-interceptor.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "devbar/codec-registry.hpp"
#include "devbar/decode-outcome.hpp"
#include "devbar/decoder.hpp"
#include "devbar/decompression-cascade.hpp"
#include "devbar/eligibility-gate.hpp"
#include "devbar/encoding-stack.hpp"
#include "devbar/header-rewriter.hpp"
#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/injection-engine.hpp"
#include "devbar/log.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/response-event.hpp"
#include "devbar/toolbar-config.hpp"
#include "devbar/utf8.hpp"

namespace devbar {

ResponseInterceptor::ResponseInterceptor(const ToolbarConfig &config, std::string requestMethod,
                                         std::string requestPath, Send downstream, FragmentProvider fragmentProvider,
                                         const CodecRegistry &registry)
    : _config(&config),
      _registry(&registry),
      _requestMethod(std::move(requestMethod)),
      _requestPath(std::move(requestPath)),
      _downstream(std::move(downstream)),
      _fragmentProvider(std::move(fragmentProvider)) {}

void ResponseInterceptor::onEvent(ResponseEvent event) {
  switch (_phase) {
    case Phase::Cancelled:
      return;
    case Phase::Streaming:
      if (const auto *pBody = std::get_if<ResponseBody>(&event); pBody != nullptr) {
        _bodyBytesReceived += pBody->body.size();
      } else if (const auto *pStart = std::get_if<ResponseStart>(&event); pStart != nullptr) {
        if (_capture.started()) {
          log::debug("Response for {} started twice, second start dropped", _requestPath);
          return;
        }
        _capture.start(*pStart);
      }
      forward(std::move(event));
      return;
    case Phase::Emitted:
      if (std::holds_alternative<ResponseOther>(event)) {
        forward(std::move(event));
      } else {
        log::warn("Response event received after the end of the response for {}, ignored", _requestPath);
      }
      return;
    case Phase::Capturing:
      break;
  }

  std::visit(
      [this](auto &&val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, ResponseStart>) {
          onStart(std::move(val));
        } else if constexpr (std::is_same_v<T, ResponseBody>) {
          onBody(std::move(val));
        } else {
          onOther(std::move(val));
        }
      },
      std::move(event));
}

void ResponseInterceptor::onStart(ResponseStart start) {
  if (_capture.started()) {
    log::debug("Response for {} started twice, captured data is passed through and second start dropped",
               _requestPath);
    switchToStreaming();
    return;
  }
  _capture.start(std::move(start));
  _eligibility = EligibilityGate(*_config).evaluate(_requestMethod, _requestPath, _capture.startEvent());
  if (_eligibility != Eligibility::eligible) {
    log::debug("Response for {} is not intercepted: {}", _requestPath, EligibilityStr(_eligibility));
    switchToStreaming();
  }
}

void ResponseInterceptor::onBody(ResponseBody body) {
  _bodyBytesReceived += body.body.size();
  if (!_capture.started()) {
    log::debug("Body received before response start for {}, response is passed through", _requestPath);
    switchToStreaming();
    forward(std::move(body));
    return;
  }
  if (_config->maxBodyBytes != 0 && _capture.bodySize() + body.body.size() > _config->maxBodyBytes) {
    log::debug("Response for {} exceeds {} bytes, response is streamed without toolbar", _requestPath,
               _config->maxBodyBytes);
    _eligibility = Eligibility::tooLarge;
    switchToStreaming();
    forward(std::move(body));
    return;
  }
  _capture.append(std::move(body.body), body.moreBody);
  if (_capture.complete()) {
    finish();
  }
}

void ResponseInterceptor::onOther(ResponseOther other) {
  if (_capture.started()) {
    // keep the order relative to the buffered body
    _pendingOthers.push_back(std::move(other));
  } else {
    forward(std::move(other));
  }
}

void ResponseInterceptor::switchToStreaming() {
  _phase = Phase::Streaming;
  if (!_capture.started() || _headersSent) {
    return;
  }
  forward(_capture.startEvent());
  for (std::string &chunk : _capture.takeBodyChunks()) {
    forward(ResponseBody{.body = std::move(chunk), .moreBody = true});
  }
  for (ResponseOther &other : std::exchange(_pendingOthers, {})) {
    forward(std::move(other));
  }
}

bool ResponseInterceptor::tryRewrite(std::string_view original, http::HeaderList &headers, std::string &body) {
  const EncodingStack stack = EncodingStack::FromHeaders(_capture.headers());
  const DecodeLimits limits{.maxDecodedBytes = _config->maxBodyBytes, .chunkSize = _config->decoderChunkSize};
  const DecodeOutcome outcome = DecompressionCascade::Run(stack, original, *_registry, limits).resolved();
  if (!stack.empty() && !outcome.decoded()) {
    return false;
  }
  if (stack.empty() && !IsValidUtf8(original)) {
    log::debug("Body of {} is not valid UTF-8, response is passed through", _requestPath);
    return false;
  }

  const std::string_view plainBody = outcome.body();
  RenderedToolbar rendered;
  if (_fragmentProvider) {
    rendered = _fragmentProvider(plainBody, _capture.startEvent());
  }
  InjectionResult result =
      InjectionEngine::Inject(plainBody, rendered.fragment, _config->insertBefore, outcome.decoded());
  headers = HeaderRewriter::Rewrite(_capture.headers(), result, rendered.extraHeaders);
  body = std::move(result.body);
  return true;
}

void ResponseInterceptor::finish() {
  _phase = Phase::Emitted;

  const RawChars original = _capture.joinedBody();
  _capture.releaseBody();

  http::HeaderList headers;
  std::string body;
  bool rewritten = false;
  try {
    rewritten = tryRewrite(original, headers, body);
  } catch (const std::exception &ex) {
    log::debug("Toolbar injection failed for {}, original response is sent: {}", _requestPath, ex.what());
    rewritten = false;
  }

  if (rewritten) {
    _injected = true;
    emitFinal(_capture.status(), std::move(headers), std::move(body));
  } else {
    emitFinal(_capture.status(), _capture.headers(), std::string(std::string_view(original)));
  }
}

bool ResponseInterceptor::flushOriginal() {
  if (_phase != Phase::Capturing || !_capture.started()) {
    return false;
  }
  _phase = Phase::Emitted;
  const RawChars original = _capture.joinedBody();
  _capture.releaseBody();
  emitFinal(_capture.status(), _capture.headers(), std::string(std::string_view(original)));
  return true;
}

void ResponseInterceptor::cancel() noexcept {
  _phase = Phase::Cancelled;
  _capture.releaseBody();
  _pendingOthers.clear();
}

void ResponseInterceptor::emitFinal(http::StatusCode status, http::HeaderList headers, std::string body) {
  forward(ResponseStart{.status = status, .headers = std::move(headers)});
  forward(ResponseBody{.body = std::move(body), .moreBody = false});
  for (ResponseOther &other : std::exchange(_pendingOthers, {})) {
    forward(std::move(other));
  }
}

void ResponseInterceptor::forward(ResponseEvent event) {
  if (std::holds_alternative<ResponseStart>(event)) {
    _headersSent = true;
  }
  _downstream(std::move(event));
}

}  // namespace devbar
