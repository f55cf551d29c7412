#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/codec-registry.hpp"
#include "devbar/eligibility-gate.hpp"
#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/response-capture.hpp"
#include "devbar/response-event.hpp"
#include "devbar/toolbar-config.hpp"

namespace devbar {

// What the toolbar injects in a response.
struct RenderedToolbar {
  // HTML inserted before the marker.
  std::string fragment;
  // Header fields appended to the rewritten response (Server-Timing for instance).
  http::HeaderList extraHeaders;
};

// Called once per injected response with the plaintext body and the response start as produced by the application.
// May throw std::exception, in which case the original response is emitted.
using FragmentProvider = std::function<RenderedToolbar(std::string_view plainBody, const ResponseStart &start)>;

// Send wrapper of one response. Events of ineligible responses are forwarded one by one as they come. Eligible
// ones are buffered until the last body chunk, then decoded, injected and emitted as a single start and a single
// final body event. Any failure after capture falls back to emitting the original bytes. Downstream receives at most
// one start event: a repeated start from the application is dropped.
// Exceptions thrown by the downstream Send are propagated unchanged.
class ResponseInterceptor {
 public:
  enum class Phase : std::uint8_t {
    Capturing,  // waiting for the start event, or buffering an eligible response
    Streaming,  // forwarding events as they come
    Emitted,    // final response sent
    Cancelled,  // nothing is written anymore
  };

  ResponseInterceptor(const ToolbarConfig &config, std::string requestMethod, std::string requestPath, Send downstream,
                      FragmentProvider fragmentProvider, const CodecRegistry &registry = CodecRegistry::Global());

  ResponseInterceptor(const ResponseInterceptor &) = delete;
  ResponseInterceptor(ResponseInterceptor &&) noexcept = delete;
  ResponseInterceptor &operator=(const ResponseInterceptor &) = delete;
  ResponseInterceptor &operator=(ResponseInterceptor &&) noexcept = delete;

  ~ResponseInterceptor() = default;

  // Entry point for the application events.
  void onEvent(ResponseEvent event);

  // A Send forwarding to onEvent. The interceptor must outlive it.
  [[nodiscard]] Send sender() {
    return [this](ResponseEvent event) { onEvent(std::move(event)); };
  }

  // Client went away: releases buffers and suppresses any further write.
  void cancel() noexcept;

  // Emits the captured response unmodified if it has not been emitted yet (application failed or returned before
  // the last chunk). Returns true if something was sent.
  bool flushOriginal();

  [[nodiscard]] Phase phase() const noexcept { return _phase; }

  // Whether a start event was sent downstream.
  [[nodiscard]] bool headersSent() const noexcept { return _headersSent; }

  // Whether the toolbar fragment was injected in the emitted response.
  [[nodiscard]] bool injected() const noexcept { return _injected; }

  // Status of the application response, 0 if none started.
  [[nodiscard]] http::StatusCode status() const noexcept { return _capture.started() ? _capture.status() : 0; }

  [[nodiscard]] const http::HeaderList &responseHeaders() const noexcept { return _capture.headers(); }

  // Body bytes received from the application so far, streamed or not.
  [[nodiscard]] std::size_t bodyBytesReceived() const noexcept { return _bodyBytesReceived; }

  [[nodiscard]] Eligibility eligibility() const noexcept { return _eligibility; }

 private:
  void onStart(ResponseStart start);
  void onBody(ResponseBody body);
  void onOther(ResponseOther other);

  // Sends what was captured so far as it was received, and forwards the next events.
  void switchToStreaming();

  // Last chunk received: emits the injected response, or the original one on any failure.
  void finish();

  // Decodes and injects the captured body. Returns false if the response has to be emitted unmodified.
  bool tryRewrite(std::string_view original, http::HeaderList &headers, std::string &body);

  void emitFinal(http::StatusCode status, http::HeaderList headers, std::string body);

  void forward(ResponseEvent event);

  const ToolbarConfig *_config;
  const CodecRegistry *_registry;
  std::string _requestMethod;
  std::string _requestPath;
  Send _downstream;
  FragmentProvider _fragmentProvider;
  ResponseCapture _capture;
  std::vector<ResponseOther> _pendingOthers;
  std::size_t _bodyBytesReceived{};
  Phase _phase{Phase::Capturing};
  Eligibility _eligibility{Eligibility::eligible};
  bool _headersSent{false};
  bool _injected{false};
};

}  // namespace devbar
