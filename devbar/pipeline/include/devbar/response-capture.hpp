#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/http-constants.hpp"
#include "devbar/http-header.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/response-event.hpp"

namespace devbar {

// Lifecycle of one response as produced by the application.
// Idle -> HeadersReceived on the start event, -> Buffering on body chunks, -> Complete with the last chunk.
class ResponseCapture {
 public:
  enum class State : std::uint8_t { Idle, HeadersReceived, Buffering, Complete };

  // Records status and headers.
  // Throws std::logic_error if a start was already recorded.
  void start(ResponseStart start);

  // Appends a body chunk, and enters Complete if it is the last one.
  // Throws std::logic_error before start or after completion.
  void append(std::string chunk, bool moreBody);

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool started() const noexcept { return _state != State::Idle; }

  [[nodiscard]] bool complete() const noexcept { return _state == State::Complete; }

  [[nodiscard]] http::StatusCode status() const noexcept { return _start.status; }

  [[nodiscard]] const http::HeaderList &headers() const noexcept { return _start.headers; }

  [[nodiscard]] const ResponseStart &startEvent() const noexcept { return _start; }

  [[nodiscard]] const std::vector<std::string> &bodyChunks() const noexcept { return _bodyChunks; }

  // Total number of buffered body bytes.
  [[nodiscard]] std::size_t bodySize() const noexcept { return _bodySize; }

  // Concatenation of all the chunks.
  [[nodiscard]] RawChars joinedBody() const;

  // Moves out the body chunks. The state is kept.
  std::vector<std::string> takeBodyChunks() noexcept;

  // Frees the body chunks. The state is kept.
  void releaseBody() noexcept;

 private:
  ResponseStart _start;
  std::vector<std::string> _bodyChunks;
  std::size_t _bodySize{};
  State _state{State::Idle};
};

}  // namespace devbar
