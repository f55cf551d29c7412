#include "devbar/response-capture.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "devbar/raw-chars.hpp"
#include "devbar/response-event.hpp"

namespace devbar {

void ResponseCapture::start(ResponseStart start) {
  if (_state != State::Idle) {
    throw std::logic_error("Response already started");
  }
  _start = std::move(start);
  _state = State::HeadersReceived;
}

void ResponseCapture::append(std::string chunk, bool moreBody) {
  if (_state == State::Idle) {
    throw std::logic_error("Body chunk received before response start");
  }
  if (_state == State::Complete) {
    throw std::logic_error("Body chunk received after the last one");
  }
  _bodySize += chunk.size();
  _bodyChunks.push_back(std::move(chunk));
  _state = moreBody ? State::Buffering : State::Complete;
}

RawChars ResponseCapture::joinedBody() const {
  RawChars body(_bodySize);
  for (const std::string &chunk : _bodyChunks) {
    body.unchecked_append(chunk);
  }
  return body;
}

std::vector<std::string> ResponseCapture::takeBodyChunks() noexcept {
  _bodySize = 0;
  return std::exchange(_bodyChunks, {});
}

void ResponseCapture::releaseBody() noexcept {
  std::vector<std::string>().swap(_bodyChunks);
  _bodySize = 0;
}

}  // namespace devbar
