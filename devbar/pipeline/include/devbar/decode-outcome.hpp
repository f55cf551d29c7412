#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "devbar/raw-chars.hpp"

namespace devbar {

// Result of trying to reverse the content codings of a response body.
// PassThrough and Failed refer to the original bytes, which are owned by the caller and must outlive the outcome.
class DecodeOutcome {
 public:
  enum class Kind : std::uint8_t { Decoded, PassThrough, Failed };

  // Every coding of the stack was removed, 'plain' is the resulting body.
  static DecodeOutcome Decoded(RawChars plain) noexcept {
    DecodeOutcome ret(Kind::Decoded, {});
    ret._plain = std::move(plain);
    return ret;
  }

  // Decoding was not attempted, 'original' has to be emitted as is.
  static DecodeOutcome PassThrough(std::string_view original) noexcept { return {Kind::PassThrough, original}; }

  // Decoding was attempted and aborted. 'reason' should be a string literal.
  static DecodeOutcome Failed(std::string_view original, const char *reason) noexcept {
    DecodeOutcome ret(Kind::Failed, original);
    ret._reason = reason;
    return ret;
  }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool decoded() const noexcept { return _kind == Kind::Decoded; }

  [[nodiscard]] bool failed() const noexcept { return _kind == Kind::Failed; }

  // Decoded bytes, or the original bytes otherwise.
  [[nodiscard]] std::string_view body() const noexcept {
    return _kind == Kind::Decoded ? std::string_view(_plain) : _original;
  }

  // Why decoding failed, nullptr unless failed().
  [[nodiscard]] const char *reason() const noexcept { return _reason; }

  // A failure is never visible outside of the pipeline: it is emitted like a pass-through.
  [[nodiscard]] DecodeOutcome resolved() && noexcept {
    if (_kind == Kind::Failed) {
      _kind = Kind::PassThrough;
      _reason = nullptr;
    }
    return std::move(*this);
  }

 private:
  DecodeOutcome(Kind kind, std::string_view original) noexcept : _kind(kind), _original(original) {}

  Kind _kind;
  std::string_view _original;
  RawChars _plain;
  const char *_reason{nullptr};
};

}  // namespace devbar
