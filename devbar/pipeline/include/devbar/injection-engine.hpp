#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace devbar {

struct InjectionResult {
  std::string body;
  std::size_t contentLength{};
  // Whether the body is no longer in the codings declared by Content-Encoding.
  bool encodingRemoved{false};
};

class InjectionEngine {
 public:
  // Position before which a fragment is inserted in 'body': last exact occurrence of 'marker', else last
  // case-insensitive occurrence, else body.size().
  static std::size_t InsertionPoint(std::string_view body, std::string_view marker) noexcept;

  static InjectionResult Inject(std::string_view body, std::string_view fragment, std::string_view marker,
                                bool encodingRemoved);
};

}  // namespace devbar
