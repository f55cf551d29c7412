#include "devbar/injection-engine.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "devbar/string-equal-ignore-case.hpp"

namespace devbar {

std::size_t InjectionEngine::InsertionPoint(std::string_view body, std::string_view marker) noexcept {
  if (marker.empty()) {
    return body.size();
  }
  std::size_t pos = body.rfind(marker);
  if (pos == std::string_view::npos) {
    pos = RFindCaseInsensitive(body, marker);
  }
  return pos == std::string_view::npos ? body.size() : pos;
}

InjectionResult InjectionEngine::Inject(std::string_view body, std::string_view fragment, std::string_view marker,
                                        bool encodingRemoved) {
  const std::size_t pos = InsertionPoint(body, marker);

  InjectionResult result;
  result.body.reserve(body.size() + fragment.size());
  result.body.append(body.substr(0, pos));
  result.body.append(fragment);
  result.body.append(body.substr(pos));
  result.contentLength = result.body.size();
  result.encodingRemoved = encodingRemoved;
  return result;
}

}  // namespace devbar
