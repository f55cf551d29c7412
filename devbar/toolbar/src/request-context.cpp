#include "devbar/request-context.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>

#include "devbar/char-hexadecimal-converter.hpp"
#include "devbar/timedef.hpp"

namespace devbar {

namespace {

std::string RandomRequestId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string id(32, '\0');
  char *out = id.data();
  for (int part = 0; part < 2; ++part) {
    std::uint64_t bits = rng();
    for (int byte = 0; byte < 8; ++byte) {
      out = to_lower_hex(static_cast<unsigned char>(bits & 0xFFU), out);
      bits >>= 8U;
    }
  }
  return id;
}

}  // namespace

RequestContext::RequestContext() : RequestContext(RandomRequestId()) {}

RequestContext::RequestContext(std::string requestId)
    : _requestId(std::move(requestId)), _startTime(SteadyClock::now()) {}

Milliseconds RequestContext::elapsed() const noexcept { return Milliseconds(SteadyClock::now() - _startTime); }

void RequestContext::setMetadata(std::string_view key, std::string value) {
  _metadata.insert_or_assign(std::string(key), std::move(value));
}

std::optional<std::string_view> RequestContext::metadata(std::string_view key) const {
  const auto it = _metadata.find(key);
  if (it == _metadata.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void RequestContext::storePanelData(std::string_view panelId, std::string_view key, std::string value) {
  auto it = _panelData.find(panelId);
  if (it == _panelData.end()) {
    it = _panelData.emplace(std::string(panelId), PanelStats{}).first;
  }
  it->second.insert_or_assign(std::string(key), std::move(value));
}

void RequestContext::recordStats(std::string_view panelId, PanelStats stats) {
  auto it = _panelData.find(panelId);
  if (it == _panelData.end()) {
    _panelData.emplace(std::string(panelId), std::move(stats));
    return;
  }
  for (auto &[key, value] : stats) {
    it->second.insert_or_assign(key, std::move(value));
  }
}

const PanelStats &RequestContext::panelData(std::string_view panelId) const {
  static const PanelStats kEmpty;
  const auto it = _panelData.find(panelId);
  return it == _panelData.end() ? kEmpty : it->second;
}

void RequestContext::recordTiming(std::string_view name, Milliseconds duration) {
  const auto it = std::ranges::find(_timings, name, &Timing::name);
  if (it == _timings.end()) {
    _timings.push_back({std::string(name), duration});
  } else {
    it->duration = duration;
  }
}

std::optional<Milliseconds> RequestContext::timing(std::string_view name) const {
  const auto it = std::ranges::find(_timings, name, &Timing::name);
  if (it == _timings.end()) {
    return std::nullopt;
  }
  return it->duration;
}

}  // namespace devbar
