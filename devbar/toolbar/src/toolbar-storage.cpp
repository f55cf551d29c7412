#include "devbar/toolbar-storage.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "devbar/request-context.hpp"

namespace devbar {

ToolbarStorage::ToolbarStorage(std::size_t maxSize) : _maxSize(maxSize) {}

void ToolbarStorage::store(ToolbarRecord record) {
  std::scoped_lock lock(_mutex);
  const auto it = std::ranges::find(_records, record.requestId, &ToolbarRecord::requestId);
  if (it != _records.end()) {
    _records.erase(it);
  }
  _records.push_front(std::move(record));
  while (_records.size() > _maxSize) {
    _records.pop_back();
  }
}

void ToolbarStorage::storeFromContext(const RequestContext &context) {
  store(ToolbarRecord{.requestId = context.requestId(),
                      .metadata = context.allMetadata(),
                      .panelData = context.allPanelData(),
                      .timings = context.timings()});
}

std::optional<ToolbarRecord> ToolbarStorage::get(std::string_view requestId) const {
  std::scoped_lock lock(_mutex);
  const auto it = std::ranges::find(_records, requestId, &ToolbarRecord::requestId);
  if (it == _records.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<ToolbarRecord> ToolbarStorage::getAll() const {
  std::scoped_lock lock(_mutex);
  return std::vector<ToolbarRecord>(_records.begin(), _records.end());
}

void ToolbarStorage::clear() {
  std::scoped_lock lock(_mutex);
  _records.clear();
}

std::size_t ToolbarStorage::size() const {
  std::scoped_lock lock(_mutex);
  return _records.size();
}

}  // namespace devbar
