#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "devbar/request-context.hpp"

namespace devbar {

// What is kept of a handled request.
struct ToolbarRecord {
  std::string requestId;
  std::map<std::string, std::string, std::less<>> metadata;
  std::map<std::string, PanelStats, std::less<>> panelData;
  std::vector<Timing> timings;

  bool operator==(const ToolbarRecord &) const = default;
};

// Thread-safe bounded history of the most recent requests. When full, the least recently stored record is evicted.
class ToolbarStorage {
 public:
  explicit ToolbarStorage(std::size_t maxSize = 50);

  // Stores 'record', replacing and refreshing a record with the same id.
  void store(ToolbarRecord record);

  void storeFromContext(const RequestContext &context);

  [[nodiscard]] std::optional<ToolbarRecord> get(std::string_view requestId) const;

  // All records, newest first.
  [[nodiscard]] std::vector<ToolbarRecord> getAll() const;

  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t maxSize() const noexcept { return _maxSize; }

 private:
  mutable std::mutex _mutex;
  std::list<ToolbarRecord> _records;  // newest first
  std::size_t _maxSize;
};

}  // namespace devbar
