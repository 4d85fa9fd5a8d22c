#include <spdlog/spdlog.h>
#include <tender/common/critical.hpp>
#include <tender/storage/memory/storage.hpp>

#include <algorithm>
#include <mutex>

namespace tender::storage {

namespace {

const detail::memory_table& checked(
    const std::unique_ptr<detail::memory_table>& table) {
  if (!table) {
    tender::common::critical("memory storage is not initialized");
  }
  return *table;
}

}  // namespace

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  auto store = storage<memory_storage_tag>();
  store.table = std::make_unique<detail::memory_table>();
  spdlog::info("Opened in-memory storage ({})", path);
  return store;
}

std::optional<tender::schema::bytes_t> storage<memory_storage_tag>::get_raw(
    const tender::schema::bytes_view_t& key) const {
  const auto& memory = checked(table);
  auto lock = std::shared_lock{memory.mutex};
  auto it = memory.rows.find(tender::schema::make_bytes(key));
  if (it == std::end(memory.rows)) {
    return std::nullopt;
  }
  return it->second;
}

void storage<memory_storage_tag>::put_raw(
    const tender::schema::bytes_view_t& key,
    const tender::schema::bytes_view_t& value) const {
  checked(table);
  auto lock = std::unique_lock{table->mutex};
  table->rows.insert_or_assign(tender::schema::make_bytes(key),
                               tender::schema::make_bytes(value));
}

void storage<memory_storage_tag>::write(const write_batch& batch) const {
  checked(table);
  if (batch.empty()) {
    return;
  }
  auto lock = std::unique_lock{table->mutex};
  for (const auto& [key, value] : batch.entries) {
    table->rows.insert_or_assign(key, value);
  }
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const tender::schema::bytes_view_t& prefix) const {
  const auto& memory = checked(table);
  auto entries = std::vector<key_value_entry_t>{};
  auto lock = std::shared_lock{memory.mutex};
  for (auto it = memory.rows.lower_bound(tender::schema::make_bytes(prefix));
       it != std::end(memory.rows); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    entries.push_back(key_value_entry_t{key, it->second});
  }
  return entries;
}

}  // namespace tender::storage
