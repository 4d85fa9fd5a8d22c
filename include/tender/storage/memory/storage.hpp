#pragma once
#include <tender/storage/storage.hpp>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string_view>

namespace tender::storage {

namespace detail {

struct memory_table final {
  mutable std::shared_mutex mutex;
  std::map<tender::schema::bytes_t, tender::schema::bytes_t> rows;
};

}  // namespace detail

/// Process-local backend with the same ordering as RocksDB's bytewise
/// comparator. Contents are lost when the storage is destroyed.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::unique_ptr<detail::memory_table> table;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tender::schema::bytes_view_t& key) const {
    auto value = get_raw(key);
    if (!value) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        tender::schema::bytes_view_t{value->data(), value->size()})};
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tender::schema::bytes_view_t& key,
           const T& value) const {
    auto encoded_value = encoder.encode(value);
    put_raw(key, tender::schema::bytes_view_t{encoded_value.data(),
                                              encoded_value.size()});
  }

  std::optional<tender::schema::bytes_t> get_raw(
      const tender::schema::bytes_view_t& key) const;
  void put_raw(const tender::schema::bytes_view_t& key,
               const tender::schema::bytes_view_t& value) const;
  void write(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tender::schema::bytes_view_t& prefix) const;
};

using memory_storage_t = storage<memory_storage_tag>;

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace tender::storage
