#pragma once
#include <tender/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tender::storage {

using key_value_entry_t =
    std::pair<tender::schema::bytes_t, tender::schema::bytes_t>;

/// Rows committed together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> entries;

  void put(tender::schema::bytes_t key, tender::schema::bytes_t value) {
    entries.emplace_back(std::move(key), std::move(value));
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder, tender::schema::bytes_t key, const T& value) {
    put(std::move(key), encoder.encode(value));
  }

  bool empty() const { return entries.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tender::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tender::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<tender::schema::bytes_t> get_raw(
      const tender::schema::bytes_view_t& key) const;

  /// Persist raw bytes at key.
  void put_raw(const tender::schema::bytes_view_t& key,
               const tender::schema::bytes_view_t& value) const;

  /// Atomically persist every row of the batch.
  void write(const write_batch& batch) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tender::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tender::storage
