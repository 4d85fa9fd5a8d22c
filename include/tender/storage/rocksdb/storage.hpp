#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tender/common/critical.hpp>
#include <tender/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace tender::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tender::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline tender::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tender::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tender::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<tender::schema::bytes_t> get_raw(
      const tender::schema::bytes_view_t& key) const;
  void put_raw(const tender::schema::bytes_view_t& key,
               const tender::schema::bytes_view_t& value) const;
  void write(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tender::schema::bytes_view_t& prefix) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tender::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      tender::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tender::schema::bytes_view_t& key,
                                       const T& value) const {
  auto encoded_value = encoder.encode(value);
  put_raw(key, tender::schema::bytes_view_t{encoded_value.data(),
                                            encoded_value.size()});
}

inline std::optional<tender::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const tender::schema::bytes_view_t& key) const {
  if (!database) {
    tender::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      tender::common::critical("RocksDB get failed: {}", status.ToString());
    }
  }
  return tender::schema::bytes_t{std::begin(value), std::end(value)};
}

inline void storage<rocksdb_storage_tag>::put_raw(
    const tender::schema::bytes_view_t& key,
    const tender::schema::bytes_view_t& value) const {
  if (!database) {
    tender::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    tender::common::critical("RocksDB put failed: {}", status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::write(
    const write_batch& batch) const {
  if (!database) {
    tender::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.entries) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      tender::common::critical("failed staging key in write batch: {}",
                               put_status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    tender::common::critical("RocksDB batch of {} row(s) failed: {}",
                             batch.entries.size(), write_status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tender::schema::bytes_view_t& prefix) const {
  if (!database) {
    tender::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    tender::common::critical("RocksDB prefix scan failed: {}",
                             iterator->status().ToString());
  }
  return entries;
}

}  // namespace tender::storage
