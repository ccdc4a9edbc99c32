#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tandem/common/critical.hpp>
#include <tandem/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace tandem::storage {

namespace detail {

inline tandem::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tandem::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<tandem::schema::bytes_t> get(
      const tandem::schema::bytes_view_t& key) const;

  template <typename T, typename EncoderLibrary>
  std::optional<T> get(
      tandem::schema::encoding::encoder<EncoderLibrary>& encoder,
      const tandem::schema::bytes_view_t& key) const;

  bool contains(const tandem::schema::bytes_view_t& key) const;
  void apply(const write_set_t& writes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tandem::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename EncoderLibrary>
std::optional<T> storage<rocksdb_storage_tag>::get(
    tandem::schema::encoding::encoder<EncoderLibrary>& encoder,
    const tandem::schema::bytes_view_t& key) const {
  auto raw = get(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded =
      tandem::schema::encoding::record_codec<T, EncoderLibrary>::decode(
          encoder, tandem::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    tandem::common::critical("undecodable record",
                             tandem::schema::to_hex(key));
  }
  return decoded;
}

inline std::optional<tandem::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const tandem::schema::bytes_view_t& key) const {
  if (!database) {
    tandem::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    tandem::common::critical("RocksDB read failed", status.ToString());
  }
  return tandem::schema::bytes_t(std::begin(value), std::end(value));
}

inline bool storage<rocksdb_storage_tag>::contains(
    const tandem::schema::bytes_view_t& key) const {
  return get(key).has_value();
}

inline void storage<rocksdb_storage_tag>::apply(
    const write_set_t& writes) const {
  if (!database) {
    tandem::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& write : writes) {
    auto key = detail::to_slice(
        tandem::schema::bytes_view_t{write.key.data(), write.key.size()});
    auto status =
        write.value
            ? batch.Put(key, detail::to_slice(tandem::schema::bytes_view_t{
                                 write.value->data(), write.value->size()}))
            : batch.Delete(key);
    if (!status.ok()) {
      tandem::common::critical("staging write batch failed",
                               status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    tandem::common::critical("committing write batch failed",
                             write_status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tandem::schema::bytes_view_t& prefix) const {
  if (!database) {
    tandem::common::critical("RocksDB database is not initialized");
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
    tandem::common::critical("RocksDB prefix scan failed",
                             iterator->status().ToString());
  }
  return entries;
}

}  // namespace tandem::storage
