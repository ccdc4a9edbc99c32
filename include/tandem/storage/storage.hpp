#pragma once
#include <tandem/schema/encoding/encoder.hpp>
#include <tandem/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tandem::storage {

using key_value_entry_t =
    std::pair<tandem::schema::bytes_t, tandem::schema::bytes_t>;

/// One mutation of a unit of work. An empty value deletes the key.
struct write_entry final {
  tandem::schema::bytes_t key;
  std::optional<tandem::schema::bytes_t> value;
};

using write_set_t = std::vector<write_entry>;

template <typename Library>
struct storage {
  /// Raw value at key, or std::nullopt when missing.
  std::optional<tandem::schema::bytes_t> get(
      const tandem::schema::bytes_view_t& key) const;

  /// Decode the record of type T at key, or std::nullopt when missing.
  template <typename T, typename EncoderLibrary>
  std::optional<T> get(
      tandem::schema::encoding::encoder<EncoderLibrary>& encoder,
      const tandem::schema::bytes_view_t& key) const;

  /// True when a value is stored at key.
  bool contains(const tandem::schema::bytes_view_t& key) const;

  /// Commit every entry of the write set or none of them.
  void apply(const write_set_t& writes) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tandem::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tandem::storage
