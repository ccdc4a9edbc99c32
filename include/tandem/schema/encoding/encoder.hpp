#pragma once
#include <tandem/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace tandem::schema::encoding {

// Selected at build time by tag; records never carry the library choice.
template <typename Library>
struct encoder {
  template <typename T>
  tandem::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const tandem::schema::bytes_view_t& bytes);

  /// Decode a record's wire tuple, whose first element is its version.
  template <uint16_t Version, typename Tuple>
  std::optional<Tuple> try_decode_record(
      const tandem::schema::bytes_view_t& bytes);
};

/// Maps a stored record type to its wire form for one encoding library.
///
/// Specializations provide `encode(encoder&, const T&) -> bytes_t` and
/// `decode(encoder&, bytes_view_t) -> std::optional<T>`; decode rejects
/// unknown record versions.
template <typename T, typename Library>
struct record_codec;

}  // namespace tandem::schema::encoding
