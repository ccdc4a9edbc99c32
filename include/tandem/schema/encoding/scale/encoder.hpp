#pragma once
#include <tandem/common/critical.hpp>
#include <tandem/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>
#include <tuple>

namespace tandem::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tandem::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      tandem::common::critical("SCALE encoding failed");
    }
    return std::move(encoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const tandem::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }

  template <uint16_t Version, typename Tuple>
  std::optional<Tuple> try_decode_record(
      const tandem::schema::bytes_view_t& bytes) {
    auto decoded = try_decode<Tuple>(bytes);
    if (!decoded || std::get<0>(*decoded) != Version) {
      return std::nullopt;
    }
    return decoded;
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace tandem::schema::encoding
