#pragma once
#include <tandem/schema/registry_state.hpp>
#include <tandem/schema/encoding/scale/encoder.hpp>
#include <optional>

namespace tandem::schema::encoding {

template <>
struct record_codec<registry_state_t, scale_encoder_tag> final {
  static tandem::schema::bytes_t encode(scale_encoder_t& encoder,
                                        const registry_state_t& value);
  static std::optional<registry_state_t> decode(
      scale_encoder_t& encoder,
      const tandem::schema::bytes_view_t& bytes);
};

}  // namespace tandem::schema::encoding
