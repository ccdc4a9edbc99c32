#pragma once
#include <tandem/schema/audit_event_record.hpp>
#include <tandem/schema/encoding/scale/encoder.hpp>
#include <optional>

namespace tandem::schema::encoding {

template <>
struct record_codec<audit_event_record_t, scale_encoder_tag> final {
  static tandem::schema::bytes_t encode(scale_encoder_t& encoder,
                                        const audit_event_record_t& value);
  static std::optional<audit_event_record_t> decode(
      scale_encoder_t& encoder,
      const tandem::schema::bytes_view_t& bytes);
};

}  // namespace tandem::schema::encoding
