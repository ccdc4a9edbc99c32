#pragma once
#include <tandem/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace tandem::schema::key {

/// Appends key segments to a byte buffer. Integers are written big-endian so
/// that RocksDB's byte order matches numeric order under prefix iteration.
class builder final {
 public:
  builder() = default;
  explicit builder(std::string_view prefix);

  builder& write(std::string_view text);
  builder& write(const bytes_view_t& bytes);
  builder& write(const hash32_t& hash);
  builder& write(uint8_t value);
  builder& write(uint16_t value);
  builder& write(uint64_t value);

  bytes_view_t view() const;
  bytes_t take();

 private:
  bytes_t data_;
};

}  // namespace tandem::schema::key
