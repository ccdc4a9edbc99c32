#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;  // principal or shared account

bytes_t make_bytes(const std::string& text);
bytes_t make_bytes(const std::string_view& text);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& text);
bytes_view_t make_bytes_view(const hash32_t& hash);

/// Exactly 32 raw bytes as a hash, e.g. an identity read back from storage.
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
/// 64 hex digits, optionally prefixed with 0x.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lower-case hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace tandem::schema
