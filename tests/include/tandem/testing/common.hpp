#pragma once

#include <tandem/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <numeric>
#include <string>
#include <string_view>
#include <system_error>

namespace tandem::testing {

/// 32 consecutive byte values starting at `seed`.
inline tandem::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tandem::schema::hash32_t{};
  std::iota(std::begin(out), std::end(out), seed);
  return out;
}

/// Principal identity whose first byte is `seed` and the rest zero.
inline tandem::schema::account_id_t make_principal(const uint8_t seed) {
  auto principal = tandem::schema::account_id_t{};
  principal[0] = seed;
  return principal;
}

inline tandem::schema::bytes_t make_seed(const std::string_view text) {
  return tandem::schema::make_bytes(text);
}

/// Unique RocksDB directory under the system temp path, removed on scope
/// exit. The directory itself is created by the store.
class temp_db_dir final {
 public:
  explicit temp_db_dir(const std::string_view prefix) {
    static auto counter = std::atomic<uint64_t>{};
    const auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = (std::filesystem::temp_directory_path() /
             (std::string{prefix} + "_" + std::to_string(stamp) + "_" +
              std::to_string(counter.fetch_add(1))))
                .string();
  }

  temp_db_dir(const temp_db_dir&) = delete;
  temp_db_dir& operator=(const temp_db_dir&) = delete;

  ~temp_db_dir() {
    auto error = std::error_code{};
    std::filesystem::remove_all(path_, error);
  }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace tandem::testing
