#pragma once

#include <tandem/schema/primitives.hpp>

namespace tandem::execution {

/// One-time proof of the right to act as a shared account.
///
/// Produced only by `engine::acquire_authority`. It is never persisted and
/// cannot be copied; a fresh proof requires a new claim and redemption.
class delegated_authority final {
 public:
  delegated_authority(const tandem::schema::account_id_t& account,
                      const tandem::schema::hash32_t& proof)
      : account_{account}, proof_{proof} {}

  delegated_authority(const delegated_authority&) = delete;
  delegated_authority& operator=(const delegated_authority&) = delete;
  delegated_authority(delegated_authority&&) noexcept = default;
  delegated_authority& operator=(delegated_authority&&) noexcept = default;
  ~delegated_authority() = default;

  /// Shared account this authority acts as.
  const tandem::schema::account_id_t& account() const { return account_; }
  const tandem::schema::hash32_t& proof() const { return proof_; }

 private:
  tandem::schema::account_id_t account_;
  tandem::schema::hash32_t proof_;
};

}  // namespace tandem::execution
