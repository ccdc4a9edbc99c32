#include <tandem/schema/key/engine_keys.hpp>
#include <tandem/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using tandem::testing::make_hash;

TEST(engine_keys, each_record_type_has_its_own_slot_per_identity) {
  auto account = make_hash(42);
  auto keys = std::set<tandem::schema::bytes_t>{
      tandem::schema::key::make_account_key(account),
      tandem::schema::key::make_registry_key(account),
      tandem::schema::key::make_shared_account_key(account),
      tandem::schema::key::make_management_key(account),
      tandem::schema::key::make_capability_key(account)};
  EXPECT_EQ(keys.size(), 5u);

  EXPECT_NE(tandem::schema::key::make_capability_key(make_hash(1)),
            tandem::schema::key::make_capability_key(make_hash(2)));
  EXPECT_EQ(tandem::schema::key::make_capability_key(make_hash(1)),
            tandem::schema::key::make_capability_key(make_hash(1)));
}

TEST(engine_keys, audit_keys_sort_by_sequence_within_kind) {
  using tandem::schema::audit_event_type_t;
  auto prefix =
      tandem::schema::key::make_audit_event_prefix(audit_event_type_t::claimer_added);
  auto first =
      tandem::schema::key::make_audit_event_key(audit_event_type_t::claimer_added, 1);
  auto later = tandem::schema::key::make_audit_event_key(
      audit_event_type_t::claimer_added, 256);
  EXPECT_LT(first, later);
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), first.begin()));
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), later.begin()));

  auto other = tandem::schema::key::make_audit_event_key(
      audit_event_type_t::claimer_removed, 1);
  EXPECT_FALSE(std::equal(prefix.begin(), prefix.end(), other.begin()));
}
