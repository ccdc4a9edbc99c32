#include <tandem/execution/address_deriver.hpp>
#include <tandem/testing/common.hpp>
#include <gtest/gtest.h>

#include <set>

using tandem::testing::make_principal;
using tandem::testing::make_seed;

TEST(address_deriver, same_inputs_give_same_identity) {
  auto deriver = tandem::execution::default_address_deriver();
  auto seed = make_seed("treasury");
  auto first = deriver(make_principal(1), tandem::schema::make_bytes_view(seed));
  auto second =
      deriver(make_principal(1), tandem::schema::make_bytes_view(seed));
  EXPECT_EQ(first, second);
  EXPECT_NE(first, make_principal(1));
}

TEST(address_deriver, parent_and_seed_both_separate_identities) {
  auto deriver = tandem::execution::default_address_deriver();
  auto alpha = make_seed("alpha");
  auto beta = make_seed("beta");
  auto ids = std::set<tandem::schema::account_id_t>{
      deriver(make_principal(1), tandem::schema::make_bytes_view(alpha)),
      deriver(make_principal(1), tandem::schema::make_bytes_view(beta)),
      deriver(make_principal(2), tandem::schema::make_bytes_view(alpha)),
      deriver(make_principal(2), tandem::schema::make_bytes_view(beta)),
      deriver(make_principal(1), tandem::schema::bytes_view_t{})};
  EXPECT_EQ(ids.size(), 5u);
}
