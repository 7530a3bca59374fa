#include <gtest/gtest.h>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/schema/key/registry_keys.hpp>

#include <algorithm>
#include <set>
#include <string_view>

namespace {

using encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;

bool has_prefix(const timeshare::schema::bytes_t& key,
                const timeshare::schema::bytes_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

TEST(registry_keys, every_slot_gets_a_distinct_key) {
  namespace key = timeshare::schema::key;
  auto encoder = encoder_t{};
  auto keys = std::set<timeshare::schema::bytes_t>{
      key::make_key(encoder, key::admin_key{}),
      key::make_key(encoder, key::counter_key{}),
      key::make_key(encoder, key::info_key{1}),
      key::make_key(encoder, key::owner_key{1}),
      key::make_key(encoder, key::info_key{2}),
      key::make_key(encoder, key::owner_key{2}),
      key::make_key(encoder,
                    key::nonce_key{timeshare::schema::named_signer_t{}})};
  EXPECT_EQ(keys.size(), 7u);
}

TEST(registry_keys, nonce_key_is_raw_prefix_then_scale_signer) {
  namespace key = timeshare::schema::key;
  auto encoder = encoder_t{};
  auto signer = timeshare::schema::signer_id_t{
      timeshare::schema::ed25519_signer_id{}};
  auto expected = timeshare::schema::make_bytes(key::kNonceKeyPrefix);
  auto id = encoder.encode(signer);
  expected.insert(std::end(expected), std::begin(id), std::end(id));
  EXPECT_EQ(key::make_key(encoder, key::nonce_key{signer}), expected);
}

TEST(registry_keys, token_keys_live_under_their_keyspace) {
  namespace key = timeshare::schema::key;
  auto encoder = encoder_t{};
  auto info_prefix = key::make_prefix_key(key::kInfoKeyPrefix);
  auto owner_prefix = key::make_prefix_key(key::kOwnerKeyPrefix);

  auto info = key::make_key(encoder, key::info_key{7});
  auto owner = key::make_key(encoder, key::owner_key{7});
  EXPECT_TRUE(has_prefix(info, info_prefix));
  EXPECT_FALSE(has_prefix(info, owner_prefix));
  EXPECT_TRUE(has_prefix(owner, owner_prefix));
  EXPECT_FALSE(has_prefix(owner, info_prefix));
}

TEST(registry_keys, token_key_is_raw_prefix_then_scale_id) {
  namespace key = timeshare::schema::key;
  auto encoder = encoder_t{};
  auto expected = timeshare::schema::make_bytes(key::kOwnerKeyPrefix);
  auto id = encoder.encode(timeshare::schema::token_id_t{42});
  expected.insert(std::end(expected), std::begin(id), std::end(id));
  EXPECT_EQ(key::make_key(encoder, key::owner_key{42}), expected);
  EXPECT_EQ(key::make_key(encoder, key::admin_key{}),
            timeshare::schema::make_bytes(key::kAdminKeyPrefix));
}

TEST(registry_keys, every_keyspace_sits_under_the_state_prefix) {
  namespace key = timeshare::schema::key;
  auto state = key::make_prefix_key(key::kStatePrefix);
  for (const auto keyspace : key::kRegistryKeyspaces) {
    EXPECT_TRUE(has_prefix(key::make_prefix_key(keyspace), state));
  }
}

TEST(registry_keys, keyspaces_list_every_prefix_once) {
  namespace key = timeshare::schema::key;
  auto prefixes = std::set<std::string_view>{std::begin(key::kRegistryKeyspaces),
                                             std::end(key::kRegistryKeyspaces)};
  EXPECT_EQ(prefixes.size(), key::kRegistryKeyspaces.size());
  EXPECT_TRUE(prefixes.contains(key::kAdminKeyPrefix));
  EXPECT_TRUE(prefixes.contains(key::kCounterKeyPrefix));
  EXPECT_TRUE(prefixes.contains(key::kNonceKeyPrefix));
}
