#include <gtest/gtest.h>
#include <timeshare/execution/signing.hpp>
#include <timeshare/schema/call.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/schema/timeshare_info.hpp>
#include <timeshare/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(scale_encoding, timeshare_info_uses_field_order_layout) {
  auto encoder = encoder_t{};
  auto info = timeshare::schema::timeshare_info_t{
      .hotel = "Grand Hotel", .room = "305", .week = 28};
  auto encoded = encoder.encode(info);

  auto expected = timeshare::schema::bytes_t{0x01, 0x00, 0x2C};
  auto hotel = timeshare::schema::make_bytes(std::string_view{"Grand Hotel"});
  expected.insert(std::end(expected), std::begin(hotel), std::end(hotel));
  expected.push_back(0x0C);
  expected.insert(std::end(expected), {'3', '0', '5'});
  expected.insert(std::end(expected), {0x1C, 0x00, 0x00, 0x00});
  EXPECT_EQ(encoded, expected);

  auto decoded = encoder.decode<timeshare::schema::timeshare_info_t>(
      timeshare::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded, info);
}

TEST(scale_encoding, signer_variant_is_tagged_by_kind) {
  auto encoder = encoder_t{};
  auto named = encoder.encode(timeshare::testing::make_named_signer(9));
  auto ed25519 = encoder.encode(timeshare::schema::signer_id_t{
      timeshare::testing::make_ed25519_signer(9)});
  ASSERT_EQ(named.size(), 33u);
  ASSERT_EQ(ed25519.size(), 33u);
  EXPECT_EQ(ed25519[0], 0x00);
  EXPECT_EQ(named[0], 0x02);
}

TEST(scale_encoding, call_survives_decode_with_every_payload) {
  auto encoder = encoder_t{};
  auto admin = timeshare::testing::make_named_signer(1);
  auto owner = timeshare::testing::make_named_signer(2);
  auto payloads = std::vector<timeshare::schema::call_payload_t>{
      timeshare::schema::initialize_registry_t{.admin = admin},
      timeshare::schema::mint_timeshare_t{
          .recipient = owner, .hotel = "Seaside", .room = "12A", .week = 52},
      timeshare::schema::transfer_timeshare_t{
          .from = owner, .to = admin, .token_id = 3}};

  for (const auto& payload : payloads) {
    auto call = timeshare::schema::call_t{
        .registry_id = timeshare::testing::make_hash(7),
        .nonce = 11,
        .signer = admin,
        .payload = payload,
        .signature = timeshare::schema::secp256k1_signature_t{}};
    auto encoded = encoder.encode(call);
    auto decoded = encoder.try_decode<timeshare::schema::call_t>(
        timeshare::schema::bytes_view_t{encoded.data(), encoded.size()});
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->payload.index(), payload.index());
    EXPECT_EQ(decoded->signer, admin);
    EXPECT_EQ(decoded->registry_id, call.registry_id);
    EXPECT_EQ(decoded->nonce, 11u);
    EXPECT_TRUE(std::holds_alternative<timeshare::schema::secp256k1_signature_t>(
        decoded->signature));
  }
}

TEST(scale_encoding, try_decode_rejects_truncated_call) {
  auto encoder = encoder_t{};
  auto call = timeshare::schema::call_t{
      .registry_id = timeshare::testing::make_hash(1),
      .signer = timeshare::testing::make_named_signer(1),
      .payload = timeshare::schema::initialize_registry_t{
          .admin = timeshare::testing::make_named_signer(1)},
      .signature = timeshare::schema::ed25519_signature_t{}};
  auto encoded = encoder.encode(call);
  encoded.resize(encoded.size() / 2);
  auto decoded = encoder.try_decode<timeshare::schema::call_t>(
      timeshare::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_FALSE(decoded.has_value());
}

TEST(signing_payload, ignores_signature_but_binds_every_other_field) {
  auto call = timeshare::schema::call_t{
      .registry_id = timeshare::testing::make_hash(1),
      .signer = timeshare::testing::make_named_signer(1),
      .payload = timeshare::schema::transfer_timeshare_t{
          .from = timeshare::testing::make_named_signer(1),
          .to = timeshare::testing::make_named_signer(2),
          .token_id = 1},
      .signature = timeshare::schema::ed25519_signature_t{}};
  auto base = timeshare::execution::signing_payload(call);

  auto resigned = call;
  auto signature = timeshare::schema::ed25519_signature_t{};
  signature.fill(0xEE);
  resigned.signature = signature;
  EXPECT_EQ(timeshare::execution::signing_payload(resigned), base);

  auto next_nonce = call;
  next_nonce.nonce = call.nonce + 1;
  EXPECT_NE(timeshare::execution::signing_payload(next_nonce), base);

  auto retargeted = call;
  retargeted.registry_id = timeshare::testing::make_hash(2);
  EXPECT_NE(timeshare::execution::signing_payload(retargeted), base);

  auto other_token = call;
  std::get<timeshare::schema::transfer_timeshare_t>(other_token.payload)
      .token_id = 2;
  EXPECT_NE(timeshare::execution::signing_payload(other_token), base);
}

TEST(signing_payload, default_registry_id_is_stable) {
  EXPECT_EQ(timeshare::execution::default_registry_id(),
            timeshare::execution::default_registry_id());
  EXPECT_NE(timeshare::execution::default_registry_id(),
            timeshare::schema::make_zero_hash());
}
