#include <gtest/gtest.h>
#include <timeshare/schema/registry_result.hpp>

#include <timeshare/schema/call.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

TEST(result_types, registry_codespace_is_stable) {
  constexpr std::string_view codespace = timeshare::schema::kRegistryCodespace;
  EXPECT_EQ(codespace, "timeshare.registry");
}

TEST(result_types, success_and_failure_carry_the_codespace) {
  using result_t = timeshare::schema::registry_result<uint64_t>;
  auto accepted = result_t::success(4);
  EXPECT_TRUE(accepted.ok());
  EXPECT_EQ(accepted.value, std::optional<uint64_t>{4});
  EXPECT_FALSE(accepted.error().has_value());
  EXPECT_EQ(accepted.codespace, timeshare::schema::kRegistryCodespace);

  auto rejected = result_t::failure(
      timeshare::schema::registry_error_code::not_owner, "not yours");
  EXPECT_FALSE(rejected.ok());
  EXPECT_FALSE(rejected.value.has_value());
  EXPECT_EQ(rejected.error(), timeshare::schema::registry_error_code::not_owner);
  EXPECT_EQ(rejected.log, "not yours");
  EXPECT_EQ(rejected.codespace, timeshare::schema::kRegistryCodespace);
}

TEST(call_types, defaults_are_stable) {
  auto call = timeshare::schema::call_t{};
  EXPECT_EQ(call.version, 1u);
  EXPECT_EQ(call.nonce, 0u);
}
