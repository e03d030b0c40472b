#include <gtest/gtest.h>
#include <docket/blake3/hash.hpp>

TEST(blake3, empty_input_matches_reference_digest) {
  EXPECT_EQ(docket::schema::to_hex(docket::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, incremental_updates_match_one_shot_hash) {
  auto hasher = docket::blake3::hasher{};
  hasher.update(std::string_view{"transfer"})
      .update(std::string_view{"(address,uint256)"});
  EXPECT_EQ(hasher.finalize(),
            docket::blake3::hash(std::string_view{"transfer(address,uint256)"}));
}

TEST(blake3, byte_and_string_overloads_agree) {
  auto text = std::string_view{"docket"};
  EXPECT_EQ(docket::blake3::hash(text),
            docket::blake3::hash(docket::schema::make_bytes_view(text)));
}

TEST(blake3, moved_hasher_keeps_its_state) {
  auto first = docket::blake3::hasher{};
  first.update(std::string_view{"abc"});
  auto second = std::move(first);
  EXPECT_EQ(second.finalize(), docket::blake3::hash(std::string_view{"abc"}));
}
