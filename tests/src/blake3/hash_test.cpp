#include <gtest/gtest.h>
#include <courier/blake3/hash.hpp>
#include <courier/schema/primitives.hpp>

TEST(blake3_hash, empty_input_matches_reference_digest) {
  EXPECT_EQ(courier::schema::to_hex(courier::blake3::hash(std::string_view{})),
            "0xaf1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, chunked_updates_match_single_pass) {
  auto chunked = courier::blake3::hasher{}
                     .update(std::string_view{"cross-"})
                     .update(std::string_view{"chain"})
                     .finalize();
  EXPECT_EQ(chunked, courier::blake3::hash(std::string_view{"cross-chain"}));
  EXPECT_NE(chunked, courier::blake3::hash(std::string_view{"crosschain"}));
}

TEST(blake3_hash, finalize_leaves_hasher_usable) {
  auto hasher = courier::blake3::hasher{};
  hasher.update(std::string_view{"a"});
  auto first = hasher.finalize();
  EXPECT_EQ(first, hasher.finalize());
  hasher.update(std::string_view{"b"});
  EXPECT_EQ(hasher.finalize(), courier::blake3::hash(std::string_view{"ab"}));
}
