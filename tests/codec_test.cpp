#include <ot-cpp/codec.hpp>

#include "src/encoding/leb128.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <string>
#include <vector>

using namespace ot_cpp;

namespace {

auto bytes(std::initializer_list<std::uint8_t> values) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    for (auto v : values) out.push_back(std::byte{v});
    return out;
}

auto repeated(std::string_view chunk, std::size_t times) -> std::string {
    auto s = std::string{};
    for (std::size_t i = 0; i < times; ++i) s += chunk;
    return s;
}

// Plain encoding of retain/delete headers: flag, op count, one header per op.
auto plain_body(std::initializer_list<std::uint64_t> headers) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{std::byte{0x00}};
    encoding::encode_uleb128(headers.size(), out);
    for (auto h : headers) encoding::encode_uleb128(h, out);
    return out;
}

constexpr auto retain_header(std::uint64_t n) -> std::uint64_t { return n << 2; }
constexpr auto delete_header(std::uint64_t n) -> std::uint64_t { return (n << 2) | 2; }

}  // anonymous namespace

// -- Layout -------------------------------------------------------------------

TEST(Codec, small_operation_is_plain) {
    const auto op = TextOperation{Retain{5}, Insert{"hi"}, Delete{2}};
    // flag, count, retain(5), insert(2) "hi", delete(2)
    EXPECT_EQ(encode(op), bytes({0x00, 0x03, 0x14, 0x09, 'h', 'i', 0x0A}));
}

TEST(Codec, empty_operation) {
    EXPECT_EQ(encode(TextOperation{}), bytes({0x00, 0x00}));
    auto decoded = decode(bytes({0x00, 0x00}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(Codec, large_retain_uses_multibyte_header) {
    const auto op = TextOperation{Retain{1000}};
    // 1000 << 2 = 4000 = 0x0FA0 → LEB128 [0xA0, 0x1F]
    EXPECT_EQ(encode(op), bytes({0x00, 0x01, 0xA0, 0x1F}));
}

TEST(Codec, decodes_what_it_encodes) {
    const auto op = TextOperation{Retain{3}, Delete{300}, Insert{"caf\xc3\xa9"}, Retain{70000}};
    auto decoded = decode(encode(op));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, op);
}

// -- Compression --------------------------------------------------------------

TEST(Codec, large_repetitive_body_is_deflated) {
    const auto op = TextOperation{Retain{10}, Insert{repeated("abc", 1000)}, Retain{10}};
    const auto encoded = encode(op);
    ASSERT_FALSE(encoded.empty());
    EXPECT_EQ(encoded[0], std::byte{0x01});
    EXPECT_LT(encoded.size(), 1000u);

    auto decoded = decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, op);
}

TEST(Codec, compression_can_be_disabled) {
    const auto op = TextOperation{Insert{repeated("abc", 1000)}};
    const auto encoded = encode(op, EncodeOptions{.compress = false});
    EXPECT_EQ(encoded[0], std::byte{0x00});
    EXPECT_GT(encoded.size(), 3000u);
}

TEST(Codec, body_below_threshold_is_plain) {
    const auto op = TextOperation{Insert{repeated("ab", 50)}};
    const auto encoded = encode(op, EncodeOptions{.deflate_threshold = 1024});
    EXPECT_EQ(encoded[0], std::byte{0x00});
}

// -- Malformed input ----------------------------------------------------------

TEST(Codec, rejects_empty_input) {
    EXPECT_FALSE(decode({}).has_value());
}

TEST(Codec, rejects_unknown_flag) {
    EXPECT_FALSE(decode(bytes({0x02, 0x00})).has_value());
}

TEST(Codec, rejects_missing_count) {
    EXPECT_FALSE(decode(bytes({0x00})).has_value());
}

TEST(Codec, rejects_missing_ops) {
    EXPECT_FALSE(decode(bytes({0x00, 0x02, 0x14})).has_value());
}

TEST(Codec, rejects_zero_length_op) {
    EXPECT_FALSE(decode(bytes({0x00, 0x01, 0x00})).has_value());
    EXPECT_FALSE(decode(bytes({0x00, 0x01, 0x01})).has_value());
}

TEST(Codec, rejects_unknown_tag) {
    EXPECT_FALSE(decode(bytes({0x00, 0x01, 0x07})).has_value());
}

TEST(Codec, rejects_truncated_insert_text) {
    EXPECT_FALSE(decode(bytes({0x00, 0x01, 0x0D, 'a', 'b'})).has_value());
}

TEST(Codec, rejects_trailing_bytes) {
    EXPECT_FALSE(decode(bytes({0x00, 0x01, 0x14, 0x00})).has_value());
}

TEST(Codec, rejects_corrupt_deflate_stream) {
    EXPECT_FALSE(decode(bytes({0x01, 0x10, 0xFF, 0xFF, 0xFF})).has_value());
}

TEST(Codec, rejects_deflated_size_mismatch) {
    const auto op = TextOperation{Insert{repeated("xyz", 500)}};
    auto encoded = encode(op);
    ASSERT_EQ(encoded[0], std::byte{0x01});
    // Claim a different uncompressed size: 1503 body bytes vs 1506 stated.
    auto tampered = std::vector<std::byte>{std::byte{0x01}};
    const auto original_size_len = std::size_t{2};
    tampered.push_back(std::byte{0xE2});
    tampered.push_back(std::byte{0x0B});
    tampered.insert(tampered.end(), encoded.begin() + 1 + original_size_len, encoded.end());
    EXPECT_FALSE(decode(tampered).has_value());
}

TEST(Codec, decode_merges_adjacent_ops) {
    auto decoded = decode(bytes({0x00, 0x02, 0x08, 0x0C}));  // retain(2), retain(3)
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, TextOperation{Retain{5}});
}

TEST(Codec, rejects_merged_length_past_max_length) {
    constexpr auto big = (std::uint64_t{1} << 62) - 1;
    // Four such deletes sum to 2^64 - 4, which would wrap the base length.
    const auto body = plain_body({retain_header(1),
                                  delete_header(big), delete_header(big),
                                  delete_header(big), delete_header(big),
                                  delete_header(3), retain_header(2)});
    EXPECT_FALSE(decode(body).has_value());
}

TEST(Codec, rejects_retains_summing_past_max_length) {
    constexpr auto big = (std::uint64_t{1} << 62) - 1;  // largest length a header holds
    const auto body = plain_body({retain_header(big), retain_header(big), retain_header(big)});
    EXPECT_FALSE(decode(body).has_value());
}

TEST(Codec, accepts_merged_length_of_exactly_max_length) {
    constexpr auto big = (std::uint64_t{1} << 62) - 1;
    auto decoded = decode(plain_body({retain_header(big), retain_header(big), retain_header(1)}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, TextOperation{Retain{max_length}});
}

TEST(Codec, splits_runs_longer_than_one_header) {
    const auto op = TextOperation{Retain{max_length}, Insert{"x"}};
    const auto encoded = encode(op);
    // retain(2^62 - 1) twice, retain(1), then the insert.
    EXPECT_EQ(encoded[1], std::byte{0x04});
    auto decoded = decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, op);
}
