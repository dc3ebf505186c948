#include "halfshift.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <climits>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using halfshift::category;

namespace
{
    // All printable ASCII, in order.
    std::string printable()
    {
        std::string s;
        for (char c = ' ';  c <= '~';  ++c) {
            s += c;
        }
        return s;
    }

    const std::vector<std::string> sample_texts = {
        "",
        "a",
        "Hello, World!",
        "The quick brown fox jumps over the lazy dog.\n",
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ abcdefghijklmnopqrstuvwxyz 0123456789",
        "naïve café, Ωμέγα",
        printable(),
    };

    const std::vector<std::pair<long long, long long>> sample_keys = {
        {0, 0}, {3, 2}, {1, 13}, {-7, 5}, {13, 13}, {26, -26}, {100, -3},
        {LLONG_MAX, LLONG_MIN}, {LLONG_MIN, LLONG_MAX},
    };
}


TEST(mod26, floored)
{
    EXPECT_EQ(halfshift::mod26(0), 0);
    EXPECT_EQ(halfshift::mod26(25), 25);
    EXPECT_EQ(halfshift::mod26(26), 0);
    EXPECT_EQ(halfshift::mod26(-1), 25);
    EXPECT_EQ(halfshift::mod26(-27), 25);
    EXPECT_EQ(halfshift::mod26(LLONG_MAX), 7);
    EXPECT_EQ(halfshift::mod26(LLONG_MIN), 18);
}

TEST(classify, boundaries)
{
    EXPECT_EQ(halfshift::classify('a'), category::lower_first);
    EXPECT_EQ(halfshift::classify('m'), category::lower_first);
    EXPECT_EQ(halfshift::classify('n'), category::lower_second);
    EXPECT_EQ(halfshift::classify('z'), category::lower_second);
    EXPECT_EQ(halfshift::classify('A'), category::upper_first);
    EXPECT_EQ(halfshift::classify('M'), category::upper_first);
    EXPECT_EQ(halfshift::classify('N'), category::upper_second);
    EXPECT_EQ(halfshift::classify('Z'), category::upper_second);
    // neighbours of the letter ranges
    EXPECT_EQ(halfshift::classify('`'), category::passthrough);
    EXPECT_EQ(halfshift::classify('{'), category::passthrough);
    EXPECT_EQ(halfshift::classify('@'), category::passthrough);
    EXPECT_EQ(halfshift::classify('['), category::passthrough);
    EXPECT_EQ(halfshift::classify('\0'), category::passthrough);
    EXPECT_EQ(halfshift::classify('\xE9'), category::passthrough);
}

TEST(codes, both_directions)
{
    for (auto const c: {category::lower_first, category::lower_second,
                        category::upper_first, category::upper_second,
                        category::passthrough}) {
        EXPECT_EQ(halfshift::from_code(halfshift::to_code(c)), c);
    }
    EXPECT_EQ(halfshift::to_code(category::lower_second), 'L');
    EXPECT_EQ(halfshift::from_code('x'), category::passthrough);

    EXPECT_THAT(halfshift::parse_metadata("lLuU0?"),
                testing::ElementsAre(category::lower_first, category::lower_second,
                                     category::upper_first, category::upper_second,
                                     category::passthrough, category::passthrough));
}

TEST(shift_char, wraps)
{
    using halfshift::lowercase;
    using halfshift::uppercase;
    EXPECT_EQ(halfshift::shift_char('a', 1, lowercase), 'b');
    EXPECT_EQ(halfshift::shift_char('z', 1, lowercase), 'a');
    EXPECT_EQ(halfshift::shift_char('a', -1, lowercase), 'z');
    EXPECT_EQ(halfshift::shift_char('A', -27, uppercase), 'Z');
    EXPECT_EQ(halfshift::shift_char('Q', 26 * 1000, uppercase), 'Q');
    EXPECT_EQ(halfshift::shift_char('c', LLONG_MIN, lowercase), 'u'); // 2 + 18
    // not in the alphabet
    EXPECT_EQ(halfshift::shift_char('a', 5, uppercase), 'a');
    EXPECT_EQ(halfshift::shift_char('!', 5, lowercase), '!');
}

TEST(cipher, rotations)
{
    auto const c = halfshift::cipher{3, 2};
    EXPECT_EQ(c.rotation(category::lower_first), 6);    // 3*2
    EXPECT_EQ(c.rotation(category::lower_second), 21);  // -(3+2)
    EXPECT_EQ(c.rotation(category::upper_first), 23);   // -3
    EXPECT_EQ(c.rotation(category::upper_second), 4);   // 2*2
    EXPECT_EQ(c.rotation(category::passthrough), 0);
}


TEST(encode, hello_world)
{
    auto const [ciphertext, metadata] = halfshift::encode_with_metadata("Hello, World!", 3, 2);
    EXPECT_EQ(ciphertext, "Ekrrj, Ajmrj!");
    EXPECT_EQ(metadata, "ulllL00ULLll0");
    EXPECT_EQ(halfshift::encode("Hello, World!", 3, 2), ciphertext);
    EXPECT_EQ(halfshift::decode_with_metadata(ciphertext, metadata, 3, 2), "Hello, World!");
}

TEST(encode, tagged)
{
    auto const result = halfshift::encode_tagged("aN z", 3, 2);
    EXPECT_EQ(result.text, "gR u");
    EXPECT_THAT(result.tags,
                testing::ElementsAre(category::lower_first, category::upper_second,
                                     category::passthrough, category::lower_second));
    EXPECT_EQ(result.metadata(), "lU0L");
    EXPECT_EQ(halfshift::decode_tagged(result.text, result.tags, 3, 2), "aN z");
}

TEST(encode, preserves_length)
{
    for (auto const& text: sample_texts) {
        for (auto const [s1, s2]: sample_keys) {
            SCOPED_TRACE(std::format("text \"{}\", keys {}, {}", text, s1, s2));
            auto const [ciphertext, metadata] = halfshift::encode_with_metadata(text, s1, s2);
            EXPECT_EQ(halfshift::encode(text, s1, s2).size(), text.size());
            EXPECT_EQ(ciphertext.size(), text.size());
            EXPECT_EQ(metadata.size(), text.size());
        }
    }
}

TEST(encode, deterministic)
{
    auto const first = halfshift::encode_with_metadata(printable(), -7, 5);
    auto const second = halfshift::encode_with_metadata(printable(), -7, 5);
    EXPECT_EQ(first, second);
}

TEST(encode, passthrough_fixed_points)
{
    auto const c = halfshift::cipher{3, 2};
    for (int i = 0;  i <= UCHAR_MAX;  ++i) {
        auto const ch = static_cast<char>(i);
        if (halfshift::classify(ch) != category::passthrough) {
            continue;
        }
        SCOPED_TRACE(std::format("byte {}", i));
        auto const s = std::string(1, ch);
        EXPECT_EQ(c.encrypt(ch), ch);
        EXPECT_EQ(c.guess(ch), ch);
        EXPECT_EQ(halfshift::encode_with_metadata(s, 3, 2).second, "0");
        EXPECT_EQ(halfshift::decode_with_metadata(s, "0", 3, 2), s);
    }
}

TEST(encode, congruent_keys_agree)
{
    auto const text = printable();
    EXPECT_EQ(halfshift::encode(text, 3 + 26, 2 - 52), halfshift::encode(text, 3, 2));
    EXPECT_EQ(halfshift::encode(text, LLONG_MAX, LLONG_MIN), halfshift::encode(text, 7, 18));
}

TEST(encode, chunks_match_whole)
{
    auto const text = std::string{"The quick brown fox jumps over the lazy dog.\n"} + printable();
    auto const whole = halfshift::encode_with_metadata(text, -7, 5);

    for (std::size_t chunk: {1uz, 3uz, 7uz, 64uz}) {
        SCOPED_TRACE(std::format("chunk size {}", chunk));
        std::string ciphertext, metadata;
        for (std::size_t pos = 0;  pos < text.size();  pos += chunk) {
            auto const [c, m] = halfshift::encode_with_metadata(text.substr(pos, chunk), -7, 5);
            ciphertext += c;
            metadata += m;
        }
        EXPECT_EQ(ciphertext, whole.first);
        EXPECT_EQ(metadata, whole.second);
    }
}

TEST(encode, multibyte_passthrough)
{
    std::string const text = "café Ω";
    auto const [ciphertext, metadata] = halfshift::encode_with_metadata(text, 3, 2);
    // é and Ω are two bytes each in UTF-8
    EXPECT_EQ(ciphertext, "iglé Ω");
    EXPECT_EQ(metadata, "lll00000");
}


TEST(decode_with_metadata, round_trip)
{
    for (auto const& text: sample_texts) {
        for (auto const [s1, s2]: sample_keys) {
            SCOPED_TRACE(std::format("text \"{}\", keys {}, {}", text, s1, s2));
            auto const [ciphertext, metadata] = halfshift::encode_with_metadata(text, s1, s2);
            EXPECT_EQ(halfshift::decode_with_metadata(ciphertext, metadata, s1, s2), text);
        }
    }
}

TEST(decode_with_metadata, length_mismatch)
{
    EXPECT_THROW(halfshift::decode_with_metadata("ab", "l", 3, 4), halfshift::length_mismatch);
    EXPECT_THROW(halfshift::decode_with_metadata("", "0", 3, 4), std::invalid_argument);

    std::vector<category> const tags{category::lower_first};
    EXPECT_THROW(halfshift::decode_tagged("ab", tags, 3, 4), halfshift::length_mismatch);
}

TEST(decode_with_metadata, resolves_collisions)
{
    // With keys (1, 13), m moves forward 13 and n moves forward 12:
    // both become z.
    auto const [ciphertext, metadata] = halfshift::encode_with_metadata("mn", 1, 13);
    EXPECT_EQ(ciphertext, "zz");
    EXPECT_EQ(metadata, "lL");
    EXPECT_EQ(halfshift::decode_with_metadata(ciphertext, metadata, 1, 13), "mn");
    EXPECT_EQ(halfshift::decode_heuristic(ciphertext, 1, 13), "mm");
}

TEST(decode_with_metadata, dispatches_on_code)
{
    // The code alone chooses the inverse rule.
    EXPECT_EQ(halfshift::decode_with_metadata("j", "l", 3, 2), "d");
    EXPECT_EQ(halfshift::decode_with_metadata("j", "L", 3, 2), "o");
    // unknown codes are treated as unchanged
    EXPECT_EQ(halfshift::decode_with_metadata("k", "x", 3, 2), "k");
    // a letter from the other alphabet is left alone
    EXPECT_EQ(halfshift::decode_with_metadata("A", "l", 3, 2), "A");
    EXPECT_EQ(halfshift::decode_with_metadata("a", "U", 3, 2), "a");
}


TEST(decode_heuristic, diverges_without_metadata)
{
    // 'o' is second-half, but its ciphertext 'j' also has a first-half
    // reading ('d'), which the heuristic prefers.
    EXPECT_EQ(halfshift::encode("o", 3, 2), "j");
    EXPECT_EQ(halfshift::decode_heuristic("j", 3, 2), "d");
    EXPECT_EQ(halfshift::decode_with_metadata("j", "L", 3, 2), "o");

    auto const [ciphertext, metadata] = halfshift::encode_with_metadata("Hello, World!", 3, 2);
    EXPECT_EQ(halfshift::decode_heuristic(ciphertext, 3, 2), "Helld, Ddgld!");
    EXPECT_EQ(halfshift::decode_with_metadata(ciphertext, metadata, 3, 2), "Hello, World!");
}

TEST(decode_heuristic, recovers_first_half)
{
    auto const text = std::string{"abcdefghijklm ABCDEFGHIJKLM 42"};
    for (auto const [s1, s2]: sample_keys) {
        SCOPED_TRACE(std::format("keys {}, {}", s1, s2));
        EXPECT_EQ(halfshift::decode_heuristic(halfshift::encode(text, s1, s2), s1, s2), text);
    }
}

TEST(decode_heuristic, identity_keys)
{
    // Every rotation is zero, so there's nothing to guess.
    auto const text = printable();
    EXPECT_EQ(halfshift::encode(text, 26, -26), text);
    EXPECT_EQ(halfshift::decode_heuristic(text, 26, -26), text);
}

TEST(decode_heuristic, empty)
{
    EXPECT_EQ(halfshift::decode_heuristic("", 3, 2), "");
}
