#ifndef HALFSHIFT_HH
#define HALFSHIFT_HH

#include <array>
#include <climits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
  A letter-substitution cipher keyed by two integers, which treats each half
  of each alphabet differently:

      a-m   rotated by  +(shift1 * shift2)
      n-z   rotated by  -(shift1 + shift2)
      A-M   rotated by  -shift1
      N-Z   rotated by  +(shift2 * shift2)

  Everything else (digits, punctuation, whitespace, and every byte of a
  multibyte sequence) is copied unchanged.

  Because both halves of an alphabet may land in the same output letters,
  ciphertext alone doesn't always determine the plaintext.  The encoder can
  therefore record which rule it applied to each character:

      auto [ciphertext, metadata] = halfshift::encode_with_metadata(text, 3, 2);
      auto plain = halfshift::decode_with_metadata(ciphertext, metadata, 3, 2);

  Metadata holds one code per character: 'l', 'L', 'u', 'U' for the four
  letter ranges above, and '0' for unchanged characters.  Without metadata,
  halfshift::decode_heuristic() makes a best guess, preferring the first-half
  reading of each letter.  The guess is often wrong for second-half letters.

  This is a teaching toy, not encryption.
 */

namespace halfshift
{
    enum class category : unsigned char {
        lower_first,            // a-m
        lower_second,           // n-z
        upper_first,            // A-M
        upper_second,           // N-Z
        passthrough,
    };

    inline constexpr std::string_view lowercase = "abcdefghijklmnopqrstuvwxyz";
    inline constexpr std::string_view uppercase = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    // Floored modulo: the result is always in [0, 26), even for negative n.
    constexpr int mod26(long long n) noexcept
    {
        return static_cast<int>((n % 26 + 26) % 26);
    }

    // Deliberately not std::islower() and friends, which depend on locale.
    constexpr category classify(char c) noexcept
    {
        if ('a' <= c && c <= 'm') { return category::lower_first; }
        if ('n' <= c && c <= 'z') { return category::lower_second; }
        if ('A' <= c && c <= 'M') { return category::upper_first; }
        if ('N' <= c && c <= 'Z') { return category::upper_second; }
        return category::passthrough;
    }

    // The alphabet that letters of this category belong to (empty for passthrough).
    constexpr std::string_view alphabet_of(category c) noexcept
    {
        switch (c) {
        case category::lower_first:
        case category::lower_second:
            return lowercase;
        case category::upper_first:
        case category::upper_second:
            return uppercase;
        case category::passthrough:
            break;
        }
        return {};
    }

    // Metadata codes
    constexpr char to_code(category c) noexcept
    {
        switch (c) {
        case category::lower_first:  return 'l';
        case category::lower_second: return 'L';
        case category::upper_first:  return 'u';
        case category::upper_second: return 'U';
        case category::passthrough:  break;
        }
        return '0';
    }

    // Unrecognised codes mean "unchanged", just like '0'.
    constexpr category from_code(char code) noexcept
    {
        switch (code) {
        case 'l': return category::lower_first;
        case 'L': return category::lower_second;
        case 'u': return category::upper_first;
        case 'U': return category::upper_second;
        default:  return category::passthrough;
        }
    }

    // Rotate c by shift places within alphabet; c is unchanged if it's not
    // a member of alphabet.
    constexpr char shift_char(char c, long long shift, std::string_view alphabet) noexcept
    {
        auto const pos = alphabet.find(c);
        if (pos == alphabet.npos) {
            return c;
        }
        return alphabet[mod26(static_cast<long long>(pos) + mod26(shift))];
    }


    // Thrown when ciphertext and its metadata have different lengths.
    class length_mismatch : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };


    // Per-character transforms for one pair of keys.  Immutable once
    // constructed, so a single instance may be shared between threads.
    class cipher
    {
        using char_table = std::array<char, UCHAR_MAX+1>;

        // forward rotation for each category, indexed by its value
        std::array<int, 5> rotations;
        char_table forward;
        char_table heuristic;

    public:
        cipher(long long shift1, long long shift2) noexcept;

        // The forward rotation, in [0, 26), applied to letters of category c.
        int rotation(category c) const noexcept
        {
            return rotations[static_cast<std::size_t>(c)];
        }

        char encrypt(char c) const noexcept
        {
            return forward[static_cast<unsigned char>(c)];
        }

        // Exact inverse of encrypt(), given the category of the original.
        char decrypt(char c, category original) const noexcept;

        // Best-effort inverse of encrypt(), without knowing the category.
        char guess(char c) const noexcept
        {
            return heuristic[static_cast<unsigned char>(c)];
        }

        char operator()(char c) const noexcept
        {
            return encrypt(c);
        }

    private:
        char guess_letter(char c) const noexcept;
    };


    // Ciphertext plus the category of each original character.
    struct tagged_text
    {
        std::string text;
        std::vector<category> tags;

        // The tags serialised as metadata codes.
        std::string metadata() const;
    };

    std::string to_metadata(std::span<const category> tags);
    std::vector<category> parse_metadata(std::string_view metadata);

    std::string encode(std::string_view text, long long shift1, long long shift2);

    tagged_text encode_tagged(std::string_view text, long long shift1, long long shift2);

    // Returns {ciphertext, metadata}.
    std::pair<std::string, std::string>
    encode_with_metadata(std::string_view text, long long shift1, long long shift2);

    // Throws length_mismatch unless tags has one entry per ciphertext character.
    std::string decode_tagged(std::string_view ciphertext, std::span<const category> tags,
                              long long shift1, long long shift2);

    // Throws length_mismatch unless metadata is the same length as ciphertext.
    std::string decode_with_metadata(std::string_view ciphertext, std::string_view metadata,
                                     long long shift1, long long shift2);

    // Never fails, but may return the wrong letters.
    std::string decode_heuristic(std::string_view ciphertext, long long shift1, long long shift2);
}

#endif // HALFSHIFT_HH
