#include "halfshift.hh"

#include <algorithm>
#include <numeric>
#include <ranges>

namespace halfshift
{
    cipher::cipher(long long shift1, long long shift2) noexcept
    {
        // Reduce the keys first, so that products can't overflow.
        auto const a = mod26(shift1);
        auto const b = mod26(shift2);

        rotations[static_cast<std::size_t>(category::lower_first)] = mod26(a * b);
        rotations[static_cast<std::size_t>(category::lower_second)] = mod26(-(a + b));
        rotations[static_cast<std::size_t>(category::upper_first)] = mod26(-a);
        rotations[static_cast<std::size_t>(category::upper_second)] = mod26(b * b);
        rotations[static_cast<std::size_t>(category::passthrough)] = 0;

        // begin with an identity mapping
        std::iota(forward.begin(), forward.end(), 0);
        std::iota(heuristic.begin(), heuristic.end(), 0);

        // then change the mapping of letters
        for (auto const alphabet: {lowercase, uppercase}) {
            for (char const c: alphabet) {
                auto const i = static_cast<unsigned char>(c);
                forward[i] = shift_char(c, rotation(classify(c)), alphabet);
                heuristic[i] = guess_letter(c);
            }
        }
    }

    char cipher::decrypt(char c, category original) const noexcept
    {
        // N.B. dispatches on the category only; a letter from the other
        // alphabet is returned unchanged.
        return shift_char(c, -rotation(original), alphabet_of(original));
    }

    char cipher::guess_letter(char c) const noexcept
    {
        auto const lower = classify(c) == category::lower_first
            || classify(c) == category::lower_second;
        auto const first = lower ? category::lower_first : category::upper_first;
        auto const second = lower ? category::lower_second : category::upper_second;
        auto const alphabet = alphabet_of(first);

        // Prefer the first-half reading whenever it's plausible.
        auto const candidate = shift_char(c, -rotation(first), alphabet);
        if (classify(candidate) == first) {
            return candidate;
        }
        return shift_char(c, -rotation(second), alphabet);
    }


    std::string tagged_text::metadata() const
    {
        return to_metadata(tags);
    }

    std::string to_metadata(std::span<const category> tags)
    {
        return tags | std::views::transform(to_code) | std::ranges::to<std::string>();
    }

    std::vector<category> parse_metadata(std::string_view metadata)
    {
        return metadata | std::views::transform(from_code) | std::ranges::to<std::vector>();
    }


    std::string encode(std::string_view text, long long shift1, long long shift2)
    {
        auto out = std::string(text);
        std::ranges::transform(out, out.begin(), cipher{shift1, shift2});
        return out;
    }

    tagged_text encode_tagged(std::string_view text, long long shift1, long long shift2)
    {
        return {
            encode(text, shift1, shift2),
            text | std::views::transform(classify) | std::ranges::to<std::vector>()
        };
    }

    std::pair<std::string, std::string>
    encode_with_metadata(std::string_view text, long long shift1, long long shift2)
    {
        auto result = encode_tagged(text, shift1, shift2);
        auto metadata = result.metadata();
        return {std::move(result.text), std::move(metadata)};
    }

    std::string decode_tagged(std::string_view ciphertext, std::span<const category> tags,
                              long long shift1, long long shift2)
    {
        if (ciphertext.size() != tags.size()) {
            throw length_mismatch("Ciphertext and metadata lengths do not match");
        }
        auto const c = cipher{shift1, shift2};
        auto out = std::string(ciphertext);
        std::ranges::transform(out, tags, out.begin(),
                               [&c](char ch, category tag) { return c.decrypt(ch, tag); });
        return out;
    }

    std::string decode_with_metadata(std::string_view ciphertext, std::string_view metadata,
                                     long long shift1, long long shift2)
    {
        // check before parsing, so that nothing is done for bad input
        if (ciphertext.size() != metadata.size()) {
            throw length_mismatch("Ciphertext and metadata lengths do not match");
        }
        return decode_tagged(ciphertext, parse_metadata(metadata), shift1, shift2);
    }

    std::string decode_heuristic(std::string_view ciphertext, long long shift1, long long shift2)
    {
        auto const c = cipher{shift1, shift2};
        auto out = std::string(ciphertext);
        std::ranges::transform(out, out.begin(), [&c](char ch) { return c.guess(ch); });
        return out;
    }
}
