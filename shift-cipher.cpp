#include "halfshift/halfshift.hh"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

static void usage(const char *program)
{
    std::println(std::cerr,
                 "Usage: {} MODE SHIFT1 SHIFT2\n"
                 "Split-alphabet shift of standard input, to standard output.\n"
                 "MODE is one of:\n"
                 "  encrypt   shift the letters\n"
                 "  metadata  print the per-character rule codes (l, L, u, U, 0)\n"
                 "  decrypt   reverse the shift, guessing each letter's original half\n"
                 "  verify    encrypt then decrypt, and report whether the input was recovered",
                 program ? program : "shift-cipher");
}

// Whole-argument integer parse; throws std::invalid_argument or std::out_of_range.
static long long parse_shift(const char *arg)
{
    std::size_t end;
    auto const value = std::stoll(arg, &end);
    if (arg[end]) {
        throw std::invalid_argument("trailing characters");
    }
    return value;
}

static std::string read_all(std::istream& in)
{
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

static int verify(std::string_view text, long long shift1, long long shift2)
{
    auto const [ciphertext, metadata] = halfshift::encode_with_metadata(text, shift1, shift2);
    auto const exact = halfshift::decode_with_metadata(ciphertext, metadata, shift1, shift2);
    auto const guessed = halfshift::decode_heuristic(ciphertext, shift1, shift2);

    bool const ok = exact == text;
    std::println(std::cout, "Verification: {}", ok ? "SUCCESS" : "FAILURE");
    std::println(std::cout, "Without metadata: {}", guessed == text ? "SUCCESS" : "FAILURE");
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char **argv)
{
    if (argc != 4) {
        usage(*argv);
        return EXIT_FAILURE;
    }

    std::string_view const mode = argv[1];
    long long shift[2];
    for (int i = 0;  i < 2;  ++i) {
        try {
            shift[i] = parse_shift(argv[i+2]);
        } catch (std::logic_error&) {
            std::println(std::cerr, "Invalid shift value: {} (integer required)", argv[i+2]);
            return EXIT_FAILURE;
        }
    }

    try {
        std::cin.exceptions(std::ios::badbit);
        std::cout.exceptions(std::ios::badbit | std::ios::failbit);

        if (mode == "encrypt") {
            std::transform(std::istreambuf_iterator<char>{std::cin},
                           std::istreambuf_iterator<char>{},
                           std::ostreambuf_iterator<char>{std::cout},
                           halfshift::cipher{shift[0], shift[1]});
        } else if (mode == "decrypt") {
            auto const cipher = halfshift::cipher{shift[0], shift[1]};
            std::transform(std::istreambuf_iterator<char>{std::cin},
                           std::istreambuf_iterator<char>{},
                           std::ostreambuf_iterator<char>{std::cout},
                           [&cipher](char c) { return cipher.guess(c); });
        } else if (mode == "metadata") {
            auto const text = read_all(std::cin);
            std::print(std::cout, "{}", halfshift::encode_tagged(text, shift[0], shift[1]).metadata());
        } else if (mode == "verify") {
            return verify(read_all(std::cin), shift[0], shift[1]);
        } else {
            std::println(std::cerr, "Unknown mode: {}", mode);
            usage(*argv);
            return EXIT_FAILURE;
        }
        std::cout.flush();
    } catch (std::exception& e) {
        std::println(std::cerr, "{}", e.what());
        return EXIT_FAILURE;
    }
}
