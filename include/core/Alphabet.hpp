#pragma once
#include <string>
#include <cstdint>

// Window of character codes the classical ciphers operate on: ' ' .. '_'
struct Alphabet {
    static constexpr char LOWER_BOUND = ' ';
    static constexpr char UPPER_BOUND = '_';
    static constexpr int RANGE = UPPER_BOUND - LOWER_BOUND + 1;

    static constexpr bool contains(char c) noexcept {
        const auto code = static_cast<unsigned char>(c);
        return code >= static_cast<unsigned char>(LOWER_BOUND)
            && code <= static_cast<unsigned char>(UPPER_BOUND);
    }

    // Maps any code onto the window, result is always in [LOWER_BOUND, UPPER_BOUND]
    static constexpr char wrap(long long code) noexcept {
        long long offset = (code - LOWER_BOUND) % RANGE;
        if (offset < 0)
            offset += RANGE;
        return static_cast<char>(offset + LOWER_BOUND);
    }

    // key mod RANGE in [0, RANGE), safe for INT_MIN
    static constexpr int normalizeShift(int key) noexcept {
        int shift = key % RANGE;
        return shift < 0 ? shift + RANGE : shift;
    }

    static std::string toUpper(const std::string& text) {
        std::string out = text;
        for (char& c : out) {
            if (c >= 'a' && c <= 'z')
                c = static_cast<char>(c - 'a' + 'A');
        }
        return out;
    }
};

static_assert(Alphabet::RANGE == 64, "alphabet window must hold 64 codes");
