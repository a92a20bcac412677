#pragma once
#include <cstddef>
#include <string>

#include <core/Alphabet.hpp>

// Caesar and Bellaso transforms over the Alphabet window.
// All functions are stateless and safe to call from any thread.
class CipherCodec {
public:
    // true iff every character lies in [LOWER_BOUND, UPPER_BOUND]
    static bool isInBounds(const std::string& text);

    // Repeats key until it is exactly length characters long.
    // Throws std::invalid_argument for an empty key.
    static std::string repeatToLength(const std::string& key, std::size_t length);

    // Upper-cases plainText and shifts every character by key (any sign, any magnitude).
    // Throws std::invalid_argument if the upper-cased text leaves the window.
    static std::string encryptCaesar(const std::string& plainText, int key);

    // Inverse of encryptCaesar. Does not validate bounds: characters outside
    // the window are wrapped back into it.
    static std::string decryptCaesar(const std::string& encryptedText, int key);

    // Shifts plainText[i] by the code of the i-th character of the repeated key.
    // Throws std::invalid_argument for out-of-window text or an empty key.
    static std::string encryptBellaso(const std::string& plainText, const std::string& bellasoStr);

    // Inverse of encryptBellaso, same failure conditions.
    static std::string decryptBellaso(const std::string& encryptedText, const std::string& bellasoStr);

private:
    static void requireInBounds(const std::string& text);
};
