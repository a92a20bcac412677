#include <core/CipherCodec.hpp>
#include <algorithm>
#include <stdexcept>

bool CipherCodec::isInBounds(const std::string& text)
{
    for (char c : text) {
        if (!Alphabet::contains(c))
            return false;
    }
    return true;
}

void CipherCodec::requireInBounds(const std::string& text)
{
    if (!isInBounds(text))
        throw std::invalid_argument("Input string contains invalid characters");
}

std::string CipherCodec::repeatToLength(const std::string& key, std::size_t length)
{
    if (key.empty())
        throw std::invalid_argument("Key must not be empty");

    std::string repeated;
    repeated.reserve(length);
    while (repeated.size() < length) {
        repeated.append(key, 0, std::min(key.size(), length - repeated.size()));
    }
    return repeated;
}

std::string CipherCodec::encryptCaesar(const std::string& plainText, int key)
{
    const std::string text = Alphabet::toUpper(plainText);
    requireInBounds(text);

    const int shift = Alphabet::normalizeShift(key);
    std::string out;
    out.reserve(text.size());

    for (char c : text) {
        int code = static_cast<unsigned char>(c);
        out.push_back(static_cast<char>((code - Alphabet::LOWER_BOUND + shift) % Alphabet::RANGE + Alphabet::LOWER_BOUND));
    }
    return out;
}

std::string CipherCodec::decryptCaesar(const std::string& encryptedText, int key)
{
    const std::string text = Alphabet::toUpper(encryptedText);

    const int shift = Alphabet::normalizeShift(key);
    std::string out;
    out.reserve(text.size());

    for (char c : text) {
        long long code = static_cast<unsigned char>(c);
        out.push_back(Alphabet::wrap(code - shift));
    }
    return out;
}

std::string CipherCodec::encryptBellaso(const std::string& plainText, const std::string& bellasoStr)
{
    const std::string text = Alphabet::toUpper(plainText);
    requireInBounds(text);
    const std::string keyStream = repeatToLength(bellasoStr, text.size());

    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        long long shifted = static_cast<long long>(static_cast<unsigned char>(text[i]))
            + static_cast<unsigned char>(keyStream[i]);
        out.push_back(Alphabet::wrap(shifted));
    }
    return out;
}

std::string CipherCodec::decryptBellaso(const std::string& encryptedText, const std::string& bellasoStr)
{
    const std::string text = Alphabet::toUpper(encryptedText);
    requireInBounds(text);
    const std::string keyStream = repeatToLength(bellasoStr, text.size());

    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        long long shifted = static_cast<long long>(static_cast<unsigned char>(text[i]))
            - static_cast<unsigned char>(keyStream[i]);
        out.push_back(Alphabet::wrap(shifted));
    }
    return out;
}
