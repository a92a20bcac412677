#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>

class DataConverter {
public:
    // STRING <-> HEX

    // string (bytes) -> hex ASCII (2 chars per byte)
    static std::string StringToHex(const std::string& input) {
        std::string out;
        out.reserve(input.size() * 2);

        for (unsigned char c : input) {
            out.push_back(ValueToHexChar(c >> 4));
            out.push_back(ValueToHexChar(c & 0x0F));
        }
        return out;
    }

    // hex ASCII -> string (bytes)
    static std::string HexToString(const std::string& hex) {
        if (hex.size() % 2 != 0)
            throw std::invalid_argument("HexToString: hex length must be even");

        std::string out;
        out.reserve(hex.size() / 2);

        for (std::size_t i = 0; i < hex.size(); i += 2) {
            uint8_t high = HexCharToValue(hex[i]);
            uint8_t low = HexCharToValue(hex[i + 1]);
            out.push_back(static_cast<char>((high << 4) | low));
        }
        return out;
    }

    // Printable ASCII stays as is, everything else becomes \xNN, backslash is doubled
    static std::string Escape(const std::string& input) {
        std::string out;
        out.reserve(input.size());

        for (unsigned char c : input) {
            if (c == '\\') {
                out += "\\\\";
            }
            else if (c >= 0x20 && c < 0x7F) {
                out.push_back(static_cast<char>(c));
            }
            else {
                out += "\\x";
                out.push_back(ValueToHexChar(c >> 4));
                out.push_back(ValueToHexChar(c & 0x0F));
            }
        }
        return out;
    }

private:
    static uint8_t HexCharToValue(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        throw std::invalid_argument("Invalid hex character");
    }

    static char ValueToHexChar(uint8_t v) {
        static const char* hex = "0123456789ABCDEF";
        return hex[v & 0x0F];
    }
};
