#pragma once
#include <memory>
#include <string>
#include <vector>
#include <cipher/cipher.hpp>

class CipherFactory {
public:
    // name is matched case-insensitively ("caesar", "BELLASO", ...)
    static std::unique_ptr<Cipher> create(const std::string& name);
    static std::vector<std::string> available();
};
