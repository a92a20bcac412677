#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <stdexcept>

#include <cipher/cipher.hpp>
#include <core/Alphabet.hpp>
#include <core/cipherFactory.hpp>
#include <cipher/Caesar/caesar.hpp>
#include <cipher/Bellaso/bellaso.hpp>

using FactoryFn = std::function<std::unique_ptr<Cipher>()>;

// keys are upper-case names
static const std::unordered_map<std::string, FactoryFn> getRegistry = {
    {"CAESAR", []() -> std::unique_ptr<Cipher> { return std::make_unique<Caesar>(); }},
    {"BELLASO", []() -> std::unique_ptr<Cipher> { return std::make_unique<Bellaso>(); }}
};

std::unique_ptr<Cipher> CipherFactory::create(const std::string& name) {
    auto it = getRegistry.find(Alphabet::toUpper(name));
    if (it == getRegistry.end()) {
        throw std::runtime_error("Unknown cipher: " + name);
    }
    return it->second();
}

std::vector<std::string> CipherFactory::available() {
    return { "Caesar", "Bellaso" };
}
