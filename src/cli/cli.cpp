#include <CLI/CLI.hpp>
#include <string>
#include <iostream>
#include <stdexcept>

#include <core/Alphabet.hpp>
#include <core/CipherCodec.hpp>
#include <core/cipherFactory.hpp>
#include <utils/DataConverter.hpp>

std::string decode(const std::string& input, const std::string& encoding) {
    if (encoding == "utf8") {
        return input;
    }
    if (encoding == "hex") {
        return DataConverter::HexToString(input);
    }
    throw std::runtime_error("Unknown encoding: " + encoding);
}

std::string encode(const std::string& output, const std::string& encoding) {
    if (encoding == "utf8") {
        return output;
    }
    if (encoding == "hex") {
        return DataConverter::StringToHex(output);
    }
    throw std::runtime_error("Unknown output encoding: " + encoding);
}

int main(int argc, char** argv) {
    CLI::App app{"Classic Cipher CLI - Caesar/Bellaso Encryption/Decryption Tool"};

    std::string text;
    std::string text_encoding = "utf8";

    std::string key;

    std::string algorithm = "Caesar";
    std::string operation = "encrypt";
    std::string output_encoding = "utf8";
    bool verbose = false;

    // Text options
    app.add_option("--text,-t", text, "Text to encrypt/decrypt")->required();
    app.add_option("--text-encoding", text_encoding, "Text encoding (utf8, hex)");

    // Key options
    app.add_option("--key,-k", key, "Shift for Caesar, key string for Bellaso");

    // Algorithm and operation options
    app.add_option("--algorithm,-a", algorithm, "Algorithm (Caesar, Bellaso)");
    app.add_option("--operation,-o", operation, "Operation (encrypt, decrypt, check)");
    app.add_option("--output-encoding", output_encoding, "Output encoding (utf8, hex)");
    app.add_flag("--verbose,-v", verbose, "Print progress to stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        auto data = decode(text, text_encoding);
        if (verbose) {
            std::cerr << "[*] input (" << data.size() << " bytes): " << DataConverter::Escape(data) << "\n";
        }

        if (operation == "check") {
            bool ok = CipherCodec::isInBounds(Alphabet::toUpper(data));
            std::cout << (ok ? "in bounds" : "out of bounds") << std::endl;
            return ok ? 0 : 2;
        }

        if (app.count("--key") == 0) {
            throw std::runtime_error("--key is required for " + operation);
        }

        auto cipher = CipherFactory::create(algorithm);
        cipher->setKey(key);
        if (verbose) {
            std::cerr << "[*] " << cipher->name() << " " << operation << "\n";
        }

        std::string result;
        if (operation == "encrypt") {
            result = cipher->encrypt(data);
        } else if (operation == "decrypt") {
            result = cipher->decrypt(data);
        } else {
            throw std::runtime_error("Unknown operation: " + operation + ". Use 'encrypt', 'decrypt' or 'check'");
        }

        std::cout << encode(result, output_encoding) << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
