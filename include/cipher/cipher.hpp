#pragma once
#include <string>

class Cipher {
public:
	virtual ~Cipher() = default;

	// Parse and install the key, throws std::invalid_argument on bad key text
	virtual void setKey(const std::string& key) = 0;
	virtual bool hasKey() const = 0;

	// Encrypt the input text
	virtual std::string encrypt(const std::string& text) const = 0;

	// Decrypt the input text
	virtual std::string decrypt(const std::string& text) const = 0;

	virtual std::string name() const = 0;
};
