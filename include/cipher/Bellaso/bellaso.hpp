#pragma once
#include <string>

#include <cipher/cipher.hpp>

class Bellaso : public Cipher
{
public:
	Bellaso() = default;
	explicit Bellaso(const std::string& key);

	void setKey(const std::string& key) override;
	const std::string& key() const { return key_; }
	bool hasKey() const override;

	std::string encrypt(const std::string& text) const override;
	std::string decrypt(const std::string& text) const override;

	std::string name() const override { return "Bellaso"; }

private:
	void requireKey() const;

	std::string key_;
};
