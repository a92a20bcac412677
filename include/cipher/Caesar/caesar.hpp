#pragma once
#include <optional>
#include <string>

#include <cipher/cipher.hpp>

class Caesar : public Cipher
{
public:
	Caesar() = default;
	explicit Caesar(int shift);

	// Key text is a signed decimal integer, e.g. "3", "-7", "+130"
	void setKey(const std::string& key) override;
	void setShift(int shift);
	int shift() const;
	bool hasKey() const override;

	std::string encrypt(const std::string& text) const override;
	std::string decrypt(const std::string& text) const override;

	std::string name() const override { return "Caesar"; }

	static int parseShift(const std::string& key);

private:
	std::optional<int> key_;
};
