#include "cipher/Caesar/caesar.hpp"
#include "core/CipherCodec.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <stdexcept>

Caesar::Caesar(int shift)
	: key_(shift)
{
}

int Caesar::parseShift(const std::string& key)
{
	if (key.empty())
		throw std::invalid_argument("Caesar key must be an integer, got empty string");

	const char* begin = key.c_str();
	char* end = nullptr;
	errno = 0;
	long value = std::strtol(begin, &end, 10);

	if (end == begin || *end != '\0' || std::isspace(static_cast<unsigned char>(key.front())))
		throw std::invalid_argument("Caesar key must be an integer, got: " + key);
	if (errno == ERANGE || value < INT_MIN || value > INT_MAX)
		throw std::invalid_argument("Caesar key out of range: " + key);

	return static_cast<int>(value);
}

void Caesar::setKey(const std::string& key)
{
	key_ = parseShift(key);
}

void Caesar::setShift(int shift)
{
	key_ = shift;
}

int Caesar::shift() const
{
	if (!key_)
		throw std::logic_error("Caesar: key not set");
	return *key_;
}

bool Caesar::hasKey() const
{
	return key_.has_value();
}

std::string Caesar::encrypt(const std::string& text) const
{
	return CipherCodec::encryptCaesar(text, shift());
}

std::string Caesar::decrypt(const std::string& text) const
{
	return CipherCodec::decryptCaesar(text, shift());
}
