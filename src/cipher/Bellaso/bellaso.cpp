#include "cipher/Bellaso/bellaso.hpp"
#include "core/CipherCodec.hpp"
#include <stdexcept>

Bellaso::Bellaso(const std::string& key)
{
	setKey(key);
}

void Bellaso::setKey(const std::string& key)
{
	if (key.empty())
		throw std::invalid_argument("Bellaso key must not be empty");
	key_ = key;
}

bool Bellaso::hasKey() const
{
	return !key_.empty();
}

void Bellaso::requireKey() const
{
	if (key_.empty())
		throw std::logic_error("Bellaso: key not set");
}

std::string Bellaso::encrypt(const std::string& text) const
{
	requireKey();
	return CipherCodec::encryptBellaso(text, key_);
}

std::string Bellaso::decrypt(const std::string& text) const
{
	requireKey();
	return CipherCodec::decryptBellaso(text, key_);
}
