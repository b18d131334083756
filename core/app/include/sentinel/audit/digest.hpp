#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sentinel {

// -----------------------------------------------------------------------------
// SHA-256 helpers over OpenSSL EVP
// -----------------------------------------------------------------------------
// sha256Hex returns 64 lowercase hex characters and throws std::runtime_error
// if OpenSSL reports a failure. digestEquals compares in constant time.
// -----------------------------------------------------------------------------
std::string sha256Hex(std::string_view data);

std::string bytesToHex(const unsigned char* data, std::size_t size);

bool digestEquals(std::string_view a, std::string_view b);

}  // namespace sentinel
