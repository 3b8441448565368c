#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace HashUtils {
using Digest = std::array<uint8_t, 32>;

Digest sha256(const uint8_t* data, size_t len);
Digest sha256(const std::vector<uint8_t>& bytes);
Digest sha256(const std::string& text);

// Lowercase hex, two digits per byte.
std::string toHex(const Digest& digest);
std::string sha256Hex(const std::vector<uint8_t>& bytes);
std::string sha256Hex(const std::string& text);

/**
 * @brief Generator seed taken from the first eight hex digits of a digest.
 * @throws FluxGuard::DatasetException when fewer than eight hex digits are available.
 */
uint32_t seedFromHexPrefix(const std::string& hex);

/**
 * @brief Reads a whole file as bytes.
 * @throws FluxGuard::IOException when the file cannot be opened or read.
 */
std::vector<uint8_t> readFileBytes(const std::string& path);
}
