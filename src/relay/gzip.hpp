#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// zlib-backed gzip (RFC 1952) framing.
namespace gzip {

std::expected<std::vector<uint8_t>, std::string> compress(std::span<const uint8_t> data);
std::expected<std::vector<uint8_t>, std::string> decompress(std::span<const uint8_t> data);

} // namespace gzip
