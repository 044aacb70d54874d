#pragma once
///@file

#include <span>
#include <string>
#include <string_view>

namespace ociauth::base64 {

/**
 * Returns the length of a base-64 representation of this many bytes.
 */
[[nodiscard]] constexpr static inline size_t encodedLength(size_t origSize)
{
    return ((4 * origSize / 3) + 3) & ~3;
}

/**
 * Encode arbitrary bytes as Base64.
 */
std::string encode(std::span<const std::byte> b);

/**
 * Decode arbitrary Base64 string to bytes.
 *
 * @throws FormatError on a character outside the Base64 alphabet.
 */
std::string decode(std::string_view s);

} // namespace ociauth::base64
