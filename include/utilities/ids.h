#pragma once
#ifndef XFERPRESS_IDS_H
#define XFERPRESS_IDS_H

#include <cstddef>
#include <string>

namespace xferpress {

/// @p bytes random bytes rendered as lower-case hex (2 * bytes characters).
std::string randomHex(std::size_t bytes);

/**
 * @brief Random identifier safe for URLs and file names.
 *
 * @p bytes random bytes encoded as unpadded base64url.
 */
std::string randomUrlId(std::size_t bytes = 16);

/// Hex encoding of arbitrary text, used to turn client-chosen ids into
/// directory names.
std::string hexEncode(const std::string &text);

} // namespace xferpress

#endif // XFERPRESS_IDS_H
