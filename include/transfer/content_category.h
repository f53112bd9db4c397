#pragma once
#ifndef XFERPRESS_CONTENT_CATEGORY_H
#define XFERPRESS_CONTENT_CATEGORY_H

#include <string>

namespace xferpress {

enum class ContentCategory { Image, Video, Document };

/**
 * @brief Classify a filename by its extension (case-insensitive).
 *
 * .jpg .jpeg .png .gif are images, .mp4 .mov .mkv .webm are videos,
 * everything else (including no extension) is a document.
 */
ContentCategory classifyFilename(const std::string &filename);

/// "image", "video" or "document".
std::string toString(ContentCategory category);

/// Inverse of toString(). Throws std::invalid_argument for unknown names.
ContentCategory categoryFromString(const std::string &name);

} // namespace xferpress

#endif // XFERPRESS_CONTENT_CATEGORY_H
