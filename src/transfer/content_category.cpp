#include "transfer/content_category.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace xferpress {

namespace {

const std::unordered_map<std::string, ContentCategory> &extensionTable() {
  static const std::unordered_map<std::string, ContentCategory> table = {
      {".jpg", ContentCategory::Image},  {".jpeg", ContentCategory::Image},
      {".png", ContentCategory::Image},  {".gif", ContentCategory::Image},
      {".mp4", ContentCategory::Video},  {".mov", ContentCategory::Video},
      {".mkv", ContentCategory::Video},  {".webm", ContentCategory::Video},
  };
  return table;
}

} // namespace

ContentCategory classifyFilename(const std::string &filename) {
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = extensionTable().find(ext);
  return it == extensionTable().end() ? ContentCategory::Document : it->second;
}

std::string toString(ContentCategory category) {
  switch (category) {
  case ContentCategory::Image:
    return "image";
  case ContentCategory::Video:
    return "video";
  case ContentCategory::Document:
    return "document";
  }
  return "document";
}

ContentCategory categoryFromString(const std::string &name) {
  if (name == "image")
    return ContentCategory::Image;
  if (name == "video")
    return ContentCategory::Video;
  if (name == "document")
    return ContentCategory::Document;
  throw std::invalid_argument("unknown content category: " + name);
}

} // namespace xferpress
