#pragma once
#ifndef XFERPRESS_TEST_HELPERS_H
#define XFERPRESS_TEST_HELPERS_H

#include "utilities/ids.h"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

/// Log file the suite writes to; tests that re-init the logger restore it.
extern std::string g_testLogFile;

/// Fresh, empty directory under the system temp dir.
inline std::filesystem::path makeScratchDir(const std::string &tag) {
  auto dir = std::filesystem::temp_directory_path() /
             ("xferpress_" + tag + "_" + xferpress::randomHex(6));
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::vector<std::byte> toBytes(const std::string &s) {
  std::vector<std::byte> out;
  out.reserve(s.size());
  for (char c : s)
    out.push_back(std::byte(c));
  return out;
}

inline std::string bytesToString(const std::vector<std::byte> &bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()),
                     bytes.size());
}

inline std::string readFileContents(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return "";
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

inline void writeFileContents(const std::filesystem::path &path,
                              const std::string &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << data;
}

/// Text that zstd shrinks well: repeated lines with a counter.
inline std::string compressibleText(size_t lines) {
  std::string text;
  for (size_t i = 0; i < lines; ++i) {
    text += "line " + std::to_string(i % 10) +
            ": the quick brown fox jumps over the lazy dog\n";
  }
  return text;
}

#endif // XFERPRESS_TEST_HELPERS_H
