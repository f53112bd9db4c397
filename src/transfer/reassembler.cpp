#include "transfer/reassembler.h"
#include "utilities/errors.h"
#include "utilities/ids.h"
#include "utilities/logger.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace xferpress {

Reassembler::Reassembler(ChunkStore &store, std::filesystem::path artifactsDir)
    : store_(store), artifactsDir_(std::move(artifactsDir)) {}

std::string Reassembler::sanitizeFilename(const std::string &filename) {
  std::string out(filename);
  for (char &c : out) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!(std::isalnum(uc) || c == '.' || c == '-')) {
      c = '_';
    }
  }
  return out;
}

// Describe why a staged set does not cover [0,total). At most a handful of
// missing indices are listed to keep log lines bounded. Relies on
// listOrdered() returning ascending indices.
static std::string describeGaps(const std::vector<ChunkInfo> &chunks,
                                uint32_t total) {
  size_t inRange = 0;
  for (const auto &c : chunks) {
    if (c.index < total)
      ++inRange;
  }
  const size_t outOfRange = chunks.size() - inRange;
  const uint64_t missing = static_cast<uint64_t>(total) - inRange;

  std::ostringstream oss;
  oss << chunks.size() << " of " << total << " chunks staged";
  size_t listed = 0;
  size_t next = 0;
  for (uint32_t i = 0; i < total && listed < 8 && listed < missing; ++i) {
    while (next < chunks.size() && chunks[next].index < i)
      ++next;
    if (next < chunks.size() && chunks[next].index == i)
      continue;
    oss << (listed == 0 ? "; missing " : ",") << i;
    ++listed;
  }
  if (missing > listed)
    oss << ",... (" << missing << " missing)";
  if (outOfRange > 0)
    oss << "; " << outOfRange << " out of range";
  return oss.str();
}

Artifact Reassembler::assemble(const std::string &uploadId,
                               const std::string &filename, uint32_t total) {
  namespace fs = std::filesystem;
  if (total == 0) {
    throw CompletenessError("Upload " + uploadId + " declares zero chunks");
  }

  const std::vector<ChunkInfo> chunks = store_.listOrdered(uploadId);
  bool complete = chunks.size() == total;
  for (size_t i = 0; complete && i < chunks.size(); ++i) {
    complete = chunks[i].index == i;
  }
  if (!complete) {
    const std::string detail = describeGaps(chunks, total);
    Logger::getInstance().log(LogLevel::WARN, "[Reassembler] Upload " +
                                                  uploadId +
                                                  " incomplete: " + detail);
    throw CompletenessError("Upload " + uploadId + " is incomplete: " + detail);
  }

  std::error_code ec;
  fs::create_directories(artifactsDir_, ec);
  if (ec) {
    throw StorageWriteError("Cannot create artifacts directory " +
                            artifactsDir_.string() + ": " + ec.message());
  }

  Artifact artifact;
  artifact.originalFilename = filename;
  artifact.category = classifyFilename(filename);
  artifact.location =
      artifactsDir_ / (randomHex(16) + "-" + sanitizeFilename(filename));

  std::ofstream out(artifact.location, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw StorageWriteError("Cannot open " + artifact.location.string() +
                            " for writing");
  }

  for (const auto &info : chunks) {
    std::vector<std::byte> data;
    try {
      data = store_.read(uploadId, info.index);
    } catch (const CompletenessError &) {
      out.close();
      fs::remove(artifact.location, ec);
      throw;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
      out.close();
      fs::remove(artifact.location, ec);
      Logger::getInstance().log(LogLevel::ERROR,
                                "[Reassembler] Write failed for upload " +
                                    uploadId + " at chunk " +
                                    std::to_string(info.index));
      throw StorageWriteError("Failed writing reassembled output for upload " +
                              uploadId);
    }
    artifact.sizeBytes += data.size();
    store_.remove(uploadId, info.index);
  }

  out.flush();
  if (!out) {
    out.close();
    fs::remove(artifact.location, ec);
    throw StorageWriteError("Failed flushing reassembled output for upload " +
                            uploadId);
  }
  out.close();

  Logger::getInstance().log(
      LogLevel::INFO, "[Reassembler] Upload " + uploadId + " assembled from " +
                          std::to_string(total) + " chunks (" +
                          std::to_string(artifact.sizeBytes) + " bytes) into " +
                          artifact.location.string());
  return artifact;
}

} // namespace xferpress
