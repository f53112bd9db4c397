#include "transfer/compression_engine.h"
#include "utilities/blockio.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace fs = std::filesystem;

namespace xferpress {

namespace {

uint64_t sizeOrZero(const fs::path &p) {
  std::error_code ec;
  if (!fs::exists(p, ec))
    return 0;
  auto size = fs::file_size(p, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

// Input is only removed once the replacement is on disk. A failed removal
// leaves a stray file but does not fail the upload.
void discardInput(const Artifact &input) {
  std::error_code ec;
  fs::remove(input.location, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[CompressionEngine] Could not remove " +
                                  input.location.string() + ": " +
                                  ec.message());
  }
}

Artifact replacedBy(const Artifact &input, const fs::path &location,
                    uint64_t size) {
  Artifact out = input;
  out.location = location;
  out.sizeBytes = size;
  return out;
}

void jpegSink(void *context, void *data, int size) {
  auto *buffer = static_cast<std::vector<unsigned char> *>(context);
  auto *bytes = static_cast<unsigned char *>(data);
  buffer->insert(buffer->end(), bytes, bytes + size);
}

} // namespace

fs::path CompressionEngine::outputPathFor(const Artifact &input) {
  fs::path out = input.location;
  out += ".cmp";
  return out;
}

// ---------------------------------------------------------------- image

ImageCompressor::ImageCompressor(AdaptiveQualityModel &model,
                                 uint64_t maxInputBytes)
    : model_(model),
      maxInputBytes_(std::min(maxInputBytes, MAX_INPUT_BYTES)) {}

CompressionOutcome ImageCompressor::compress(const Artifact &input) {
  CompressionOutcome outcome;
  outcome.artifact = input;

  const uint64_t onDisk = sizeOrZero(input.location);
  if (onDisk > maxInputBytes_) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[ImageCompressor] " + input.originalFilename +
                                  " is " + std::to_string(onDisk) +
                                  " bytes, above the decode limit of " +
                                  std::to_string(maxInputBytes_) +
                                  ", storing unchanged");
    outcome.passthrough = true;
    return outcome;
  }

  std::ifstream in(input.location, std::ios::binary);
  if (!in.is_open()) {
    throw StorageWriteError("Cannot read artifact " + input.location.string());
  }
  std::vector<unsigned char> encoded((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
  in.close();

  int width = 0, height = 0, channels = 0;
  unsigned char *pixels =
      encoded.empty()
          ? nullptr
          : stbi_load_from_memory(encoded.data(),
                                  static_cast<int>(encoded.size()), &width,
                                  &height, &channels, 3);
  if (!pixels) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[ImageCompressor] Cannot decode " +
                                  input.originalFilename +
                                  ", storing unchanged");
    outcome.passthrough = true;
    return outcome;
  }

  const ParameterSpec spec = model_.specFor(AdaptiveQualityModel::IMAGE_QUALITY);
  const double current = model_.get(AdaptiveQualityModel::IMAGE_QUALITY);
  const int quality = static_cast<int>(
      std::clamp(std::lround(current), std::lround(spec.floor),
                 std::lround(spec.cap)));

  std::vector<unsigned char> jpeg;
  int written = stbi_write_jpg_to_func(jpegSink, &jpeg, width, height, 3,
                                       pixels, quality);
  stbi_image_free(pixels);
  if (!written || jpeg.empty()) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[ImageCompressor] JPEG encode failed for " +
                                  input.originalFilename +
                                  ", storing unchanged");
    outcome.passthrough = true;
    return outcome;
  }

  const fs::path target = outputPathFor(input);
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(jpeg.data()),
            static_cast<std::streamsize>(jpeg.size()));
  out.close();
  if (!out) {
    std::error_code ec;
    fs::remove(target, ec);
    throw StorageWriteError("Cannot write " + target.string());
  }
  discardInput(input);

  const uint64_t original = encoded.size();
  const uint64_t compressed = jpeg.size();
  model_.adjust(AdaptiveQualityModel::IMAGE_QUALITY, current, original,
                compressed);
  outcome.artifact = replacedBy(input, target, compressed);
  outcome.feedback = SizeFeedback{original, compressed};
  Logger::getInstance().log(LogLevel::INFO,
                            "[ImageCompressor] " + input.originalFilename +
                                " re-encoded at quality " +
                                std::to_string(quality) + ": " +
                                std::to_string(original) + " -> " +
                                std::to_string(compressed) + " bytes");
  return outcome;
}

// ---------------------------------------------------------------- video

VideoCompressor::VideoCompressor(AdaptiveQualityModel &model,
                                 Transcoder &transcoder)
    : model_(model), transcoder_(transcoder) {}

int VideoCompressor::crfFrom(double stored) {
  if (!std::isfinite(stored))
    return MIN_CRF;
  const long rounded = std::lround(stored);
  return static_cast<int>(
      std::clamp<long>(rounded, MIN_CRF, MAX_CRF));
}

CompressionOutcome VideoCompressor::compress(const Artifact &input) {
  CompressionOutcome outcome;
  outcome.artifact = input;

  const int crf = crfFrom(model_.get(AdaptiveQualityModel::VIDEO_CRF));
  const fs::path target = outputPathFor(input);
  const uint64_t original = input.sizeBytes;

  const bool ok = transcoder_.transcode(input.location, crf, target);
  const uint64_t produced = sizeOrZero(target);

  try {
    if (!ok) {
      throw TranscodeFailure("Transcoder failed for " +
                             input.location.string());
    }
    if (produced == 0) {
      throw TranscodeFailure("Transcoder produced no output for " +
                             input.location.string());
    }
  } catch (const TranscodeFailure &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("[VideoCompressor] ") + e.what() +
                                  ", storing unchanged");
    MetricsRegistry::instance().incrementCounter(
        "xferpress_transcode_failures_total");
    if (produced > 0) {
      model_.adjust(AdaptiveQualityModel::VIDEO_CRF, crf, original, produced);
      outcome.feedback = SizeFeedback{original, produced};
    }
    std::error_code ec;
    fs::remove(target, ec);
    outcome.passthrough = true;
    return outcome;
  }

  discardInput(input);
  model_.adjust(AdaptiveQualityModel::VIDEO_CRF, crf, original, produced);
  outcome.artifact = replacedBy(input, target, produced);
  outcome.feedback = SizeFeedback{original, produced};
  Logger::getInstance().log(LogLevel::INFO,
                            "[VideoCompressor] " + input.originalFilename +
                                " transcoded at crf " + std::to_string(crf) +
                                ": " + std::to_string(original) + " -> " +
                                std::to_string(produced) + " bytes");
  return outcome;
}

// ---------------------------------------------------------------- document

DocumentCompressor::DocumentCompressor(int compressionLevel)
    : compressionLevel_(compressionLevel) {}

CompressionOutcome DocumentCompressor::compress(const Artifact &input) {
  CompressionOutcome outcome;
  const fs::path target = outputPathFor(input);

  std::ifstream in(input.location, std::ios::binary);
  if (!in.is_open()) {
    throw StorageWriteError("Cannot read artifact " + input.location.string());
  }
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw StorageWriteError("Cannot open " + target.string() + " for writing");
  }

  uint64_t compressed = 0;
  try {
    BlockIO codec(compressionLevel_);
    compressed = codec.compress_stream(in, out);
    out.close();
    if (!out)
      throw std::runtime_error("close failed");
  } catch (const std::runtime_error &e) {
    out.close();
    std::error_code ec;
    fs::remove(target, ec);
    Logger::getInstance().log(LogLevel::ERROR,
                              "[DocumentCompressor] " + target.string() +
                                  ": " + e.what());
    throw StorageWriteError("Cannot compress " + input.location.string() +
                            ": " + e.what());
  }
  in.close();
  discardInput(input);

  outcome.artifact = replacedBy(input, target, compressed);
  Logger::getInstance().log(LogLevel::INFO,
                            "[DocumentCompressor] " + input.originalFilename +
                                ": " + std::to_string(input.sizeBytes) +
                                " -> " + std::to_string(compressed) +
                                " bytes");
  return outcome;
}

// ---------------------------------------------------------------- registry

void CompressorRegistry::add(std::unique_ptr<CompressionEngine> engine) {
  const ContentCategory category = engine->category();
  engines_[category] = std::move(engine);
}

CompressionEngine &CompressorRegistry::forCategory(ContentCategory category) const {
  auto it = engines_.find(category);
  if (it == engines_.end()) {
    throw std::out_of_range("No compression engine for " + toString(category));
  }
  return *it->second;
}

CompressorRegistry CompressorRegistry::withDefaults(AdaptiveQualityModel &model,
                                                    Transcoder &transcoder,
                                                    int compressionLevel) {
  CompressorRegistry registry;
  registry.add(std::make_unique<ImageCompressor>(model));
  registry.add(std::make_unique<VideoCompressor>(model, transcoder));
  registry.add(std::make_unique<DocumentCompressor>(compressionLevel));
  return registry;
}

} // namespace xferpress
