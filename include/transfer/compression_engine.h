#pragma once
#ifndef XFERPRESS_COMPRESSION_ENGINE_H
#define XFERPRESS_COMPRESSION_ENGINE_H

#include "transfer/artifact.h"
#include "transfer/content_category.h"
#include "transfer/quality_model.h"
#include "transfer/transcoder.h"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <optional>

namespace xferpress {

/// Size pair fed back into the quality model.
struct SizeFeedback {
  uint64_t originalSizeBytes{0};
  uint64_t compressedSizeBytes{0};
};

struct CompressionOutcome {
  Artifact artifact;
  /// Present only when a size comparison was fed to the quality model.
  std::optional<SizeFeedback> feedback;
  /// True when the input artifact was returned unchanged.
  bool passthrough{false};
};

/**
 * @brief One compression strategy per content category.
 *
 * compress() consumes the reassembled artifact and returns the one that
 * should be stored. When a new file is produced the input is deleted, and
 * only after the output has been fully written.
 */
class CompressionEngine {
public:
  virtual ~CompressionEngine() = default;

  virtual ContentCategory category() const = 0;

  /**
   * @throw StorageWriteError If the output cannot be written.
   */
  virtual CompressionOutcome compress(const Artifact &input) = 0;

  /// `<input>.cmp`, where every engine writes its result.
  static std::filesystem::path outputPathFor(const Artifact &input);
};

/**
 * @brief Lossy JPEG re-encode driven by the `image_quality` parameter.
 *
 * Inputs stb_image cannot decode, and inputs larger than the decoder's
 * int-sized buffer limit, are passed through without feedback.
 */
class ImageCompressor : public CompressionEngine {
public:
  static constexpr uint64_t MAX_INPUT_BYTES =
      static_cast<uint64_t>(std::numeric_limits<int>::max());

  explicit ImageCompressor(AdaptiveQualityModel &model,
                           uint64_t maxInputBytes = MAX_INPUT_BYTES);

  ContentCategory category() const override { return ContentCategory::Image; }
  CompressionOutcome compress(const Artifact &input) override;

private:
  AdaptiveQualityModel &model_;
  uint64_t maxInputBytes_;
};

/**
 * @brief External transcode driven by the `video_crf` parameter.
 *
 * Transcoder failures never abort the upload: the input is passed through.
 * If the failed run still left a non-empty output file its size is fed to
 * the model before the file is discarded.
 */
class VideoCompressor : public CompressionEngine {
public:
  static constexpr int MIN_CRF = 18;
  static constexpr int MAX_CRF = 32;

  VideoCompressor(AdaptiveQualityModel &model, Transcoder &transcoder);

  ContentCategory category() const override { return ContentCategory::Video; }
  CompressionOutcome compress(const Artifact &input) override;

  /// Round and clamp a stored parameter value into [MIN_CRF, MAX_CRF].
  static int crfFrom(double stored);

private:
  AdaptiveQualityModel &model_;
  Transcoder &transcoder_;
};

/// Lossless zstd stream compression with no adaptive parameter.
class DocumentCompressor : public CompressionEngine {
public:
  explicit DocumentCompressor(int compressionLevel = 3);

  ContentCategory category() const override {
    return ContentCategory::Document;
  }
  CompressionOutcome compress(const Artifact &input) override;

private:
  int compressionLevel_;
};

/// Maps every ContentCategory to the engine that handles it.
class CompressorRegistry {
public:
  /// Register @p engine under its own category, replacing any previous one.
  void add(std::unique_ptr<CompressionEngine> engine);

  /// @throw std::out_of_range If no engine handles @p category.
  CompressionEngine &forCategory(ContentCategory category) const;

  /// Image, video and document engines wired to the given collaborators.
  static CompressorRegistry withDefaults(AdaptiveQualityModel &model,
                                         Transcoder &transcoder,
                                         int compressionLevel);

private:
  std::map<ContentCategory, std::unique_ptr<CompressionEngine>> engines_;
};

} // namespace xferpress

#endif // XFERPRESS_COMPRESSION_ENGINE_H
