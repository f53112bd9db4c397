#pragma once
#ifndef XFERPRESS_QUALITY_MODEL_H
#define XFERPRESS_QUALITY_MODEL_H

#include "utilities/audit_log.hpp"
#include "utilities/keyed_mutex.h"
#include "utilities/kv_store.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace xferpress {

/**
 * @brief Bounds and polarity of one tunable compression parameter.
 */
struct ParameterSpec {
  double defaultValue{80};
  double floor{30};
  double cap{95};
  double step{5};
  /// True when a larger value yields smaller output (e.g. a CRF). The
  /// controller then moves up, not down, when compression barely helped.
  bool largerMeansSmaller{false};
};

/**
 * @brief Persistent compression parameters tuned by a bang-bang controller.
 *
 * After each compression run the ratio compressed/original decides the next
 * value: above 0.95 the parameter moves one step toward smaller output,
 * below 0.60 one step toward higher quality, otherwise it stays. Only the
 * immediately preceding run is considered, so inputs alternating between
 * the two regimes make the value oscillate.
 */
class AdaptiveQualityModel {
public:
  static constexpr const char *IMAGE_QUALITY = "image_quality";
  static constexpr const char *VIDEO_CRF = "video_crf";
  static constexpr double SHRINK_ABOVE_RATIO = 0.95;
  static constexpr double EXPAND_BELOW_RATIO = 0.60;

  /// Registers image_quality (80 in [30,95]) and video_crf (23 in [18,32]).
  explicit AdaptiveQualityModel(KeyValueStore &store);

  AdaptiveQualityModel(const AdaptiveQualityModel &) = delete;
  AdaptiveQualityModel &operator=(const AdaptiveQualityModel &) = delete;

  /// Register or replace the bounds used for @p name.
  void defineParameter(const std::string &name, const ParameterSpec &spec);

  /// Bounds for @p name; unregistered names get the generic 80 in [30,95].
  ParameterSpec specFor(const std::string &name) const;

  /**
   * @brief Current value of @p name.
   *
   * Returns the parameter default when nothing is stored, the stored text is
   * not a finite number, or the store cannot be read. A stored value outside
   * the parameter's range is clamped into it. Never throws.
   */
  double get(const std::string &name) const;

  /**
   * @brief Feed back the outcome of a compression run.
   *
   * Computes the next value from @p previousValue (clamped into range first),
   * persists it under
   * @p name and appends a history record. Serialised per parameter name.
   * A zero @p originalSizeBytes carries no information and leaves the value
   * unchanged without a history record.
   *
   * @return The value now stored.
   */
  double adjust(const std::string &name, double previousValue,
                uint64_t originalSizeBytes, uint64_t compressedSizeBytes);

  const AdjustmentHistory &history() const { return history_; }
  AdjustmentHistory &history() { return history_; }

private:
  KeyValueStore &store_;
  AdjustmentHistory history_;
  KeyedMutex keyLocks_;
  mutable std::mutex specMutex_;
  std::map<std::string, ParameterSpec> specs_;
};

} // namespace xferpress

#endif // XFERPRESS_QUALITY_MODEL_H
