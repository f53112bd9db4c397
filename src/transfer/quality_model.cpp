#include "transfer/quality_model.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace xferpress {

namespace {

std::string formatValue(double v) {
  std::ostringstream oss;
  oss << std::setprecision(10) << v;
  return oss.str();
}

bool parseFinite(const std::string &text, double &out) {
  try {
    size_t consumed = 0;
    double v = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(v)) {
      return false;
    }
    out = v;
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

} // namespace

AdaptiveQualityModel::AdaptiveQualityModel(KeyValueStore &store)
    : store_(store) {
  specs_[IMAGE_QUALITY] = ParameterSpec{80, 30, 95, 5, false};
  specs_[VIDEO_CRF] = ParameterSpec{23, 18, 32, 5, true};
}

void AdaptiveQualityModel::defineParameter(const std::string &name,
                                           const ParameterSpec &spec) {
  std::lock_guard<std::mutex> lock(specMutex_);
  specs_[name] = spec;
}

ParameterSpec AdaptiveQualityModel::specFor(const std::string &name) const {
  std::lock_guard<std::mutex> lock(specMutex_);
  auto it = specs_.find(name);
  return it == specs_.end() ? ParameterSpec{} : it->second;
}

double AdaptiveQualityModel::get(const std::string &name) const {
  const ParameterSpec spec = specFor(name);
  std::optional<std::string> stored;
  try {
    stored = store_.get(name);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[AdaptiveQualityModel] Read of " + name +
                                  " failed, using default: " + e.what());
    return spec.defaultValue;
  }
  if (!stored) {
    return spec.defaultValue;
  }
  double value = 0;
  if (!parseFinite(*stored, value)) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[AdaptiveQualityModel] Non-numeric value '" +
                                  *stored + "' for " + name +
                                  ", using default");
    return spec.defaultValue;
  }
  if (value < spec.floor || value > spec.cap) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[AdaptiveQualityModel] Stored " + name + "=" +
                                  *stored + " outside [" +
                                  formatValue(spec.floor) + "," +
                                  formatValue(spec.cap) + "], clamping");
  }
  return std::clamp(value, spec.floor, spec.cap);
}

double AdaptiveQualityModel::adjust(const std::string &name,
                                    double previousValue,
                                    uint64_t originalSizeBytes,
                                    uint64_t compressedSizeBytes) {
  const ParameterSpec spec = specFor(name);
  auto guard = keyLocks_.lock(name);

  double prev = std::isfinite(previousValue) ? previousValue : spec.defaultValue;
  prev = std::clamp(prev, spec.floor, spec.cap);
  if (originalSizeBytes == 0) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "[AdaptiveQualityModel] Empty input, " + name +
                                  " left at " + formatValue(prev));
    return prev;
  }

  const double ratio = static_cast<double>(compressedSizeBytes) /
                       static_cast<double>(originalSizeBytes);
  // Direction is expressed as "toward smaller output" (+1) or "toward
  // higher quality" (-1), then mapped onto the parameter's polarity.
  int direction = 0;
  if (ratio > SHRINK_ABOVE_RATIO)
    direction = 1;
  else if (ratio < EXPAND_BELOW_RATIO)
    direction = -1;

  const double sign = spec.largerMeansSmaller ? 1.0 : -1.0;
  const double next =
      std::clamp(prev + sign * direction * spec.step, spec.floor, spec.cap);

  try {
    store_.put(name, formatValue(next));
  } catch (const StorageWriteError &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[AdaptiveQualityModel] Could not persist " +
                                  name + ": " + e.what());
  }

  const auto event = history_.record(name, prev, next, ratio);
  MetricsRegistry::instance().setGauge("xferpress_quality_parameter", next,
                                       {{"name", name}});
  MetricsRegistry::instance().incrementCounter(
      "xferpress_quality_adjustments_total", 1.0,
      {{"name", name},
       {"direction", direction > 0 ? "shrink"
                                   : (direction < 0 ? "expand" : "hold")}});

  std::ostringstream msg;
  msg << "[AdaptiveQualityModel] " << name << ' ' << event.transition
      << " ratio=" << std::fixed << std::setprecision(2) << ratio;
  Logger::getInstance().log(LogLevel::INFO, msg.str());
  return next;
}

} // namespace xferpress
