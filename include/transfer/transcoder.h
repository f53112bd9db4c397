#pragma once
#ifndef XFERPRESS_TRANSCODER_H
#define XFERPRESS_TRANSCODER_H

#include <filesystem>
#include <string>

namespace xferpress {

/**
 * @brief External video transcoding capability.
 *
 * A black box: it reports success or failure and nothing else. A failed run
 * may still leave a (possibly partial) file at the output path.
 */
class Transcoder {
public:
  virtual ~Transcoder() = default;

  virtual bool transcode(const std::filesystem::path &input, int quality,
                         const std::filesystem::path &output) = 0;
};

/**
 * @brief Runs a shell command template through std::system.
 *
 * `{input}`, `{output}` and `{crf}` in the template are replaced by the
 * single-quoted input path, output path and quality value.
 */
class ShellTranscoder : public Transcoder {
public:
  explicit ShellTranscoder(std::string commandTemplate);

  bool transcode(const std::filesystem::path &input, int quality,
                 const std::filesystem::path &output) override;

  /// Command line that transcode() would run for these arguments.
  std::string renderCommand(const std::filesystem::path &input, int quality,
                            const std::filesystem::path &output) const;

  /// Wrap @p value in single quotes, escaping embedded quotes.
  static std::string shellQuote(const std::string &value);

private:
  std::string commandTemplate_;
};

} // namespace xferpress

#endif // XFERPRESS_TRANSCODER_H
