#include "transfer/transcoder.h"
#include "utilities/logger.h"

#include <cstdlib>
#include <sys/wait.h>

namespace xferpress {

namespace {

void replaceAll(std::string &text, const std::string &token,
                const std::string &value) {
  size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

} // namespace

ShellTranscoder::ShellTranscoder(std::string commandTemplate)
    : commandTemplate_(std::move(commandTemplate)) {}

std::string ShellTranscoder::shellQuote(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::string
ShellTranscoder::renderCommand(const std::filesystem::path &input, int quality,
                               const std::filesystem::path &output) const {
  std::string command = commandTemplate_;
  replaceAll(command, "{input}", shellQuote(input.string()));
  replaceAll(command, "{output}", shellQuote(output.string()));
  replaceAll(command, "{crf}", std::to_string(quality));
  return command;
}

bool ShellTranscoder::transcode(const std::filesystem::path &input,
                                int quality,
                                const std::filesystem::path &output) {
  const std::string command = renderCommand(input, quality, output);
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[ShellTranscoder] Running: " + command);
  int status = std::system(command.c_str());
  if (status == -1) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[ShellTranscoder] Could not start shell");
    return false;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    Logger::getInstance().log(
        LogLevel::WARN,
        "[ShellTranscoder] Command exited with status " +
            std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status));
    return false;
  }
  return true;
}

} // namespace xferpress
