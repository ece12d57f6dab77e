#include "nb/script/result_decoder.hpp"

#include "nb/util/text.hpp"

namespace nb::script {

namespace {

int priority(Signal signal) {
  return signal == Signal::kFolderNotFound ? 0 : 1;
}

}  // namespace

Decoded decode(const CommandOutcome& outcome, std::span<const SentinelRule> rules) {
  if (!outcome.success) {
    return Decoded{Signal::kFailed, {}};
  }

  for (int pass = 0; pass < 2; ++pass) {
    for (const auto& rule : rules) {
      if (priority(rule.signal) == pass && outcome.output == rule.text) {
        return Decoded{rule.signal, {}};
      }
    }
  }

  return Decoded{Signal::kPayload, outcome.output};
}

std::vector<std::string> decodeList(std::string_view output, char separator) {
  return util::splitTrimmed(output, separator);
}

}  // namespace nb::script
