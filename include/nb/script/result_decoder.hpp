#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nb/script/command_executor.hpp"

namespace nb::script {

// What a command's outcome means to the operation that issued it
enum class Signal {
  kPayload,         // command succeeded, output is data
  kNotFound,        // script reported the target entity missing
  kFolderNotFound,  // script reported a referenced folder missing
  kFailed           // the interpreter did not run the command to completion
};

// Maps one exact output value to a signal
struct SentinelRule {
  std::string_view text;
  Signal signal;
};

struct Decoded {
  Signal signal = Signal::kFailed;
  std::string payload;
};

/**
 * @brief Decode an outcome against an operation's sentinel set
 *
 * A failed outcome decodes to kFailed. Otherwise folder rules are tried before
 * any other rule, whatever their order in `rules`, and output matching no rule
 * is returned as payload. The raw error text of a failed outcome is not copied.
 */
Decoded decode(const CommandOutcome& outcome, std::span<const SentinelRule> rules);

// Decode list output: empty output is an empty list, items are trimmed
std::vector<std::string> decodeList(std::string_view output, char separator);

}  // namespace nb::script
