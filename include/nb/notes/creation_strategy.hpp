#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nb/notes/note_scripts.hpp"
#include "nb/script/command_executor.hpp"
#include "nb/script/result_decoder.hpp"

namespace nb::notes {

// One way of issuing `make new note`
struct CreationVariant {
  std::string name;
  std::string command;
};

/**
 * @brief Ordered list of create commands plus the rule for when to stop
 *
 * Variants run in order. The first variant whose command runs to completion
 * ends the run, whatever it answered; a variant that fails at the process
 * level hands over to the next one. When every variant failed the run
 * decodes to Signal::kFailed.
 *
 * Without a folder the note goes to the application's default account first,
 * then explicitly to the configured account. With a folder there is a single
 * variant, since a missing folder is an answer and not a failure.
 */
class CreationStrategy {
 public:
  static CreationStrategy forNote(const scripts::Target& target, std::string_view title,
                                  std::string_view body,
                                  const std::optional<std::string>& folder);

  explicit CreationStrategy(std::vector<CreationVariant> variants);

  const std::vector<CreationVariant>& variants() const { return variants_; }

  script::Decoded run(script::CommandExecutor& executor) const;

 private:
  std::vector<CreationVariant> variants_;
};

}  // namespace nb::notes
