#include "nb/notes/creation_strategy.hpp"

#include <array>

#include <spdlog/spdlog.h>

#include "nb/script/sentinels.hpp"

namespace nb::notes {

namespace {

constexpr std::array<script::SentinelRule, 1> kCreateRules = {{
    {script::sentinel::kFolderNotFound, script::Signal::kFolderNotFound},
}};

}  // namespace

CreationStrategy CreationStrategy::forNote(const scripts::Target& target, std::string_view title,
                                           std::string_view body,
                                           const std::optional<std::string>& folder) {
  std::vector<CreationVariant> variants;
  if (folder.has_value()) {
    variants.push_back({"folder", scripts::createNoteInFolder(target, *folder, title, body)});
  } else {
    variants.push_back({"default-account", scripts::createNoteInDefaultAccount(target, title, body)});
    variants.push_back({"account", scripts::createNoteInAccount(target, title, body)});
  }
  return CreationStrategy(std::move(variants));
}

CreationStrategy::CreationStrategy(std::vector<CreationVariant> variants)
    : variants_(std::move(variants)) {}

script::Decoded CreationStrategy::run(script::CommandExecutor& executor) const {
  for (const auto& variant : variants_) {
    auto outcome = executor.execute(variant.command);
    auto decoded = script::decode(outcome, kCreateRules);
    if (decoded.signal != script::Signal::kFailed) {
      return decoded;
    }
    spdlog::debug("Create variant '{}' failed, trying next", variant.name);
  }
  return script::Decoded{script::Signal::kFailed, {}};
}

}  // namespace nb::notes
