#include "nb/notes/note_id.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace nb::notes {

namespace {

// Crockford's base32 alphabet
constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr size_t kTimeDigits = 10;
constexpr size_t kRandomDigits = 16;

using RandomDigits = std::array<uint8_t, kRandomDigits>;

// Last id handed out; ids minted within one millisecond increment its random
// part so a batch (e.g. one search result) sorts in the order it was built.
struct Sequence {
  std::mutex mutex;
  int64_t last_ms = -1;
  RandomDigits last_random{};
  std::mt19937_64 engine{std::random_device{}()};
};

Sequence& sequence() {
  static Sequence instance;
  return instance;
}

RandomDigits freshRandom(std::mt19937_64& engine) {
  std::uniform_int_distribution<int> digit(0, static_cast<int>(kAlphabet.size()) - 1);
  RandomDigits digits{};
  for (auto& d : digits) {
    d = static_cast<uint8_t>(digit(engine));
  }
  return digits;
}

// False when every digit was already at its maximum
bool increment(RandomDigits& digits) {
  for (size_t i = digits.size(); i-- > 0;) {
    if (digits[i] + 1u < kAlphabet.size()) {
      ++digits[i];
      return true;
    }
    digits[i] = 0;
  }
  return false;
}

int digitValue(char c) {
  auto pos = kAlphabet.find(c);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

std::string encode(int64_t ms, const RandomDigits& random) {
  std::string out(kTimeDigits + kRandomDigits, '0');
  auto value = static_cast<uint64_t>(ms);
  for (size_t i = kTimeDigits; i-- > 0;) {
    out[i] = kAlphabet[value % kAlphabet.size()];
    value /= kAlphabet.size();
  }
  for (size_t i = 0; i < kRandomDigits; ++i) {
    out[kTimeDigits + i] = kAlphabet[random[i]];
  }
  return out;
}

}  // namespace

NoteId NoteId::generate() {
  return generate(std::chrono::system_clock::now());
}

NoteId NoteId::generate(std::chrono::system_clock::time_point timestamp) {
  int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      timestamp.time_since_epoch()).count();

  auto& seq = sequence();
  std::lock_guard lock(seq.mutex);

  if (ms == seq.last_ms && increment(seq.last_random)) {
    return NoteId(encode(ms, seq.last_random));
  }

  seq.last_ms = ms;
  seq.last_random = freshRandom(seq.engine);
  return NoteId(encode(ms, seq.last_random));
}

Result<NoteId> NoteId::fromString(std::string_view str) {
  if (!isValidFormat(str)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid note id: " + std::string(str)));
  }
  return NoteId(std::string(str));
}

std::chrono::system_clock::time_point NoteId::timestamp() const {
  if (!isValid()) {
    return {};
  }

  uint64_t ms = 0;
  for (size_t i = 0; i < kTimeDigits; ++i) {
    ms = ms * kAlphabet.size() + static_cast<uint64_t>(digitValue(id_[i]));
  }
  return std::chrono::system_clock::time_point{std::chrono::milliseconds(ms)};
}

bool NoteId::isValid() const noexcept {
  return isValidFormat(id_);
}

NoteId::NoteId(std::string id) : id_(std::move(id)) {}

bool NoteId::isValidFormat(std::string_view str) {
  if (str.size() != kTimeDigits + kRandomDigits) {
    return false;
  }
  for (char c : str) {
    if (digitValue(c) < 0) {
      return false;
    }
  }
  return true;
}

}  // namespace nb::notes
