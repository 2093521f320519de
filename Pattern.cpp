#include "Solver.hpp"

#include <cctype>

namespace pythia {
namespace {
constexpr int kLetterBits = 5;
constexpr uint32_t kLetterMask = 0x1F;

uint8_t LetterAt(const PackedWord& word, int index) {
  return static_cast<uint8_t>((word.letters >> (index * kLetterBits)) &
                              kLetterMask);
}

}  // namespace

bool PatternCodec::IsValidWord(std::string_view word) {
  if (word.size() != kWordLen) {
    return false;
  }
  for (char c : word) {
    if (c < 'a' || c > 'z') {
      return false;
    }
  }
  return true;
}

std::string PatternCodec::NormalizeWord(std::string_view word) {
  std::string normalized;
  normalized.reserve(word.size());
  for (char c : word) {
    if (c >= 'A' && c <= 'Z') {
      normalized.push_back(static_cast<char>(c - 'A' + 'a'));
    } else if (c >= 'a' && c <= 'z') {
      normalized.push_back(c);
    }
  }
  return normalized;
}

PackedWord PatternCodec::EncodeWord(std::string_view word) {
  PackedWord packed;
  for (int i = 0; i < kWordLen; ++i) {
    uint32_t letter = static_cast<uint32_t>(word[i] - 'a');
    packed.letters |= (letter & kLetterMask) << (i * kLetterBits);
    packed.mask |= 1U << letter;
  }
  return packed;
}

int PatternCodec::Pattern(const PackedWord& guess, const PackedWord& answer) {
  std::array<uint8_t, kWordLen> guess_letters{};
  std::array<uint8_t, kWordLen> answer_letters{};
  for (int i = 0; i < kWordLen; ++i) {
    guess_letters[i] = LetterAt(guess, i);
    answer_letters[i] = LetterAt(answer, i);
  }

  // Greens consume their letter first so a later yellow cannot reuse it.
  std::array<int, kAlphabet> counts{};
  counts.fill(0);
  for (int i = 0; i < kWordLen; ++i) {
    counts[answer_letters[i]]++;
  }

  std::array<int, kWordLen> result{};
  result.fill(0);
  for (int i = 0; i < kWordLen; ++i) {
    if (guess_letters[i] == answer_letters[i]) {
      result[i] = 2;
      counts[guess_letters[i]]--;
    }
  }

  uint32_t answer_mask = answer.mask;
  for (int i = 0; i < kWordLen; ++i) {
    if (result[i] != 0) {
      continue;
    }
    uint8_t letter = guess_letters[i];
    if ((answer_mask & (1U << letter)) == 0) {
      continue;
    }
    if (counts[letter] > 0) {
      result[i] = 1;
      counts[letter]--;
    }
  }

  return FromDigits(result);
}

bool PatternCodec::Encode(std::string_view guess,
                          std::string_view answer,
                          int* pattern_out) {
  if (guess.size() != kWordLen || answer.size() != kWordLen) {
    return false;
  }
  std::string g = NormalizeWord(guess);
  std::string a = NormalizeWord(answer);
  if (!IsValidWord(g) || !IsValidWord(a)) {
    return false;
  }
  if (pattern_out) {
    *pattern_out = Pattern(EncodeWord(g), EncodeWord(a));
  }
  return true;
}

std::array<int, kWordLen> PatternCodec::Decode(int pattern) {
  std::array<int, kWordLen> digits{};
  for (int i = 0; i < kWordLen; ++i) {
    digits[i] = pattern % 3;
    pattern /= 3;
  }
  return digits;
}

int PatternCodec::FromDigits(const std::array<int, kWordLen>& digits) {
  int pattern = 0;
  int base = 1;
  for (int i = 0; i < kWordLen; ++i) {
    pattern += digits[i] * base;
    base *= 3;
  }
  return pattern;
}

bool PatternCodec::IsWinning(int pattern) { return pattern == kSolvedPattern; }

int PatternCodec::CountCorrect(int pattern) {
  int correct = 0;
  for (int digit : Decode(pattern)) {
    if (digit == 2) {
      ++correct;
    }
  }
  return correct;
}

std::string PatternCodec::ToString(int pattern) {
  std::string out(kWordLen, '0');
  for (int i = 0; i < kWordLen; ++i) {
    out[i] = static_cast<char>('0' + (pattern % 3));
    pattern /= 3;
  }
  return out;
}

std::string PatternCodec::ToSymbols(int pattern) {
  static const char kSymbols[] = {'-', 'y', 'G'};
  std::string out(kWordLen, '-');
  for (int i = 0; i < kWordLen; ++i) {
    out[i] = kSymbols[pattern % 3];
    pattern /= 3;
  }
  return out;
}

bool PatternCodec::Parse(std::string_view text, int* pattern_out) {
  if (text.size() != kWordLen) {
    return false;
  }
  std::array<int, kWordLen> digits{};
  for (int i = 0; i < kWordLen; ++i) {
    char c = static_cast<char>(
        std::tolower(static_cast<unsigned char>(text[i])));
    switch (c) {
      case '0':
      case 'b':
      case 'x':
      case '-':
      case '.':
        digits[i] = 0;
        break;
      case '1':
      case 'y':
        digits[i] = 1;
        break;
      case '2':
      case 'g':
        digits[i] = 2;
        break;
      default:
        return false;
    }
  }
  if (pattern_out) {
    *pattern_out = FromDigits(digits);
  }
  return true;
}

bool MakeGuessResult(std::string_view word,
                     const std::array<Clue, kWordLen>& clues,
                     GuessResult* out) {
  if (word.size() != kWordLen) {
    return false;
  }
  std::string normalized = PatternCodec::NormalizeWord(word);
  if (!PatternCodec::IsValidWord(normalized)) {
    return false;
  }
  if (out) {
    out->word = normalized;
    for (int i = 0; i < kWordLen; ++i) {
      out->clues[i].letter = normalized[i];
      out->clues[i].position = i;
      out->clues[i].clue = clues[i];
    }
  }
  return true;
}

bool GuessResultFromPattern(std::string_view word,
                            int pattern,
                            GuessResult* out) {
  if (pattern < 0 || pattern >= kPatternCount) {
    return false;
  }
  std::array<Clue, kWordLen> clues{};
  std::array<int, kWordLen> digits = PatternCodec::Decode(pattern);
  for (int i = 0; i < kWordLen; ++i) {
    clues[i] = static_cast<Clue>(digits[i]);
  }
  return MakeGuessResult(word, clues, out);
}

bool IsWellFormed(const GuessResult& guess) {
  if (!PatternCodec::IsValidWord(guess.word)) {
    return false;
  }
  for (int i = 0; i < kWordLen; ++i) {
    const LetterClue& clue = guess.clues[i];
    if (clue.position != i || clue.letter != guess.word[i] ||
        static_cast<int>(clue.clue) < 0 ||
        static_cast<int>(clue.clue) > static_cast<int>(Clue::kCorrect)) {
      return false;
    }
  }
  return true;
}

int PatternOf(const GuessResult& guess) {
  std::array<int, kWordLen> digits{};
  for (int i = 0; i < kWordLen; ++i) {
    digits[i] = static_cast<int>(guess.clues[i].clue);
  }
  return PatternCodec::FromDigits(digits);
}

const char* SuggestionModeName(SuggestionMode mode) {
  switch (mode) {
    case SuggestionMode::kNone:
      return "none";
    case SuggestionMode::kOpeners:
      return "openers";
    case SuggestionMode::kSingleCandidate:
      return "single";
    case SuggestionMode::kEntropy:
      return "entropy";
    case SuggestionMode::kHeuristic:
      return "heuristic";
    case SuggestionMode::kNoCandidates:
      return "no-candidates";
  }
  return "unknown";
}

}  // namespace pythia
