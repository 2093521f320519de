#include "Solver.hpp"

#include <algorithm>
#include <sstream>

#if defined(PYTHIA_USE_HWY)
#include "hwy/highway.h"
#endif

namespace pythia {
namespace {

std::array<int, kAlphabet> CountLetters(std::string_view word) {
  std::array<int, kAlphabet> counts{};
  counts.fill(0);
  for (char c : word) {
    counts[c - 'a']++;
  }
  return counts;
}

int CountOf(const std::array<int, kAlphabet>& counts, char letter) {
  return letter >= 'a' && letter <= 'z' ? counts[letter - 'a'] : 0;
}

#if defined(PYTHIA_USE_HWY)
constexpr int kLetterBits = 5;
constexpr uint32_t kLetterMask = 0x1F;

// Keeps the indices of words whose letters at the green positions match.
std::vector<size_t> GreenPrefilter(const std::vector<std::string>& words,
                                   const WordConstraints& constraints) {
  namespace hn = hwy::HWY_NAMESPACE;

  uint32_t green_mask = 0;
  uint32_t green_bits = 0;
  for (const auto& [position, letter] : constraints.correct_positions) {
    green_mask |= kLetterMask << (position * kLetterBits);
    green_bits |= (static_cast<uint32_t>(letter - 'a') & kLetterMask)
                  << (position * kLetterBits);
  }

  std::vector<size_t> kept;
  kept.reserve(words.size());
  const hn::ScalableTag<uint32_t> d;
  const size_t lanes = hn::Lanes(d);
  std::vector<uint32_t> packed(lanes);
  std::vector<uint32_t> pass(lanes);

  size_t offset = 0;
  while (offset < words.size()) {
    size_t batch = 0;
    for (; batch < lanes && (offset + batch) < words.size(); ++batch) {
      const std::string& word = words[offset + batch];
      packed[batch] = PatternCodec::IsValidWord(word)
                          ? PatternCodec::EncodeWord(word).letters
                          : ~green_bits;
    }
    for (size_t lane = batch; lane < lanes; ++lane) {
      packed[lane] = ~green_bits;
    }

    auto v = hn::LoadU(d, packed.data());
    auto masked = hn::And(v, hn::Set(d, green_mask));
    auto cmp = hn::Eq(masked, hn::Set(d, green_bits));
    auto pass_vec = hn::IfThenElse(cmp, hn::Set(d, 1u), hn::Zero(d));
    hn::StoreU(pass_vec, d, pass.data());

    for (size_t lane = 0; lane < batch; ++lane) {
      if (pass[lane] != 0) {
        kept.push_back(offset + lane);
      }
    }
    offset += lanes;
  }
  return kept;
}
#endif

}  // namespace

bool WordConstraints::empty() const {
  return correct_positions.empty() && present_letters.empty() &&
         absent_letters.empty() && wrong_positions.empty() &&
         min_letter_count.empty() && exact_letter_counts.empty();
}

WordConstraints ConstraintBuilder::Build(
    const std::vector<GuessResult>& guesses) {
  WordConstraints constraints;

  for (const auto& guess : guesses) {
    if (!IsWellFormed(guess)) {
      continue;
    }
    std::array<int, kAlphabet> counts_in_guess{};
    counts_in_guess.fill(0);
    std::set<char> absent_in_guess;

    for (const auto& clue : guess.clues) {
      switch (clue.clue) {
        case Clue::kCorrect:
          constraints.correct_positions[clue.position] = clue.letter;
          constraints.present_letters.insert(clue.letter);
          counts_in_guess[clue.letter - 'a']++;
          break;
        case Clue::kPresent:
          constraints.present_letters.insert(clue.letter);
          constraints.wrong_positions[clue.letter].insert(clue.position);
          counts_in_guess[clue.letter - 'a']++;
          break;
        case Clue::kAbsent:
          absent_in_guess.insert(clue.letter);
          break;
      }
    }

    // Each guess is an independent lower bound, so take the max.
    for (int i = 0; i < kAlphabet; ++i) {
      if (counts_in_guess[i] == 0) {
        continue;
      }
      char letter = static_cast<char>('a' + i);
      int& current = constraints.min_letter_count[letter];
      current = std::max(current, counts_in_guess[i]);
    }

    // A gray copy next to a green/yellow copy pins the exact count.
    for (char letter : absent_in_guess) {
      int matched = counts_in_guess[letter - 'a'];
      if (matched > 0) {
        constraints.exact_letter_counts[letter] = matched;
      } else {
        constraints.absent_letters.insert(letter);
      }
    }
  }

  return constraints;
}

std::string ConstraintBuilder::Summarize(const WordConstraints& constraints) {
  std::vector<std::string> parts;

  auto join = [](const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += items[i];
    }
    return out;
  };

  if (!constraints.correct_positions.empty()) {
    std::vector<std::string> items;
    for (const auto& [position, letter] : constraints.correct_positions) {
      items.push_back(std::string(1, letter) + "@" + std::to_string(position));
    }
    parts.push_back("Correct: " + join(items));
  }
  if (!constraints.present_letters.empty()) {
    std::vector<std::string> items;
    for (char letter : constraints.present_letters) {
      items.emplace_back(1, letter);
    }
    parts.push_back("Present: " + join(items));
  }
  if (!constraints.absent_letters.empty()) {
    std::vector<std::string> items;
    for (char letter : constraints.absent_letters) {
      items.emplace_back(1, letter);
    }
    parts.push_back("Absent: " + join(items));
  }
  if (!constraints.min_letter_count.empty()) {
    std::vector<std::string> items;
    for (const auto& [letter, count] : constraints.min_letter_count) {
      items.push_back(std::string(1, letter) + ">=" + std::to_string(count));
    }
    parts.push_back("Min counts: " + join(items));
  }
  if (!constraints.exact_letter_counts.empty()) {
    std::vector<std::string> items;
    for (const auto& [letter, count] : constraints.exact_letter_counts) {
      items.push_back(std::string(1, letter) + "=" + std::to_string(count));
    }
    parts.push_back("Exact counts: " + join(items));
  }

  if (parts.empty()) {
    return "No constraints";
  }
  std::ostringstream out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out << " | ";
    }
    out << parts[i];
  }
  return out.str();
}

bool WordFilter::Matches(std::string_view word,
                         const WordConstraints& constraints) {
  if (!PatternCodec::IsValidWord(word)) {
    return false;
  }

  for (const auto& [position, letter] : constraints.correct_positions) {
    if (position < 0 || position >= kWordLen || word[position] != letter) {
      return false;
    }
  }

  for (char letter : constraints.present_letters) {
    if (word.find(letter) == std::string_view::npos) {
      return false;
    }
  }

  for (char letter : constraints.absent_letters) {
    if (constraints.exact_letter_counts.count(letter) > 0) {
      continue;
    }
    if (word.find(letter) != std::string_view::npos) {
      return false;
    }
  }

  for (const auto& [letter, positions] : constraints.wrong_positions) {
    for (int position : positions) {
      if (position >= 0 && position < kWordLen && word[position] == letter) {
        return false;
      }
    }
  }

  std::array<int, kAlphabet> counts = CountLetters(word);

  for (const auto& [letter, min_count] : constraints.min_letter_count) {
    if (constraints.exact_letter_counts.count(letter) > 0) {
      continue;
    }
    if (CountOf(counts, letter) < min_count) {
      return false;
    }
  }

  for (const auto& [letter, exact_count] : constraints.exact_letter_counts) {
    if (CountOf(counts, letter) != exact_count) {
      return false;
    }
  }

  return true;
}

std::vector<std::string> WordFilter::Filter(
    const std::vector<std::string>& words,
    const WordConstraints& constraints) {
  std::vector<std::string> out;
  if (words.empty()) {
    return out;
  }

#if defined(PYTHIA_USE_HWY)
  if (!constraints.correct_positions.empty()) {
    for (size_t index : GreenPrefilter(words, constraints)) {
      if (Matches(words[index], constraints)) {
        out.push_back(words[index]);
      }
    }
    return out;
  }
#endif

  for (const auto& word : words) {
    if (Matches(word, constraints)) {
      out.push_back(word);
    }
  }
  return out;
}

std::vector<std::string> WordFilter::FilterWithFallback(
    const std::vector<std::string>& primary,
    const std::vector<std::string>& fallback,
    const WordConstraints& constraints,
    bool* used_fallback) {
  std::vector<std::string> remaining = Filter(primary, constraints);
  bool broadened = false;
  if (remaining.empty()) {
    remaining = Filter(fallback, constraints);
    broadened = true;
  }
  if (used_fallback) {
    *used_fallback = broadened;
  }
  return remaining;
}

}  // namespace pythia
