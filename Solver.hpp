#pragma once

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pythia {

constexpr int kWordLen = 5;
constexpr int kAlphabet = 26;
constexpr int kPatternCount = 243;
constexpr int kSolvedPattern = 242;

enum class Clue : uint8_t {
  kAbsent = 0,
  kPresent = 1,
  kCorrect = 2,
};

struct LetterClue {
  char letter = 'a';
  int position = 0;
  Clue clue = Clue::kAbsent;
};

// One accepted guess. clues[i].position == i.
struct GuessResult {
  std::string word;
  std::array<LetterClue, kWordLen> clues{};
};

struct PackedWord {
  uint32_t letters = 0;
  uint32_t mask = 0;
};

// Everything learned from a guess history. Rebuilt from scratch for every
// filtering pass. A letter with an exact count ignores the min-count and
// absent checks.
struct WordConstraints {
  std::map<int, char> correct_positions;
  std::set<char> present_letters;
  std::set<char> absent_letters;
  std::map<char, std::set<int>> wrong_positions;
  std::map<char, int> min_letter_count;
  std::map<char, int> exact_letter_counts;

  bool empty() const;
};

struct WordSuggestion {
  std::string word;
  double entropy = 0.0;
  std::optional<double> remaining_words;
};

// Tags a suggestion list with how it was produced. Heuristic scores live in
// WordSuggestion::entropy but are not bits.
enum class SuggestionMode {
  kNone,
  kOpeners,
  kSingleCandidate,
  kEntropy,
  kHeuristic,
  kNoCandidates,
};

const char* SuggestionModeName(SuggestionMode mode);

// Called with (processed, total). Returning false aborts the computation.
using ProgressCallback = std::function<bool(size_t, size_t)>;

struct SolverOptions {
  size_t heuristic_threshold = 2000;
  size_t extra_candidates = 100;
  size_t max_candidates = 2000;
  size_t max_suggestions = 20;
  size_t progress_interval = 100;
  int max_guesses = 6;
};

class PatternCodec {
 public:
  static bool IsValidWord(std::string_view word);
  static std::string NormalizeWord(std::string_view word);
  static PackedWord EncodeWord(std::string_view word);

  // Hot path. Both words must already be valid.
  static int Pattern(const PackedWord& guess, const PackedWord& answer);

  // Case-insensitive. Returns false unless both inputs are 5 letters.
  static bool Encode(std::string_view guess,
                     std::string_view answer,
                     int* pattern_out);

  static std::array<int, kWordLen> Decode(int pattern);
  static int FromDigits(const std::array<int, kWordLen>& digits);
  static bool IsWinning(int pattern);
  static int CountCorrect(int pattern);
  static std::string ToString(int pattern);
  static std::string ToSymbols(int pattern);
  static bool Parse(std::string_view text, int* pattern_out);
};

bool MakeGuessResult(std::string_view word,
                     const std::array<Clue, kWordLen>& clues,
                     GuessResult* out);
bool GuessResultFromPattern(std::string_view word,
                            int pattern,
                            GuessResult* out);
int PatternOf(const GuessResult& guess);
// Lowercase word with one clue per position, each naming that position's
// letter.
bool IsWellFormed(const GuessResult& guess);

class ConstraintBuilder {
 public:
  static WordConstraints Build(const std::vector<GuessResult>& guesses);
  static std::string Summarize(const WordConstraints& constraints);
};

class WordFilter {
 public:
  static bool Matches(std::string_view word,
                      const WordConstraints& constraints);
  static std::vector<std::string> Filter(
      const std::vector<std::string>& words,
      const WordConstraints& constraints);

  // Filters `primary`; when that leaves nothing, filters `fallback` instead.
  static std::vector<std::string> FilterWithFallback(
      const std::vector<std::string>& primary,
      const std::vector<std::string>& fallback,
      const WordConstraints& constraints,
      bool* used_fallback);
};

class EntropyRanker {
 public:
  struct Bucket {
    size_t count = 0;
    double percentage = 0.0;
    std::vector<std::string> samples;
  };

  static std::vector<WordSuggestion> Rank(
      const std::vector<std::string>& candidates,
      const std::vector<std::string>& pool,
      size_t limit = 20);
  // Returns false, leaving *out empty, when `progress` aborts.
  static bool Rank(const std::vector<std::string>& candidates,
                   const std::vector<std::string>& pool,
                   size_t limit,
                   size_t progress_interval,
                   const ProgressCallback& progress,
                   std::vector<WordSuggestion>* out);

  static double Entropy(std::string_view word,
                        const std::vector<std::string>& pool);
  static double ExpectedRemaining(std::string_view word,
                                  const std::vector<std::string>& pool);
  static std::map<int, Bucket> Distribution(
      std::string_view word,
      const std::vector<std::string>& pool);
  static std::string BestGuess(const std::vector<std::string>& candidates,
                               const std::vector<std::string>& pool);
  static double InformationGain(double entropy, size_t pool_size);
  static int Compare(std::string_view a,
                     std::string_view b,
                     const std::vector<std::string>& pool);

 private:
  static std::vector<PackedWord> PackAll(
      const std::vector<std::string>& words);
  static std::array<int, kPatternCount> PatternCounts(
      const PackedWord& guess,
      const std::vector<PackedWord>& pool);
  static double EntropyFromCounts(const std::array<int, kPatternCount>& counts,
                                  size_t total);
  static double ExpectedFromCounts(
      const std::array<int, kPatternCount>& counts,
      size_t total);
};

class HeuristicRanker {
 public:
  // Rows are words, columns are letters a-z; 1.0 when the word contains it.
  static Eigen::MatrixXd PresenceMatrix(const std::vector<std::string>& words);
  // Fraction of pool words containing each letter at least once.
  static Eigen::VectorXd LetterFrequencies(
      const std::vector<std::string>& pool);
  static double Score(std::string_view word,
                      const std::vector<std::string>& pool);

  static std::vector<WordSuggestion> Rank(
      const std::vector<std::string>& candidates,
      const std::vector<std::string>& pool,
      size_t limit = 20);
  // Scores in slices of `progress_interval` candidates, reporting after each.
  static bool Rank(const std::vector<std::string>& candidates,
                   const std::vector<std::string>& pool,
                   size_t limit,
                   size_t progress_interval,
                   const ProgressCallback& progress,
                   std::vector<WordSuggestion>* out);
};

class Dictionary {
 public:
  bool Load(const std::string& answers_path,
            const std::string& allowed_path,
            std::string* error);
  void SetWordLists(const std::vector<std::string>& answers,
                    const std::vector<std::string>& allowed);

  const std::vector<std::string>& answers() const { return answers_; }
  const std::vector<std::string>& allowed() const { return allowed_; }
  const std::vector<std::string>& full() const { return full_; }

  bool Contains(std::string_view word) const;
  bool IsPossibleAnswer(std::string_view word) const;
  bool empty() const { return full_.empty(); }

  static bool ReadWordList(const std::string& path,
                           std::vector<std::string>* out);

 private:
  static std::vector<std::string> Clean(const std::vector<std::string>& words);

  std::vector<std::string> answers_;
  std::vector<std::string> allowed_;
  std::vector<std::string> full_;
  std::unordered_set<std::string> full_index_;
  std::unordered_set<std::string> answer_index_;
};

class OpenerTable {
 public:
  static constexpr int kBuiltinVersion = 1;

  static OpenerTable Builtin();
  static OpenerTable Compute(const std::vector<std::string>& answers,
                             size_t count,
                             const ProgressCallback& progress = nullptr);

  bool Load(const std::string& path, std::string* error);
  bool Write(const std::string& path, std::string* error) const;
  std::string Format() const;

  const std::vector<WordSuggestion>& entries() const { return entries_; }
  int version() const { return version_; }

 private:
  std::vector<WordSuggestion> entries_;
  int version_ = kBuiltinVersion;
};

struct SolveResult {
  std::vector<WordSuggestion> suggestions;
  SuggestionMode mode = SuggestionMode::kNone;
  size_t remaining_count = 0;
  size_t candidate_count = 0;
  bool used_fallback = false;
  double elapsed_ms = 0.0;
};

// Composes filtering and ranking. Holds references; the dictionary and the
// opener table must outlive it.
class Solver {
 public:
  Solver(const Dictionary& dictionary,
         const OpenerTable& openers,
         SolverOptions options = SolverOptions());

  bool Solve(const std::vector<GuessResult>& history,
             SolveResult* out,
             const ProgressCallback& progress = nullptr) const;
  bool Suggest(const std::vector<std::string>& remaining,
               SolveResult* out,
               const ProgressCallback& progress = nullptr) const;

  std::vector<std::string> RemainingWords(
      const std::vector<GuessResult>& history,
      bool* used_fallback) const;
  std::vector<std::string> CandidateGuesses(
      const std::vector<std::string>& remaining) const;

  const Dictionary& dictionary() const { return dictionary_; }
  const OpenerTable& openers() const { return openers_; }
  const SolverOptions& options() const { return options_; }

 private:
  const Dictionary& dictionary_;
  const OpenerTable& openers_;
  SolverOptions options_;
};

}  // namespace pythia
