#include "Solver.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace pythia {
namespace {
constexpr char kOpenerHeader[] = "# pythia-openers v";

struct BuiltinOpener {
  const char* word;
  double entropy;
  double remaining;
};

// Published opener table, carried over as-is; "soare" comes from the allowed
// list. --compute-openers ranks answers against answers only, so its output
// differs from this table.
constexpr BuiltinOpener kBuiltinOpeners[] = {
    {"soare", 5.885, 61}, {"raise", 5.878, 61}, {"slate", 5.868, 62},
    {"trace", 5.851, 63}, {"crate", 5.843, 64}, {"irate", 5.821, 65},
    {"stare", 5.819, 65}, {"arose", 5.799, 67}, {"snare", 5.794, 67},
    {"arise", 5.792, 68},
};

double ElapsedMs(std::chrono::high_resolution_clock::time_point start) {
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(end - start).count();
}

}  // namespace

OpenerTable OpenerTable::Builtin() {
  OpenerTable table;
  for (const auto& opener : kBuiltinOpeners) {
    WordSuggestion entry;
    entry.word = opener.word;
    entry.entropy = opener.entropy;
    entry.remaining_words = opener.remaining;
    table.entries_.push_back(std::move(entry));
  }
  table.version_ = kBuiltinVersion;
  return table;
}

OpenerTable OpenerTable::Compute(const std::vector<std::string>& answers,
                                 size_t count,
                                 const ProgressCallback& progress) {
  OpenerTable table;
  table.version_ = kBuiltinVersion;
  EntropyRanker::Rank(answers, answers, count, SolverOptions().progress_interval,
                      progress, &table.entries_);
  return table;
}

std::string OpenerTable::Format() const {
  std::ostringstream out;
  out << kOpenerHeader << version_ << "\n";
  for (const auto& entry : entries_) {
    out << entry.word << " " << std::fixed << std::setprecision(3)
        << entry.entropy << " "
        << std::llround(entry.remaining_words.value_or(0.0)) << "\n";
  }
  return out.str();
}

bool OpenerTable::Write(const std::string& path, std::string* error) const {
  std::ofstream out(path);
  if (!out) {
    if (error) {
      *error = "cannot open opener table for writing: " + path;
    }
    return false;
  }
  out << Format();
  if (!out) {
    if (error) {
      *error = "failed writing opener table: " + path;
    }
    return false;
  }
  return true;
}

bool OpenerTable::Load(const std::string& path, std::string* error) {
  std::ifstream infile(path);
  if (!infile) {
    if (error) {
      *error = "cannot read opener table: " + path;
    }
    return false;
  }

  std::string line;
  if (!std::getline(infile, line) ||
      line.compare(0, sizeof(kOpenerHeader) - 1, kOpenerHeader) != 0) {
    if (error) {
      *error = path + ": missing '" + kOpenerHeader + "N' header";
    }
    return false;
  }
  int version = 0;
  {
    std::istringstream header(line.substr(sizeof(kOpenerHeader) - 1));
    if (!(header >> version) || version <= 0) {
      if (error) {
        *error = path + ": bad opener table version";
      }
      return false;
    }
  }

  std::vector<WordSuggestion> entries;
  size_t line_number = 1;
  while (std::getline(infile, line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::istringstream fields(line);
    std::string word;
    double entropy = 0.0;
    double remaining = 0.0;
    if (!(fields >> word >> entropy >> remaining) ||
        !PatternCodec::IsValidWord(word) || entropy < 0.0 ||
        remaining < 0.0) {
      if (error) {
        *error = path + ":" + std::to_string(line_number) +
                 ": expected 'word entropy remaining'";
      }
      return false;
    }
    WordSuggestion entry;
    entry.word = word;
    entry.entropy = entropy;
    entry.remaining_words = remaining;
    entries.push_back(std::move(entry));
  }

  if (entries.empty()) {
    if (error) {
      *error = path + ": opener table is empty";
    }
    return false;
  }
  entries_ = std::move(entries);
  version_ = version;
  return true;
}

Solver::Solver(const Dictionary& dictionary,
               const OpenerTable& openers,
               SolverOptions options)
    : dictionary_(dictionary), openers_(openers), options_(options) {}

std::vector<std::string> Solver::RemainingWords(
    const std::vector<GuessResult>& history,
    bool* used_fallback) const {
  WordConstraints constraints = ConstraintBuilder::Build(history);
  return WordFilter::FilterWithFallback(dictionary_.answers(),
                                        dictionary_.full(), constraints,
                                        used_fallback);
}

std::vector<std::string> Solver::CandidateGuesses(
    const std::vector<std::string>& remaining) const {
  std::vector<std::string> candidates = remaining;
  std::unordered_set<std::string> seen(remaining.begin(), remaining.end());

  size_t added = 0;
  for (const auto& word : dictionary_.full()) {
    if (added >= options_.extra_candidates) {
      break;
    }
    if (seen.insert(word).second) {
      candidates.push_back(word);
      ++added;
    }
  }

  if (options_.max_candidates > 0 &&
      candidates.size() > options_.max_candidates) {
    candidates.resize(options_.max_candidates);
  }
  return candidates;
}

bool Solver::Suggest(const std::vector<std::string>& remaining,
                     SolveResult* out,
                     const ProgressCallback& progress) const {
  if (!out) {
    return false;
  }
  auto start = std::chrono::high_resolution_clock::now();

  SolveResult result;
  result.remaining_count = remaining.size();

  if (remaining.empty()) {
    result.mode = SuggestionMode::kNoCandidates;
  } else if (remaining.size() == 1) {
    WordSuggestion only;
    only.word = remaining.front();
    only.entropy = 0.0;
    only.remaining_words = 1.0;
    result.suggestions.push_back(std::move(only));
    result.mode = SuggestionMode::kSingleCandidate;
    result.candidate_count = 1;
  } else if (remaining.size() > options_.heuristic_threshold) {
    // The pool itself dominates the cost; no candidate expansion.
    result.candidate_count = remaining.size();
    if (!HeuristicRanker::Rank(remaining, remaining, options_.max_suggestions,
                               options_.progress_interval, progress,
                               &result.suggestions)) {
      return false;
    }
    result.mode = SuggestionMode::kHeuristic;
  } else {
    std::vector<std::string> candidates = CandidateGuesses(remaining);
    result.candidate_count = candidates.size();
    if (!EntropyRanker::Rank(candidates, remaining, options_.max_suggestions,
                             options_.progress_interval, progress,
                             &result.suggestions)) {
      return false;
    }
    result.mode = SuggestionMode::kEntropy;
  }

  result.elapsed_ms = ElapsedMs(start);
  *out = std::move(result);
  return true;
}

bool Solver::Solve(const std::vector<GuessResult>& history,
                   SolveResult* out,
                   const ProgressCallback& progress) const {
  if (!out) {
    return false;
  }
  if (history.empty()) {
    SolveResult result;
    result.suggestions = openers_.entries();
    result.mode = SuggestionMode::kOpeners;
    result.remaining_count = dictionary_.answers().size();
    result.candidate_count = result.suggestions.size();
    *out = std::move(result);
    return true;
  }
  for (const auto& guess : history) {
    if (!IsWellFormed(guess)) {
      return false;
    }
  }

  auto start = std::chrono::high_resolution_clock::now();
  bool used_fallback = false;
  std::vector<std::string> remaining = RemainingWords(history, &used_fallback);
  if (!Suggest(remaining, out, progress)) {
    return false;
  }
  out->used_fallback = used_fallback;
  out->elapsed_ms = ElapsedMs(start);
  return true;
}

}  // namespace pythia
