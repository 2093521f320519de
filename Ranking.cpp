#include "Solver.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <atomic>
#include <cmath>

namespace pythia {
namespace {
constexpr size_t kDistributionSamples = 5;
constexpr double kCompareEpsilon = 0.001;

void SortAndTruncate(std::vector<WordSuggestion>* suggestions, size_t limit) {
  std::stable_sort(suggestions->begin(), suggestions->end(),
                   [](const WordSuggestion& a, const WordSuggestion& b) {
                     return a.entropy > b.entropy;
                   });
  if (limit > 0 && suggestions->size() > limit) {
    suggestions->resize(limit);
  }
}

}  // namespace

std::vector<PackedWord> EntropyRanker::PackAll(
    const std::vector<std::string>& words) {
  std::vector<PackedWord> packed;
  packed.reserve(words.size());
  for (const auto& word : words) {
    if (PatternCodec::IsValidWord(word)) {
      packed.push_back(PatternCodec::EncodeWord(word));
    }
  }
  return packed;
}

std::array<int, kPatternCount> EntropyRanker::PatternCounts(
    const PackedWord& guess,
    const std::vector<PackedWord>& pool) {
  std::array<int, kPatternCount> counts{};
  counts.fill(0);
  for (const PackedWord& answer : pool) {
    counts[PatternCodec::Pattern(guess, answer)]++;
  }
  return counts;
}

double EntropyRanker::EntropyFromCounts(
    const std::array<int, kPatternCount>& counts,
    size_t total) {
  if (total <= 1) {
    return 0.0;
  }
  double entropy = 0.0;
  const double inv_total = 1.0 / static_cast<double>(total);
  for (int count : counts) {
    if (count == 0) {
      continue;
    }
    double p = count * inv_total;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

double EntropyRanker::ExpectedFromCounts(
    const std::array<int, kPatternCount>& counts,
    size_t total) {
  if (total == 0) {
    return 0.0;
  }
  double expected = 0.0;
  const double inv_total = 1.0 / static_cast<double>(total);
  for (int count : counts) {
    if (count == 0) {
      continue;
    }
    expected += count * inv_total * count;
  }
  return expected;
}

std::vector<WordSuggestion> EntropyRanker::Rank(
    const std::vector<std::string>& candidates,
    const std::vector<std::string>& pool,
    size_t limit) {
  std::vector<WordSuggestion> out;
  Rank(candidates, pool, limit, 0, nullptr, &out);
  return out;
}

bool EntropyRanker::Rank(const std::vector<std::string>& candidates,
                         const std::vector<std::string>& pool,
                         size_t limit,
                         size_t progress_interval,
                         const ProgressCallback& progress,
                         std::vector<WordSuggestion>* out) {
  if (!out) {
    return false;
  }
  out->clear();

  const std::vector<PackedWord> packed_pool = PackAll(pool);
  if (packed_pool.empty()) {
    return true;
  }
  if (packed_pool.size() == 1) {
    WordSuggestion only;
    only.word = *std::find_if(pool.begin(), pool.end(),
                              [](const std::string& word) {
                                return PatternCodec::IsValidWord(word);
                              });
    only.entropy = 0.0;
    only.remaining_words = 1.0;
    out->push_back(std::move(only));
    return true;
  }

  const size_t total = candidates.size();
  const size_t n = packed_pool.size();
  const size_t interval = progress_interval == 0 ? 100 : progress_interval;
  std::vector<WordSuggestion> scored(total);
  std::vector<char> valid(total, 0);
  std::atomic<size_t> processed{0};
  std::atomic<bool> aborted{false};

#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic, 16)
#endif
  for (size_t i = 0; i < total; ++i) {
    if (aborted.load(std::memory_order_relaxed)) {
      continue;
    }
    const std::string& word = candidates[i];
    if (PatternCodec::IsValidWord(word)) {
      auto counts = PatternCounts(PatternCodec::EncodeWord(word), packed_pool);
      scored[i].word = word;
      scored[i].entropy = EntropyFromCounts(counts, n);
      scored[i].remaining_words = ExpectedFromCounts(counts, n);
      valid[i] = 1;
    }

    size_t done = processed.fetch_add(1) + 1;
    if (progress && done % interval == 0 && done != total) {
#ifdef _OPENMP
#pragma omp critical(pythia_progress)
#endif
      {
        if (!progress(done, total)) {
          aborted.store(true);
        }
      }
    }
  }

  if (!aborted.load() && progress && !progress(total, total)) {
    aborted.store(true);
  }
  if (aborted.load()) {
    return false;
  }

  out->reserve(total);
  for (size_t i = 0; i < total; ++i) {
    if (valid[i]) {
      out->push_back(std::move(scored[i]));
    }
  }
  SortAndTruncate(out, limit);
  return true;
}

double EntropyRanker::Entropy(std::string_view word,
                              const std::vector<std::string>& pool) {
  if (!PatternCodec::IsValidWord(word)) {
    return 0.0;
  }
  std::vector<PackedWord> packed_pool = PackAll(pool);
  auto counts = PatternCounts(PatternCodec::EncodeWord(word), packed_pool);
  return EntropyFromCounts(counts, packed_pool.size());
}

double EntropyRanker::ExpectedRemaining(std::string_view word,
                                        const std::vector<std::string>& pool) {
  if (!PatternCodec::IsValidWord(word)) {
    return 0.0;
  }
  std::vector<PackedWord> packed_pool = PackAll(pool);
  auto counts = PatternCounts(PatternCodec::EncodeWord(word), packed_pool);
  return ExpectedFromCounts(counts, packed_pool.size());
}

std::map<int, EntropyRanker::Bucket> EntropyRanker::Distribution(
    std::string_view word,
    const std::vector<std::string>& pool) {
  std::map<int, Bucket> buckets;
  if (!PatternCodec::IsValidWord(word)) {
    return buckets;
  }
  const PackedWord guess = PatternCodec::EncodeWord(word);
  size_t total = 0;
  for (const auto& answer : pool) {
    if (!PatternCodec::IsValidWord(answer)) {
      continue;
    }
    Bucket& bucket =
        buckets[PatternCodec::Pattern(guess, PatternCodec::EncodeWord(answer))];
    bucket.count++;
    if (bucket.samples.size() < kDistributionSamples) {
      bucket.samples.push_back(answer);
    }
    ++total;
  }
  for (auto& entry : buckets) {
    entry.second.percentage =
        100.0 * static_cast<double>(entry.second.count) /
        static_cast<double>(total);
  }
  return buckets;
}

std::string EntropyRanker::BestGuess(
    const std::vector<std::string>& candidates,
    const std::vector<std::string>& pool) {
  if (candidates.empty()) {
    return {};
  }
  if (pool.size() == 1) {
    return pool.front();
  }
  std::vector<WordSuggestion> ranked = Rank(candidates, pool, 1);
  if (ranked.empty()) {
    return {};
  }
  return ranked.front().word;
}

double EntropyRanker::InformationGain(double entropy, size_t pool_size) {
  if (pool_size <= 1) {
    return 100.0;
  }
  return entropy / std::log2(static_cast<double>(pool_size)) * 100.0;
}

int EntropyRanker::Compare(std::string_view a,
                           std::string_view b,
                           const std::vector<std::string>& pool) {
  double entropy_a = Entropy(a, pool);
  double entropy_b = Entropy(b, pool);
  if (std::fabs(entropy_a - entropy_b) < kCompareEpsilon) {
    return 0;
  }
  return entropy_a > entropy_b ? 1 : -1;
}

Eigen::MatrixXd HeuristicRanker::PresenceMatrix(
    const std::vector<std::string>& words) {
  Eigen::MatrixXd presence =
      Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(words.size()), kAlphabet);
  for (size_t i = 0; i < words.size(); ++i) {
    if (!PatternCodec::IsValidWord(words[i])) {
      continue;
    }
    for (char c : words[i]) {
      presence(static_cast<Eigen::Index>(i), c - 'a') = 1.0;
    }
  }
  return presence;
}

Eigen::VectorXd HeuristicRanker::LetterFrequencies(
    const std::vector<std::string>& pool) {
  if (pool.empty()) {
    return Eigen::VectorXd::Zero(kAlphabet);
  }
  return PresenceMatrix(pool).colwise().mean().transpose();
}

double HeuristicRanker::Score(std::string_view word,
                              const std::vector<std::string>& pool) {
  if (!PatternCodec::IsValidWord(word)) {
    return 0.0;
  }
  Eigen::MatrixXd row = PresenceMatrix({std::string(word)});
  return (row * LetterFrequencies(pool))(0);
}

std::vector<WordSuggestion> HeuristicRanker::Rank(
    const std::vector<std::string>& candidates,
    const std::vector<std::string>& pool,
    size_t limit) {
  std::vector<WordSuggestion> out;
  Rank(candidates, pool, limit, 0, nullptr, &out);
  return out;
}

bool HeuristicRanker::Rank(const std::vector<std::string>& candidates,
                           const std::vector<std::string>& pool,
                           size_t limit,
                           size_t progress_interval,
                           const ProgressCallback& progress,
                           std::vector<WordSuggestion>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  if (pool.empty()) {
    return true;
  }

  const Eigen::VectorXd frequencies = LetterFrequencies(pool);
  const size_t total = candidates.size();
  const size_t interval = progress_interval == 0 ? 100 : progress_interval;
  std::vector<WordSuggestion> scored;
  scored.reserve(total);

  for (size_t begin = 0; begin < total; begin += interval) {
    const size_t end = std::min(total, begin + interval);
    std::vector<std::string> chunk;
    chunk.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      if (PatternCodec::IsValidWord(candidates[i])) {
        chunk.push_back(candidates[i]);
      }
    }
    const Eigen::VectorXd scores = PresenceMatrix(chunk) * frequencies;
    for (size_t i = 0; i < chunk.size(); ++i) {
      WordSuggestion suggestion;
      suggestion.word = std::move(chunk[i]);
      suggestion.entropy = scores(static_cast<Eigen::Index>(i));
      scored.push_back(std::move(suggestion));
    }
    if (progress && end != total && !progress(end, total)) {
      return false;
    }
  }

  if (progress && !progress(total, total)) {
    return false;
  }
  *out = std::move(scored);
  SortAndTruncate(out, limit);
  return true;
}

}  // namespace pythia
