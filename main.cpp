#include "Session.hpp"
#include "Solver.hpp"

#include <chrono>
#include <cmath>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {
struct Config {
  std::string answers_path;
  std::string allowed_path;
  std::string target;
  int max_steps = 6;
  bool interactive = false;
  bool profile = false;
  std::string openers_path;
  bool compute_openers = false;
  std::string write_openers_path;
  size_t opener_count = 10;
  pythia::SolverOptions options;
};

constexpr char kFallbackWarning[] =
    "Warning: answer not in the curated answer list; searching the full "
    "dictionary.\n";

void PrintUsage(const char* argv0) {
  std::cout
      << "Pythia: Wordle entropy solver\n"
      << "Usage:\n"
      << "  " << argv0 << " --answers ANSWERS.txt --allowed ALLOWED.txt\n"
      << "  " << argv0
      << " --answers ANSWERS.txt --allowed ALLOWED.txt --target CRANE\n"
      << "  " << argv0
      << " --answers ANSWERS.txt --allowed ALLOWED.txt --interactive\n"
      << "  " << argv0
      << " --answers ANSWERS.txt --allowed ALLOWED.txt --compute-openers "
         "[--write-openers PATH]\n"
      << "Options:\n"
      << "  --answers PATH             Curated answer list (words or JSON array)\n"
      << "  --allowed PATH             Additional allowed guesses\n"
      << "  --target WORD              Auto-play against WORD\n"
      << "  --interactive              Play with feedback typed at the prompt\n"
      << "  --max-steps N              Guesses per game (default 6)\n"
      << "  --openers PATH             Load an opener table instead of the "
         "built-in one\n"
      << "  --compute-openers          Rank openers over the answer list\n"
      << "  --write-openers PATH       Save computed openers to PATH\n"
      << "  --heuristic-threshold N    Pool size above which letter frequency "
         "is used (default 2000)\n"
      << "  --extra-candidates N       Non-pool guesses to consider (default "
         "100)\n"
      << "  --max-candidates N         Cap on candidates ranked (default 2000, "
         "0 = no cap)\n"
      << "  --top N                    Suggestions to show (default 20)\n"
      << "  --profile                  Print filter and ranking timings\n"
      << "  --help                     Show this message\n";
}

std::string ToUpperAscii(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string TrimWhitespace(const std::string& input) {
  size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    ++start;
  }
  size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(start, end - start);
}

bool ParseCount(const char* text, size_t* out) {
  std::istringstream in(text);
  long long value = 0;
  if (!(in >> value) || value < 0) {
    return false;
  }
  *out = static_cast<size_t>(value);
  return true;
}

std::array<pythia::Clue, pythia::kWordLen> CluesFromPattern(int pattern) {
  std::array<int, pythia::kWordLen> digits = pythia::PatternCodec::Decode(pattern);
  std::array<pythia::Clue, pythia::kWordLen> clues{};
  for (int i = 0; i < pythia::kWordLen; ++i) {
    clues[i] = static_cast<pythia::Clue>(digits[i]);
  }
  return clues;
}

void PrintInteractiveHelp() {
  std::cout
      << "Interactive commands:\n"
      << "  GUESS PATTERN   Guess and feedback (01220, bygg., -y-GG)\n"
      << "  PATTERN         Feedback for the top suggestion\n"
      << "  GUESS           (with --target) Feedback is computed for you\n"
      << "  [Enter]         (with --target) Play the top suggestion\n"
      << "  hint            Describe the remaining pool\n"
      << "  history         Show guesses so far\n"
      << "  reset           Start a new game\n"
      << "  help or ?       Show this help\n"
      << "  quit or exit    Leave interactive mode\n";
}

void PrintColoredPattern(const std::string& guess, int pattern) {
  const char* colors[] = {"\x1b[90m", "\x1b[33m", "\x1b[32m"};
  const char* reset = "\x1b[0m";
  std::string display = ToUpperAscii(guess);
  std::array<int, pythia::kWordLen> digits =
      pythia::PatternCodec::Decode(pattern);
  std::cout << "Feedback: ";
  for (int i = 0; i < pythia::kWordLen; ++i) {
    std::cout << colors[digits[i]] << display[i] << reset;
  }
  std::cout << "\n";
}

void PrintEntropyBar(size_t remaining, size_t total) {
  if (total == 0) {
    return;
  }
  constexpr int kBarWidth = 20;
  double ratio = static_cast<double>(remaining) / static_cast<double>(total);
  int filled = static_cast<int>(std::round(ratio * kBarWidth));
  if (filled > kBarWidth) {
    filled = kBarWidth;
  }
  if (filled < 0) {
    filled = 0;
  }
  std::cout << "Uncertainty: [";
  for (int i = 0; i < kBarWidth; ++i) {
    std::cout << (i < filled ? '#' : '.');
  }
  std::cout << "] " << std::fixed << std::setprecision(1) << ratio * 100.0
            << "% remaining\n";
}

void PrintProgressLine(const char* label, double percent) {
  constexpr int kBarWidth = 30;
  int filled = static_cast<int>(std::round(percent / 100.0 * kBarWidth));
  std::cerr << "\r" << label << " [";
  for (int i = 0; i < kBarWidth; ++i) {
    std::cerr << (i < filled ? '=' : ' ');
  }
  std::cerr << "] " << std::fixed << std::setprecision(0) << percent << "%"
            << std::flush;
}

void PrintSuggestions(const std::vector<pythia::WordSuggestion>& suggestions,
                      pythia::SuggestionMode mode,
                      size_t limit) {
  if (suggestions.empty()) {
    std::cout << "No suggestions (" << pythia::SuggestionModeName(mode)
              << ").\n";
    return;
  }
  const bool bits = mode != pythia::SuggestionMode::kHeuristic;
  std::cout << "Suggestions (" << pythia::SuggestionModeName(mode) << "):\n";
  for (size_t i = 0; i < suggestions.size() && i < limit; ++i) {
    const auto& s = suggestions[i];
    std::cout << "  " << std::setw(2) << (i + 1) << ". "
              << ToUpperAscii(s.word) << "  " << (bits ? "entropy=" : "score=")
              << std::fixed << std::setprecision(3) << s.entropy;
    if (s.remaining_words) {
      std::cout << "  expected=" << std::llround(*s.remaining_words);
    }
    std::cout << "\n";
  }
}

int64_t MicrosSince(std::chrono::high_resolution_clock::time_point start) {
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(end - start)
      .count();
}

void PrintPruning(size_t before, size_t after) {
  double pruned = static_cast<double>(before - after);
  double pruned_pct =
      before > 0 ? (pruned / static_cast<double>(before)) * 100.0 : 0.0;
  std::cout << "Optimization Summary: pruned " << before << " -> " << after
            << " (" << std::fixed << std::setprecision(1) << pruned_pct
            << "%)\n";
}

int RunComputeOpeners(const Config& config,
                      const pythia::Dictionary& dictionary) {
  auto start = std::chrono::high_resolution_clock::now();
  pythia::OpenerTable table = pythia::OpenerTable::Compute(
      dictionary.answers(), config.opener_count,
      [](size_t processed, size_t total) {
        PrintProgressLine("Ranking openers",
                          100.0 * static_cast<double>(processed) /
                              static_cast<double>(total));
        return true;
      });
  std::cerr << "\n";
  std::cout << table.Format();
  if (config.profile) {
    std::cout << "Total latency: " << MicrosSince(start) << "us\n";
  }
  if (!config.write_openers_path.empty()) {
    std::string error;
    if (!table.Write(config.write_openers_path, &error)) {
      std::cerr << error << "\n";
      return 1;
    }
    std::cout << "Wrote " << config.write_openers_path << "\n";
  }
  return 0;
}

int RunAutoPlay(const Config& config, const pythia::Solver& solver) {
  const pythia::Dictionary& dictionary = solver.dictionary();
  if (!dictionary.Contains(config.target)) {
    std::cerr << "Target is not in the dictionary: " << config.target << "\n";
    return 1;
  }
  pythia::GameSession session(dictionary, config.max_steps);
  const size_t initial_count = dictionary.answers().size();
  auto game_start = std::chrono::high_resolution_clock::now();

  std::cout << "\n[Pythia] Answers: " << dictionary.answers().size()
            << "  Dictionary: " << dictionary.full().size() << "\n";
  std::cout << "Target: " << config.target << "\n";
  std::cout << "Solution path:\n";

  bool warned = false;
  while (!session.is_complete()) {
    auto rank_start = std::chrono::high_resolution_clock::now();
    pythia::SolveResult result;
    bool ok = session.state().guesses.empty()
                  ? solver.Solve(session.state().guesses, &result)
                  : solver.Suggest(session.state().remaining_words, &result);
    int64_t rank_us = MicrosSince(rank_start);
    if (!ok || result.suggestions.empty()) {
      std::cerr << "No suggestion available.\n";
      return 1;
    }

    // The top suggestion may already have been played when the pool fell
    // back to the full dictionary.
    std::string guess;
    for (const auto& s : result.suggestions) {
      if (session.Validate(s.word) == pythia::GuessRejection::kNone) {
        guess = s.word;
        break;
      }
    }
    if (guess.empty()) {
      std::cerr << "Every suggestion was rejected.\n";
      return 1;
    }

    int pattern = 0;
    if (!pythia::PatternCodec::Encode(guess, config.target, &pattern)) {
      std::cerr << "Cannot score guess: " << guess << "\n";
      return 1;
    }
    size_t before = session.state().remaining_words.size();
    auto filter_start = std::chrono::high_resolution_clock::now();
    pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
    if (!session.AddGuess(guess, CluesFromPattern(pattern), &rejection)) {
      std::cerr << "Guess rejected: " << pythia::RejectionMessage(rejection)
                << "\n";
      return 1;
    }
    int64_t filter_us = MicrosSince(filter_start);
    size_t after = session.state().remaining_words.size();

    if (session.used_fallback() && !warned) {
      std::cerr << kFallbackWarning;
      warned = true;
    }
    const pythia::WordSuggestion& top = result.suggestions.front();
    std::cout << "  Step " << session.state().guesses.size()
              << ": guess=" << guess
              << " pattern=" << pythia::PatternCodec::ToString(pattern)
              << " mode=" << pythia::SuggestionModeName(result.mode)
              << " score=" << std::fixed << std::setprecision(4)
              << (top.word == guess ? top.entropy : 0.0)
              << " remaining=" << before << " -> " << after << "\n";
    if (config.profile) {
      std::cout << "    Perf: rank=" << rank_us << "us filter=" << filter_us
                << "us candidates=" << result.candidate_count << "\n";
      std::cout << "    ";
      PrintPruning(before, after);
    }
  }

  std::cout << session.FormatHistory() << "\n";
  std::cout << session.StatusMessage() << "\n";
  PrintEntropyBar(session.state().remaining_words.size(), initial_count);
  std::cout << "Total latency: " << MicrosSince(game_start) << "us\n";
  return session.status() == pythia::GameStatus::kWon ? 0 : 2;
}

// Drives the controller until the background ranking resolves, drawing a
// progress bar on stderr.
void AwaitSuggestions(pythia::SuggestionController* controller) {
  while (!controller->Poll()) {
    PrintProgressLine("Ranking", controller->progress());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  PrintProgressLine("Ranking", controller->progress());
  std::cerr << "\n";
}

int RunInteractive(const Config& config, const pythia::Solver& solver) {
  const pythia::Dictionary& dictionary = solver.dictionary();
  pythia::SuggestionController controller(solver);
  const size_t initial_count = dictionary.answers().size();
  const bool auto_pattern = !config.target.empty();
  bool warned = false;

  std::cout << "\n[Pythia Interactive]\n";
  if (auto_pattern) {
    std::cout << "Auto feedback enabled.\n";
  }
  std::cout << "Type '?' for help.\n";

  while (true) {
    const pythia::GameSession& session = controller.session();
    if (session.is_complete()) {
      std::cout << session.FormatHistory() << "\n";
      std::cout << session.StatusMessage() << "\n";
      if (session.state().solution) {
        std::cout << "Solution: " << ToUpperAscii(*session.state().solution)
                  << "\n";
      }
      std::cout << "Type 'reset' for a new game or 'quit' to leave.\n";
    } else {
      // Hints, history and rejected input keep the current list.
      if (controller.NeedsSuggestions()) {
        pythia::RequestStatus status = controller.RequestSuggestions();
        if (status == pythia::RequestStatus::kStarted) {
          AwaitSuggestions(&controller);
        }
      }
      if (controller.compute_state() == pythia::ComputeState::kFailed) {
        std::cerr << "Ranking failed: " << controller.last_error() << "\n";
      } else {
        PrintSuggestions(controller.suggestions(), controller.mode(),
                         solver.options().max_suggestions);
        if (config.profile) {
          std::cout << "Compute latency: " << std::fixed
                    << std::setprecision(1) << controller.elapsed_ms()
                    << "ms\n";
        }
      }
      std::cout << "Round " << (session.state().guesses.size() + 1) << " of "
                << session.max_guesses() << "  ("
                << session.StatusMessage() << ")\n";
      std::cout << "Remaining possibilities: "
                << session.state().remaining_words.size() << "\n";
      PrintEntropyBar(session.state().remaining_words.size(), initial_count);
      std::cout << (auto_pattern ? "Enter guess (or press Enter): "
                                 : "Enter guess and pattern: ");
    }

    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    line = TrimWhitespace(line);

    if (line == "help" || line == "?") {
      PrintInteractiveHelp();
      continue;
    }
    if (line == "quit" || line == "exit") {
      break;
    }
    if (line == "reset") {
      controller.Reset();
      warned = false;
      continue;
    }
    if (line == "hint") {
      std::cout << session.Hint() << "\n";
      continue;
    }
    if (line == "history") {
      std::cout << session.FormatHistory() << "\n";
      continue;
    }
    if (session.is_complete()) {
      continue;
    }

    const std::string top =
        controller.suggestions().empty() ? "" : controller.suggestions()[0].word;
    std::string guess;
    std::string pattern_text;
    std::istringstream iss(line);
    std::string first;
    std::string second;
    iss >> first >> second;
    int pattern = 0;
    if (auto_pattern) {
      guess = first.empty() ? top : first;
    } else if (second.empty() && pythia::PatternCodec::Parse(first, &pattern)) {
      guess = top;
      pattern_text = first;
    } else {
      guess = first;
      pattern_text = second;
    }
    if (guess.empty()) {
      std::cout << "Expected a guess.\n";
      continue;
    }

    pythia::GuessRejection rejection = controller.session().Validate(guess);
    if (rejection != pythia::GuessRejection::kNone) {
      std::cout << pythia::RejectionMessage(rejection) << ": " << guess
                << "\n";
      continue;
    }
    if (auto_pattern) {
      if (!pythia::PatternCodec::Encode(guess, config.target, &pattern)) {
        std::cout << "Cannot score guess: " << guess << "\n";
        continue;
      }
    } else if (!pythia::PatternCodec::Parse(pattern_text, &pattern)) {
      std::cout << "Invalid pattern: " << pattern_text
                << " (use 0/1/2 or b/y/g)\n";
      continue;
    }

    size_t before = session.state().remaining_words.size();
    auto filter_start = std::chrono::high_resolution_clock::now();
    if (!controller.SubmitGuess(guess, CluesFromPattern(pattern),
                                &rejection)) {
      std::cout << pythia::RejectionMessage(rejection) << "\n";
      continue;
    }
    int64_t filter_us = MicrosSince(filter_start);
    const pythia::GameSession& updated = controller.session();
    size_t after = updated.state().remaining_words.size();

    PrintColoredPattern(guess, pattern);
    if (updated.used_fallback() && !warned) {
      std::cerr << kFallbackWarning;
      warned = true;
    }
    double info_bits = 0.0;
    if (before > 0 && after > 0 && after <= before) {
      info_bits = -std::log2(static_cast<double>(after) /
                             static_cast<double>(before));
    }
    std::cout << "Information gained: " << std::fixed << std::setprecision(4)
              << info_bits << " bits\n";
    if (config.profile) {
      std::cout << "Perf: filter=" << filter_us << "us\n";
      PrintPruning(before, after);
      std::cout << pythia::ConstraintBuilder::Summarize(
                       pythia::ConstraintBuilder::Build(
                           updated.state().guesses))
                << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool ok = true;
    if (arg == "--answers" && i + 1 < argc) {
      config.answers_path = argv[++i];
    } else if (arg == "--allowed" && i + 1 < argc) {
      config.allowed_path = argv[++i];
    } else if (arg == "--target" && i + 1 < argc) {
      config.target = pythia::PatternCodec::NormalizeWord(argv[++i]);
    } else if (arg == "--max-steps" && i + 1 < argc) {
      size_t steps = 0;
      ok = ParseCount(argv[++i], &steps) && steps > 0;
      config.max_steps = static_cast<int>(steps);
      config.options.max_guesses = config.max_steps;
    } else if (arg == "--interactive") {
      config.interactive = true;
    } else if (arg == "--profile") {
      config.profile = true;
    } else if (arg == "--openers" && i + 1 < argc) {
      config.openers_path = argv[++i];
    } else if (arg == "--compute-openers") {
      config.compute_openers = true;
    } else if (arg == "--write-openers" && i + 1 < argc) {
      config.write_openers_path = argv[++i];
      config.compute_openers = true;
    } else if (arg == "--heuristic-threshold" && i + 1 < argc) {
      ok = ParseCount(argv[++i], &config.options.heuristic_threshold);
    } else if (arg == "--extra-candidates" && i + 1 < argc) {
      ok = ParseCount(argv[++i], &config.options.extra_candidates);
    } else if (arg == "--max-candidates" && i + 1 < argc) {
      ok = ParseCount(argv[++i], &config.options.max_candidates);
    } else if (arg == "--top" && i + 1 < argc) {
      ok = ParseCount(argv[++i], &config.options.max_suggestions) &&
           config.options.max_suggestions > 0;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
    if (!ok) {
      std::cerr << "Invalid value for " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  if (config.answers_path.empty() || config.allowed_path.empty()) {
    std::cerr << "Pythia requires --answers and --allowed.\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (!config.target.empty() &&
      !pythia::PatternCodec::IsValidWord(config.target)) {
    std::cerr << "Invalid target: " << config.target << "\n";
    return 1;
  }

  auto load_start = std::chrono::high_resolution_clock::now();
  pythia::Dictionary dictionary;
  std::string error;
  if (!dictionary.Load(config.answers_path, config.allowed_path, &error)) {
    std::cerr << "Failed to load dictionary: " << error << "\n";
    return 1;
  }
  if (config.profile) {
    std::cout << "Load latency: " << MicrosSince(load_start) << "us\n";
  }

  if (config.compute_openers) {
    return RunComputeOpeners(config, dictionary);
  }

  pythia::OpenerTable openers = pythia::OpenerTable::Builtin();
  if (!config.openers_path.empty() &&
      !openers.Load(config.openers_path, &error)) {
    std::cerr << "Failed to load openers: " << error << "\n";
    return 1;
  }
  pythia::Solver solver(dictionary, openers, config.options);

  if (config.interactive) {
    return RunInteractive(config, solver);
  }
  if (!config.target.empty()) {
    return RunAutoPlay(config, solver);
  }

  std::cout << "\n[Pythia] Answers: " << dictionary.answers().size()
            << "  Dictionary: " << dictionary.full().size() << "\n";
  pythia::SolveResult result;
  if (!solver.Solve({}, &result)) {
    std::cerr << "Failed to produce openers.\n";
    return 1;
  }
  PrintSuggestions(result.suggestions, result.mode,
                   config.options.max_suggestions);
  return 0;
}
