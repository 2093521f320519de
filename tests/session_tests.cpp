#include "Session.hpp"

#include <iostream>

namespace {
int g_failures = 0;

void ExpectTrue(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++g_failures;
  }
}

void ExpectFalse(bool condition, const char* message) {
  ExpectTrue(!condition, message);
}

using Clues = std::array<pythia::Clue, pythia::kWordLen>;

const Clues kAllAbsent = {pythia::Clue::kAbsent, pythia::Clue::kAbsent,
                          pythia::Clue::kAbsent, pythia::Clue::kAbsent,
                          pythia::Clue::kAbsent};
const Clues kAllCorrect = {pythia::Clue::kCorrect, pythia::Clue::kCorrect,
                           pythia::Clue::kCorrect, pythia::Clue::kCorrect,
                           pythia::Clue::kCorrect};

Clues CluesFor(const std::string& guess, const std::string& answer) {
  int pattern = 0;
  Clues clues = kAllAbsent;
  if (!pythia::PatternCodec::Encode(guess, answer, &pattern)) {
    std::cerr << "FAIL: could not score " << guess << "\n";
    ++g_failures;
    return clues;
  }
  std::array<int, pythia::kWordLen> digits =
      pythia::PatternCodec::Decode(pattern);
  for (int i = 0; i < pythia::kWordLen; ++i) {
    clues[i] = static_cast<pythia::Clue>(digits[i]);
  }
  return clues;
}
}  // namespace

int main() {
  // Six uninformative guesses against a two-word answer list.
  {
    pythia::Dictionary dictionary;
    dictionary.SetWordLists(
        {"mummy", "puppy"},
        {"crate", "solid", "brick", "fjord", "blank", "witch"});
    pythia::GameSession session(dictionary);
    const char* guesses[] = {"crate", "solid", "brick",
                             "fjord", "blank", "witch"};
    for (int i = 0; i < 6; ++i) {
      pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
      ExpectTrue(session.AddGuess(guesses[i], kAllAbsent, &rejection),
                 "each distinct dictionary guess is accepted");
      if (i < 5) {
        ExpectTrue(session.status() == pythia::GameStatus::kInProgress,
                   "game continues before the last attempt");
      }
    }
    ExpectTrue(session.status() == pythia::GameStatus::kLostNoAttempts,
               "sixth miss loses on attempts");
    ExpectTrue(session.is_complete(), "lost game is complete");
    ExpectTrue(session.state().remaining_words.size() == 2,
               "both answers still remain");
    ExpectFalse(session.state().solution.has_value(),
                "no solution with two candidates");
    ExpectTrue(session.RemainingAttempts() == 0, "no attempts left");
    ExpectTrue(session.Progress() == 100.0, "every attempt used");
    ExpectTrue(session.StatusMessage() == "Game over - no guesses remaining",
               "lost status message");
    ExpectTrue(session.Hint() == "2 words possible: MUMMY, PUPPY",
               "hint names a short pool");

    pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
    ExpectFalse(session.AddGuess("mummy", kAllCorrect, &rejection),
                "no guesses after the game ends");
    ExpectTrue(rejection == pythia::GuessRejection::kGameOver,
               "rejected as game over");
    ExpectTrue(session.state().guesses.size() == 6,
               "a rejected guess changes nothing");
  }

  // The answer is outside the curated list.
  {
    pythia::Dictionary dictionary;
    dictionary.SetWordLists({"crate", "trace"}, {"mummy", "puppy"});
    pythia::GameSession session(dictionary);
    pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
    ExpectTrue(session.AddGuess("crate", kAllAbsent, &rejection),
               "all-absent crate is accepted");
    ExpectTrue(session.used_fallback(), "filtering fell back");
    ExpectTrue(session.state().remaining_words ==
                   std::vector<std::string>({"mummy", "puppy"}),
               "the full dictionary supplies the pool");
    ExpectTrue(session.status() == pythia::GameStatus::kInProgress,
               "fallback keeps the game going");
    ExpectTrue(session.FormatHistory() == "1. CRATE -----",
               "history shows the guess");
    ExpectTrue(session.StatusMessage() == "5 guesses remaining",
               "in-progress status message");
  }

  {
    pythia::Dictionary dictionary;
    dictionary.SetWordLists({"crate", "trace", "irate", "slate"},
                            {"mummy", "puppy"});
    pythia::GameSession session(dictionary);
    ExpectTrue(session.state().remaining_words.size() == 4,
               "a new game starts with every answer");
    ExpectTrue(session.FormatHistory() == "No guesses yet", "empty history");
    ExpectTrue(session.StatusMessage() == "6 guesses remaining",
               "six guesses to start");

    ExpectTrue(session.Validate("crat") ==
                   pythia::GuessRejection::kInvalidLength,
               "short words are rejected");
    ExpectTrue(session.Validate("cratES") ==
                   pythia::GuessRejection::kInvalidLength,
               "long words are rejected");
    ExpectTrue(session.Validate("cr4te") ==
                   pythia::GuessRejection::kInvalidCharacters,
               "digits are rejected");
    ExpectTrue(session.Validate("zzzzz") ==
                   pythia::GuessRejection::kNotInDictionary,
               "unknown words are rejected");
    ExpectTrue(session.Validate("MUMMY") == pythia::GuessRejection::kNone,
               "allowed guesses pass case-insensitively");

    pythia::GuessResult bad_clues;
    ExpectTrue(pythia::MakeGuessResult("slate", kAllAbsent, &bad_clues),
               "build a guess result");
    bad_clues.clues[2].letter = 'q';
    pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
    ExpectFalse(session.AddGuess(bad_clues, &rejection),
                "clues must match the word");
    ExpectTrue(rejection == pythia::GuessRejection::kInvalidClues,
               "rejected for its clues");
    ExpectTrue(session.state().guesses.empty(), "nothing was recorded");

    ExpectTrue(session.AddGuess("CRATE", CluesFor("crate", "trace"),
                                &rejection),
               "uppercase guesses are accepted");
    ExpectTrue(session.state().guesses[0].word == "crate",
               "guesses are stored normalized");
    ExpectTrue(session.state().remaining_words ==
                   std::vector<std::string>({"trace"}),
               "one answer fits");
    ExpectTrue(session.state().solution &&
                   *session.state().solution == "trace",
               "the sole remaining word is the solution");
    ExpectTrue(session.status() == pythia::GameStatus::kInProgress,
               "a known solution is not yet a win");
    ExpectTrue(session.Hint() == "Only one word possible: TRACE",
               "hint for one word");

    ExpectFalse(session.AddGuess("crate", kAllAbsent, &rejection),
                "repeats are rejected");
    ExpectTrue(rejection == pythia::GuessRejection::kAlreadyGuessed,
               "rejected as a repeat");

    ExpectTrue(session.AddGuess("trace", kAllCorrect, &rejection), "win");
    ExpectTrue(session.status() == pythia::GameStatus::kWon, "status is won");
    ExpectTrue(session.is_complete(), "won game is complete");
    ExpectTrue(session.state().solution &&
                   *session.state().solution == "trace",
               "solution is the winning word");
    ExpectTrue(session.StatusMessage() == "Won in 2 guesses!",
               "won status message");
    ExpectTrue(session.FormatHistory() == "1. CRATE yGGyG\n2. TRACE GGGGG",
               "history lists both guesses");

    session.Reset();
    ExpectTrue(session.state().guesses.empty(), "reset clears guesses");
    ExpectTrue(session.state().remaining_words.size() == 4,
               "reset restores the answers");
    ExpectTrue(session.status() == pythia::GameStatus::kInProgress,
               "reset starts a new game");
    ExpectFalse(session.state().solution.has_value(), "reset clears solution");
  }

  // Contradictory clues empty both lists.
  {
    pythia::Dictionary dictionary;
    dictionary.SetWordLists({"crate", "trace"}, {"mummy", "puppy"});
    Clues clues = kAllAbsent;
    clues[0] = pythia::Clue::kCorrect;

    pythia::GameSession session(dictionary);
    pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
    ExpectTrue(session.AddGuess("crate", clues, &rejection), "accepted");
    ExpectTrue(session.status() == pythia::GameStatus::kLostNoCandidates,
               "no candidates ends the game");
    ExpectTrue(session.Hint() ==
                   "No possible words remaining - check your clues",
               "hint for an empty pool");

    pythia::GameSession last_try(dictionary, 1);
    ExpectTrue(last_try.AddGuess("crate", clues, &rejection), "accepted");
    ExpectTrue(last_try.status() == pythia::GameStatus::kLostNoCandidates,
               "no candidates wins over no attempts");
  }

  {
    pythia::Channel<int> channel;
    int value = 0;
    ExpectFalse(channel.TryPop(&value), "new channel is empty");
    channel.Push(1);
    channel.Push(2);
    ExpectTrue(channel.TryPop(&value) && value == 1, "first in, first out");
    ExpectTrue(channel.WaitPop(&value) && value == 2, "wait pop takes queued");
    channel.Push(3);
    channel.Close();
    ExpectFalse(channel.WaitPop(&value), "closed channel stops waiters");
    channel.Push(4);
    ExpectFalse(channel.TryPop(&value), "closed channel drops pushes");
  }

  pythia::Dictionary dictionary;
  dictionary.SetWordLists({"crate", "trace", "irate", "slate", "grace",
                           "brace", "stare", "share"},
                          {"fuzzy", "mummy"});
  pythia::OpenerTable openers = pythia::OpenerTable::Builtin();
  pythia::Solver solver(dictionary, openers);

  {
    pythia::RankingWorker worker(solver);
    pythia::RankingRequest request;
    request.id = 7;
    request.remaining = dictionary.answers();
    worker.Post(request);

    pythia::WorkerMessage message;
    bool got_result = false;
    size_t progress_messages = 0;
    while (!got_result && worker.outbox().WaitPop(&message)) {
      ExpectTrue(message.id == 7, "messages carry the request id");
      if (message.type == pythia::WorkerMessage::Type::kProgress) {
        ++progress_messages;
      } else {
        ExpectTrue(message.type == pythia::WorkerMessage::Type::kResult,
                   "the job finishes with a result");
        got_result = true;
      }
    }
    ExpectTrue(got_result, "worker answers the request");
    ExpectTrue(progress_messages >= 1, "completion is reported as progress");
    ExpectTrue(message.result.mode == pythia::SuggestionMode::kEntropy,
               "worker ranks by entropy");
    ExpectFalse(message.result.suggestions.empty(), "worker has suggestions");
  }

  {
    pythia::SuggestionController controller(solver);
    ExpectTrue(controller.compute_state() == pythia::ComputeState::kIdle,
               "controller starts idle");
    ExpectTrue(controller.NeedsSuggestions(), "a new game needs suggestions");
    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kReady,
               "openers are immediate");
    ExpectFalse(controller.NeedsSuggestions(), "openers are current");
    ExpectTrue(controller.showing_openers(), "openers are shown");
    ExpectTrue(controller.suggestions().size() == 10, "ten openers");

    pythia::GuessRejection rejection = pythia::GuessRejection::kNone;
    ExpectFalse(controller.SubmitGuess("zzzzz", kAllAbsent, &rejection),
                "controller validates guesses");
    ExpectTrue(rejection == pythia::GuessRejection::kNotInDictionary,
               "unknown word");
    ExpectFalse(controller.NeedsSuggestions(),
                "a rejected guess keeps the current suggestions");

    ExpectTrue(controller.SubmitGuess("fuzzy", kAllAbsent, &rejection),
               "uninformative guess");
    ExpectTrue(controller.session().state().remaining_words.size() == 8,
               "no answer was eliminated");
    ExpectTrue(controller.NeedsSuggestions(),
               "an accepted guess needs new suggestions");

    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kStarted,
               "a pool of eight is ranked in the background");
    ExpectTrue(controller.is_computing(), "computation is running");
    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kAlreadyInProgress,
               "a second request is refused");
    ExpectTrue(controller.Wait(), "wait resolves the request");
    ExpectTrue(controller.compute_state() == pythia::ComputeState::kDone,
               "done after waiting");
    ExpectTrue(controller.mode() == pythia::SuggestionMode::kEntropy,
               "entropy suggestions");
    ExpectFalse(controller.suggestions().empty(), "suggestions arrived");
    ExpectTrue(controller.progress() == 100.0, "progress is complete");
    ExpectFalse(controller.showing_openers(), "openers are replaced");
    ExpectFalse(controller.NeedsSuggestions(),
                "finished suggestions stay current");

    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kStarted,
               "a finished request can be repeated");
    controller.Cancel();
    ExpectTrue(controller.compute_state() == pythia::ComputeState::kCancelled,
               "cancel marks the request cancelled");
    ExpectTrue(controller.NeedsSuggestions(),
               "a cancelled ranking needs a new request");
    ExpectTrue(controller.progress() == 0.0, "cancel resets progress");
    ExpectTrue(controller.Poll(), "nothing in flight after cancel");
    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kStarted,
               "a fresh worker takes new requests");
    ExpectTrue(controller.Wait(), "the fresh worker answers");

    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kStarted,
               "start another request");
    ExpectTrue(controller.SubmitGuess("crate", CluesFor("crate", "trace"),
                                      &rejection),
               "a guess during ranking is accepted");
    ExpectFalse(controller.is_computing(), "the stale ranking was cancelled");
    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kReady,
               "a single candidate is immediate");
    ExpectTrue(controller.mode() == pythia::SuggestionMode::kSingleCandidate,
               "single candidate mode");
    ExpectTrue(controller.suggestions().size() == 1 &&
                   controller.suggestions()[0].word == "trace",
               "the only answer is suggested");

    ExpectTrue(controller.SubmitGuess("trace", kAllCorrect, &rejection),
               "winning guess");
    ExpectTrue(controller.session().status() == pythia::GameStatus::kWon,
               "controller game is won");
    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kReady,
               "finished games answer immediately");
    ExpectTrue(controller.suggestions().empty(), "no suggestions after a win");
    ExpectTrue(controller.mode() == pythia::SuggestionMode::kNone,
               "no mode after a win");

    controller.Reset();
    ExpectTrue(controller.session().state().guesses.empty(),
               "reset starts over");
    ExpectTrue(controller.compute_state() == pythia::ComputeState::kIdle,
               "reset returns to idle");
    ExpectTrue(controller.NeedsSuggestions(), "reset needs openers again");
    ExpectTrue(controller.suggestions().empty(), "reset clears suggestions");

    Clues conflicting = kAllAbsent;
    conflicting[0] = pythia::Clue::kCorrect;
    ExpectTrue(controller.SubmitGuess("crate", conflicting, &rejection),
               "conflicting clues are accepted");
    ExpectTrue(controller.RequestSuggestions() ==
                   pythia::RequestStatus::kReady,
               "an empty pool answers immediately");
    ExpectTrue(controller.mode() == pythia::SuggestionMode::kNoCandidates,
               "empty pool is tagged");
  }

  if (g_failures > 0) {
    std::cerr << g_failures << " test(s) failed.\n";
    return 1;
  }
  std::cout << "All tests passed.\n";
  return 0;
}
