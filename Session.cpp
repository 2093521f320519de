#include "Session.hpp"

#include <algorithm>
#include <sstream>

namespace pythia {
namespace {

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

bool IsAllCorrect(const GuessResult& guess) {
  return std::all_of(guess.clues.begin(), guess.clues.end(),
                     [](const LetterClue& clue) {
                       return clue.clue == Clue::kCorrect;
                     });
}

}  // namespace

const char* GameStatusName(GameStatus status) {
  switch (status) {
    case GameStatus::kInProgress:
      return "in-progress";
    case GameStatus::kWon:
      return "won";
    case GameStatus::kLostNoAttempts:
      return "lost-no-attempts";
    case GameStatus::kLostNoCandidates:
      return "lost-no-candidates";
  }
  return "unknown";
}

const char* RejectionMessage(GuessRejection rejection) {
  switch (rejection) {
    case GuessRejection::kNone:
      return "ok";
    case GuessRejection::kInvalidLength:
      return "Word must be exactly 5 letters";
    case GuessRejection::kInvalidCharacters:
      return "Word must contain only letters a-z";
    case GuessRejection::kInvalidClues:
      return "Clues must cover each of the 5 letters in order";
    case GuessRejection::kNotInDictionary:
      return "Word not in dictionary";
    case GuessRejection::kAlreadyGuessed:
      return "Word already guessed";
    case GuessRejection::kGameOver:
      return "Game is already complete";
  }
  return "unknown rejection";
}

GameSession::GameSession(const Dictionary& dictionary, int max_guesses)
    : dictionary_(dictionary), max_guesses_(max_guesses) {
  Reset();
}

GuessRejection GameSession::Validate(std::string_view word) const {
  if (state_.is_complete ||
      static_cast<int>(state_.guesses.size()) >= max_guesses_) {
    return GuessRejection::kGameOver;
  }
  if (word.size() != kWordLen) {
    return GuessRejection::kInvalidLength;
  }
  std::string normalized = PatternCodec::NormalizeWord(word);
  if (!PatternCodec::IsValidWord(normalized)) {
    return GuessRejection::kInvalidCharacters;
  }
  if (!dictionary_.Contains(normalized)) {
    return GuessRejection::kNotInDictionary;
  }
  for (const auto& guess : state_.guesses) {
    if (guess.word == normalized) {
      return GuessRejection::kAlreadyGuessed;
    }
  }
  return GuessRejection::kNone;
}

bool GameSession::AddGuess(std::string_view word,
                           const std::array<Clue, kWordLen>& clues,
                           GuessRejection* rejection) {
  GuessResult guess;
  if (!MakeGuessResult(word, clues, &guess)) {
    GuessRejection reason = Validate(word);
    if (rejection) {
      *rejection = reason == GuessRejection::kNone
                       ? GuessRejection::kInvalidCharacters
                       : reason;
    }
    return false;
  }
  return AddGuess(guess, rejection);
}

bool GameSession::AddGuess(const GuessResult& guess,
                           GuessRejection* rejection) {
  GuessRejection reason = Validate(guess.word);
  GuessResult accepted = guess;
  accepted.word = PatternCodec::NormalizeWord(guess.word);
  if (reason == GuessRejection::kNone && !IsWellFormed(accepted)) {
    reason = GuessRejection::kInvalidClues;
  }
  if (rejection) {
    *rejection = reason;
  }
  if (reason != GuessRejection::kNone) {
    return false;
  }

  state_.guesses.push_back(accepted);

  // Recomputed from the whole history every time.
  WordConstraints constraints = ConstraintBuilder::Build(state_.guesses);
  state_.remaining_words = WordFilter::FilterWithFallback(
      dictionary_.answers(), dictionary_.full(), constraints, &used_fallback_);
  state_.current_guess.clear();

  if (IsAllCorrect(accepted)) {
    state_.status = GameStatus::kWon;
    state_.solution = accepted.word;
  } else if (state_.remaining_words.empty()) {
    state_.status = GameStatus::kLostNoCandidates;
  } else if (static_cast<int>(state_.guesses.size()) >= max_guesses_) {
    state_.status = GameStatus::kLostNoAttempts;
  } else {
    state_.status = GameStatus::kInProgress;
  }

  if (state_.status != GameStatus::kWon &&
      state_.remaining_words.size() == 1) {
    state_.solution = state_.remaining_words.front();
  }
  state_.is_complete = state_.status != GameStatus::kInProgress;
  return true;
}

void GameSession::Reset() {
  state_ = GameState();
  state_.remaining_words = dictionary_.answers();
  used_fallback_ = false;
}

int GameSession::RemainingAttempts() const {
  return std::max(0, max_guesses_ - static_cast<int>(state_.guesses.size()));
}

double GameSession::Progress() const {
  if (max_guesses_ <= 0) {
    return 100.0;
  }
  double percent = 100.0 * static_cast<double>(state_.guesses.size()) /
                   static_cast<double>(max_guesses_);
  return std::min(100.0, percent);
}

std::string GameSession::StatusMessage() const {
  std::ostringstream out;
  switch (state_.status) {
    case GameStatus::kWon: {
      size_t count = state_.guesses.size();
      out << "Won in " << count << (count == 1 ? " guess!" : " guesses!");
      break;
    }
    case GameStatus::kLostNoAttempts:
      out << "Game over - no guesses remaining";
      break;
    case GameStatus::kLostNoCandidates:
      out << "No candidates - the answer is outside the known dictionaries "
             "or the clues conflict";
      break;
    case GameStatus::kInProgress: {
      int remaining = RemainingAttempts();
      out << remaining << (remaining == 1 ? " guess" : " guesses")
          << " remaining";
      break;
    }
  }
  return out.str();
}

std::string GameSession::Hint() const {
  const auto& words = state_.remaining_words;
  const size_t count = words.size();
  std::ostringstream out;
  if (count == 0) {
    out << "No possible words remaining - check your clues";
  } else if (count == 1) {
    out << "Only one word possible: " << ToUpperAscii(words.front());
  } else if (count <= 5) {
    out << count << " words possible: ";
    for (size_t i = 0; i < count; ++i) {
      if (i > 0) {
        out << ", ";
      }
      out << ToUpperAscii(words[i]);
    }
  } else if (count <= 20) {
    out << count << " words still possible";
  } else if (count <= 100) {
    out << count << " words remaining - try to eliminate more";
  } else {
    out << count << " words remaining - use high-entropy guesses";
  }
  return out.str();
}

std::string GameSession::FormatHistory() const {
  if (state_.guesses.empty()) {
    return "No guesses yet";
  }
  std::ostringstream out;
  for (size_t i = 0; i < state_.guesses.size(); ++i) {
    const GuessResult& guess = state_.guesses[i];
    if (i > 0) {
      out << "\n";
    }
    out << (i + 1) << ". " << ToUpperAscii(guess.word) << " "
        << PatternCodec::ToSymbols(PatternOf(guess));
  }
  return out.str();
}

}  // namespace pythia
