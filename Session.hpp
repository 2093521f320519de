#pragma once

#include "Solver.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pythia {

enum class GameStatus {
  kInProgress,
  kWon,
  kLostNoAttempts,
  kLostNoCandidates,
};

const char* GameStatusName(GameStatus status);

enum class GuessRejection {
  kNone,
  kInvalidLength,
  kInvalidCharacters,
  kInvalidClues,
  kNotInDictionary,
  kAlreadyGuessed,
  kGameOver,
};

const char* RejectionMessage(GuessRejection rejection);

struct GameState {
  std::vector<GuessResult> guesses;
  std::vector<std::string> remaining_words;
  std::string current_guess;
  bool is_complete = false;
  std::optional<std::string> solution;
  GameStatus status = GameStatus::kInProgress;
};

// Single in-memory game. Rejected guesses leave the state untouched.
class GameSession {
 public:
  GameSession(const Dictionary& dictionary, int max_guesses = 6);

  GuessRejection Validate(std::string_view word) const;
  bool AddGuess(std::string_view word,
                const std::array<Clue, kWordLen>& clues,
                GuessRejection* rejection);
  bool AddGuess(const GuessResult& guess, GuessRejection* rejection);
  void Reset();

  const GameState& state() const { return state_; }
  GameStatus status() const { return state_.status; }
  bool is_complete() const { return state_.is_complete; }
  bool used_fallback() const { return used_fallback_; }
  int max_guesses() const { return max_guesses_; }
  void set_current_guess(std::string guess) {
    state_.current_guess = std::move(guess);
  }

  int RemainingAttempts() const;
  double Progress() const;
  std::string StatusMessage() const;
  std::string Hint() const;
  std::string FormatHistory() const;

 private:
  const Dictionary& dictionary_;
  int max_guesses_;
  GameState state_;
  bool used_fallback_ = false;
};

// Unbounded MPMC queue. Pop calls fail once the channel is closed.
template <typename T>
class Channel {
 public:
  void Push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
  }

  bool TryPop(T* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return false;
    }
    *out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  bool WaitPop(T* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (closed_) {
      return false;
    }
    *out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      queue_.clear();
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

struct RankingRequest {
  uint64_t id = 0;
  std::vector<std::string> remaining;
};

struct WorkerMessage {
  enum class Type {
    kProgress,
    kResult,
    kFailure,
  };

  Type type = Type::kProgress;
  uint64_t id = 0;
  size_t processed = 0;
  size_t total = 0;
  SolveResult result;
  std::string error;
};

// One background thread running Solver::Suggest for posted requests.
// Destruction aborts the running job at its next progress checkpoint and
// joins the thread.
class RankingWorker {
 public:
  explicit RankingWorker(const Solver& solver);
  ~RankingWorker();

  RankingWorker(const RankingWorker&) = delete;
  RankingWorker& operator=(const RankingWorker&) = delete;

  void Post(RankingRequest request);
  Channel<WorkerMessage>& outbox() { return outbox_; }

 private:
  void Run();

  const Solver& solver_;
  Channel<RankingRequest> inbox_;
  Channel<WorkerMessage> outbox_;
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};

enum class ComputeState {
  kIdle,
  kRunning,
  kDone,
  kCancelled,
  kFailed,
};

const char* ComputeStateName(ComputeState state);

enum class RequestStatus {
  kReady,
  kStarted,
  kAlreadyInProgress,
};

// Owns the game session and the worker. At most one ranking request is in
// flight; the controller is driven from a single thread.
class SuggestionController {
 public:
  explicit SuggestionController(const Solver& solver);

  bool SubmitGuess(std::string_view word,
                   const std::array<Clue, kWordLen>& clues,
                   GuessRejection* rejection);
  void Reset();

  RequestStatus RequestSuggestions();
  // Drains worker messages without blocking. True once nothing is in flight.
  bool Poll();
  // Blocks until the in-flight request resolves. True when suggestions are
  // available.
  bool Wait();
  void Cancel();
  // True when the game state changed since the last request, or when no
  // ranking has run or finished for it.
  bool NeedsSuggestions() const;

  const GameSession& session() const { return session_; }
  const std::vector<WordSuggestion>& suggestions() const {
    return suggestions_;
  }
  SuggestionMode mode() const { return mode_; }
  bool showing_openers() const { return mode_ == SuggestionMode::kOpeners; }
  ComputeState compute_state() const { return state_; }
  bool is_computing() const { return state_ == ComputeState::kRunning; }
  double progress() const { return progress_; }
  double elapsed_ms() const { return elapsed_ms_; }
  const std::string& last_error() const { return last_error_; }

 private:
  void Apply(WorkerMessage message);
  void Publish(SolveResult result);

  const Solver& solver_;
  GameSession session_;
  std::unique_ptr<RankingWorker> worker_;
  uint64_t next_request_id_ = 1;
  uint64_t pending_id_ = 0;
  bool stale_ = true;

  ComputeState state_ = ComputeState::kIdle;
  std::vector<WordSuggestion> suggestions_;
  SuggestionMode mode_ = SuggestionMode::kNone;
  double progress_ = 0.0;
  double elapsed_ms_ = 0.0;
  std::string last_error_;
};

}  // namespace pythia
