#include "Session.hpp"

#include <exception>
#include <utility>

namespace pythia {

const char* ComputeStateName(ComputeState state) {
  switch (state) {
    case ComputeState::kIdle:
      return "idle";
    case ComputeState::kRunning:
      return "running";
    case ComputeState::kDone:
      return "done";
    case ComputeState::kCancelled:
      return "cancelled";
    case ComputeState::kFailed:
      return "failed";
  }
  return "unknown";
}

RankingWorker::RankingWorker(const Solver& solver)
    : solver_(solver), thread_([this] { Run(); }) {}

RankingWorker::~RankingWorker() {
  stopping_.store(true);
  inbox_.Close();
  if (thread_.joinable()) {
    thread_.join();
  }
  outbox_.Close();
}

void RankingWorker::Post(RankingRequest request) {
  inbox_.Push(std::move(request));
}

void RankingWorker::Run() {
  RankingRequest request;
  while (inbox_.WaitPop(&request)) {
    if (stopping_.load()) {
      break;
    }
    const uint64_t id = request.id;
    WorkerMessage reply;
    reply.id = id;
    try {
      auto progress = [this, id](size_t processed, size_t total) {
        if (stopping_.load()) {
          return false;
        }
        WorkerMessage update;
        update.type = WorkerMessage::Type::kProgress;
        update.id = id;
        update.processed = processed;
        update.total = total;
        outbox_.Push(std::move(update));
        return true;
      };
      if (!solver_.Suggest(request.remaining, &reply.result, progress)) {
        // Aborted by shutdown; the controller has already moved on.
        continue;
      }
      reply.type = WorkerMessage::Type::kResult;
    } catch (const std::exception& e) {
      reply.type = WorkerMessage::Type::kFailure;
      reply.error = e.what();
    } catch (...) {
      reply.type = WorkerMessage::Type::kFailure;
      reply.error = "unknown ranking failure";
    }
    outbox_.Push(std::move(reply));
  }
}

SuggestionController::SuggestionController(const Solver& solver)
    : solver_(solver),
      session_(solver.dictionary(), solver.options().max_guesses),
      worker_(std::make_unique<RankingWorker>(solver)) {}

bool SuggestionController::SubmitGuess(
    std::string_view word,
    const std::array<Clue, kWordLen>& clues,
    GuessRejection* rejection) {
  GuessRejection reason = session_.Validate(word);
  if (reason != GuessRejection::kNone) {
    if (rejection) {
      *rejection = reason;
    }
    return false;
  }
  // The new guess supersedes whatever was being ranked for the old state.
  Cancel();
  if (!session_.AddGuess(word, clues, rejection)) {
    return false;
  }
  stale_ = true;
  return true;
}

void SuggestionController::Reset() {
  Cancel();
  session_.Reset();
  suggestions_.clear();
  mode_ = SuggestionMode::kNone;
  state_ = ComputeState::kIdle;
  progress_ = 0.0;
  elapsed_ms_ = 0.0;
  last_error_.clear();
  stale_ = true;
}

bool SuggestionController::NeedsSuggestions() const {
  return stale_ || state_ == ComputeState::kIdle ||
         state_ == ComputeState::kCancelled;
}

RequestStatus SuggestionController::RequestSuggestions() {
  if (state_ == ComputeState::kRunning) {
    return RequestStatus::kAlreadyInProgress;
  }
  last_error_.clear();
  stale_ = false;

  const GameState& game = session_.state();
  if (game.guesses.empty()) {
    SolveResult result;
    if (!solver_.Solve(game.guesses, &result)) {
      state_ = ComputeState::kFailed;
      last_error_ = "opener lookup failed";
      return RequestStatus::kReady;
    }
    Publish(std::move(result));
    return RequestStatus::kReady;
  }

  if (game.remaining_words.empty() || game.is_complete) {
    suggestions_.clear();
    mode_ = game.remaining_words.empty() ? SuggestionMode::kNoCandidates
                                         : SuggestionMode::kNone;
    elapsed_ms_ = 0.0;
    progress_ = 100.0;
    state_ = ComputeState::kDone;
    return RequestStatus::kReady;
  }

  if (game.remaining_words.size() == 1) {
    SolveResult result;
    if (!solver_.Suggest(game.remaining_words, &result)) {
      state_ = ComputeState::kFailed;
      last_error_ = "single-candidate lookup failed";
      return RequestStatus::kReady;
    }
    Publish(std::move(result));
    return RequestStatus::kReady;
  }

  RankingRequest request;
  request.id = next_request_id_++;
  request.remaining = game.remaining_words;
  pending_id_ = request.id;
  state_ = ComputeState::kRunning;
  progress_ = 0.0;
  worker_->Post(std::move(request));
  return RequestStatus::kStarted;
}

bool SuggestionController::Poll() {
  WorkerMessage message;
  while (state_ == ComputeState::kRunning &&
         worker_->outbox().TryPop(&message)) {
    Apply(std::move(message));
  }
  return state_ != ComputeState::kRunning;
}

bool SuggestionController::Wait() {
  while (state_ == ComputeState::kRunning) {
    WorkerMessage message;
    if (!worker_->outbox().WaitPop(&message)) {
      state_ = ComputeState::kFailed;
      last_error_ = "ranking worker stopped";
      break;
    }
    Apply(std::move(message));
  }
  return state_ == ComputeState::kDone;
}

void SuggestionController::Cancel() {
  if (state_ != ComputeState::kRunning) {
    return;
  }
  // No partial results: tear the worker down and start a fresh one.
  worker_.reset();
  worker_ = std::make_unique<RankingWorker>(solver_);
  pending_id_ = 0;
  state_ = ComputeState::kCancelled;
  progress_ = 0.0;
}

void SuggestionController::Apply(WorkerMessage message) {
  if (message.id != pending_id_) {
    return;
  }
  switch (message.type) {
    case WorkerMessage::Type::kProgress:
      if (message.total > 0) {
        progress_ = 100.0 * static_cast<double>(message.processed) /
                    static_cast<double>(message.total);
      }
      break;
    case WorkerMessage::Type::kResult:
      pending_id_ = 0;
      Publish(std::move(message.result));
      break;
    case WorkerMessage::Type::kFailure:
      pending_id_ = 0;
      suggestions_.clear();
      mode_ = SuggestionMode::kNone;
      progress_ = 0.0;
      last_error_ = message.error;
      state_ = ComputeState::kFailed;
      break;
  }
}

void SuggestionController::Publish(SolveResult result) {
  suggestions_ = std::move(result.suggestions);
  mode_ = result.mode;
  elapsed_ms_ = result.elapsed_ms;
  progress_ = 100.0;
  state_ = ComputeState::kDone;
}

}  // namespace pythia
