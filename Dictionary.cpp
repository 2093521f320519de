#include "Solver.hpp"

#include <fstream>
#include <sstream>

namespace pythia {

bool Dictionary::ReadWordList(const std::string& path,
                              std::vector<std::string>* out) {
  if (!out) {
    return false;
  }
  std::ifstream infile(path);
  if (!infile) {
    return false;
  }
  out->clear();
  std::string line;
  while (std::getline(infile, line)) {
    // Plain word-per-line files and JSON string arrays both reduce to tokens.
    for (char& c : line) {
      if (c == ',' || c == ';' || c == '[' || c == ']' || c == '"') {
        c = ' ';
      }
    }
    std::istringstream tokens(line);
    std::string token;
    while (tokens >> token) {
      out->push_back(token);
    }
  }
  return !infile.bad();
}

std::vector<std::string> Dictionary::Clean(
    const std::vector<std::string>& words) {
  std::vector<std::string> cleaned;
  cleaned.reserve(words.size());
  std::unordered_set<std::string> seen;
  for (const auto& word : words) {
    if (word.size() != kWordLen) {
      continue;
    }
    std::string normalized = PatternCodec::NormalizeWord(word);
    if (!PatternCodec::IsValidWord(normalized)) {
      continue;
    }
    if (seen.insert(normalized).second) {
      cleaned.push_back(std::move(normalized));
    }
  }
  return cleaned;
}

bool Dictionary::Load(const std::string& answers_path,
                      const std::string& allowed_path,
                      std::string* error) {
  std::vector<std::string> answers;
  std::vector<std::string> allowed;
  if (!ReadWordList(answers_path, &answers)) {
    if (error) {
      *error = "cannot read answer list: " + answers_path;
    }
    return false;
  }
  if (!ReadWordList(allowed_path, &allowed)) {
    if (error) {
      *error = "cannot read allowed-guess list: " + allowed_path;
    }
    return false;
  }

  std::vector<std::string> clean_answers = Clean(answers);
  if (clean_answers.empty()) {
    if (error) {
      *error = "answer list has no valid 5-letter words: " + answers_path;
    }
    return false;
  }
  std::vector<std::string> clean_allowed = Clean(allowed);
  if (clean_allowed.empty()) {
    if (error) {
      *error = "allowed-guess list has no valid 5-letter words: " +
               allowed_path;
    }
    return false;
  }

  SetWordLists(clean_answers, clean_allowed);
  return true;
}

void Dictionary::SetWordLists(const std::vector<std::string>& answers,
                              const std::vector<std::string>& allowed) {
  answers_ = Clean(answers);
  allowed_ = Clean(allowed);

  full_.clear();
  full_index_.clear();
  answer_index_.clear();
  full_.reserve(answers_.size() + allowed_.size());

  for (const auto& word : answers_) {
    answer_index_.insert(word);
    if (full_index_.insert(word).second) {
      full_.push_back(word);
    }
  }
  for (const auto& word : allowed_) {
    if (full_index_.insert(word).second) {
      full_.push_back(word);
    }
  }
}

bool Dictionary::Contains(std::string_view word) const {
  return full_index_.count(PatternCodec::NormalizeWord(word)) > 0;
}

bool Dictionary::IsPossibleAnswer(std::string_view word) const {
  return answer_index_.count(PatternCodec::NormalizeWord(word)) > 0;
}

}  // namespace pythia
