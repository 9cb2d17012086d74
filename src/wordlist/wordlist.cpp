#include "wordlist/wordlist.hpp"

#include <cctype>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace mnemoscan::wordlist {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::vector<std::string> ParseWordlist(std::string_view text) {
  std::vector<std::string> words;
  while (!text.empty()) {
    const auto newline = text.find('\n');
    const auto line =
        newline == std::string_view::npos ? text : text.substr(0, newline);
    const auto word = Trim(line);
    if (!word.empty()) {
      words.emplace_back(word);
    }
    if (newline == std::string_view::npos) {
      break;
    }
    text.remove_prefix(newline + 1);
  }
  return words;
}

bool LoadWordlistFile(const std::filesystem::path& path, std::vector<std::string>* out,
                      std::string* error) {
  std::ifstream in(path, std::ios::in);
  if (!in) {
    if (error) {
      *error = "failed to open word list: " + path.string();
    }
    return false;
  }
  std::vector<std::string> words;
  std::string line;
  while (std::getline(in, line)) {
    const auto word = Trim(line);
    if (!word.empty()) {
      words.emplace_back(word);
    }
  }
  if (in.bad()) {
    if (error) {
      *error = "error reading word list: " + path.string();
    }
    return false;
  }
  *out = std::move(words);
  return true;
}

std::optional<std::string> FindDuplicateWord(const std::vector<std::string>& words) {
  std::unordered_set<std::string_view> seen;
  seen.reserve(words.size());
  for (const auto& word : words) {
    if (!seen.insert(word).second) {
      return word;
    }
  }
  return std::nullopt;
}

}  // namespace mnemoscan::wordlist
