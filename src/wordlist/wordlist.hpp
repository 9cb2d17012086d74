#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemoscan::wordlist {

// Split a line-delimited word list. Each line is trimmed of surrounding
// whitespace (including a trailing CR); empty lines are skipped. No other
// parsing is done, so duplicates and interior spaces are kept as-is.
std::vector<std::string> ParseWordlist(std::string_view text);

// Read a word list file with the rules of ParseWordlist.
bool LoadWordlistFile(const std::filesystem::path& path, std::vector<std::string>* out,
                      std::string* error = nullptr);

// First word that occurs more than once, if any.
std::optional<std::string> FindDuplicateWord(const std::vector<std::string>& words);

}  // namespace mnemoscan::wordlist
