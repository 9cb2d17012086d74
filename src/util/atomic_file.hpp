#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace mnemoscan::util {

// Replace `path` by writing a sibling temp file and renaming it over the
// target, so readers see either the old or the new contents. Missing parent
// directories are created. `writer` must return true once it has written
// everything.
bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ostream&)>& writer,
                     std::string* error = nullptr);

bool AtomicWriteText(const std::filesystem::path& path, std::string_view contents,
                     std::string* error = nullptr);

}  // namespace mnemoscan::util
