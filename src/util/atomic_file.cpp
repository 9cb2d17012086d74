#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace mnemoscan::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path TempPathFor(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  auto name = target.filename().string();
  name += ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / name;
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

bool RenameOver(const std::filesystem::path& from, const std::filesystem::path& to,
                std::string* error) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) {
    return true;
  }
  // Some platforms refuse to rename onto an existing file.
  RemoveQuietly(to);
  ec.clear();
  std::filesystem::rename(from, to, ec);
  if (ec) {
    if (error) {
      *error = "rename to " + to.string() + " failed: " + ec.message();
    }
    return false;
  }
  return true;
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ostream&)>& writer,
                     std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "cannot create " + parent.string() + ": " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = TempPathFor(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) {
        *error = "cannot open " + tmp_path.string() + " for writing";
      }
      return false;
    }
    const bool written = writer(out);
    out.flush();
    if (!written || !out.good()) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error) {
        *error = written ? "write to " + tmp_path.string() + " failed"
                         : "serialization of " + path.string() + " failed";
      }
      return false;
    }
  }

  if (!RenameOver(tmp_path, path, error)) {
    RemoveQuietly(tmp_path);
    return false;
  }
  return true;
}

bool AtomicWriteText(const std::filesystem::path& path, std::string_view contents,
                     std::string* error) {
  return AtomicWriteFile(
      path,
      [&](std::ostream& out) -> bool {
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        return out.good();
      },
      error);
}

}  // namespace mnemoscan::util
