#include "agripv/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace agripv {
namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path& target) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string base = target.filename().string() + ".tmp." + std::to_string(stamp);
  const fs::path dir = target.parent_path();
  for (int attempt = 0; attempt < 64; ++attempt) {
    const std::string name = attempt == 0 ? base : base + "." + std::to_string(attempt);
    const fs::path candidate = dir.empty() ? fs::path(name) : dir / name;
    std::error_code ec;
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }
  return dir.empty() ? fs::path(base) : dir / base;
}

// Removes the temporary file unless the rename succeeded.
class TempFileGuard {
 public:
  explicit TempFileGuard(fs::path p) : path_(std::move(p)) {}
  ~TempFileGuard() {
    if (!armed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  const fs::path& path() const { return path_; }
  void disarm() { armed_ = false; }

 private:
  fs::path path_;
  bool armed_{true};
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  TempFileGuard tmp(temp_sibling(target));
  {
    std::ofstream out(tmp.path(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path().string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path().string());
  }

  std::error_code ec;
  fs::rename(tmp.path(), target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp.path(), target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.disarm();
}

} // namespace agripv
