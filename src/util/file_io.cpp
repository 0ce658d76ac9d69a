#include "aurora/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace aurora {

namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path& target) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string base = target.filename().string() + ".tmp." + std::to_string(stamp);
  const fs::path dir = target.parent_path();

  std::error_code ec;
  for (int attempt = 0; attempt < 64; ++attempt) {
    const std::string name = attempt == 0 ? base : base + "." + std::to_string(attempt);
    const fs::path candidate = dir.empty() ? fs::path(name) : dir / name;
    ec.clear();
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }
  return dir.empty() ? fs::path(base) : dir / base;
}

// Removes the temp file unless the rename succeeded.
class TempGuard {
 public:
  explicit TempGuard(fs::path p) : path_(std::move(p)) {}
  ~TempGuard() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  TempGuard(const TempGuard&) = delete;
  TempGuard& operator=(const TempGuard&) = delete;

  void disarm() { path_.clear(); }

 private:
  fs::path path_;
};

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute()) return requested;
  if (fs::exists(requested, ec) && !ec) return requested;

  std::vector<fs::path> roots;
#ifdef AURORA_SOURCE_DIR
  roots.emplace_back(AURORA_SOURCE_DIR);
#endif
  ec.clear();
  fs::path cur = fs::current_path(ec);
  for (int depth = 0; !ec && !cur.empty() && depth < 8; ++depth) {
    roots.push_back(cur);
    const fs::path parent = cur.parent_path();
    if (parent == cur) break;
    cur = parent;
  }

  for (const auto& root : roots) {
    ec.clear();
    const fs::path candidate = root / requested;
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path requested(path);
  const fs::path resolved = resolve_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    std::string msg = "Failed to open file for reading: " + path;
    if (resolved != requested) msg += " (resolved to: " + resolved.string() + ")";
    throw std::runtime_error(msg);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
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

  const fs::path tmp = temp_sibling(target);
  TempGuard guard(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");

  guard.disarm();
}

} // namespace aurora
