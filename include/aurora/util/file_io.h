#pragma once

#include <string>

namespace aurora {

// Reads an entire file (binary-safe) into a string.
//
// Relative paths that do not exist from the current directory are also tried
// against the source tree root and its ancestors, so data files resolve when
// running from a build directory. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes `contents` to `path`, creating parent directories as needed.
//
// The data lands in a temporary sibling first and is renamed into place, so an
// interrupted write never leaves a truncated image or config behind.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if it already exists.
void ensure_dir(const std::string& path);

} // namespace aurora
