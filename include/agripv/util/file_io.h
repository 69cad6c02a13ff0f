#pragma once

#include <string>

namespace agripv {

// Reads an entire file. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes a file, creating parent directories if needed.
//
// Contents go to a sibling temporary file first and are renamed into place, so a
// crash mid-write never leaves a truncated results file behind.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if it exists.
void ensure_dir(const std::string& path);

} // namespace agripv
