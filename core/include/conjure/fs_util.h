#pragma once

#include <filesystem>
#include <string>

namespace conjure {

// Whole-file read. Returns false when the file cannot be opened.
bool slurp_file(const std::filesystem::path& p, std::string* out);

// Writes body to "<dst>.tmp-<pid>-<hex>" and renames it over dst.
// Returns "" on success, otherwise a short error description.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body);

// Renames a corrupt file to "<path>.corrupt-YYYYMMDDTHHMMSS".
// Returns the new path, or "" if nothing was moved.
std::string quarantine_corrupt_file(const std::filesystem::path& p);

} // namespace conjure
