#pragma once

#include <string>
#include <vector>

#include "ytdle/models.hpp"

namespace ytdle {

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
// Check if a file exists.
bool fileExists(const std::string& path);

// Absolute, lexically normalized form of a directory without a trailing slash.
std::string normalizeDirectory(const std::string& path);

// Identity of a job's output on disk; two jobs with the same key never run together.
std::string outputKey(const JobRequest& request);

// Remove leftovers of an unfinished transfer: the recorded destination files
// themselves, their .part/.ytdl/.temp/.tmp/.part-FragN companions, per-format
// intermediates (<stem>.f<id>.<ext>) and thumbnails sharing the stem.
// Returns the number of files removed.
size_t removePartialArtifacts(const std::vector<std::string>& knownPaths);

} // namespace ytdle
