#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion, executable lookup, small file helpers
 */

#include <string>
#include <vector>

namespace samaira {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Returns the first espeak-ng data directory that exists on this machine,
 * or the distribution default when none is found.
 */
std::string default_espeak_data_path();

/// True if path names an existing regular file with execute permission
bool is_executable_file(const std::string& path);

/**
 * Locates an executable: an explicit configured path wins, then the
 * fallback directories, then every directory of $PATH.
 * @return Absolute path, or empty if nothing was found
 */
std::string find_executable(const std::string& configured,
                            const std::string& name,
                            const std::vector<std::string>& fallback_dirs = {});

/// Reads the first line of a small text file (trimmed); empty if missing
std::string read_first_line(const std::string& path);

/// Overwrites a small text file; false if it could not be written
bool write_text_file(const std::string& path, const std::string& contents);

} // namespace samaira
