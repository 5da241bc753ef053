#pragma once

/**
 * Dated backups and whole-file replacement of the settings file.
 *
 * Backups sit next to the original as <stem>.<YYMMDD>-<n>.backup.json and
 * are never overwritten. The settings file itself is replaced by writing a
 * temporary sibling and renaming it into place.
 */

#include <chrono>
#include <filesystem>
#include <string>

namespace lmcfg {

// Formats the local date of time as YYMMDD, e.g. "250924".
std::string format_date_tag(std::chrono::system_clock::time_point time);

// First <stem>.<date_tag>-<n>.backup.json next to target that does not exist yet, n from 0.
std::filesystem::path next_backup_path(const std::filesystem::path& target, const std::string& date_tag);

/**
 * Copies target to the next free backup path, carrying over permissions and
 * modification time. Returns the backup path.
 *
 * Throws FilesystemError if the copy fails; the target is untouched either way.
 */
std::filesystem::path create_backup(const std::filesystem::path& target, const std::string& date_tag);

/**
 * Replaces target with content in one step: the data goes to a temporary
 * file in the same directory, which is then renamed over target. Missing
 * parent directories are created. If target is a symbolic link, the file it
 * points to is replaced and the link itself is left in place.
 *
 * Throws FilesystemError on failure, in which case target is unchanged.
 */
void write_file_atomically(const std::filesystem::path& target, const std::string& content);

} // namespace lmcfg
