#include "backup_writer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace lmcfg {

namespace fs = std::filesystem;

std::string format_date_tag(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local_tm;
#ifdef _WIN32
    localtime_s(&local_tm, &t);
#else
    localtime_r(&t, &local_tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%y%m%d");
    return oss.str();
}

fs::path next_backup_path(const fs::path& target, const std::string& date_tag) {
    std::string stem = target.stem().string();
    if (stem.empty()) {
        stem = FALLBACK_STEM;
    }

    for (unsigned index = 0;; ++index) {
        fs::path candidate = target;
        candidate.replace_filename(stem + "." + date_tag + "-" + std::to_string(index) + BACKUP_SUFFIX);
        std::error_code ec;
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

fs::path create_backup(const fs::path& target, const std::string& date_tag) {
    fs::path backup = next_backup_path(target, date_tag);
    verbose_out("BACKUP", target.string() + " -> " + backup.string());

    std::error_code ec;
    // copy_options::none refuses to replace an existing file.
    if (!fs::copy_file(target, backup, fs::copy_options::none, ec)) {
        throw FilesystemError(backup.string(),
            "Failed to create backup " + backup.string() + ": " + ec.message());
    }

    // Metadata is best effort; the content copy above is what matters.
    fs::file_status source_status = fs::status(target, ec);
    if (!ec) {
        fs::permissions(backup, source_status.permissions(), fs::perm_options::replace, ec);
    }
    if (ec) {
        verbose_err("BACKUP", "Could not copy permissions: " + ec.message());
    }
    auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        fs::last_write_time(backup, mtime, ec);
    }
    if (ec) {
        verbose_err("BACKUP", "Could not copy modification time: " + ec.message());
    }

    return backup;
}

// Follows target through any chain of symlinks to the path that holds the data.
static fs::path resolve_link_target(const fs::path& target) {
    fs::path resolved = target;
    std::error_code ec;
    for (int hops = 0; fs::is_symlink(fs::symlink_status(resolved, ec)); ++hops) {
        if (hops == MAX_SYMLINK_HOPS) {
            throw FilesystemError(target.string(), "Too many levels of symbolic links at " + target.string());
        }
        fs::path link = fs::read_symlink(resolved, ec);
        if (ec) {
            throw FilesystemError(target.string(),
                "Cannot resolve symbolic link " + resolved.string() + ": " + ec.message());
        }
        resolved = link.is_absolute() ? link : resolved.parent_path() / link;
    }
    if (resolved != target) {
        verbose_log("WRITE", target.string() + " is a link to " + resolved.string());
    }
    return resolved;
}

void write_file_atomically(const fs::path& link_or_file, const std::string& content) {
    const fs::path target = resolve_link_target(link_or_file);
    std::error_code ec;
    fs::path parent = target.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        if (!fs::create_directories(parent, ec) && ec) {
            throw FilesystemError(parent.string(),
                "Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    fs::path temp = target;
    temp.replace_filename("." + target.filename().string() + ".lmcfg-tmp");
    verbose_out("WRITE", std::to_string(content.size()) + " bytes -> " + temp.string());

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw FilesystemError(target.string(), "Cannot open " + temp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            throw FilesystemError(target.string(), "Failed to write " + temp.string());
        }
    }

    fs::file_status target_status = fs::status(target, ec);
    if (!ec && fs::exists(target_status)) {
        fs::permissions(temp, target_status.permissions(), fs::perm_options::replace, ec);
        if (ec) {
            verbose_err("WRITE", "Could not carry over permissions: " + ec.message());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        throw FilesystemError(target.string(),
            "Failed to replace " + target.string() + ": " + ec.message());
    }
    verbose_log("WRITE", "Replaced " + target.string());
}

} // namespace lmcfg
