#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    bool verbose_mode = false;
    bool quiet_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    if (quiet_mode) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_verbose(std::string_view msg) {
    if (!verbose_mode) return;
    log_info(msg);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

bool get_verbose_mode() {
    return verbose_mode;
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

bool get_quiet_mode() {
    return quiet_mode;
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw fs::filesystem_error(string_format("error.create_dir_failed", path.string()), path, ec);
        }
    }
    else if (!fs::is_directory(path)) {
        throw LtarException(ErrorKind::NotADirectory, string_format("error.path_not_dir", path.string()));
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute() || path.has_root_name()) {
        throw LtarException(ErrorKind::InvalidEntryPath, string_format("error.entry_path_absolute", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw LtarException(ErrorKind::InvalidEntryPath, string_format("error.entry_path_traversal", path.string()));
        }
    }
    if (normalized == ".") {
        return root;
    }
    return root / normalized;
}

std::string to_archive_path(const fs::path& relative) {
    return relative.generic_string();
}

std::string normalize_entry_path(std::string_view path) {
    while (path.starts_with("./")) path.remove_prefix(2);
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    return std::string(path);
}
