#include "archiver.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "extractor.hpp"
#include "hash.hpp"
#include "in_place.hpp"
#include "localization.hpp"
#include "path_resolver.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <cstdio>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.create_desc") << std::endl;
    std::cerr << get_string("info.extract_desc") << std::endl;
    std::cerr << get_string("info.pack_desc") << std::endl;
    std::cerr << get_string("info.unpack_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
}

std::vector<std::string> operands(const cxxopts::ParseResult& result, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    std::vector<std::string> paths;
    if (result.count("paths")) {
        paths = result["paths"].as<std::vector<std::string>>();
    }
    if (paths.size() < min || (max.has_value() && paths.size() > max.value())) {
        print_usage_func();
        throw LtarException(ErrorKind::UsageError, get_string("error.invalid_arg_count"));
    }
    return paths;
}

void print_sha256(const fs::path& archive_path) {
    std::cout << "SHA256: " << calculate_sha256(archive_path) << "  " << archive_path.string() << std::endl;
}

void print_listing(const std::vector<ArchiveEntry>& entries) {
    for (const auto& entry : entries) {
        if (get_verbose_mode()) {
            char mode[8];
            std::snprintf(mode, sizeof(mode), "%04o", entry.mode);
            std::cout << mode << ' ' << entry_kind_name(entry.kind) << ' ' << entry.size << ' ';
        }
        std::cout << entry.path;
        if (entry.kind == EntryKind::Directory) std::cout << '/';
        if (entry.kind == EntryKind::Symlink) std::cout << " -> " << entry.link_target;
        std::cout << '\n';
    }
    std::cout << std::flush;
}

int main(int argc, char* argv[]) {
    try {
        // --l10n-dir has to be honoured before any help text is looked up
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--l10n-dir" && i + 1 < argc) {
                set_l10n_dir(argv[i + 1]);
            } else if (arg.starts_with("--l10n-dir=")) {
                set_l10n_dir(arg.substr(11));
            }
        }
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("sha256", get_string("help.sha256"), cxxopts::value<bool>()->default_value("false"))
            ("l10n-dir", get_string("help.l10n_dir"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("paths", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "paths"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        set_verbose_mode(result["verbose"].as<bool>());
        set_quiet_mode(result["quiet"].as<bool>());
        bool show_sha256 = result["sha256"].as<bool>();

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };

        if (command == "create") {
            auto paths = operands(result, usage_printer, 2, 2);
            create_archive(paths[0], paths[1]);
            if (show_sha256) print_sha256(paths[0]);
        } else if (command == "extract") {
            auto paths = operands(result, usage_printer, 1, 2);
            if (show_sha256) print_sha256(paths[0]);
            extract_archive(paths.size() > 1 ? fs::path(paths[1]) : fs::path("."), paths[0]);
        } else if (command == "pack") {
            auto paths = operands(result, usage_printer, 1, 1);
            create_in_place(paths[0]);
            if (show_sha256) {
                fs::path archive_path = named_directory_path(paths[0]);
                archive_path += TAR_EXTENSION;
                print_sha256(archive_path);
            }
        } else if (command == "unpack") {
            auto paths = operands(result, usage_printer, 1, 1);
            if (show_sha256) print_sha256(paths[0]);
            extract_in_place(paths[0]);
        } else if (command == "list") {
            auto paths = operands(result, usage_printer, 1, 1);
            print_listing(list_archive(paths[0]));
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const LtarException& e) {
        log_error(string_format("error.ltar_error", e.what()));
        return 1;
    } catch (const fs::filesystem_error& e) {
        log_error(string_format("error.filesystem_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
