#include "config.hpp"

#include <filesystem>

namespace fs = std::filesystem;

fs::path L10N_DIR = LTAR_L10N_DIR;

void set_l10n_dir(const std::string& dir) {
    L10N_DIR = fs::path(dir).lexically_normal();
    if (L10N_DIR.empty()) L10N_DIR = LTAR_L10N_DIR;
}
