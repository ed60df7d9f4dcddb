#include "path_utils.h"
#include "utils.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace samaira {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

static bool espeak_data_exists(const std::string& base) {
    std::ifstream f(base + "/phontab");
    return f.good();
}

std::string default_espeak_data_path() {
    const char* candidates[] = {
        "/usr/share/espeak-ng-data",
        "/usr/lib/x86_64-linux-gnu/espeak-ng-data",
        "/usr/lib/aarch64-linux-gnu/espeak-ng-data",
        "/usr/local/share/espeak-ng-data",
    };
    for (const char* p : candidates) {
        if (espeak_data_exists(p)) return p;
    }
    return "/usr/share/espeak-ng-data";
}

bool is_executable_file(const std::string& path) {
    if (path.empty()) return false;
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string find_executable(const std::string& configured,
                            const std::string& name,
                            const std::vector<std::string>& fallback_dirs) {
    if (!configured.empty()) {
        std::string expanded = expand_path(configured);
        return is_executable_file(expanded) ? expanded : std::string();
    }

    for (const auto& dir : fallback_dirs) {
        std::string candidate = expand_path(dir) + "/" + name;
        if (is_executable_file(candidate)) return candidate;
    }

    const char* env_path = std::getenv("PATH");
    if (!env_path) return "";

    std::istringstream dirs(env_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
    }
    return "";
}

std::string read_first_line(const std::string& path) {
    std::ifstream file(expand_path(path));
    if (!file.is_open()) return "";
    std::string line;
    std::getline(file, line);
    return utils::trim_copy(line);
}

bool write_text_file(const std::string& path, const std::string& contents) {
    std::ofstream file(expand_path(path), std::ios::trunc);
    if (!file.is_open()) return false;
    file << contents << "\n";
    return static_cast<bool>(file);
}

} // namespace samaira
