#include "util/env.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <mutex>

namespace rock::util {

namespace {

std::string_view trim(std::string_view text) {
    const char* blanks = " \t\r\n";
    size_t first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

std::string_view unquote(std::string_view value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::optional<std::filesystem::path> executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return exe.parent_path();
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    constexpr std::string_view EXPORT_PREFIX = "export ";
    if (line.substr(0, EXPORT_PREFIX.size()) == EXPORT_PREFIX) {
        line = trim(line.substr(EXPORT_PREFIX.size()));
    }

    size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view key = trim(line.substr(0, eq));
    std::string_view value = unquote(trim(line.substr(eq + 1)));
    if (key.empty() || value.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::string(key), std::string(value));
}

size_t apply_dotenv_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return 0;
    }

    size_t applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto entry = parse_dotenv_line(line);
        if (!entry || is_env_set(entry->first)) {
            continue;
        }
        if (setenv(entry->first.c_str(), entry->second.c_str(), 0) == 0) {
            ++applied;
        }
    }
    return applied;
}

std::vector<std::filesystem::path> dotenv_search_paths() {
    std::vector<std::filesystem::path> paths;
    std::string explicit_path = get_env("ROCK_DOTENV_PATH");
    if (!explicit_path.empty()) {
        paths.emplace_back(explicit_path);
    }

    std::error_code ec;
    auto dir = std::filesystem::current_path(ec);
    for (int depth = 0; !ec && depth < 3 && !dir.empty(); ++depth) {
        paths.push_back(dir / ".env");
        if (dir == dir.parent_path()) break;
        dir = dir.parent_path();
    }

    if (auto exe = executable_dir()) {
        paths.push_back(*exe / ".env");
        paths.push_back(exe->parent_path() / ".env");
    }
    return paths;
}

void load_dotenv() {
    static std::once_flag once;
    std::call_once(once, [] {
        for (const auto& path : dotenv_search_paths()) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                continue;
            }
            size_t applied = apply_dotenv_file(path);
            spdlog::debug("Loaded {} variables from {}", applied, path.string());
            return;
        }
    });
}

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return default_value;
    }
    return std::string(value);
}

bool is_env_set(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}

std::string EnvVars::base_url() {
    return get_env("ROCK_BASE_URL", "http://localhost:8080");
}

int EnvVars::sandbox_startup_timeout_seconds() {
    std::string raw = get_env("ROCK_SANDBOX_STARTUP_TIMEOUT_SECONDS", "180");
    try {
        return std::stoi(raw);
    } catch (const std::exception&) {
        spdlog::warn("Invalid ROCK_SANDBOX_STARTUP_TIMEOUT_SECONDS '{}', using 180", raw);
        return 180;
    }
}

std::string EnvVars::logging_path() {
    return get_env("ROCK_LOGGING_PATH");
}

std::string EnvVars::logging_file_name() {
    return get_env("ROCK_LOGGING_FILE_NAME", "rocklet.log");
}

std::string EnvVars::logging_level() {
    return get_env("ROCK_LOGGING_LEVEL", "INFO");
}

} // namespace rock::util
