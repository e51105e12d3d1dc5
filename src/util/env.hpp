#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rock::util {

// Split one .env line into key and value. Blank lines, comments and lines
// without '=' or with an empty key or value yield nullopt. A leading
// "export " is dropped and one pair of matching quotes is stripped.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(std::string_view line);

// Set every pair from path that is not already in the environment.
// Returns the number of variables set.
size_t apply_dotenv_file(const std::filesystem::path& path);

// ROCK_DOTENV_PATH, then .env in cwd and its two parents, then next to the
// executable and one level up
std::vector<std::filesystem::path> dotenv_search_paths();

// Apply the first .env found in dotenv_search_paths(), once per process
void load_dotenv();

// Read an environment variable, falling back to default_value when unset
std::string get_env(const std::string& name, const std::string& default_value = "");

bool is_env_set(const std::string& name);

// ROCK_* environment variables
struct EnvVars {
    static std::string base_url();                      // ROCK_BASE_URL
    static int sandbox_startup_timeout_seconds();       // ROCK_SANDBOX_STARTUP_TIMEOUT_SECONDS
    static std::string logging_path();                  // ROCK_LOGGING_PATH
    static std::string logging_file_name();             // ROCK_LOGGING_FILE_NAME
    static std::string logging_level();                 // ROCK_LOGGING_LEVEL
};

} // namespace rock::util
