/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, record builders).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "FileMetadataResolver.hpp"
#include "NamingOptions.hpp"
#include "Types.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
#ifdef _WIN32
        _putenv_s(key_.c_str(), value ? value->c_str() : "");
#else
        if (value.has_value()) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
#endif
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("vlr-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Create an empty file (and its parent folders).
 */
inline void touch_file(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << "data";
}

/**
 * @brief Resolve a path the way the CLI does, failing loudly for non-video input.
 */
inline FileRecord make_record(const std::string& path,
                              const NamingOptions& options,
                              bool is_directory = false,
                              bool parse_name = true) {
    auto record = FileMetadataResolver::resolve(path, is_directory, options, parse_name);
    if (!record) {
        throw std::invalid_argument("not a video path: " + path);
    }
    return *record;
}

/**
 * @brief Resolve every path in @p paths, keeping input order.
 */
inline std::vector<FileRecord> make_records(const std::vector<std::string>& paths,
                                            const NamingOptions& options) {
    std::vector<FileRecord> records;
    records.reserve(paths.size());
    for (const auto& path : paths) {
        records.push_back(make_record(path, options));
    }
    return records;
}

/**
 * @brief Every file path an entry list refers to, primaries and alternates alike.
 */
inline std::vector<std::string> all_paths(const std::vector<LogicalEntry>& entries) {
    std::vector<std::string> paths;
    for (const auto& entry : entries) {
        for (const auto& file : entry.files) {
            paths.push_back(file.path);
        }
        for (const auto& file : entry.alternate_versions) {
            paths.push_back(file.path);
        }
    }
    return paths;
}
