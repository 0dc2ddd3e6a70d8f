#pragma once

#include "Utils.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        const auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 32; ++attempt) {
            auto candidate = base / ("file_organizer_test_" + std::to_string(gen()));
            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec)) {
                path_ = std::filesystem::canonical(candidate);
                return;
            }
        }
        throw std::runtime_error("Failed to create temporary directory");
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

class EnvVarGuard {
public:
    EnvVarGuard(std::string name, std::optional<std::string> value)
        : name_(std::move(name)) {
        if (const char* existing = std::getenv(name_.c_str())) {
            previous_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(previous_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
        if (value) {
            ::setenv(name_.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    std::string name_;
    std::optional<std::string> previous_;
};

inline std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Sets modification (and access) time to the given local wall-clock date.
inline void set_mtime(const std::filesystem::path& path, int year, int month, int day) {
    const auto when = Utils::make_local_time(year, month, day, 12, 0, 0);
    if (when) {
        Utils::set_file_times(path, *when, *when);
    }
}

inline std::string jpeg_bytes() {
    return std::string("\xFF\xD8\xFF\xE0\x00\x10JFIF\x00\x01\x01\x00\x00\x01\x00\x01\x00\x00", 20) +
           std::string("\xFF\xD9", 2);
}
