/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Config.hpp>
#include <Argus/Core/Logger.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <cerrno>

#include <sstream>

namespace Argus::Config {

namespace {

std::string trim(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Drop a trailing " ;" or " #" comment
std::string stripInlineComment(const std::string& value) {
    for (size_t i = 1; i < value.size(); ++i) {
        if ((value[i] == ';' || value[i] == '#') && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
            return value.substr(0, i);
        }
    }
    return value;
}

} // anonymous namespace

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return ErrorCode::InvalidPath;
        }

        std::string allowed = allowedResult.value();
        if (allowed.back() != '/') {
            allowed.push_back('/');
        }
        return canonicalPath.compare(0, allowed.length(), allowed) == 0;
    }

    Result<std::string> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            ARGUS_LOG_WARNING_F("Config path '%s' is outside the allowed directory", canonPath.c_str());
            return ErrorCode::AccessDenied;
        }

        // O_NOFOLLOW so a swapped-in symlink is refused
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return ErrorCode::FileNotFound;
        }

        // Size from the open descriptor, not the path
        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }
        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }
        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(st.st_size), '\0');
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = read(fd, data.data() + total, data.size() - total);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::IOError;
        }
        return data;
    }

    Result<ConfigMap> parseConfig(std::string_view text) {
        ConfigMap config;
        std::istringstream stream{std::string(text)};
        std::string line;
        std::string section;
        size_t lineNumber = 0;

        while (std::getline(stream, line)) {
            ++lineNumber;
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']' || line.size() < 3) {
                    ARGUS_LOG_WARNING_F("Malformed section header on config line %zu", lineNumber);
                    return ErrorCode::ConfigInvalid;
                }
                section = trim(line.substr(1, line.size() - 2));
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                ARGUS_LOG_DEBUG_F("Ignoring config line %zu without '='", lineNumber);
                continue;
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(stripInlineComment(line.substr(pos + 1)));
            if (key.empty()) {
                continue;
            }
            if (!section.empty()) {
                key = section + "." + key;
            }
            config[key] = value;
        }

        return config;
    }
};

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        ARGUS_LOG_ERROR_F("Failed to read config '%s': %s", path.c_str(),
                          std::string(getErrorMessage(dataResult.error())).c_str());
        return dataResult.error();
    }

    auto parsed = m_impl->parseConfig(dataResult.value());
    if (parsed.isSuccess()) {
        ARGUS_LOG_INFO_F("Loaded %zu settings from '%s'", parsed.value().size(), path.c_str());
    }
    return parsed;
}

Result<ConfigMap> ConfigLoader::loadFromString(std::string_view text) {
    return m_impl->parseConfig(text);
}

} // namespace Argus::Config
