#pragma once

#include <exception>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace utils {
class IOError : public std::exception {
public:
    IOError(std::string_view msg, fs::path path);
    IOError(std::string_view msg, fs::path path, spdlog::logger& logger);

    char const* what() const noexcept override { return m_message.c_str(); }
    fs::path path() const { return m_path; }

private:
    std::string m_message;
    fs::path m_path;
};

class DBError : public std::exception {
public:
    DBError(std::string_view msg, int error_code);
    DBError(std::string_view msg, int error_code, spdlog::logger& logger);

    char const* what() const noexcept override { return m_message.c_str(); }
    int error_code() const { return m_error; }

private:
    std::string m_message;
    int m_error;
};

class GenericError : public std::exception {
public:
    explicit GenericError(std::string_view msg);
    GenericError(std::string_view msg, spdlog::logger& logger);

    char const* what() const noexcept override { return m_message.c_str(); }

private:
    std::string m_message;
};

// Fatal conditions of a stack run. Each one ends the run with a non-zero
// exit status after the run log has been closed.
class StackError : public std::exception {
public:
    explicit StackError(std::string_view msg);

    char const* what() const noexcept override { return m_message.c_str(); }

private:
    std::string m_message;
};

// Incompatible or unknown options, detected before any processing starts
class ConfigurationConflict : public StackError {
public:
    using StackError::StackError;
};

// A file or directory named by the caller does not exist
class MissingInput : public StackError {
public:
    MissingInput(std::string_view msg, fs::path path);

    fs::path path() const { return m_path; }

private:
    fs::path m_path;
};

// Discovery produced an empty catalog
class NoUsableScenes : public StackError {
public:
    using StackError::StackError;
};

// No scene survived the cut. The message is specific to the clip strategy.
class NoOverlap : public StackError {
public:
    using StackError::StackError;
};
}
