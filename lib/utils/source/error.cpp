#include "utils/error.h"
#include "utils/log.h"

#include <fmt/std.h>
#include <sqlite3.h>

namespace utils {
IOError::IOError(std::string_view msg, fs::path path)
    : m_message(msg)
    , m_path(std::move(path))
{
}

IOError::IOError(std::string_view msg, fs::path path, spdlog::logger& logger)
    : m_message(msg)
    , m_path(std::move(path))
{
    logger.error("{} (path: {})", m_message, m_path);
}

DBError::DBError(std::string_view msg, int error_code)
    : m_message(msg)
    , m_error(error_code)
{
}

DBError::DBError(std::string_view msg, int error_code, spdlog::logger& logger)
    : m_message(msg)
    , m_error(error_code)
{
    logger.error("{} (Error {} ({}))", m_message, m_error, sqlite3_errstr(m_error));
}

GenericError::GenericError(std::string_view msg)
    : m_message(msg)
{
}

GenericError::GenericError(std::string_view msg, spdlog::logger& logger)
    : m_message(msg)
{
    logger.error("Error: {}", m_message);
}

StackError::StackError(std::string_view msg)
    : m_message(msg)
{
}

MissingInput::MissingInput(std::string_view msg, fs::path path)
    : StackError(fmt::format("{} {}", msg, path.string()))
    , m_path(std::move(path))
{
}
}
