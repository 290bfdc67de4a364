#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace sqlquote {

// Maps failures of the sql-quote command to process exit codes.
// Values follow sysexits(3).
class ErrorHandler {
public:
    // Exit code for an exception escaping the command
    static int exitCodeFor(const std::exception& error);

    // Message prefixed with the active ErrorContext, if any
    static std::string withContext(const std::string& message);

    static constexpr int SUCCESS = 0;
    static constexpr int ERR_USAGE = 64;
    static constexpr int ERR_DATA = 65;
    static constexpr int ERR_NO_INPUT = 66;
    static constexpr int ERR_SOFTWARE = 70;
    static constexpr int ERR_CONFIG = 78;
};

// RAII wrapper for pushing/popping error context, e.g. "reading names.txt"
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    // Active contexts joined with ": ", outermost first
    static std::string current();

private:
    static thread_local std::vector<std::string> s_contexts;
};

// Invalid configuration file or option value. The active ErrorContext is
// captured into what() at construction.
class ConfigException : public std::runtime_error {
public:
    ConfigException(const std::string& key, const std::string& message);

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

// Unreadable input or malformed input line
class InputException : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        Malformed
    };

    InputException(Kind kind, const std::string& message, size_t line = 0);

    Kind kind() const { return m_kind; }
    size_t line() const { return m_line; }

private:
    Kind m_kind;
    size_t m_line;
};

}  // namespace sqlquote
