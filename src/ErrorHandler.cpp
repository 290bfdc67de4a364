#include "ErrorHandler.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace sqlquote {

thread_local std::vector<std::string> ErrorContext::s_contexts;

int ErrorHandler::exitCodeFor(const std::exception& error) {
    if (dynamic_cast<const ConfigException*>(&error)) {
        return ERR_CONFIG;
    }

    if (const auto* input = dynamic_cast<const InputException*>(&error)) {
        switch (input->kind()) {
            case InputException::Kind::NotFound:
                return ERR_NO_INPUT;
            case InputException::Kind::Malformed:
                return ERR_DATA;
        }
    }

    if (dynamic_cast<const CLI::Error*>(&error)) {
        return ERR_USAGE;
    }

    if (dynamic_cast<const nlohmann::json::exception*>(&error)) {
        return ERR_DATA;
    }

    return ERR_SOFTWARE;
}

std::string ErrorHandler::withContext(const std::string& message) {
    std::string context = ErrorContext::current();
    if (context.empty()) {
        return message;
    }
    return context + ": " + message;
}

ErrorContext::ErrorContext(const std::string& context) {
    s_contexts.push_back(context);
}

ErrorContext::~ErrorContext() {
    s_contexts.pop_back();
}

std::string ErrorContext::current() {
    std::string result;
    for (const auto& context : s_contexts) {
        if (!result.empty()) result += ": ";
        result += context;
    }
    return result;
}

ConfigException::ConfigException(const std::string& key, const std::string& message)
    : std::runtime_error(ErrorHandler::withContext(key.empty() ? message : key + ": " + message)),
      m_key(key) {}

InputException::InputException(Kind kind, const std::string& message, size_t line)
    : std::runtime_error(ErrorHandler::withContext(
          line > 0 ? "line " + std::to_string(line) + ": " + message : message)),
      m_kind(kind),
      m_line(line) {}

}  // namespace sqlquote
