#pragma once

#include "FragmentRenderer.hpp"
#include "SqlEscaper.hpp"
#include <spdlog/common.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sqlquote {

struct QuotingConfig {
    std::string identifiers = "needed";  // needed, always
    std::string kind = "identifier";     // identifier, literal, table
    std::string schema;
};

struct OutputConfig {
    std::string format = "text";  // text, json
    bool pretty_json = true;
    int indent = 2;
};

struct LoggingConfig {
    std::string level = "warn";
};

struct Config {
    QuotingConfig quoting;
    OutputConfig output;
    LoggingConfig logging;

    std::vector<std::string> values;
    std::string input_file;  // "-" reads stdin
    std::string config_file;
    bool debug = false;

    // Load from file. Returns nullopt if the file cannot be opened and
    // throws ConfigException on malformed values.
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments. A config file given with -c or the
    // SQL_QUOTE_CONFIG environment variable is loaded first; options given
    // on the command line override it. Throws ConfigException if that file
    // cannot be opened.
    static Config parseArgs(int argc, char* argv[]);

    // Throws ConfigException for an invalid option value and InputException
    // for a missing input file. Returns false when there is nothing to render.
    bool validate() const;

    IdentifierQuoting identifierQuoting() const;
    FragmentKind fragmentKind() const;
    OutputFormat outputFormat() const;
    spdlog::level::level_enum logLevel() const;

    RenderOptions renderOptions() const;
};

}  // namespace sqlquote
