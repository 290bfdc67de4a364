#include "Config.hpp"
#include "ErrorHandler.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace sqlquote {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Drop a trailing "; comment" or "# comment" outside quotes
std::string stripComment(const std::string& value) {
    char in_quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (in_quote) {
            if (c == in_quote) in_quote = 0;
        } else if (c == '"' || c == '\'') {
            in_quote = c;
        } else if ((c == ';' || c == '#') && (i == 0 || value[i - 1] == ' ' || value[i - 1] == '\t')) {
            return trim(value.substr(0, i));
        }
    }
    return value;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw ConfigException(key, "expected a boolean, got '" + value + "'");
}

int parseInt(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw ConfigException(key, "expected an integer, got '" + value + "'");
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw ConfigException(key, "expected an integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ConfigException(key, "integer out of range: " + value);
    }
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    ErrorContext fileContext(path.string());

    Config config;
    config.config_file = path.string();
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        ErrorContext lineContext("line " + std::to_string(line_number));

        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigException("", "expected 'key = value', got '" + line + "'");
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = stripComment(trim(line.substr(eq_pos + 1)));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "quoting") {
            if (key == "identifiers") config.quoting.identifiers = value;
            else if (key == "kind") config.quoting.kind = value;
            else if (key == "schema") config.quoting.schema = value;
            else spdlog::debug("Ignoring unknown key {}.{}", current_section, key);
        }
        else if (current_section == "output") {
            if (key == "format") config.output.format = value;
            else if (key == "pretty_json") config.output.pretty_json = parseBool(key, value);
            else if (key == "indent") config.output.indent = parseInt(key, value);
            else spdlog::debug("Ignoring unknown key {}.{}", current_section, key);
        }
        else if (current_section == "logging") {
            if (key == "level") config.logging.level = value;
            else spdlog::debug("Ignoring unknown key {}.{}", current_section, key);
        }
        else {
            spdlog::debug("Ignoring key {} in unknown section [{}]", key, current_section);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"sql-quote - Render escaped SQL identifiers and string literals"};

    std::string kind;
    std::string schema;
    std::string input_file;
    std::string config_file;
    std::vector<std::string> values;
    bool always_quote = false;
    bool json = false;
    bool compact = false;
    bool debug = false;

    app.add_option("-k,--kind", kind, "Fragment kind (identifier, literal, table)")
        ->check(CLI::IsMember({"identifier", "column", "literal", "data", "table"}));
    app.add_option("-s,--schema", schema, "Schema qualifying every table name");
    app.add_option("-i,--input", input_file, "Read values from a file, one per line (- for stdin)");
    app.add_flag("-a,--always-quote", always_quote, "Quote identifiers even when not needed");
    app.add_flag("--json", json, "Emit a JSON array of input/output pairs");
    app.add_flag("--compact", compact, "Emit single-line JSON");
    app.add_option("-c,--config", config_file, "Path to configuration file");
    app.add_flag("-d,--debug", debug, "Enable debug output");
    app.add_option("values", values, "Values to render");
    app.set_version_flag("-V,--version", "sql-quote version 1.0.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        std::exit(code == 0 ? ErrorHandler::SUCCESS : ErrorHandler::ERR_USAGE);
    }

    if (config_file.empty()) {
        const char* env_config = std::getenv("SQL_QUOTE_CONFIG");
        if (env_config) {
            config_file = env_config;
        }
    }

    // Load config file if specified
    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (!file_config) {
            throw ConfigException("config", "cannot open " + config_file);
        }
        config = std::move(*file_config);
    }

    // Command line args override file config
    if (app.count("--kind")) config.quoting.kind = kind;
    if (app.count("--schema")) config.quoting.schema = schema;
    if (always_quote) config.quoting.identifiers = "always";
    if (json) config.output.format = "json";
    if (compact) config.output.pretty_json = false;
    if (debug) {
        config.debug = true;
        config.logging.level = "debug";
    }

    config.values = std::move(values);
    config.input_file = input_file;
    config.config_file = config_file;

    return config;
}

bool Config::validate() const {
    if (quoting.identifiers != "needed" && quoting.identifiers != "always") {
        throw ConfigException("quoting.identifiers",
                              "invalid value '" + quoting.identifiers + "' (expected needed or always)");
    }

    if (!FragmentRenderer::parseKind(quoting.kind)) {
        throw ConfigException("quoting.kind",
                              "invalid value '" + quoting.kind + "' (expected identifier, literal or table)");
    }

    if (!quoting.schema.empty() && fragmentKind() != FragmentKind::Table) {
        throw ConfigException("quoting.schema", "a schema can only be given for the table kind");
    }

    if (output.format != "text" && output.format != "json") {
        throw ConfigException("output.format",
                              "invalid value '" + output.format + "' (expected text or json)");
    }

    if (output.indent < 0 || output.indent > 16) {
        throw ConfigException("output.indent",
                              "must be between 0 and 16, got " + std::to_string(output.indent));
    }

    if (logging.level != "off" && spdlog::level::from_str(logging.level) == spdlog::level::off) {
        throw ConfigException("logging.level", "invalid value '" + logging.level + "'");
    }

    if (values.empty() && input_file.empty()) {
        spdlog::error("No values given (pass them as arguments or use -i)");
        return false;
    }

    if (!input_file.empty() && input_file != "-" && !std::filesystem::exists(input_file)) {
        throw InputException(InputException::Kind::NotFound,
                             "input file does not exist: " + input_file);
    }

    return true;
}

IdentifierQuoting Config::identifierQuoting() const {
    if (quoting.identifiers == "always") return IdentifierQuoting::Always;
    if (quoting.identifiers == "needed") return IdentifierQuoting::WhenNeeded;
    throw ConfigException("quoting.identifiers", "unknown value '" + quoting.identifiers + "'");
}

FragmentKind Config::fragmentKind() const {
    auto kind = FragmentRenderer::parseKind(quoting.kind);
    if (!kind) {
        throw ConfigException("quoting.kind", "unknown value '" + quoting.kind + "'");
    }
    return *kind;
}

OutputFormat Config::outputFormat() const {
    if (output.format == "json") return OutputFormat::JSON;
    if (output.format == "text") return OutputFormat::Text;
    throw ConfigException("output.format", "unknown value '" + output.format + "'");
}

spdlog::level::level_enum Config::logLevel() const {
    return spdlog::level::from_str(logging.level);
}

RenderOptions Config::renderOptions() const {
    RenderOptions options;
    options.kind = fragmentKind();
    options.quoting = identifierQuoting();
    options.schema = quoting.schema;
    options.format = outputFormat();
    options.pretty = output.pretty_json;
    options.indent = output.indent;
    return options;
}

}  // namespace sqlquote
