#include "FragmentRenderer.hpp"
#include "ErrorHandler.hpp"
#include "Identifier.hpp"
#include "QuotedData.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace sqlquote {

using json = nlohmann::json;

RenderedFragment FragmentRenderer::render(const std::string& value) const {
    RenderedFragment fragment;
    fragment.input = value;

    switch (m_options.kind) {
        case FragmentKind::Identifier:
            fragment.output = Identifier(value).toString(m_options.quoting);
            break;

        case FragmentKind::Literal:
            fragment.output = QuotedData(value).toString();
            break;

        case FragmentKind::Table: {
            if (!m_options.schema.empty()) {
                fragment.output = SchemaTable(m_options.schema, value).toString(m_options.quoting);
                break;
            }

            auto fields = splitCSVLine(value);
            if (fields.size() == 1) {
                fragment.output = Table(fields[0]).toString(m_options.quoting);
            } else if (fields.size() == 2) {
                fragment.output = SchemaTable(fields[0], fields[1]).toString(m_options.quoting);
            } else {
                throw InputException(InputException::Kind::Malformed,
                                     "expected 'table' or 'schema,table', got " +
                                         std::to_string(fields.size()) + " fields");
            }
            break;
        }
    }

    spdlog::debug("Rendered {} {} as {}", kindToString(m_options.kind), value, fragment.output);
    return fragment;
}

std::vector<RenderedFragment> FragmentRenderer::renderAll(const std::vector<std::string>& values) const {
    std::vector<RenderedFragment> result;
    result.reserve(values.size());

    for (size_t i = 0; i < values.size(); ++i) {
        ErrorContext context("value " + std::to_string(i + 1));
        result.push_back(render(values[i]));
    }

    return result;
}

std::string FragmentRenderer::format(const std::vector<RenderedFragment>& fragments) const {
    return m_options.format == OutputFormat::JSON ? toJSON(fragments) : toText(fragments);
}

std::string FragmentRenderer::toText(const std::vector<RenderedFragment>& fragments) const {
    std::ostringstream out;
    for (const auto& fragment : fragments) {
        out << fragment.output << '\n';
    }
    return out.str();
}

std::string FragmentRenderer::toJSON(const std::vector<RenderedFragment>& fragments) const {
    json arr = json::array();

    for (const auto& fragment : fragments) {
        json obj = json::object();
        obj["kind"] = kindToString(m_options.kind);
        obj["input"] = fragment.input;
        obj["output"] = fragment.output;
        arr.push_back(std::move(obj));
    }

    // Input is arbitrary bytes; invalid UTF-8 is replaced rather than rejected
    const int indent = m_options.pretty ? m_options.indent : -1;
    return arr.dump(indent, ' ', false, json::error_handler_t::replace) + "\n";
}

std::vector<std::string> FragmentRenderer::readLines(std::istream& input) {
    std::vector<std::string> lines;
    std::string line;

    while (std::getline(input, line)) {
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) continue;

        lines.push_back(std::move(line));
    }

    return lines;
}

std::vector<std::string> FragmentRenderer::readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputException(InputException::Kind::NotFound,
                             "cannot open input file " + path.string());
    }

    auto lines = readLines(file);
    spdlog::debug("Read {} values from {}", lines.size(), path.string());
    return lines;
}

std::vector<std::string> FragmentRenderer::splitCSVLine(const std::string& line,
                                                        char delimiter,
                                                        char quote) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    size_t i = 0;

    while (i < line.size()) {
        char c = line[i];

        if (in_quotes) {
            if (c == quote) {
                // Check for escaped quote
                if (i + 1 < line.size() && line[i + 1] == quote) {
                    current += quote;
                    i += 2;
                    continue;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else {
            if (c == quote) {
                in_quotes = true;
            } else if (c == delimiter) {
                fields.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }

        ++i;
    }

    if (in_quotes) {
        throw InputException(InputException::Kind::Malformed, "unterminated quoted field");
    }

    fields.push_back(current);
    return fields;
}

std::optional<FragmentKind> FragmentRenderer::parseKind(std::string_view name) {
    if (name == "identifier" || name == "column") return FragmentKind::Identifier;
    if (name == "literal" || name == "data") return FragmentKind::Literal;
    if (name == "table") return FragmentKind::Table;
    return std::nullopt;
}

std::string FragmentRenderer::kindToString(FragmentKind kind) {
    switch (kind) {
        case FragmentKind::Identifier: return "identifier";
        case FragmentKind::Literal: return "literal";
        case FragmentKind::Table: return "table";
    }
    return "unknown";
}

}  // namespace sqlquote
