#pragma once

#include "SqlEscaper.hpp"
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlquote {

enum class FragmentKind {
    Identifier,
    Literal,
    Table
};

enum class OutputFormat {
    Text,
    JSON
};

struct RenderOptions {
    FragmentKind kind = FragmentKind::Identifier;
    IdentifierQuoting quoting = IdentifierQuoting::WhenNeeded;
    std::string schema;  // Qualifies every value when kind is Table
    OutputFormat format = OutputFormat::Text;
    bool pretty = true;
    int indent = 2;
};

struct RenderedFragment {
    std::string input;
    std::string output;
};

// Turns raw command line values into escaped SQL fragments and formats
// the batch as text (one fragment per line) or JSON.
class FragmentRenderer {
public:
    explicit FragmentRenderer(RenderOptions options) : m_options(std::move(options)) {}

    const RenderOptions& options() const { return m_options; }

    // Render one value. Throws InputException for a malformed schema,table pair.
    RenderedFragment render(const std::string& value) const;

    std::vector<RenderedFragment> renderAll(const std::vector<std::string>& values) const;

    std::string format(const std::vector<RenderedFragment>& fragments) const;
    std::string toText(const std::vector<RenderedFragment>& fragments) const;
    std::string toJSON(const std::vector<RenderedFragment>& fragments) const;

    // One value per line; trailing \r is dropped and blank lines are skipped
    static std::vector<std::string> readLines(std::istream& input);
    static std::vector<std::string> readFile(const std::filesystem::path& path);

    // Split a CSV line honoring "quoted, fields" and "" escapes
    static std::vector<std::string> splitCSVLine(const std::string& line,
                                                 char delimiter = ',',
                                                 char quote = '"');

    static std::optional<FragmentKind> parseKind(std::string_view name);
    static std::string kindToString(FragmentKind kind);

private:
    RenderOptions m_options;
};

}  // namespace sqlquote
