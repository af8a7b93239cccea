#include <spdlog/spdlog.h>
#include <kgrag/kg/extraction_parser.h>
#include <kgrag/kg/identity.h>

#include <charconv>

namespace kgrag::kg {

namespace {

enum class Section { None, Nodes, Relations, Hierarchy, Unknown };

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

Section classifyHeading(std::string_view line) {
    auto title = line;
    while (!title.empty() && title.front() == '#')
        title.remove_prefix(1);
    const auto key = toLowerAscii(trim(title));

    if (key == "nodes" || key == "entities" || key == "concepts" || key == "节点")
        return Section::Nodes;
    if (key == "relations" || key == "relationships" || key == "edges" || key == "关系")
        return Section::Relations;
    if (key == "hierarchy" || key == "层次结构")
        return Section::Hierarchy;
    return Section::Unknown;
}

// Returns the bullet body or an empty view when the line is not a list item
std::string_view bulletBody(std::string_view line) {
    if (line.size() < 2)
        return {};
    if ((line[0] == '-' || line[0] == '*') && line[1] == ' ')
        return trim(line.substr(2));
    return {};
}

// Position and width of the first ':' or full-width '：'
std::pair<std::size_t, std::size_t> findColon(std::string_view text) {
    static constexpr std::string_view kWideColon = "\xEF\xBC\x9A";
    const auto ascii = text.find(':');
    const auto wide = text.find(kWideColon);
    if (wide != std::string_view::npos && (ascii == std::string_view::npos || wide < ascii))
        return {wide, kWideColon.size()};
    return {ascii, 1};
}

} // namespace

ExtractionParser::ExtractionParser(ParserOptions options) : options_(options) {}

Result<DraftGraph> ExtractionParser::parse(std::string_view text) const {
    if (trim(text).empty()) {
        return Error{ErrorCode::InvalidData, "Extraction output is empty"};
    }

    DraftGraph draft;
    Section section = Section::None;
    bool recognized = false;
    std::string hierarchy;

    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = text.size();
        const auto raw = text.substr(pos, eol - pos);
        pos = eol + 1;

        const auto line = trim(raw);
        if (line.rfind("#", 0) == 0) {
            section = classifyHeading(line);
            recognized = recognized || (section != Section::Unknown);
            continue;
        }

        if (section == Section::Hierarchy) {
            if (!hierarchy.empty() || !line.empty()) {
                hierarchy.append(raw);
                hierarchy.push_back('\n');
            }
            continue;
        }
        if (line.empty() || (section != Section::Nodes && section != Section::Relations))
            continue;

        const auto body = bulletBody(line);
        if (body.empty()) {
            ++draft.skippedLines;
            continue;
        }

        if (section == Section::Nodes) {
            DraftNode node;
            const auto [colon, width] = findColon(body);
            if (colon == std::string_view::npos) {
                node.name = std::string(body);
            } else {
                node.name = std::string(trim(body.substr(0, colon)));
                node.description = std::string(trim(body.substr(colon + width)));
            }
            if (node.name.empty()) {
                ++draft.skippedLines;
                continue;
            }
            draft.nodes.push_back(std::move(node));
            continue;
        }

        // Relations
        const auto arrow = body.find("->");
        if (arrow == std::string_view::npos) {
            ++draft.skippedLines;
            continue;
        }
        DraftEdge edge;
        edge.confidence = options_.defaultConfidence;
        edge.weight = options_.defaultWeight;
        edge.source = std::string(trim(body.substr(0, arrow)));

        auto rest = body.substr(arrow + 2);
        const auto [colon, width] = findColon(rest);
        if (colon == std::string_view::npos) {
            edge.target = std::string(trim(rest));
        } else {
            edge.target = std::string(trim(rest.substr(0, colon)));
            auto label = rest.substr(colon + width);
            const auto bar = label.find('|');
            if (bar != std::string_view::npos) {
                const auto confText = trim(label.substr(bar + 1));
                double confidence = 0.0;
                auto [ptr, ec] =
                    std::from_chars(confText.data(), confText.data() + confText.size(), confidence);
                if (ec == std::errc{} && ptr == confText.data() + confText.size()) {
                    edge.confidence = confidence;
                } else {
                    spdlog::debug("[ExtractionParser] ignoring confidence '{}'", confText);
                }
                label = label.substr(0, bar);
            }
            edge.typeLabel = std::string(trim(label));
        }

        if (edge.source.empty() || edge.target.empty()) {
            ++draft.skippedLines;
            continue;
        }
        edge.description = edge.source + " -> " + edge.target;
        draft.edges.push_back(std::move(edge));
    }

    if (!recognized) {
        return Error{ErrorCode::InvalidData, "Extraction output has no recognizable sections"};
    }

    draft.hierarchy = std::string(trim(hierarchy));
    if (draft.skippedLines > 0) {
        spdlog::debug("[ExtractionParser] skipped {} unparseable lines", draft.skippedLines);
    }
    return draft;
}

} // namespace kgrag::kg
