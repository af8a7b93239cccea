#include <kgrag/kg/identity.h>
#include <kgrag/kg/types.h>

#include <array>
#include <utility>

namespace kgrag::kg {

namespace {

constexpr std::array<std::pair<RelationType, std::string_view>, 14> kRelationNames{{
    {RelationType::Related, "RELATED"},
    {RelationType::IsA, "IS_A"},
    {RelationType::PartOf, "PART_OF"},
    {RelationType::InstanceOf, "INSTANCE_OF"},
    {RelationType::HasProperty, "HAS_PROPERTY"},
    {RelationType::DependsOn, "DEPENDS_ON"},
    {RelationType::PrerequisiteOf, "PREREQUISITE_OF"},
    {RelationType::Uses, "USES"},
    {RelationType::Implements, "IMPLEMENTS"},
    {RelationType::Causes, "CAUSES"},
    {RelationType::ContrastsWith, "CONTRASTS_WITH"},
    {RelationType::ExampleOf, "EXAMPLE_OF"},
    {RelationType::DerivedFrom, "DERIVED_FROM"},
    {RelationType::Mentions, "MENTIONS"},
}};

constexpr std::array<std::pair<std::string_view, RelationType>, 5> kSynonyms{{
    {"RELATED_TO", RelationType::Related},
    {"RELATES_TO", RelationType::Related},
    {"SUBCLASS_OF", RelationType::IsA},
    {"TYPE_OF", RelationType::IsA},
    {"REQUIRES", RelationType::DependsOn},
}};

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

const char* relationTypeName(RelationType type) noexcept {
    for (const auto& [value, name] : kRelationNames) {
        if (value == type)
            return name.data();
    }
    return "RELATED";
}

bool isSafeIdentifier(std::string_view label) noexcept {
    if (label.empty() || label.size() > 64)
        return false;
    if (label[0] < 'A' || label[0] > 'Z')
        return false;
    for (char c : label.substr(1)) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok)
            return false;
    }
    return true;
}

std::optional<RelationType> relationTypeFromName(std::string_view name) noexcept {
    for (const auto& [value, known] : kRelationNames) {
        if (known == name)
            return value;
    }
    return std::nullopt;
}

ParsedRelation parseRelationType(std::string_view label) {
    const auto trimmed = trim(label);
    if (trimmed.empty())
        return {};

    std::string key(trimmed);
    for (auto& c : key) {
        if (c >= 'a' && c <= 'z')
            c = static_cast<char>(c - 'a' + 'A');
        else if (c == ' ' || c == '-')
            c = '_';
    }

    if (isSafeIdentifier(key)) {
        if (auto known = relationTypeFromName(key))
            return {*known, {}};
        for (const auto& [synonym, value] : kSynonyms) {
            if (synonym == key)
                return {value, {}};
        }
    }
    return {RelationType::Related, std::string(trimmed)};
}

SectionContext makeSectionContext(std::string topic, std::string chapter, std::string subchapter,
                                  std::vector<std::string> keywords, std::string language) {
    SectionContext ctx;
    ctx.sectionId = kg::sectionId(topic, chapter, subchapter);
    ctx.scope = sectionScope(ctx.sectionId);
    ctx.topic = std::move(topic);
    ctx.chapter = std::move(chapter);
    ctx.subchapter = std::move(subchapter);
    ctx.keywords = std::move(keywords);
    ctx.language = std::move(language);
    return ctx;
}

} // namespace kgrag::kg
