#include <kgrag/crypto/hasher.h>
#include <kgrag/kg/identity.h>
#include <kgrag/kg/types.h>

#include <cctype>

namespace kgrag::kg {

namespace {

// Decodes the code point starting at text[pos] and advances pos. Invalid lead bytes are
// consumed one at a time and reported as U+FFFD.
char32_t nextCodePoint(std::string_view text, std::size_t& pos) noexcept {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 1;
    char32_t cp = lead;
    if (lead >= 0xF0 && lead < 0xF8) {
        len = 4;
        cp = lead & 0x07;
    } else if (lead >= 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if (lead >= 0x80) {
        ++pos;
        return 0xFFFD;
    }
    if (pos + len > text.size()) {
        ++pos;
        return 0xFFFD;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return 0xFFFD;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += len;
    return cp;
}

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isWidePunctuation(char32_t cp) {
    return (cp >= 0x2000 && cp <= 0x206F) || // general punctuation
           (cp >= 0x3000 && cp <= 0x303F) || // CJK symbols and punctuation
           (cp >= 0xFF00 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) || cp == 0xFFFD;
}

std::string collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isAsciiSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string md5Prefix(std::string_view text, std::size_t length) {
    return crypto::md5Hex(text).substr(0, length);
}

} // namespace

bool isCjkIdeograph(char32_t cp) noexcept {
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

char32_t decodeUtf8(std::string_view text, std::size_t& pos) noexcept {
    return nextCodePoint(text, pos);
}

std::vector<std::size_t> utf8Boundaries(std::string_view text) {
    std::vector<std::size_t> offsets;
    offsets.reserve(text.size() + 1);
    std::size_t pos = 0;
    while (pos < text.size()) {
        offsets.push_back(pos);
        nextCodePoint(text, pos);
    }
    offsets.push_back(text.size());
    return offsets;
}

std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::size_t utf8Length(std::string_view text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        nextCodePoint(text, pos);
        ++count;
    }
    return count;
}

std::size_t utf8PrefixBytes(std::string_view text, std::size_t maxChars) {
    std::size_t pos = 0;
    std::size_t chars = 0;
    while (pos < text.size() && chars < maxChars) {
        nextCodePoint(text, pos);
        ++chars;
    }
    return pos;
}

std::string slug(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool inRun = false;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        const char32_t cp = nextCodePoint(text, pos);
        // '_' joins the separator run so that underscores collapse with it
        const bool keep =
            (cp < 0x80 && std::isalnum(static_cast<unsigned char>(cp))) || isCjkIdeograph(cp);
        if (!keep) {
            inRun = true;
            continue;
        }
        if (inRun) {
            out.push_back('_');
            inRun = false;
        }
        out.append(text.substr(start, pos - start));
    }

    const auto first = out.find_first_not_of('_');
    if (first == std::string::npos)
        return {};
    const auto last = out.find_last_not_of('_');
    return toLowerAscii(std::string_view(out).substr(first, last - first + 1));
}

std::string canonicalize(std::string_view name) {
    return collapseWhitespace(name);
}

std::string contentHash(std::string_view text) {
    auto normalized = collapseWhitespace(text);
    if (normalized.empty())
        return {};
    return md5Prefix(normalized, kContentHashLength);
}

std::string sectionId(std::string_view topic, std::string_view chapter,
                      std::string_view subchapter) {
    std::string key;
    key.reserve(topic.size() + chapter.size() + subchapter.size() + 2);
    key.append(topic).append("|").append(chapter).append("|").append(subchapter);
    return md5Prefix(key, kSectionIdLength);
}

std::string sectionScope(std::string_view id) {
    if (id.empty())
        return {};
    return std::string(kSectionScopePrefix) + std::string(id);
}

std::string nodeId(std::string_view canonicalName, std::string_view type, std::string_view scope) {
    auto base = slug(canonicalName);
    if (base.empty())
        return {};

    std::string id = std::move(base);
    if (!type.empty() && type != kDefaultNodeType) {
        id += "_";
        id += toLowerAscii(type);
    }
    id += "_";
    id += md5Prefix(scope, kScopeHashLength);

    if (id.size() > kMaxNodeIdLength) {
        // Cut on a code point boundary so the id stays valid UTF-8
        std::size_t cut = 0;
        std::size_t pos = 0;
        while (pos < id.size()) {
            std::size_t next = pos;
            nextCodePoint(id, next);
            if (next > kNodeIdPrefixLength)
                break;
            pos = next;
            cut = pos;
        }
        id = id.substr(0, cut) + "_" + md5Prefix(id, kScopeHashLength);
    }
    return id;
}

std::string relationId(std::string_view typeName, std::string_view sourceId,
                       std::string_view targetId, std::string_view scope) {
    std::string key;
    key.reserve(typeName.size() + sourceId.size() + targetId.size() + scope.size() + 3);
    key.append(typeName).append("|").append(sourceId).append("|").append(targetId).append("|").append(
        scope);
    return md5Prefix(key, kRelationIdLength);
}

std::string bookId(std::string_view topic, std::string_view runId) {
    std::string id(kBookScopePrefix);
    id += slug(topic);
    if (!runId.empty()) {
        id += ":";
        id += std::string(runId.substr(0, kRunIdPrefixLength));
    }
    return id;
}

std::string bookScope(std::string_view id) {
    if (id.empty())
        return {};
    if (id.substr(0, kBookScopePrefix.size()) == kBookScopePrefix)
        return std::string(id);
    return std::string(kBookScopePrefix) + std::string(id);
}

std::string foldAlnum(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        const char32_t cp = nextCodePoint(text, pos);
        if (cp < 0x80) {
            const auto c = static_cast<unsigned char>(cp);
            if (std::isalnum(c))
                out.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        if (isWidePunctuation(cp))
            continue;
        out.append(text.substr(start, pos - start));
    }
    return out;
}

} // namespace kgrag::kg
