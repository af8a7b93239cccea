#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::kg {

// Deterministic identity helpers. All functions are pure; empty input yields empty output
// unless noted otherwise.

inline constexpr std::size_t kSectionIdLength = 12;
inline constexpr std::size_t kContentHashLength = 12;
inline constexpr std::size_t kRelationIdLength = 16;
inline constexpr std::size_t kScopeHashLength = 8;
inline constexpr std::size_t kMaxNodeIdLength = 64;
inline constexpr std::size_t kNodeIdPrefixLength = 50;
inline constexpr std::size_t kRunIdPrefixLength = 8;

inline constexpr std::string_view kSectionScopePrefix = "section:";
inline constexpr std::string_view kBookScopePrefix = "book:";

/**
 * Replace every run of characters outside [A-Za-z0-9_] and CJK (U+4E00..U+9FFF) with a
 * single '_', strip leading/trailing '_', lower-case ASCII.
 */
std::string slug(std::string_view text);

/// Trim and collapse internal whitespace runs to a single space
std::string canonicalize(std::string_view name);

/// md5 over the whitespace-normalized text, truncated to kContentHashLength hex chars
std::string contentHash(std::string_view text);

/// md5("topic|chapter|subchapter") truncated to kSectionIdLength hex chars
std::string sectionId(std::string_view topic, std::string_view chapter,
                      std::string_view subchapter);

std::string sectionScope(std::string_view sectionId);

/**
 * Node id: slug(name) [+ "_" + lower(type) when not "Concept"] + "_" + md5(scope)[0..8).
 * Ids longer than kMaxNodeIdLength keep their first 50 chars plus "_" + md5(id)[0..8).
 */
std::string nodeId(std::string_view canonicalName, std::string_view type, std::string_view scope);

/// md5("type|source|target|scope") truncated to kRelationIdLength hex chars
std::string relationId(std::string_view typeName, std::string_view sourceId,
                       std::string_view targetId, std::string_view scope);

/// "book:<slug(topic)>:<runId[0..8)>", or "book:<slug(topic)>" without a run id
std::string bookId(std::string_view topic, std::string_view runId);

/// Scope string for a book id; ids already tagged with "book:" are used as-is
std::string bookScope(std::string_view bookId);

/**
 * Simplified text used for content dedup: ASCII alphanumerics (lower-cased) and non-ASCII
 * letters are kept; whitespace and ASCII/CJK/full-width punctuation are dropped.
 */
std::string foldAlnum(std::string_view text);

/// ASCII lower-case copy (multi-byte UTF-8 sequences pass through unchanged)
std::string toLowerAscii(std::string_view text);

/// Number of UTF-8 code points in text
std::size_t utf8Length(std::string_view text);

/// Byte length of the longest prefix holding at most maxChars code points
std::size_t utf8PrefixBytes(std::string_view text, std::size_t maxChars);

/// Byte offset of every code point, followed by text.size()
std::vector<std::size_t> utf8Boundaries(std::string_view text);

/// True for U+4E00..U+9FFF
bool isCjkIdeograph(char32_t cp) noexcept;

/// Decode the code point starting at byte pos and advance pos past it
char32_t decodeUtf8(std::string_view text, std::size_t& pos) noexcept;

} // namespace kgrag::kg
