#include <spdlog/spdlog.h>
#include <kgrag/crypto/hasher.h>
#include <kgrag/kg/identity.h>
#include <kgrag/vector/document_chunker.h>

#include <algorithm>
#include <array>

namespace kgrag::vector {

namespace {

constexpr std::array<std::string_view, 6> kSentenceTerminators = {
    "\xE3\x80\x82", // 。
    "\xEF\xBC\x81", // ！
    "\xEF\xBC\x9F", // ？
    ".", "!", "?"};

bool isTerminatorAt(std::string_view text, size_t byteOffset) {
    if (text[byteOffset] == '\n')
        return true;
    const auto rest = text.substr(byteOffset);
    return std::any_of(kSentenceTerminators.begin(), kSentenceTerminators.end(),
                       [&](std::string_view t) { return rest.substr(0, t.size()) == t; });
}

std::string_view trimView(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(first, last - first + 1);
}

} // namespace

DocumentChunker::DocumentChunker(ChunkingConfig config) : config_(config) {}

std::string DocumentChunker::makeChunkId(const std::string& docId, size_t index,
                                         std::string_view text) {
    return fmt::format("{}_chunk_{:04d}_{}", docId, index, crypto::md5Hex(text).substr(0, 8));
}

size_t DocumentChunker::estimateTokens(std::string_view text) {
    size_t cjk = 0;
    size_t words = 0;
    bool inWord = false;
    bool wordHasAlpha = false;
    size_t pos = 0;
    while (pos < text.size()) {
        const char32_t cp = kg::decodeUtf8(text, pos);
        if (kg::isCjkIdeograph(cp))
            ++cjk;
        const bool space = cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
                           cp == U'\f' || cp == U'\v';
        if (space) {
            if (inWord && wordHasAlpha)
                ++words;
            inWord = false;
            wordHasAlpha = false;
            continue;
        }
        inWord = true;
        if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z'))
            wordHasAlpha = true;
    }
    if (inWord && wordHasAlpha)
        ++words;
    return cjk + static_cast<size_t>(static_cast<double>(words) * 1.3);
}

Result<std::vector<DocumentChunk>>
DocumentChunker::chunkDocument(const std::string& docId, std::string_view text,
                               const std::map<std::string, std::string>& metadata) const {
    if (!config_.isValid()) {
        return Error{ErrorCode::InvalidArgument, "Invalid chunking configuration"};
    }
    if (docId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Document id must not be empty"};
    }

    std::vector<DocumentChunk> chunks;
    const auto bounds = kg::utf8Boundaries(text);
    const size_t length = bounds.size() - 1; // in code points

    size_t start = 0;
    size_t index = 0;
    while (start < length) {
        size_t end = std::min(start + config_.chunk_size, length);

        if (end < length) {
            const size_t floor = std::max(start + config_.chunk_size / 2, end >= 50 ? end - 50 : 0);
            for (size_t i = end; i > floor; --i) {
                if (isTerminatorAt(text, bounds[i])) {
                    end = i + 1;
                    break;
                }
            }
        }

        const auto raw = text.substr(bounds[start], bounds[end] - bounds[start]);
        const auto body = trimView(raw);
        if (!body.empty()) {
            DocumentChunk chunk;
            chunk.doc_id = docId;
            chunk.content = std::string(body);
            chunk.chunk_index = index;
            chunk.chunk_id = makeChunkId(docId, index, chunk.content);
            chunk.start_offset = start;
            chunk.end_offset = end;
            chunk.token_count = estimateTokens(chunk.content);
            chunk.metadata = metadata;
            chunk.metadata["chunk_index"] = std::to_string(index);
            chunk.metadata["start_char"] = std::to_string(start);
            chunk.metadata["end_char"] = std::to_string(end);
            chunks.push_back(std::move(chunk));
            ++index;
        }

        if (end >= length)
            break;
        start = std::max(start + 1, end > config_.overlap ? end - config_.overlap : 0);
    }

    spdlog::debug("[DocumentChunker] {} split into {} chunks", docId, chunks.size());
    return chunks;
}

} // namespace kgrag::vector
