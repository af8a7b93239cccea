#pragma once

#include <kgrag/core/types.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::vector {

/**
 * Configuration for document chunking. Sizes are in characters (UTF-8 code points).
 */
struct ChunkingConfig {
    size_t chunk_size = 800;
    size_t overlap = 120;

    bool isValid() const { return chunk_size > 0 && overlap < chunk_size; }
};

/**
 * Represents a single document chunk
 */
struct DocumentChunk {
    std::string chunk_id;   // <doc>_chunk_<index>_<md5(text)[0..8)>
    std::string doc_id;     // Parent document id
    std::string content;    // Chunk text content (trimmed)
    size_t chunk_index = 0; // Position in document (0-based)
    size_t start_offset = 0; // Character offset in document
    size_t end_offset = 0;   // End character offset (exclusive)
    size_t token_count = 0;  // Estimated token count

    std::map<std::string, std::string> metadata;

    bool hasOverlapWith(const DocumentChunk& other) const {
        return (start_offset < other.end_offset) && (end_offset > other.start_offset);
    }
};

/**
 * Sliding-window chunker that prefers to end a chunk right after a sentence terminator.
 */
class DocumentChunker {
public:
    explicit DocumentChunker(ChunkingConfig config = {});

    Result<std::vector<DocumentChunk>>
    chunkDocument(const std::string& docId, std::string_view text,
                  const std::map<std::string, std::string>& metadata = {}) const;

    /// CJK characters + 1.3 x ASCII words
    static size_t estimateTokens(std::string_view text);

    static std::string makeChunkId(const std::string& docId, size_t index, std::string_view text);

    const ChunkingConfig& config() const { return config_; }

private:
    ChunkingConfig config_;
};

} // namespace kgrag::vector
