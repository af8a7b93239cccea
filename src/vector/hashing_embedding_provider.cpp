#include <spdlog/spdlog.h>
#include <kgrag/kg/identity.h>
#include <kgrag/vector/embedding_provider.h>

#include <cctype>
#include <cmath>
#include <cstdint>

namespace kgrag::vector {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t fnv1a(const std::string& s) {
    std::uint64_t h = kFnvOffset;
    for (unsigned char c : s) {
        h ^= c;
        h *= kFnvPrime;
    }
    return h;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension);
}

std::vector<std::string> HashingEmbeddingProvider::features(const std::string& text) {
    std::vector<std::string> out;
    std::string word;
    std::string prevCjk;
    auto flushWord = [&]() {
        if (!word.empty()) {
            out.push_back(std::move(word));
            word.clear();
        }
    };

    size_t pos = 0;
    while (pos < text.size()) {
        const size_t start = pos;
        const char32_t cp = kg::decodeUtf8(text, pos);
        if (cp < 0x80 && std::isalnum(static_cast<unsigned char>(cp))) {
            word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(cp))));
            prevCjk.clear();
            continue;
        }
        flushWord();
        if (kg::isCjkIdeograph(cp)) {
            std::string ch(text.substr(start, pos - start));
            if (!prevCjk.empty())
                out.push_back(prevCjk + ch);
            out.push_back(ch);
            prevCjk = std::move(ch);
        } else {
            prevCjk.clear();
        }
    }
    flushWord();
    return out;
}

Result<std::vector<float>> HashingEmbeddingProvider::embed(const std::string& text) {
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidState, "Embedding dimension is zero"};
    }
    const auto feats = features(text);
    if (feats.empty()) {
        return Error{ErrorCode::InvalidArgument, "Text has no embeddable content"};
    }

    std::vector<float> embedding(dimension_, 0.0f);
    for (const auto& f : feats) {
        const auto h = fnv1a(f);
        const auto bucket = static_cast<size_t>(h % dimension_);
        embedding[bucket] += (h >> 63) ? -1.0f : 1.0f;
    }

    float norm = 0.0f;
    for (float v : embedding)
        norm += v * v;
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& v : embedding)
            v /= norm;
    }
    return embedding;
}

Result<std::vector<std::vector<float>>>
HashingEmbeddingProvider::embedBatch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        auto result = embed(text);
        if (!result)
            return result.error();
        embeddings.push_back(std::move(result).value());
    }
    return embeddings;
}

std::shared_ptr<IEmbeddingProvider> makeHashingEmbeddingProvider(size_t dimension) {
    return std::make_shared<HashingEmbeddingProvider>(dimension);
}

} // namespace kgrag::vector
