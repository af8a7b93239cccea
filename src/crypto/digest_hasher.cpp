#include <kgrag/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <stdexcept>

namespace kgrag::crypto {

namespace {
const EVP_MD* evpFor(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5:
            return EVP_md5();
        case DigestAlgorithm::SHA256:
            return EVP_sha256();
    }
    return EVP_sha256();
}
} // namespace

struct DigestHasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

DigestHasher::DigestHasher(DigestAlgorithm algorithm)
    : pImpl(std::make_unique<Impl>()), algorithm_(algorithm) {
    init();
}

DigestHasher::~DigestHasher() = default;

DigestHasher::DigestHasher(DigestHasher&&) noexcept = default;
DigestHasher& DigestHasher::operator=(DigestHasher&&) noexcept = default;

void DigestHasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, evpFor(algorithm_), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }
}

void DigestHasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string DigestHasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hashLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, hash.data(), &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }

    std::string result;
    result.reserve(hashLen * 2);
    for (unsigned int i = 0; i < hashLen; ++i) {
        result += fmt::format("{:02x}", hash[i]);
    }

    // Reset for potential reuse
    init();

    return result;
}

std::unique_ptr<IContentHasher> createHasher(DigestAlgorithm algorithm) {
    return std::make_unique<DigestHasher>(algorithm);
}

std::string md5Hex(std::string_view text) {
    DigestHasher hasher(DigestAlgorithm::MD5);
    return hasher.hash(text);
}

std::string sha256Hex(std::string_view text) {
    DigestHasher hasher(DigestAlgorithm::SHA256);
    return hasher.hash(text);
}

} // namespace kgrag::crypto
