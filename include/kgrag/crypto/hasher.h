#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace kgrag::crypto {

enum class DigestAlgorithm { MD5, SHA256 };

// Interface for streaming content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span<const char>(text.data(), text.size())));
        return finalize();
    }
};

// OpenSSL EVP backed digest (lower-case hex output)
class DigestHasher : public IContentHasher {
public:
    explicit DigestHasher(DigestAlgorithm algorithm = DigestAlgorithm::SHA256);
    ~DigestHasher() override;

    DigestHasher(const DigestHasher&) = delete;
    DigestHasher& operator=(const DigestHasher&) = delete;
    DigestHasher(DigestHasher&&) noexcept;
    DigestHasher& operator=(DigestHasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    DigestAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
    DigestAlgorithm algorithm_;
};

std::unique_ptr<IContentHasher> createHasher(DigestAlgorithm algorithm);

// One-shot helpers over UTF-8 text
std::string md5Hex(std::string_view text);
std::string sha256Hex(std::string_view text);

} // namespace kgrag::crypto
