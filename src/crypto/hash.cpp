// AGORA - SHA256 Hashing Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/crypto/hash.h"

#include <openssl/evp.h>

namespace agora {

// ============================================================================
// SHA256 Implementation
// ============================================================================

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};
    
    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        Init();
    }
    
    ~Impl() {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
    
    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) return *this;
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

SHA256& SHA256::WriteField(const std::string& str) {
    Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    uint32_t len = static_cast<uint32_t>(str.size());
    Byte suffix[4] = {
        static_cast<Byte>(len), static_cast<Byte>(len >> 8),
        static_cast<Byte>(len >> 16), static_cast<Byte>(len >> 24)
    };
    return Write(suffix, sizeof(suffix));
}

SHA256& SHA256::WriteU64(uint64_t value) {
    Byte buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<Byte>(value >> (8 * i));
    }
    return Write(buf, sizeof(buf));
}

Hash256 SHA256::Finalize() {
    Hash256 result;
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, result.data(), &outLen) != 1 ||
        outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return result;
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

Hash256 SHA256Hash(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

Hash160 Truncate160(const Hash256& digest) {
    return Hash160(digest.data(), Hash160::SIZE);
}

AccountId AccountIdFromName(const std::string& name) {
    return Truncate160(SHA256Hash(name));
}

AssetId AssetIdFromSymbol(const std::string& symbol) {
    return AssetId(Truncate160(SHA256Hash("asset:" + symbol)));
}

} // namespace agora
