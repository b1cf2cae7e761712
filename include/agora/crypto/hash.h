// AGORA - SHA256 Hashing
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL EVP, plus the helpers used to
// derive proposal handles, account handles and audit digests.

#ifndef AGORA_CRYPTO_HASH_H
#define AGORA_CRYPTO_HASH_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "agora/core/types.h"

namespace agora {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    
    /// Write a string's bytes followed by a 4-byte length suffix, so that
    /// adjacent fields cannot run into each other
    SHA256& WriteField(const std::string& str);
    
    /// Write a 64-bit integer little-endian
    SHA256& WriteU64(uint64_t value);
    
    /// Finalize the hash into a Hash256. The hasher must be Reset before reuse.
    Hash256 Finalize();
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256 hash of a string
Hash256 SHA256Hash(const std::string& str);

/// Truncate a 256-bit digest to a 160-bit handle (first 20 bytes)
Hash160 Truncate160(const Hash256& digest);

/// Deterministic account handle for a human-readable name
AccountId AccountIdFromName(const std::string& name);

/// Deterministic asset handle for a ticker symbol
AssetId AssetIdFromSymbol(const std::string& symbol);

} // namespace agora

#endif // AGORA_CRYPTO_HASH_H
