// AGORA - Core Types Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/types.h"

namespace agora {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    std::string result;
    result.reserve(SIZE * 2);
    
    static const char hexChars[] = "0123456789abcdef";
    
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    
    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for handle");
    }
    
    BaseHash result;
    
    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };
    
    for (size_t i = 0; i < SIZE; ++i) {
        Byte high = hexCharToNibble(hex[i * 2]);
        Byte low = hexCharToNibble(hex[i * 2 + 1]);
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }
    
    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// DaoError Implementation
// ============================================================================

const char* DaoErrorToString(DaoError err) {
    switch (err) {
        case DaoError::OK: return "OK";
        case DaoError::Unauthorized: return "Unauthorized";
        case DaoError::NotFound: return "NotFound";
        case DaoError::InvalidState: return "InvalidState";
        case DaoError::InvalidInput: return "InvalidInput";
        case DaoError::AlreadyExists: return "AlreadyExists";
        case DaoError::GoalReached: return "GoalReached";
        case DaoError::GoalNotReached: return "GoalNotReached";
        case DaoError::InsufficientFunds: return "InsufficientFunds";
        case DaoError::TransferFailed: return "TransferFailed";
    }
    return "Unknown error";
}

} // namespace agora
