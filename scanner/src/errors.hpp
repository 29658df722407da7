#pragma once

#include <stdexcept>
#include <string>

class ScannerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TickRejectReason {
    InvalidSymbol,
    InvalidPrice,
    InvalidVolume,
    OutOfOrder,
    Duplicate,
    Malformed
};

inline const char* to_string(TickRejectReason reason) {
    switch (reason) {
        case TickRejectReason::InvalidSymbol: return "invalid_symbol";
        case TickRejectReason::InvalidPrice: return "invalid_price";
        case TickRejectReason::InvalidVolume: return "invalid_volume";
        case TickRejectReason::OutOfOrder: return "out_of_order";
        case TickRejectReason::Duplicate: return "duplicate";
        case TickRejectReason::Malformed: return "malformed";
    }
    return "unknown";
}

// Malformed, stale or replayed tick. The tick is dropped, nothing is applied.
class InvalidTickError : public ScannerError {
public:
    InvalidTickError(TickRejectReason reason, const std::string& message)
        : ScannerError(message), reason_(reason) {}

    TickRejectReason reason() const { return reason_; }

private:
    TickRejectReason reason_;
};

// Aggregation attempted without five fresh pillar scores.
class IncompleteScoreSetError : public ScannerError {
public:
    using ScannerError::ScannerError;
};

class ProviderUnavailableError : public ScannerError {
public:
    using ScannerError::ScannerError;
};

class DeadlineExceededError : public ScannerError {
public:
    using ScannerError::ScannerError;
};

class ConfigError : public ScannerError {
public:
    using ScannerError::ScannerError;
};
