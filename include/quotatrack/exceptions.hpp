#pragma once

#include "quotatrack/types.hpp"
#include <stdexcept>
#include <string>

namespace quotatrack {

class QuotaTrackException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class QuotaNotFoundException : public QuotaTrackException {
public:
    explicit QuotaNotFoundException(const QuotaKey& key)
        : QuotaTrackException("Quota not registered: " + key.to_string())
        , key_(key) {}

    const QuotaKey& key() const noexcept { return key_; }

private:
    QuotaKey key_;
};

class QuotaAlreadyRegisteredException : public QuotaTrackException {
public:
    explicit QuotaAlreadyRegisteredException(const QuotaKey& key)
        : QuotaTrackException("Quota already registered: " + key.to_string())
        , key_(key) {}

    const QuotaKey& key() const noexcept { return key_; }

private:
    QuotaKey key_;
};

// Raw sample could not be turned into a consumption value
class MalformedSampleException : public QuotaTrackException {
public:
    MalformedSampleException(const QuotaKey& key, const std::string& reason)
        : QuotaTrackException("Malformed sample for " + key.to_string() + ": " + reason)
        , key_(key)
        , reason_(reason) {}

    const QuotaKey& key() const noexcept { return key_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    QuotaKey key_;
    std::string reason_;
};

class InvalidConfigException : public QuotaTrackException {
public:
    using QuotaTrackException::QuotaTrackException;
};

// Backing store failed or rejected an operation
class StoreException : public QuotaTrackException {
public:
    using QuotaTrackException::QuotaTrackException;
};

class CycleNotFoundException : public StoreException {
public:
    explicit CycleNotFoundException(CycleId id)
        : StoreException("Cycle not found: " + std::to_string(id))
        , cycle_id_(id) {}

    CycleId cycle_id() const noexcept { return cycle_id_; }

private:
    CycleId cycle_id_;
};

} // namespace quotatrack
