#pragma once

#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

// Source of ticks. Implementations must be safe to call from the cycle
// thread while subscribe/unsubscribe run on another.
class Provider {
public:
    virtual ~Provider() = default;

    // Returns whatever is available before `deadline`; an empty batch means
    // nothing more is pending. Throws ProviderUnavailableError when the
    // upstream cannot be reached.
    virtual std::vector<Tick> poll(std::chrono::steady_clock::time_point deadline) = 0;

    virtual void subscribe(const std::vector<std::string>& symbols) = 0;
    virtual void unsubscribe(const std::vector<std::string>& symbols) = 0;

    virtual bool is_connected() const = 0;
    virtual std::string name() const = 0;

    // Upstream records dropped because they did not decode into a Tick
    virtual uint64_t malformed_messages() const { return 0; }
};
