#pragma once

#include "fundamentals/clock.hpp"
#include "vault/secure_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace auth
{

struct AttemptCount
{
    uint32_t count = 0;
    std::optional<clk::time_point> reset_at;
};

/**
 * Persistent failure counter with a lazily evaluated reset window.
 * The window opens on the first failure of a streak and is never extended by
 * later failures. Expiry is only noticed on read: a read at or after
 * reset_at clears the stored counter before returning it.
 * All operations may throw vault::StorageError.
 */
class AttemptCounter
{
public:
    AttemptCounter(vault::SecureStore& store, std::string key,
                   const clk::Clock& clock, std::chrono::hours window);

    [[nodiscard]] AttemptCount current();
    AttemptCount increment();
    void reset();

    [[nodiscard]] std::chrono::hours window() const { return win; }

private:
    std::reference_wrapper<vault::SecureStore> store;
    std::string key;
    std::reference_wrapper<const clk::Clock> clock;
    std::chrono::hours win;
};

}
