#pragma once

#include "config/config_types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

namespace sqlsession {

/**
 * @brief Delay between connection attempts
 *
 * delay(n) is the wait after the n-th failed attempt (n >= 1).
 */
class IBackoffPolicy {
public:
    virtual ~IBackoffPolicy() = default;

    [[nodiscard]] virtual std::chrono::milliseconds delay(uint32_t failed_attempt) const = 0;
};

/**
 * @brief Same delay after every failure
 */
class FixedBackoff : public IBackoffPolicy {
public:
    explicit FixedBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

    [[nodiscard]] std::chrono::milliseconds delay(uint32_t) const override { return delay_; }

private:
    std::chrono::milliseconds delay_;
};

/**
 * @brief initial * multiplier^(n-1), capped at max
 */
class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff(std::chrono::milliseconds initial, double multiplier,
                       std::chrono::milliseconds max);

    [[nodiscard]] std::chrono::milliseconds delay(uint32_t failed_attempt) const override;

private:
    std::chrono::milliseconds initial_;
    double multiplier_;
    std::chrono::milliseconds max_;
};

/**
 * @brief Build the policy selected by RetrySettings::backoff
 */
[[nodiscard]] std::shared_ptr<IBackoffPolicy> make_backoff_policy(const RetrySettings& retry);

} // namespace sqlsession
