#include "engine/backoff_policy.hpp"
#include <algorithm>
#include <cmath>

namespace sqlsession {

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds initial, double multiplier,
                                       std::chrono::milliseconds max)
    : initial_(initial), multiplier_(multiplier), max_(std::max(max, initial)) {}

std::chrono::milliseconds ExponentialBackoff::delay(uint32_t failed_attempt) const {
    if (failed_attempt <= 1) {
        return initial_;
    }
    const double scaled = static_cast<double>(initial_.count()) *
                          std::pow(multiplier_, static_cast<double>(failed_attempt - 1));
    if (!std::isfinite(scaled) || scaled >= static_cast<double>(max_.count())) {
        return max_;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(scaled));
}

std::shared_ptr<IBackoffPolicy> make_backoff_policy(const RetrySettings& retry) {
    switch (retry.backoff) {
        case BackoffKind::FIXED:
            return std::make_shared<FixedBackoff>(retry.initial_backoff);
        case BackoffKind::EXPONENTIAL:
        default:
            return std::make_shared<ExponentialBackoff>(
                retry.initial_backoff, retry.multiplier, retry.max_backoff);
    }
}

} // namespace sqlsession
