// =============================================================================
// rate_cap.cpp - Capped exchange rate
// =============================================================================

#include "lever/rate_cap.hpp"
#include "lever/errors.hpp"
#include "lever/math.hpp"

namespace lever {

namespace rate_cap_math {

I128 max_rate(const RateCapInputs& in) {
    uint64_t elapsed = in.now > in.snapshot_time ? in.now - in.snapshot_time : 0;
    I128 yearly = wad::mul(in.snapshot_rate, in.max_yearly_growth, Rounding::FLOOR);
    I128 growth = math::mul_div(yearly, static_cast<I128>(elapsed),
                                static_cast<I128>(SECONDS_PER_YEAR), Rounding::FLOOR);
    return math::checked_add(in.snapshot_rate, growth);
}

I128 capped_rate(const RateCapInputs& in) {
    return math::min(in.source_rate, max_rate(in));
}

bool is_capped(const RateCapInputs& in) {
    return in.source_rate > max_rate(in);
}

} // namespace rate_cap_math

CappedRateAdapter::CappedRateAdapter(const IStakingToken& source, I128 snapshot_rate,
                                     uint64_t snapshot_time, I128 max_yearly_growth,
                                     Clock clock)
    : source_(source)
    , snapshot_rate_(snapshot_rate)
    , snapshot_time_(snapshot_time)
    , max_yearly_growth_(max_yearly_growth)
    , clock_(std::move(clock)) {
    if (snapshot_rate_ <= 0 || max_yearly_growth_ < 0) {
        throw VaultError(ErrorCode::INVALID_CONFIG, "rate cap parameters");
    }
}

I128 CappedRateAdapter::current_rate() const {
    return rate_cap_math::capped_rate(inputs());
}

bool CappedRateAdapter::is_capped() const {
    return rate_cap_math::is_capped(inputs());
}

RateCapInputs CappedRateAdapter::inputs() const {
    RateCapInputs in{};
    in.snapshot_rate = snapshot_rate_;
    in.snapshot_time = snapshot_time_;
    in.max_yearly_growth = max_yearly_growth_;
    in.source_rate = source_.current_rate();
    in.now = clock_();
    return in;
}

void CappedRateAdapter::set_snapshot(I128 rate, uint64_t time) {
    if (rate <= 0) {
        throw VaultError(ErrorCode::INVALID_CONFIG, "snapshot rate must be positive");
    }
    if (time > clock_()) {
        throw VaultError(ErrorCode::INVALID_CONFIG, "snapshot time is in the future");
    }
    snapshot_rate_ = rate;
    snapshot_time_ = time;
}

void CappedRateAdapter::set_max_yearly_growth(I128 growth) {
    if (growth < 0) {
        throw VaultError(ErrorCode::INVALID_CONFIG, "max yearly growth must be non-negative");
    }
    max_yearly_growth_ = growth;
}

} // namespace lever
