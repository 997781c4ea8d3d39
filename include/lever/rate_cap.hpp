#ifndef LEVER_RATE_CAP_HPP
#define LEVER_RATE_CAP_HPP

#include <cstdint>
#include <functional>

#include "types.hpp"
#include "collaborators.hpp"

namespace lever {

constexpr uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 3600;

// =============================================================================
// Rate cap math (independent of the lending market's own price feed)
// =============================================================================

namespace rate_cap_math {

// snapshot_rate grown linearly by max_yearly_growth since snapshot_time
I128 max_rate(const RateCapInputs& in);

// min(source_rate, max_rate)
I128 capped_rate(const RateCapInputs& in);

bool is_capped(const RateCapInputs& in);

} // namespace rate_cap_math

// =============================================================================
// CappedRateAdapter - IRateCap over a staking token's exchange rate
// =============================================================================

class CappedRateAdapter : public IRateCap {
public:
    using Clock = std::function<uint64_t()>;

    CappedRateAdapter(const IStakingToken& source, I128 snapshot_rate, uint64_t snapshot_time,
                      I128 max_yearly_growth, Clock clock);

    I128 current_rate() const override;
    bool is_capped() const override;
    RateCapInputs inputs() const override;

    // Throws INVALID_CONFIG for a non-positive rate or a future timestamp
    void set_snapshot(I128 rate, uint64_t time);
    void set_max_yearly_growth(I128 growth);

private:
    const IStakingToken& source_;
    I128 snapshot_rate_;
    uint64_t snapshot_time_;
    I128 max_yearly_growth_;
    Clock clock_;
};

} // namespace lever

#endif // LEVER_RATE_CAP_HPP
