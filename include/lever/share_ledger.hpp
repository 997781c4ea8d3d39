#ifndef LEVER_SHARE_LEDGER_HPP
#define LEVER_SHARE_LEDGER_HPP

#include <unordered_map>

#include "types.hpp"

namespace lever {

// =============================================================================
// ShareLedger - vault share balances and supply
// =============================================================================

class ShareLedger {
public:
    // Throws ZERO_ADDRESS
    void mint(const Address& to, I128 amount);

    // Throws INSUFFICIENT_SHARES
    void burn(const Address& from, I128 amount);

    // Throws ZERO_ADDRESS, INSUFFICIENT_SHARES
    void transfer(const Address& from, const Address& to, I128 amount);

    I128 balance_of(const Address& holder) const;
    I128 total_supply() const noexcept { return total_supply_; }
    size_t holders() const noexcept { return balances_.size(); }

private:
    std::unordered_map<Address, I128, AddressHash> balances_;
    I128 total_supply_{0};
};

} // namespace lever

#endif // LEVER_SHARE_LEDGER_HPP
