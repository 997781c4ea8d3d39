#ifndef LEVER_SIM_TOKEN_HPP
#define LEVER_SIM_TOKEN_HPP

#include <map>
#include <string>
#include <unordered_map>
#include <utility>

#include "../types.hpp"
#include "../collaborators.hpp"

namespace lever {
namespace sim {

// =============================================================================
// SimToken - in-memory fungible token
// =============================================================================

class SimToken : public IToken {
public:
    struct State {
        std::unordered_map<Address, I128, AddressHash> balances;
        std::map<std::pair<Address, Address>, I128> allowances;
        I128 total_supply{0};
    };

    SimToken(const Address& address, std::string symbol);

    Address address() const override { return address_; }
    I128 balance_of(const Address& holder) const override;

    // Throws CollaboratorError on insufficient balance
    void transfer(const Address& from, const Address& to, I128 amount) override;

    // Spends allowance unless spender == from
    void transfer_from(const Address& spender, const Address& from,
                       const Address& to, I128 amount) override;

    void approve(const Address& owner, const Address& spender, I128 amount) override;
    I128 allowance(const Address& owner, const Address& spender) const override;

    void mint(const Address& to, I128 amount);
    void burn(const Address& from, I128 amount);

    I128 total_supply() const noexcept { return state_.total_supply; }
    const std::string& symbol() const noexcept { return symbol_; }

    State checkpoint() const { return state_; }
    void restore(State state) { state_ = std::move(state); }

private:
    Address address_;
    std::string symbol_;
    State state_;
};

} // namespace sim
} // namespace lever

#endif // LEVER_SIM_TOKEN_HPP
