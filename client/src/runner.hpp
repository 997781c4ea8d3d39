#ifndef LEVER_CLIENT_RUNNER_HPP
#define LEVER_CLIENT_RUNNER_HPP

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "lever/vault.hpp"
#include "lever/sim/world.hpp"

namespace lever {
namespace cli {

constexpr Address VAULT_ADDRESS = addresses::from_id(0x2000);
constexpr uint32_t FIRST_ACCOUNT_ID = 0x3000;

sim::WorldParams world_params(const nlohmann::json& doc);

// Replays scenario steps against a simulated world. `accounts` maps names to
// initial borrowed-asset balances; `operators` names accounts allowed to unwind.
class Runner {
public:
    Runner(const nlohmann::json& doc, VaultConfig config);

    // Result of one step; failures carry "error" and "message" and never
    // escape, so a bad step cannot end the replay
    nlohmann::json execute(const nlohmann::json& step);

    // Throws VaultError, CollaboratorError, ConfigError, nlohmann::json::exception
    nlohmann::json run(const nlohmann::json& step);

    const LeverVault& vault() const noexcept { return vault_; }
    Address account(const std::string& name) const;

private:
    Address receiver(const nlohmann::json& step, const Address& caller) const;
    nlohmann::json state(const std::string& kind) const;

    sim::SimWorld world_;
    LeverVault vault_;
    std::map<std::string, Address> accounts_;
    nlohmann::json last_;
};

} // namespace cli
} // namespace lever

#endif // LEVER_CLIENT_RUNNER_HPP
