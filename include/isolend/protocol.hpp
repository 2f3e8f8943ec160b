#ifndef ISOLEND_PROTOCOL_HPP
#define ISOLEND_PROTOCOL_HPP

// =============================================================================
// isolend - Isolated-Market Lending Protocol
//
// Component addresses:
//   0x...5010: Ledger           (market share accounting)
//   0x...5020: RiskEngine       (oracle and LTV governance)
//   0x...5021: RiskModule       (valuation and liquidation checks)
//   0x...5030: PositionManager  (position actions)
//   0x...5040: SuperPoolFactory (liquidity routers)
//
// =============================================================================

#include <memory>
#include <ostream>

#include "action.hpp"
#include "config.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "math.hpp"
#include "oracle.hpp"
#include "position.hpp"
#include "position_manager.hpp"
#include "risk_engine.hpp"
#include "risk_module.hpp"
#include "runtime.hpp"
#include "super_pool.hpp"
#include "token.hpp"
#include "types.hpp"

namespace isolend {

// =============================================================================
// Protocol - owns and wires every component from one config
// =============================================================================

class Protocol {
public:
    explicit Protocol(const ProtocolConfig& config);
    ~Protocol();

    // Non-copyable
    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    Runtime& runtime() { return *runtime_; }
    const Runtime& runtime() const { return *runtime_; }

    TokenBank& tokens() { return *tokens_; }
    const TokenBank& tokens() const { return *tokens_; }

    Ledger& ledger() { return *ledger_; }
    const Ledger& ledger() const { return *ledger_; }

    PositionRegistry& positions() { return *positions_; }
    const PositionRegistry& positions() const { return *positions_; }

    RiskEngine& risk_engine() { return *risk_engine_; }
    const RiskEngine& risk_engine() const { return *risk_engine_; }

    const RiskModule& risk_module() const { return *risk_module_; }

    PositionManager& position_manager() { return *position_manager_; }
    const PositionManager& position_manager() const { return *position_manager_; }

    SuperPoolFactory& super_pool_factory() { return *super_pool_factory_; }
    const SuperPoolFactory& super_pool_factory() const { return *super_pool_factory_; }

    const ProtocolConfig& config() const { return config_; }

    // =========================================================================
    // Logging
    // =========================================================================

    // Routes events and reverts to `out` as JSON lines at the config's level
    void attach_logger(std::ostream& out);
    void detach_logger();

private:
    ProtocolConfig config_;

    std::unique_ptr<Runtime> runtime_;
    std::unique_ptr<TokenBank> tokens_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<PositionRegistry> positions_;
    std::unique_ptr<RiskEngine> risk_engine_;
    std::unique_ptr<RiskModule> risk_module_;
    std::unique_ptr<PositionManager> position_manager_;
    std::unique_ptr<SuperPoolFactory> super_pool_factory_;
    std::unique_ptr<StreamLogger> logger_;
};

} // namespace isolend

#endif // ISOLEND_PROTOCOL_HPP
