// =============================================================================
// protocol.cpp - Component wiring
// =============================================================================

#include "isolend/protocol.hpp"

namespace isolend {

Protocol::Protocol(const ProtocolConfig& config)
    : config_(config)
    , runtime_(std::make_unique<Runtime>())
    , tokens_(std::make_unique<TokenBank>(*runtime_)) {

    config_.validate();

    ledger_ = std::make_unique<Ledger>(*runtime_, *tokens_, LedgerParams{
        .owner = config_.owner,
        .position_manager = addresses::POSITION_MANAGER,
        .fee_recipient = config_.fee_recipient,
        .interest_fee_x18 = config_.interest_fee_x18,
        .origination_fee_x18 = config_.origination_fee_x18,
        .min_borrow = config_.min_borrow,
        .min_debt = config_.min_debt,
        .min_burned_shares = config_.min_burned_shares,
        .timelock_duration = config_.timelock_duration,
        .timelock_deadline = config_.timelock_deadline
    });

    positions_ = std::make_unique<PositionRegistry>(*runtime_);

    risk_engine_ = std::make_unique<RiskEngine>(*runtime_, *ledger_, RiskEngineParams{
        .owner = config_.owner,
        .min_ltv_x18 = config_.min_ltv_x18,
        .max_ltv_x18 = config_.max_ltv_x18,
        .timelock_duration = config_.timelock_duration,
        .timelock_deadline = config_.timelock_deadline
    });

    risk_module_ = std::make_unique<RiskModule>(*ledger_, *risk_engine_, *positions_, *tokens_,
        RiskModuleParams{
            .close_factor_x18 = config_.close_factor_x18,
            .liquidation_discount_x18 = config_.liquidation_discount_x18
        });

    position_manager_ = std::make_unique<PositionManager>(
        *runtime_, *tokens_, *ledger_, *positions_, *risk_module_,
        PositionManagerParams{
            .owner = config_.owner,
            .liquidation_fee_x18 = config_.liquidation_fee_x18
        });

    super_pool_factory_ = std::make_unique<SuperPoolFactory>(
        *runtime_, *tokens_, *ledger_, config_.min_burned_shares);
}

Protocol::~Protocol() {
    detach_logger();
}

void Protocol::attach_logger(std::ostream& out) {
    logger_ = std::make_unique<StreamLogger>(out, config_.log_level);
    runtime_->set_event_listener(logger_.get());
}

void Protocol::detach_logger() {
    runtime_->set_event_listener(nullptr);
    logger_.reset();
}

} // namespace isolend
