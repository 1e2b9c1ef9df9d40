// Mercuri vault simulator
//
// Deploys a vault on the in-memory chain from a JSON scenario and runs the
// canonical lifecycle: approve manager, deposit, manager mint, earn fees,
// manager close, owner withdraw.
//
// Usage: mercuri-sim --config scenario.json [--log-level debug]

#include <cstdlib>
#include <iostream>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "mercuri/config.hpp"
#include "mercuri/events.hpp"
#include "mercuri/factory.hpp"
#include "mercuri/registry.hpp"
#include "mercuri/sim/chain.hpp"
#include "mercuri/sim/liquidity_engine.hpp"
#include "mercuri/sim/pool_directory.hpp"
#include "mercuri/sim/swap_engine.hpp"

using namespace mercuri;

//------------------------------------------------------------------------------
// Arguments
//------------------------------------------------------------------------------

struct Args {
    std::string config_path;
    std::string log_level;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --config <scenario.json> [--log-level <level>]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>     Scenario file (JSON)\n"
              << "  -l, --log-level <lvl>   trace, debug, info, warn, error (overrides file)\n"
              << "  -h, --help              Show this help\n";
}

bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !args.config_path.empty();
}

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

I128 with_slippage(I128 desired, uint32_t slippage_bps) {
    return desired - desired * slippage_bps / BPS_DENOMINATOR;
}

void print_balances(sim::SimChain& chain, const ScenarioConfig& cfg, const Vault& vault) {
    auto row = [&](const char* who, const Address& addr) {
        std::cout << "  " << who << " " << address::to_hex(addr)
                  << "  token0=" << amount::to_string(chain.token_balance(cfg.pool.token0, addr))
                  << "  token1=" << amount::to_string(chain.token_balance(cfg.pool.token1, addr))
                  << "  native=" << amount::to_string(chain.balance_of(addr)) << "\n";
    };
    std::cout << "Balances:\n";
    row("owner        ", cfg.owner);
    row("vault        ", vault.address());
    row("fee recipient", cfg.factory.fee_recipient);
}

int run(const ScenarioConfig& cfg) {
    sim::SimChain chain;
    sim::SimWrappedNative& wrapped = chain.create_wrapped_native(cfg.wrapped_native);
    sim::SimLiquidityEngine engine(chain, cfg.liquidity_engine);
    sim::SimSwapEngine router(chain, cfg.swap_engine);
    sim::SimPoolDirectory pools;
    pools.create_pool(cfg.pool);

    ManagerRegistry registry(cfg.registry_admin);
    LoggingEvents events;
    VaultFactory factory(cfg.factory,
                         {engine, router, registry, pools, chain, wrapped, chain, chain},
                         &events);

    if (!address::is_zero(cfg.manager)) {
        registry.set_approved(cfg.registry_admin, cfg.manager, true);
    }

    Vault& vault = factory.create_vault(cfg.owner, cfg.manager, cfg.pool.pool);
    chain.set_receiver(vault.address(), &vault);
    vault.set_unwrap_native(cfg.owner, cfg.unwrap_native);

    // Owner funds and deposits
    for (const auto& [token, funds, dep] : {
             std::tuple{cfg.pool.token0, cfg.owner_funds.amount0, cfg.deposit.amount0},
             std::tuple{cfg.pool.token1, cfg.owner_funds.amount1, cfg.deposit.amount1}}) {
        if (token == vault.wrapped_native()) {
            chain.mint_native(cfg.owner, funds);
            wrapped.deposit(cfg.owner, funds);
        } else {
            chain.mint_token(token, cfg.owner, funds);
        }
        if (dep > 0) {
            chain.token(token).approve(cfg.owner, vault.address(), dep);
            vault.deposit(cfg.owner, token, dep);
        }
    }

    const Address op = address::is_zero(cfg.manager) ? cfg.owner : cfg.manager;

    MintParams mint{cfg.pool.token0, cfg.pool.token1, cfg.pool.fee,
                    cfg.mint.tick_lower, cfg.mint.tick_upper,
                    cfg.mint.desired.amount0, cfg.mint.desired.amount1,
                    with_slippage(cfg.mint.desired.amount0, cfg.mint.slippage_bps),
                    with_slippage(cfg.mint.desired.amount1, cfg.mint.slippage_bps),
                    vault.address(), chain.now() + 600};
    MintResult minted = vault.mint(op, mint);
    std::cout << "Minted position " << minted.token_id
              << " liquidity=" << amount::to_string(minted.liquidity) << "\n";

    if (!cfg.fees_earned.is_zero()) {
        engine.accrue_fees(minted.token_id, cfg.fees_earned.amount0, cfg.fees_earned.amount1);
        // Wrapped fee income must stay redeemable for native currency
        if (cfg.pool.token0 == vault.wrapped_native()) {
            chain.mint_native(cfg.wrapped_native, cfg.fees_earned.amount0);
        } else if (cfg.pool.token1 == vault.wrapped_native()) {
            chain.mint_native(cfg.wrapped_native, cfg.fees_earned.amount1);
        }
        std::cout << "Position earned " << amount::to_string(cfg.fees_earned.amount0) << " / "
                  << amount::to_string(cfg.fees_earned.amount1) << " in swap fees\n";
    }

    TokenAmounts principal = vault.close_position(op, minted.token_id);
    std::cout << "Closed position, principal " << amount::to_string(principal.amount0) << " / "
              << amount::to_string(principal.amount1) << "\n";

    vault.withdraw_all(cfg.owner);
    std::cout << "Owner withdrew all funds\n";

    print_balances(chain, cfg, vault);
    return 0;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        ScenarioConfig cfg = Config::from_file(args.config_path);
        const std::string& level = args.log_level.empty() ? cfg.log_level : args.log_level;
        spdlog::set_level(spdlog::level::from_str(level));

        return run(cfg);
    } catch (const VaultError& e) {
        spdlog::error("{} ({}): {}", errors::name(e.code()), e.code(), e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
}
