// Mercuri - shared test world

#ifndef MERCURI_TESTS_FIXTURE_HPP
#define MERCURI_TESTS_FIXTURE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_tostring.hpp>

#include <mercuri/registry.hpp>
#include <mercuri/sim/chain.hpp>
#include <mercuri/sim/liquidity_engine.hpp>
#include <mercuri/sim/pool_directory.hpp>
#include <mercuri/sim/swap_engine.hpp>
#include <mercuri/vault.hpp>

namespace Catch {

template <>
struct StringMaker<mercuri::I128> {
    static std::string convert(mercuri::I128 v) { return mercuri::amount::to_string(v); }
};

template <>
struct StringMaker<mercuri::TokenAmounts> {
    static std::string convert(const mercuri::TokenAmounts& v) {
        return "{" + mercuri::amount::to_string(v.amount0) + ", " +
               mercuri::amount::to_string(v.amount1) + "}";
    }
};

} // namespace Catch

namespace mercuri::test {

inline const Address OWNER = address::from_u64(0xA1);
inline const Address MANAGER = address::from_u64(0xA2);
inline const Address STRANGER = address::from_u64(0xA3);
inline const Address FEE_RECIPIENT = address::from_u64(0xA4);
inline const Address ADMIN = address::from_u64(0xA5);

inline const Address VAULT = address::from_u64(0xB1);
inline const Address POOL = address::from_u64(0xC1);
inline const Address ENGINE = address::from_u64(0xE1);
inline const Address ROUTER = address::from_u64(0xE2);

inline const Address TOKEN = address::from_u64(0x1000);
inline const Address WETH = address::from_u64(0x2000);
inline const Address OTHER_TOKEN = address::from_u64(0x3000);

// Runs `fn` and returns the VaultError code it raised, or errors::OK
template <typename Fn>
int32_t error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const VaultError& e) {
        return e.code();
    }
    return errors::OK;
}

// Fee source whose values tests can change between calls
struct TestFees : IFeeSource {
    uint32_t fee_bps = 1000;
    Address recipient = FEE_RECIPIENT;
    std::function<void()> on_read;
    mutable int reads = 0;

    ProtocolFees protocol_fees() const override {
        ++reads;
        if (on_read) on_read();
        return {fee_bps, recipient};
    }
};

struct RecordingEvents : IVaultEvents {
    std::vector<Address> managers;
    std::vector<I128> deposits;
    std::vector<std::pair<Currency, I128>> withdrawals;
    std::vector<I128> native_withdrawals;
    std::vector<std::pair<uint64_t, TokenAmounts>> closed;
    std::vector<std::pair<uint32_t, TokenAmounts>> fees;

    void on_manager_changed(const Address&, const Address& manager) override {
        managers.push_back(manager);
    }
    void on_deposit(const Address&, const Currency&, I128 amount) override {
        deposits.push_back(amount);
    }
    void on_withdraw(const Address&, const Currency& token, const Address&, I128 amount) override {
        withdrawals.emplace_back(token, amount);
    }
    void on_native_withdraw(const Address&, const Address&, I128 amount) override {
        native_withdrawals.push_back(amount);
    }
    void on_position_closed(const Address&, uint64_t token_id, const TokenAmounts& principal) override {
        closed.emplace_back(token_id, principal);
    }
    void on_performance_fee(const Address&, const Address&, uint32_t fee_bps,
                            const TokenAmounts& fee) override {
        fees.emplace_back(fee_bps, fee);
    }

    size_t total() const {
        return managers.size() + deposits.size() + withdrawals.size() +
               native_withdrawals.size() + closed.size() + fees.size();
    }
};

// Refuses every native transfer; optionally runs a callback first
struct RejectingReceiver : INativeReceiver {
    std::function<void()> on_receive;

    void receive_native(const Address&, I128) override {
        if (on_receive) on_receive();
        throw VaultError(errors::UNAUTHORIZED, "receiver refuses native currency");
    }
};

// Vault over TOKEN/WETH with an approved manager and a 10% performance fee
struct World {
    sim::SimChain chain;
    sim::SimWrappedNative& wrapped;
    sim::SimLiquidityEngine engine;
    sim::SimSwapEngine router;
    ManagerRegistry registry{ADMIN};
    TestFees fee_config;
    RecordingEvents events;
    sim::SimPoolDirectory pools;
    PoolKey pool{POOL, Currency(TOKEN), Currency(WETH), fees::FEE_005, 10};
    std::unique_ptr<Vault> vault;

    World()
        : wrapped(chain.create_wrapped_native(WETH))
        , engine(chain, ENGINE)
        , router(chain, ROUTER) {
        // Backing for wrapped tokens credited without a native deposit
        chain.mint_native(WETH, 1000000000);

        pools.create_pool(pool);
        registry.set_approved(ADMIN, MANAGER, true);
        vault = std::make_unique<Vault>(VaultParams{VAULT, OWNER, MANAGER, pool}, deps(), &events);
        chain.set_receiver(VAULT, vault.get());
    }

    VaultDeps deps() { return {engine, router, registry, fee_config, pools, chain, wrapped, chain, chain}; }

    Currency token0() const { return pool.token0; }
    Currency token1() const { return pool.token1; }

    I128 balance0(const Address& holder) const { return chain.token_balance(pool.token0, holder); }
    I128 balance1(const Address& holder) const { return chain.token_balance(pool.token1, holder); }

    void fund(I128 amount0, I128 amount1) {
        chain.mint_token(pool.token0, VAULT, amount0);
        chain.mint_token(pool.token1, VAULT, amount1);
    }

    MintParams mint_params(I128 amount0, I128 amount1) const {
        return {pool.token0, pool.token1, pool.fee, -600, 600,
                amount0, amount1, amount0 * 99 / 100, amount1 * 99 / 100,
                VAULT, chain.now() + 600};
    }

    // Funds the vault and opens a position as the manager
    uint64_t open(I128 amount0 = 1000, I128 amount1 = 1000) {
        fund(amount0, amount1);
        return vault->mint(MANAGER, mint_params(amount0, amount1)).token_id;
    }
};

} // namespace mercuri::test

#endif // MERCURI_TESTS_FIXTURE_HPP
