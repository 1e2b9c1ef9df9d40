#ifndef MERCURI_SIM_CHAIN_HPP
#define MERCURI_SIM_CHAIN_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

#include "../interfaces.hpp"
#include "../types.hpp"

namespace mercuri::sim {

// =============================================================================
// Journaled - participant in the chain's nested snapshots
// =============================================================================

class Journaled {
public:
    virtual ~Journaled() = default;

    virtual void save() = 0;      // Push a snapshot
    virtual void restore() = 0;   // Pop and reinstate the snapshot
    virtual void discard() = 0;   // Pop and keep current state
};

class SimToken;
class SimWrappedNative;

// =============================================================================
// SimChain - in-memory balances, allowances, native currency and clock
// =============================================================================

class SimChain : public IStateJournal, public INativeBank, public ITokenDirectory {
public:
    SimChain();
    ~SimChain() override;

    SimChain(const SimChain&) = delete;
    SimChain& operator=(const SimChain&) = delete;

    // =========================================================================
    // Tokens
    // =========================================================================

    // Lazily creates a plain token for unknown currencies
    IToken& token(const Currency& currency) override;

    // Registers the wrapped-native token at `addr`
    SimWrappedNative& create_wrapped_native(const Address& addr);

    I128 token_balance(const Currency& token, const Address& holder) const;
    I128 token_supply(const Currency& token) const;
    void mint_token(const Currency& token, const Address& to, I128 amount);
    // Throws VaultError(INSUFFICIENT_BALANCE)
    void burn_token(const Currency& token, const Address& from, I128 amount);
    void move_token(const Currency& token, const Address& from, const Address& to, I128 amount);

    I128 allowance(const Currency& token, const Address& holder, const Address& spender) const;
    void set_allowance(const Currency& token, const Address& holder, const Address& spender, I128 amount);
    // Throws VaultError(INSUFFICIENT_ALLOWANCE)
    void spend_allowance(const Currency& token, const Address& holder, const Address& spender, I128 amount);

    // =========================================================================
    // Native Currency
    // =========================================================================

    I128 balance_of(const Address& holder) const override;

    // Runs the receiver hook of `to`; a throwing receiver refuses the transfer
    bool send(const Address& from, const Address& to, I128 amount) override;

    void mint_native(const Address& to, I128 amount);
    void set_receiver(const Address& addr, INativeReceiver* receiver);

    // =========================================================================
    // Clock
    // =========================================================================

    uint64_t now() const { return now_; }
    void advance(uint64_t seconds) { now_ += seconds; }

    // =========================================================================
    // Journal
    // =========================================================================

    void attach(Journaled& participant);

    void begin() override;
    void commit() override;
    void rollback() override;

    size_t depth() const { return saved_.size(); }

private:
    using TokenKey = std::pair<Currency, Address>;
    using AllowanceKey = std::tuple<Currency, Address, Address>;

    struct Ledger {
        std::map<TokenKey, I128> tokens;
        std::map<AllowanceKey, I128> allowances;
        std::map<Address, I128> native;
    };

    Ledger ledger_;
    std::vector<Ledger> saved_;
    std::vector<Journaled*> participants_;

    std::map<Currency, std::unique_ptr<SimToken>> tokens_;
    std::map<Address, INativeReceiver*> receivers_;
    uint64_t now_;
};

// =============================================================================
// SimToken - ERC20-style view over the chain's balances
// =============================================================================

class SimToken : public IToken {
public:
    SimToken(SimChain& chain, const Currency& currency);

    Currency currency() const override { return currency_; }
    I128 balance_of(const Address& holder) const override;
    I128 allowance(const Address& holder, const Address& spender) const override;

    void transfer(const Address& sender, const Address& to, I128 amount) override;
    void transfer_from(const Address& spender, const Address& from,
                       const Address& to, I128 amount) override;
    void approve(const Address& sender, const Address& spender, I128 amount) override;

protected:
    SimChain& chain_;
    Currency currency_;
};

// =============================================================================
// SimWrappedNative - wrapped native token (1:1 with native currency)
// =============================================================================

class SimWrappedNative : public SimToken, public IWrappedNative {
public:
    SimWrappedNative(SimChain& chain, const Address& addr);

    Address address() const override { return currency_.addr; }

    void deposit(const Address& sender, I128 amount) override;
    void withdraw(const Address& sender, I128 amount) override;
};

} // namespace mercuri::sim

#endif // MERCURI_SIM_CHAIN_HPP
