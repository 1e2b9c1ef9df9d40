// =============================================================================
// chain.cpp - In-memory chain for simulation and tests
// =============================================================================

#include "mercuri/sim/chain.hpp"

#include <spdlog/spdlog.h>

namespace mercuri::sim {

namespace {

// Launch timestamp of the simulated chain
constexpr uint64_t GENESIS_TIME = 1704067200;

void require_amount(I128 amount) {
    if (amount < 0) {
        throw VaultError(errors::INVALID_AMOUNT, "negative amount");
    }
}

} // namespace

SimChain::SimChain() : now_(GENESIS_TIME) {}

SimChain::~SimChain() = default;

// =============================================================================
// Tokens
// =============================================================================

IToken& SimChain::token(const Currency& currency) {
    auto it = tokens_.find(currency);
    if (it == tokens_.end()) {
        it = tokens_.emplace(currency, std::make_unique<SimToken>(*this, currency)).first;
    }
    return *it->second;
}

SimWrappedNative& SimChain::create_wrapped_native(const Address& addr) {
    auto wrapped = std::make_unique<SimWrappedNative>(*this, addr);
    SimWrappedNative& ref = *wrapped;
    tokens_[Currency(addr)] = std::move(wrapped);
    return ref;
}

I128 SimChain::token_balance(const Currency& token, const Address& holder) const {
    auto it = ledger_.tokens.find({token, holder});
    return it == ledger_.tokens.end() ? 0 : it->second;
}

I128 SimChain::token_supply(const Currency& token) const {
    I128 total = 0;
    for (const auto& [key, balance] : ledger_.tokens) {
        if (key.first == token) total += balance;
    }
    return total;
}

void SimChain::mint_token(const Currency& token, const Address& to, I128 amount) {
    require_amount(amount);
    ledger_.tokens[{token, to}] += amount;
}

void SimChain::burn_token(const Currency& token, const Address& from, I128 amount) {
    require_amount(amount);
    I128& balance = ledger_.tokens[{token, from}];
    if (balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE,
                         "burn exceeds balance of " + address::to_hex(from));
    }
    balance -= amount;
}

void SimChain::move_token(const Currency& token, const Address& from, const Address& to, I128 amount) {
    require_amount(amount);
    I128& balance = ledger_.tokens[{token, from}];
    if (balance < amount) {
        throw VaultError(errors::INSUFFICIENT_BALANCE,
                         "transfer exceeds balance of " + address::to_hex(from));
    }
    balance -= amount;
    ledger_.tokens[{token, to}] += amount;
}

I128 SimChain::allowance(const Currency& token, const Address& holder, const Address& spender) const {
    auto it = ledger_.allowances.find({token, holder, spender});
    return it == ledger_.allowances.end() ? 0 : it->second;
}

void SimChain::set_allowance(const Currency& token, const Address& holder,
                             const Address& spender, I128 amount) {
    require_amount(amount);
    ledger_.allowances[{token, holder, spender}] = amount;
}

void SimChain::spend_allowance(const Currency& token, const Address& holder,
                               const Address& spender, I128 amount) {
    I128& allowed = ledger_.allowances[{token, holder, spender}];
    if (allowed < amount) {
        throw VaultError(errors::INSUFFICIENT_ALLOWANCE,
                         "allowance of " + address::to_hex(spender) + " exceeded");
    }
    allowed -= amount;
}

// =============================================================================
// Native Currency
// =============================================================================

I128 SimChain::balance_of(const Address& holder) const {
    auto it = ledger_.native.find(holder);
    return it == ledger_.native.end() ? 0 : it->second;
}

bool SimChain::send(const Address& from, const Address& to, I128 amount) {
    if (amount < 0 || balance_of(from) < amount) {
        return false;
    }

    begin();
    ledger_.native[from] -= amount;
    ledger_.native[to] += amount;

    auto it = receivers_.find(to);
    if (it != receivers_.end() && it->second != nullptr) {
        try {
            it->second->receive_native(from, amount);
        } catch (const std::exception& e) {
            rollback();
            spdlog::debug("native transfer {} -> {} refused: {}", address::to_hex(from),
                          address::to_hex(to), e.what());
            return false;
        }
    }

    commit();
    return true;
}

void SimChain::mint_native(const Address& to, I128 amount) {
    require_amount(amount);
    ledger_.native[to] += amount;
}

void SimChain::set_receiver(const Address& addr, INativeReceiver* receiver) {
    if (receiver == nullptr) {
        receivers_.erase(addr);
    } else {
        receivers_[addr] = receiver;
    }
}

// =============================================================================
// Journal
// =============================================================================

void SimChain::attach(Journaled& participant) {
    participants_.push_back(&participant);
}

void SimChain::begin() {
    saved_.push_back(ledger_);
    for (Journaled* p : participants_) p->save();
}

void SimChain::commit() {
    if (saved_.empty()) return;
    saved_.pop_back();
    for (Journaled* p : participants_) p->discard();
}

void SimChain::rollback() {
    if (saved_.empty()) return;
    ledger_ = std::move(saved_.back());
    saved_.pop_back();
    for (Journaled* p : participants_) p->restore();
}

// =============================================================================
// SimToken
// =============================================================================

SimToken::SimToken(SimChain& chain, const Currency& currency)
    : chain_(chain), currency_(currency) {}

I128 SimToken::balance_of(const Address& holder) const {
    return chain_.token_balance(currency_, holder);
}

I128 SimToken::allowance(const Address& holder, const Address& spender) const {
    return chain_.allowance(currency_, holder, spender);
}

void SimToken::transfer(const Address& sender, const Address& to, I128 amount) {
    chain_.move_token(currency_, sender, to, amount);
}

void SimToken::transfer_from(const Address& spender, const Address& from,
                             const Address& to, I128 amount) {
    if (spender != from) {
        chain_.spend_allowance(currency_, from, spender, amount);
    }
    chain_.move_token(currency_, from, to, amount);
}

void SimToken::approve(const Address& sender, const Address& spender, I128 amount) {
    chain_.set_allowance(currency_, sender, spender, amount);
}

// =============================================================================
// SimWrappedNative
// =============================================================================

SimWrappedNative::SimWrappedNative(SimChain& chain, const Address& addr)
    : SimToken(chain, Currency(addr)) {}

void SimWrappedNative::deposit(const Address& sender, I128 amount) {
    if (!chain_.send(sender, address(), amount)) {
        throw VaultError(errors::TRANSFER_FAILURE, "wrap: native transfer failed");
    }
    chain_.mint_token(currency_, sender, amount);
}

void SimWrappedNative::withdraw(const Address& sender, I128 amount) {
    chain_.burn_token(currency_, sender, amount);
    if (!chain_.send(address(), sender, amount)) {
        throw VaultError(errors::TRANSFER_FAILURE, "unwrap: native transfer failed");
    }
}

} // namespace mercuri::sim
