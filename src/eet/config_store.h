// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_CONFIG_STORE_H
#define EET_CONFIG_STORE_H

/**
 * @file config_store.h
 * @brief Owner-gated administrative configuration of the ledger
 *
 * The ConfigStore holds the owner, the pause flag, the attester and
 * registry addresses and the fee recipient. Every field is written only
 * through an owner-gated command; each successful command bumps the
 * version of the record.
 */

#include <eet/eet_common.h>
#include <sync.h>

namespace eet {

/**
 * @brief Snapshot of the administrative configuration
 */
struct LedgerConfig {
    Principal owner;
    bool paused;
    Principal attester;
    Principal registry;
    Principal feeRecipient;

    /** Incremented on every successful administrative write */
    uint64_t nVersion;

    LedgerConfig() : paused(false), nVersion(0) {}
};

class ConfigStore {
public:
    ConfigStore(const Principal& owner, const Principal& attester,
                const Principal& registry, const Principal& feeRecipient);

    /** @brief Block mint, burn and transfer */
    OperationResult Pause(const Principal& caller);

    /** @brief Lift a pause */
    OperationResult Unpause(const Principal& caller);

    OperationResult SetFeeRecipient(const Principal& newRecipient, const Principal& caller);

    OperationResult SetAttester(const Principal& newAttester, const Principal& caller);

    OperationResult SetRegistry(const Principal& newRegistry, const Principal& caller);

    /**
     * @brief Hand the owner role to another principal
     *
     * The previous owner loses every administrative right immediately.
     * Transferring to oneself is a validation error.
     */
    OperationResult TransferOwnership(const Principal& newOwner, const Principal& caller);

    Principal GetOwner() const;
    bool IsPaused() const;
    Principal GetAttester() const;
    Principal GetRegistry() const;
    Principal GetFeeRecipient() const;

    /** @return Copy of the whole record */
    LedgerConfig GetConfig() const;

private:
    /** Must be called with cs_config_ held */
    bool IsOwner(const Principal& caller) const { return caller == config_.owner; }

    OperationResult NotOwner(const char* command) const;

    LedgerConfig config_;

    mutable CCriticalSection cs_config_;
};

} // namespace eet

#endif // EET_CONFIG_STORE_H
