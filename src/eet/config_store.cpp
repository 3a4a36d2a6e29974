// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/config_store.h>
#include <util.h>

namespace eet {

ConfigStore::ConfigStore(const Principal& owner, const Principal& attester,
                         const Principal& registry, const Principal& feeRecipient)
{
    config_.owner = owner;
    config_.attester = attester;
    config_.registry = registry;
    config_.feeRecipient = feeRecipient;
}

OperationResult ConfigStore::NotOwner(const char* command) const
{
    LogPrint(BCLog::EET, "ConfigStore: %s rejected, caller is not the owner\n", command);
    return OperationResult::Failure(LedgerError::AUTHORIZATION, "Caller is not the owner");
}

OperationResult ConfigStore::Pause(const Principal& caller)
{
    LOCK(cs_config_);

    if (!IsOwner(caller)) {
        return NotOwner("pause");
    }

    config_.paused = true;
    config_.nVersion++;
    LogPrintf("ConfigStore: ledger paused by %s\n", PrincipalToLogString(caller));
    return OperationResult::Success();
}

OperationResult ConfigStore::Unpause(const Principal& caller)
{
    LOCK(cs_config_);

    if (!IsOwner(caller)) {
        return NotOwner("unpause");
    }

    config_.paused = false;
    config_.nVersion++;
    LogPrintf("ConfigStore: ledger unpaused by %s\n", PrincipalToLogString(caller));
    return OperationResult::Success();
}

OperationResult ConfigStore::SetFeeRecipient(const Principal& newRecipient, const Principal& caller)
{
    LOCK(cs_config_);

    if (!IsOwner(caller)) {
        return NotOwner("setFeeRecipient");
    }

    config_.feeRecipient = newRecipient;
    config_.nVersion++;
    LogPrint(BCLog::EET, "ConfigStore: fee recipient set to %s\n", PrincipalToLogString(newRecipient));
    return OperationResult::Success();
}

OperationResult ConfigStore::SetAttester(const Principal& newAttester, const Principal& caller)
{
    LOCK(cs_config_);

    if (!IsOwner(caller)) {
        return NotOwner("setAttester");
    }

    config_.attester = newAttester;
    config_.nVersion++;
    LogPrint(BCLog::EET, "ConfigStore: attester set to %s\n", PrincipalToLogString(newAttester));
    return OperationResult::Success();
}

OperationResult ConfigStore::SetRegistry(const Principal& newRegistry, const Principal& caller)
{
    LOCK(cs_config_);

    if (!IsOwner(caller)) {
        return NotOwner("setRegistry");
    }

    config_.registry = newRegistry;
    config_.nVersion++;
    LogPrint(BCLog::EET, "ConfigStore: registry set to %s\n", PrincipalToLogString(newRegistry));
    return OperationResult::Success();
}

OperationResult ConfigStore::TransferOwnership(const Principal& newOwner, const Principal& caller)
{
    LOCK(cs_config_);

    if (!IsOwner(caller)) {
        return NotOwner("transferOwnership");
    }

    if (newOwner == caller) {
        return OperationResult::Failure(LedgerError::VALIDATION, "New owner must differ from the current owner");
    }

    config_.owner = newOwner;
    config_.nVersion++;
    LogPrintf("ConfigStore: ownership transferred from %s to %s\n",
              PrincipalToLogString(caller), PrincipalToLogString(newOwner));
    return OperationResult::Success();
}

Principal ConfigStore::GetOwner() const
{
    LOCK(cs_config_);
    return config_.owner;
}

bool ConfigStore::IsPaused() const
{
    LOCK(cs_config_);
    return config_.paused;
}

Principal ConfigStore::GetAttester() const
{
    LOCK(cs_config_);
    return config_.attester;
}

Principal ConfigStore::GetRegistry() const
{
    LOCK(cs_config_);
    return config_.registry;
}

Principal ConfigStore::GetFeeRecipient() const
{
    LOCK(cs_config_);
    return config_.feeRecipient;
}

LedgerConfig ConfigStore::GetConfig() const
{
    LOCK(cs_config_);
    return config_;
}

} // namespace eet
