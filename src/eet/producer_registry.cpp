// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/producer_registry.h>
#include <util.h>

namespace eet {

bool MemoryProducerRegistry::IsRegistered(const Principal& principal) const
{
    LOCK(cs_producers_);
    return producers_.count(principal) > 0;
}

bool MemoryProducerRegistry::Register(const Principal& principal)
{
    LOCK(cs_producers_);

    if (principal.IsNull()) {
        return false;
    }
    if (!producers_.insert(principal).second) {
        return false;
    }

    LogPrint(BCLog::EET, "MemoryProducerRegistry: registered %s\n", PrincipalToLogString(principal));
    return true;
}

bool MemoryProducerRegistry::Unregister(const Principal& principal)
{
    LOCK(cs_producers_);
    return producers_.erase(principal) > 0;
}

size_t MemoryProducerRegistry::GetProducerCount() const
{
    LOCK(cs_producers_);
    return producers_.size();
}

void MemoryProducerRegistry::Clear()
{
    LOCK(cs_producers_);
    producers_.clear();
}

} // namespace eet
