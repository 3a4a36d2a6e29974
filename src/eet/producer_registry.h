// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_PRODUCER_REGISTRY_H
#define EET_PRODUCER_REGISTRY_H

/**
 * @file producer_registry.h
 * @brief Membership check for principals allowed to mint
 */

#include <eet/eet_common.h>
#include <sync.h>

#include <set>

namespace eet {

/**
 * @brief External registry of producers
 */
class ProducerRegistry {
public:
    virtual ~ProducerRegistry() {}

    /** @return true if the principal may mint */
    virtual bool IsRegistered(const Principal& principal) const = 0;
};

/**
 * @brief In-memory producer registry
 */
class MemoryProducerRegistry : public ProducerRegistry {
public:
    MemoryProducerRegistry() {}

    bool IsRegistered(const Principal& principal) const override;

    /** @return false if already registered or null */
    bool Register(const Principal& principal);

    /** @return false if not registered */
    bool Unregister(const Principal& principal);

    size_t GetProducerCount() const;

    void Clear();

private:
    std::set<Principal> producers_;

    mutable CCriticalSection cs_producers_;
};

} // namespace eet

#endif // EET_PRODUCER_REGISTRY_H
