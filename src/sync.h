// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_SYNC_H
#define EET_SYNC_H

#include <mutex>

/**
 * Wrapped mutex: supports recursive locking, so a component holding its own
 * lock may call its public accessors.
 */
class CCriticalSection : public std::recursive_mutex
{
};

/** Wrapper around std::unique_lock<CCriticalSection> */
class CCriticalBlock
{
private:
    std::unique_lock<CCriticalSection> lock;

public:
    explicit CCriticalBlock(CCriticalSection& mutexIn) : lock(mutexIn) {}

    CCriticalBlock(const CCriticalBlock&) = delete;
    CCriticalBlock& operator=(const CCriticalBlock&) = delete;

    bool owns_lock() const { return lock.owns_lock(); }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)

#endif // EET_SYNC_H
