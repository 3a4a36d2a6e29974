// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EET_SETTLEMENT_H
#define EET_SETTLEMENT_H

/**
 * @file settlement.h
 * @brief Settlement rail used to move the issuance fee
 *
 * The fee is paid in the rail's own currency, not in EET, so it never
 * touches ledger balances.
 */

#include <eet/eet_common.h>
#include <sync.h>

#include <vector>

namespace eet {

/**
 * @brief A fee movement on the settlement rail
 */
struct SettlementTransfer {
    CAmount amount;
    Principal from;
    Principal to;

    SettlementTransfer() : amount(0) {}

    SettlementTransfer(CAmount amt, const Principal& fromIn, const Principal& toIn)
        : amount(amt), from(fromIn), to(toIn) {}

    bool operator==(const SettlementTransfer& other) const {
        return amount == other.amount && from == other.from && to == other.to;
    }
};

/**
 * @brief External payment rail
 */
class SettlementRail {
public:
    virtual ~SettlementRail() {}

    /**
     * @brief Move funds between principals
     * @return true if the transfer was executed
     */
    virtual bool Transfer(CAmount amount, const Principal& from, const Principal& to) = 0;
};

/**
 * @brief Settlement rail that records every transfer it accepts
 *
 * SetFailing(true) makes subsequent transfers fail, which lets hosts and
 * tests exercise the minter's abort path.
 */
class RecordingSettlementRail : public SettlementRail {
public:
    RecordingSettlementRail() : failing_(false) {}

    bool Transfer(CAmount amount, const Principal& from, const Principal& to) override;

    std::vector<SettlementTransfer> GetTransfers() const;

    /** Sum of all accepted transfers into the given principal */
    CAmount GetTotalReceived(const Principal& to) const;

    void SetFailing(bool failing);

    void Clear();

private:
    std::vector<SettlementTransfer> transfers_;
    bool failing_;

    mutable CCriticalSection cs_rail_;
};

} // namespace eet

#endif // EET_SETTLEMENT_H
