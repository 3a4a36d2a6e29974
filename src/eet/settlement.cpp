// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <eet/settlement.h>
#include <util.h>

namespace eet {

bool RecordingSettlementRail::Transfer(CAmount amount, const Principal& from, const Principal& to)
{
    LOCK(cs_rail_);

    if (failing_) {
        LogPrint(BCLog::EET, "RecordingSettlementRail: refusing transfer of %d from %s\n",
                 amount, PrincipalToLogString(from));
        return false;
    }
    if (amount <= 0) {
        return false;
    }

    transfers_.emplace_back(amount, from, to);
    return true;
}

std::vector<SettlementTransfer> RecordingSettlementRail::GetTransfers() const
{
    LOCK(cs_rail_);
    return transfers_;
}

CAmount RecordingSettlementRail::GetTotalReceived(const Principal& to) const
{
    LOCK(cs_rail_);

    CAmount total = 0;
    for (const auto& transfer : transfers_) {
        if (transfer.to == to) {
            total += transfer.amount;
        }
    }
    return total;
}

void RecordingSettlementRail::SetFailing(bool failing)
{
    LOCK(cs_rail_);
    failing_ = failing;
}

void RecordingSettlementRail::Clear()
{
    LOCK(cs_rail_);
    transfers_.clear();
    failing_ = false;
}

} // namespace eet
