// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file eet_collaborator_tests.cpp
 * @brief Tests for the in-memory proof store, producer registry and
 *        settlement rail
 */

#include <eet/producer_registry.h>
#include <eet/proof_store.h>
#include <eet/settlement.h>
#include <test/test_eet.h>

#include <boost/test/unit_test.hpp>

#include <vector>

BOOST_FIXTURE_TEST_SUITE(eet_collaborator_tests, BasicTestingSetup)

// ============================================================================
// MemoryProofStore
// ============================================================================

BOOST_AUTO_TEST_CASE(proof_store_add_and_get)
{
    eet::MemoryProofStore store;
    eet::Proof proof(1000, 0, TestPrincipal(1));

    BOOST_CHECK(!store.GetProof(1).has_value());
    BOOST_CHECK(store.AddProof(1, proof));
    BOOST_REQUIRE(store.GetProof(1).has_value());
    BOOST_CHECK(*store.GetProof(1) == proof);
    BOOST_CHECK_EQUAL(store.GetProofCount(), 1U);
}

BOOST_AUTO_TEST_CASE(proof_store_is_immutable)
{
    eet::MemoryProofStore store;
    eet::Proof proof(1000, 0, TestPrincipal(1));

    BOOST_CHECK(store.AddProof(1, proof));
    BOOST_CHECK(!store.AddProof(1, eet::Proof(5000, 3, TestPrincipal(2))));
    BOOST_CHECK(*store.GetProof(1) == proof);

    BOOST_CHECK(!store.AddProof(2, eet::Proof(-1, 0, TestPrincipal(1))));
    BOOST_CHECK(!store.GetProof(2).has_value());
}

BOOST_AUTO_TEST_CASE(proof_store_remove_and_clear)
{
    eet::MemoryProofStore store;

    BOOST_CHECK(store.AddProof(1, eet::Proof(1, 0, TestPrincipal(1))));
    BOOST_CHECK(store.AddProof(2, eet::Proof(2, 0, TestPrincipal(1))));
    BOOST_CHECK(store.RemoveProof(1));
    BOOST_CHECK(!store.RemoveProof(1));
    BOOST_CHECK(!store.GetProof(1).has_value());

    store.Clear();
    BOOST_CHECK_EQUAL(store.GetProofCount(), 0U);
}

// ============================================================================
// MemoryProducerRegistry
// ============================================================================

BOOST_AUTO_TEST_CASE(producer_registry)
{
    eet::MemoryProducerRegistry registry;
    eet::Principal producer = TestPrincipal(1);

    BOOST_CHECK(!registry.IsRegistered(producer));
    BOOST_CHECK(registry.Register(producer));
    BOOST_CHECK(registry.IsRegistered(producer));
    BOOST_CHECK(!registry.Register(producer));
    BOOST_CHECK(!registry.Register(eet::Principal()));
    BOOST_CHECK_EQUAL(registry.GetProducerCount(), 1U);

    BOOST_CHECK(registry.Unregister(producer));
    BOOST_CHECK(!registry.IsRegistered(producer));
    BOOST_CHECK(!registry.Unregister(producer));
}

// ============================================================================
// RecordingSettlementRail
// ============================================================================

BOOST_AUTO_TEST_CASE(settlement_rail_records_transfers)
{
    eet::RecordingSettlementRail rail;
    eet::Principal payer = TestPrincipal(1);
    eet::Principal recipient = TestPrincipal(2);

    BOOST_CHECK(rail.Transfer(10, payer, recipient));
    BOOST_CHECK(rail.Transfer(5, payer, recipient));
    BOOST_CHECK(!rail.Transfer(0, payer, recipient));

    std::vector<eet::SettlementTransfer> transfers = rail.GetTransfers();
    BOOST_REQUIRE_EQUAL(transfers.size(), 2U);
    BOOST_CHECK(transfers[0] == eet::SettlementTransfer(10, payer, recipient));
    BOOST_CHECK_EQUAL(rail.GetTotalReceived(recipient), 15);
    BOOST_CHECK_EQUAL(rail.GetTotalReceived(payer), 0);
}

BOOST_AUTO_TEST_CASE(settlement_rail_failing)
{
    eet::RecordingSettlementRail rail;

    rail.SetFailing(true);
    BOOST_CHECK(!rail.Transfer(10, TestPrincipal(1), TestPrincipal(2)));
    BOOST_CHECK(rail.GetTransfers().empty());

    rail.SetFailing(false);
    BOOST_CHECK(rail.Transfer(10, TestPrincipal(1), TestPrincipal(2)));

    rail.Clear();
    BOOST_CHECK(rail.GetTransfers().empty());
}

BOOST_AUTO_TEST_SUITE_END()
