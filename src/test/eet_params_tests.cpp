// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file eet_params_tests.cpp
 * @brief Tests for issuance parameters and their configuration from gArgs
 */

#include <eet/eet_config.h>
#include <eet/eet_params.h>
#include <util.h>
#include <test/test_eet.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BOOST_FIXTURE_TEST_SUITE(eet_params_tests, BasicTestingSetup)

// ============================================================================
// Parameter sets
// ============================================================================

BOOST_AUTO_TEST_CASE(mainnet_params)
{
    const eet::EETParams& params = eet::MainnetEETParams();
    BOOST_CHECK_EQUAL(params.strNetworkID, "main");
    BOOST_CHECK_EQUAL(params.nFeeBasisPoints, 100);
    BOOST_CHECK_EQUAL(params.nMaxSupply, 1000000000000LL);
    BOOST_CHECK_EQUAL(params.nMaxPerProof, 1000000);
    BOOST_CHECK_EQUAL(params.nProofExpiryBlocks, 144U);
    BOOST_CHECK_EQUAL(params.nMaxHistoryEntries, 100U);
    BOOST_CHECK(params.historyOverflowPolicy == eet::HistoryOverflowPolicy::REJECT);
    BOOST_CHECK(params.IsValid());
}

BOOST_AUTO_TEST_CASE(testnet_and_regtest_params)
{
    BOOST_CHECK_EQUAL(eet::TestnetEETParams().strNetworkID, "test");
    BOOST_CHECK_EQUAL(eet::TestnetEETParams().nMaxSupply, eet::MainnetEETParams().nMaxSupply);
    BOOST_CHECK(eet::TestnetEETParams().IsValid());

    BOOST_CHECK_EQUAL(eet::RegtestEETParams().strNetworkID, "regtest");
    BOOST_CHECK_EQUAL(eet::RegtestEETParams().nMaxSupply, 5000000);
    BOOST_CHECK_EQUAL(eet::RegtestEETParams().nFeeBasisPoints, 100);
    BOOST_CHECK(eet::RegtestEETParams().IsValid());

    // Regtest differs from main only in its supply cap
    const eet::EETParams& main = eet::MainnetEETParams();
    const eet::EETParams& regtest = eet::RegtestEETParams();
    BOOST_CHECK_EQUAL(regtest.nFeeBasisPoints, main.nFeeBasisPoints);
    BOOST_CHECK_EQUAL(regtest.nMaxPerProof, main.nMaxPerProof);
    BOOST_CHECK_EQUAL(regtest.nProofExpiryBlocks, main.nProofExpiryBlocks);
    BOOST_CHECK_EQUAL(regtest.nMaxHistoryEntries, main.nMaxHistoryEntries);
    BOOST_CHECK(regtest.historyOverflowPolicy == main.historyOverflowPolicy);
    BOOST_CHECK(regtest.nMaxSupply < main.nMaxSupply);
}

BOOST_AUTO_TEST_CASE(select_params)
{
    // Fixture selects regtest
    BOOST_CHECK_EQUAL(eet::GetEETParams().strNetworkID, "regtest");

    eet::SelectEETParams("main");
    BOOST_CHECK_EQUAL(eet::GetEETParams().strNetworkID, "main");

    eet::SelectEETParams("test");
    BOOST_CHECK_EQUAL(eet::GetEETParams().strNetworkID, "test");

    BOOST_CHECK_THROW(eet::SelectEETParams("bogus"), std::runtime_error);
    BOOST_CHECK_EQUAL(eet::GetEETParams().strNetworkID, "test");
}

BOOST_AUTO_TEST_CASE(params_validity)
{
    eet::EETParams params = eet::MainnetEETParams();

    params.nFeeBasisPoints = 0;
    BOOST_CHECK(params.IsValid());
    params.nFeeBasisPoints = 9999;
    BOOST_CHECK(params.IsValid());
    params.nFeeBasisPoints = 10000;
    BOOST_CHECK(!params.IsValid());
    params.nFeeBasisPoints = -1;
    BOOST_CHECK(!params.IsValid());

    params = eet::MainnetEETParams();
    params.nMaxPerProof = params.nMaxSupply + 1;
    BOOST_CHECK(!params.IsValid());

    params = eet::MainnetEETParams();
    params.nMaxSupply = 0;
    BOOST_CHECK(!params.IsValid());

    params = eet::MainnetEETParams();
    params.nMaxHistoryEntries = 0;
    BOOST_CHECK(!params.IsValid());
}

BOOST_AUTO_TEST_CASE(history_policy_strings)
{
    eet::HistoryOverflowPolicy policy = eet::HistoryOverflowPolicy::REJECT;

    BOOST_CHECK(eet::HistoryOverflowPolicyFromString("dropoldest", policy));
    BOOST_CHECK(policy == eet::HistoryOverflowPolicy::DROP_OLDEST);
    BOOST_CHECK(eet::HistoryOverflowPolicyFromString("reject", policy));
    BOOST_CHECK(policy == eet::HistoryOverflowPolicy::REJECT);

    BOOST_CHECK(!eet::HistoryOverflowPolicyFromString("Reject", policy));
    BOOST_CHECK(!eet::HistoryOverflowPolicyFromString("", policy));

    BOOST_CHECK_EQUAL(eet::HistoryOverflowPolicyToString(eet::HistoryOverflowPolicy::DROP_OLDEST), "dropoldest");
    BOOST_CHECK_EQUAL(eet::HistoryOverflowPolicyToString(eet::HistoryOverflowPolicy::REJECT), "reject");
}

// ============================================================================
// InitEETConfig
// ============================================================================

BOOST_AUTO_TEST_CASE(init_config_defaults_to_main)
{
    BOOST_CHECK(eet::InitEETConfig());
    BOOST_CHECK_EQUAL(eet::GetEETParams().strNetworkID, "main");
    BOOST_CHECK_EQUAL(eet::GetEETParams().nMaxSupply, eet::MainnetEETParams().nMaxSupply);
}

BOOST_AUTO_TEST_CASE(init_config_overrides)
{
    gArgs.ForceSetArg("-eetnetwork", "regtest");
    gArgs.ForceSetArg("-eetfeebps", "250");
    gArgs.ForceSetArg("-eetmaxsupply", "9000000");
    gArgs.ForceSetArg("-eetmaxperproof", "5000");
    gArgs.ForceSetArg("-eetexpiry", "10");
    gArgs.ForceSetArg("-eethistorysize", "3");
    gArgs.ForceSetArg("-eethistorypolicy", "dropoldest");

    BOOST_CHECK(eet::InitEETConfig());

    const eet::EETParams& params = eet::GetEETParams();
    BOOST_CHECK_EQUAL(params.strNetworkID, "regtest");
    BOOST_CHECK_EQUAL(params.nFeeBasisPoints, 250);
    BOOST_CHECK_EQUAL(params.nMaxSupply, 9000000);
    BOOST_CHECK_EQUAL(params.nMaxPerProof, 5000);
    BOOST_CHECK_EQUAL(params.nProofExpiryBlocks, 10U);
    BOOST_CHECK_EQUAL(params.nMaxHistoryEntries, 3U);
    BOOST_CHECK(params.historyOverflowPolicy == eet::HistoryOverflowPolicy::DROP_OLDEST);

    // Presets are untouched by overrides
    BOOST_CHECK_EQUAL(eet::RegtestEETParams().nFeeBasisPoints, 100);
}

BOOST_AUTO_TEST_CASE(init_config_zero_fee_and_expiry)
{
    gArgs.ForceSetArg("-eetfeebps", "0");
    gArgs.ForceSetArg("-eetexpiry", "0");

    BOOST_CHECK(eet::InitEETConfig());
    BOOST_CHECK_EQUAL(eet::GetEETParams().nFeeBasisPoints, 0);
    BOOST_CHECK_EQUAL(eet::GetEETParams().nProofExpiryBlocks, 0U);
}

BOOST_AUTO_TEST_CASE(init_config_rejects_invalid_values)
{
    const char* const invalid[][2] = {
        {"-eetnetwork", "bogus"},
        {"-eetfeebps", "-1"},
        {"-eetfeebps", "10000"},
        {"-eetfeebps", "abc"},
        {"-eetmaxsupply", "0"},
        {"-eetmaxsupply", "1e6"},
        {"-eetmaxperproof", "-5"},
        {"-eetmaxperproof", "2000000000000"},
        {"-eetexpiry", "-1"},
        {"-eethistorysize", "0"},
        {"-eethistorypolicy", "evict"},
    };

    for (const auto& arg : invalid) {
        gArgs.ClearArgs();
        eet::SelectEETParams("regtest");
        gArgs.ForceSetArg(arg[0], arg[1]);

        BOOST_CHECK_MESSAGE(!eet::InitEETConfig(), std::string(arg[0]) + "=" + arg[1] + " accepted");

        // Active parameters are left as they were
        BOOST_CHECK_EQUAL(eet::GetEETParams().strNetworkID, "regtest");
        BOOST_CHECK_EQUAL(eet::GetEETParams().nFeeBasisPoints, 100);
        BOOST_CHECK_EQUAL(eet::GetEETParams().nMaxSupply, 5000000);
    }
}

BOOST_AUTO_TEST_CASE(help_message_lists_options)
{
    std::string help = eet::GetEETHelpMessage();
    for (const char* option : {"-eetnetwork", "-eetfeebps", "-eetmaxsupply", "-eetmaxperproof",
                               "-eetexpiry", "-eethistorysize", "-eethistorypolicy"}) {
        BOOST_CHECK_MESSAGE(help.find(option) != std::string::npos, option);
    }
}

BOOST_AUTO_TEST_SUITE_END()
