// Copyright (c) 2026 The EET Ledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>
#include <utilstrencodings.h>
#include <test/test_eet.h>

#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_HexStr)
{
    std::vector<unsigned char> vch = {0x00, 0x1f, 0xa0, 0xff};
    BOOST_CHECK_EQUAL(HexStr(vch), "001fa0ff");
    BOOST_CHECK_EQUAL(HexStr(std::vector<unsigned char>()), "");
}

BOOST_AUTO_TEST_CASE(util_IsHex)
{
    BOOST_CHECK(IsHex("00"));
    BOOST_CHECK(IsHex("00112233445566778899aabbccddeeffAABBCCDDEEFF"));
    BOOST_CHECK(IsHex("ff"));
    BOOST_CHECK(IsHex("FF"));

    BOOST_CHECK(!IsHex(""));
    BOOST_CHECK(!IsHex("0"));
    BOOST_CHECK(!IsHex("a"));
    BOOST_CHECK(!IsHex("eleven"));
    BOOST_CHECK(!IsHex("00xx00"));
    BOOST_CHECK(!IsHex("0x0000"));
}

BOOST_AUTO_TEST_CASE(test_ParseInt64)
{
    int64_t n;
    // Valid values
    BOOST_CHECK(ParseInt64("1234", nullptr));
    BOOST_CHECK(ParseInt64("0", &n) && n == 0LL);
    BOOST_CHECK(ParseInt64("1234", &n) && n == 1234LL);
    BOOST_CHECK(ParseInt64("01234", &n) && n == 1234LL); // no octal
    BOOST_CHECK(ParseInt64("2147483647", &n) && n == 2147483647LL);
    BOOST_CHECK(ParseInt64("-2147483648", &n) && n == -2147483648LL);
    BOOST_CHECK(ParseInt64("9223372036854775807", &n) && n == (int64_t)9223372036854775807);
    BOOST_CHECK(ParseInt64("-9223372036854775808", &n) && n == (int64_t)-9223372036854775807-1);
    BOOST_CHECK(ParseInt64("-1234", &n) && n == -1234LL);
    // Invalid values
    BOOST_CHECK(!ParseInt64("", &n));
    BOOST_CHECK(!ParseInt64(" 1", &n)); // no padding inside
    BOOST_CHECK(!ParseInt64("1 ", &n));
    BOOST_CHECK(!ParseInt64("1a", &n));
    BOOST_CHECK(!ParseInt64("aap", &n));
    BOOST_CHECK(!ParseInt64("0x1", &n)); // no hex
    BOOST_CHECK(!ParseInt64(std::string("1\0" "1", 3), &n));
    // Overflow and underflow
    BOOST_CHECK(!ParseInt64("-9223372036854775809", nullptr));
    BOOST_CHECK(!ParseInt64("9223372036854775808", nullptr));
    BOOST_CHECK(!ParseInt64("-32482348723847471234", nullptr));
    BOOST_CHECK(!ParseInt64("32482348723847471234", nullptr));
}

BOOST_AUTO_TEST_CASE(test_ParseUInt64)
{
    uint64_t n;
    // Valid values
    BOOST_CHECK(ParseUInt64("1234", nullptr));
    BOOST_CHECK(ParseUInt64("0", &n) && n == 0LL);
    BOOST_CHECK(ParseUInt64("1234", &n) && n == 1234LL);
    BOOST_CHECK(ParseUInt64("01234", &n) && n == 1234LL); // no octal
    BOOST_CHECK(ParseUInt64("9223372036854775807", &n) && n == 9223372036854775807ULL);
    BOOST_CHECK(ParseUInt64("18446744073709551615", &n) && n == 18446744073709551615ULL);
    // Invalid values
    BOOST_CHECK(!ParseUInt64("", &n));
    BOOST_CHECK(!ParseUInt64(" 1", &n)); // no padding inside
    BOOST_CHECK(!ParseUInt64(" -1", &n));
    BOOST_CHECK(!ParseUInt64("1 ", &n));
    BOOST_CHECK(!ParseUInt64("1a", &n));
    BOOST_CHECK(!ParseUInt64("aap", &n));
    BOOST_CHECK(!ParseUInt64("0x1", &n)); // no hex
    // Overflow and underflow
    BOOST_CHECK(!ParseUInt64("-9223372036854775809", nullptr));
    BOOST_CHECK(!ParseUInt64("18446744073709551616", nullptr));
    BOOST_CHECK(!ParseUInt64("-1", &n));
    BOOST_CHECK(!ParseUInt64("-1234", &n));
}

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    ArgsManager testArgs;
    std::string error;
    const char *argv_test[] = {"-ignored", "-a", "-b", "-ccc=argument", "-ccc=multiple", "f", "-d=e"};

    BOOST_CHECK(testArgs.ParseParameters(0, (char**)argv_test, error));
    BOOST_CHECK(!testArgs.IsArgSet("-a"));

    BOOST_CHECK(testArgs.ParseParameters(1, (char**)argv_test, error));
    BOOST_CHECK(!testArgs.IsArgSet("-ignored"));

    BOOST_CHECK(testArgs.ParseParameters(7, (char**)argv_test, error));
    // expectation: -ignored is ignored (program name argument),
    // -a, -b and -ccc end up in map, -d ignored because it is after
    // a non-option argument (non-GNU option parsing)
    BOOST_CHECK(testArgs.IsArgSet("-a") && testArgs.IsArgSet("-b") && testArgs.IsArgSet("-ccc")
                && !testArgs.IsArgSet("f") && !testArgs.IsArgSet("-d"));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-a", "xxx"), "");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-ccc", "xxx"), "multiple");
    BOOST_CHECK_EQUAL(testArgs.GetArgs("-ccc").size(), 2U);
}

BOOST_AUTO_TEST_CASE(util_GetArg)
{
    ArgsManager testArgs;
    testArgs.ForceSetArg("strtest1", "string...");
    // strtest2 undefined on purpose
    testArgs.ForceSetArg("inttest1", "12345");
    testArgs.ForceSetArg("inttest2", "81985529216486895");
    // inttest3 undefined on purpose
    testArgs.ForceSetArg("booltest1", "");
    // booltest2 undefined on purpose
    testArgs.ForceSetArg("booltest3", "0");
    testArgs.ForceSetArg("booltest4", "1");

    BOOST_CHECK_EQUAL(testArgs.GetArg("strtest1", "default"), "string...");
    BOOST_CHECK_EQUAL(testArgs.GetArg("strtest2", "default"), "default");
    BOOST_CHECK_EQUAL(testArgs.GetArg("inttest1", -1), 12345);
    BOOST_CHECK_EQUAL(testArgs.GetArg("inttest2", -1), 81985529216486895LL);
    BOOST_CHECK_EQUAL(testArgs.GetArg("inttest3", -1), -1);
    BOOST_CHECK_EQUAL(testArgs.GetBoolArg("booltest1", false), true);
    BOOST_CHECK_EQUAL(testArgs.GetBoolArg("booltest2", false), false);
    BOOST_CHECK_EQUAL(testArgs.GetBoolArg("booltest3", false), false);
    BOOST_CHECK_EQUAL(testArgs.GetBoolArg("booltest4", false), true);
}

BOOST_AUTO_TEST_CASE(util_NegatedArgs)
{
    ArgsManager testArgs;
    std::string error;
    const char *argv_test[] = {"ignored", "-nofoo", "-nobar=0", "-baz"};

    BOOST_CHECK(testArgs.ParseParameters(4, (char**)argv_test, error));
    BOOST_CHECK(!testArgs.GetBoolArg("-foo", true));
    BOOST_CHECK(testArgs.GetBoolArg("-bar", false));
    BOOST_CHECK(testArgs.GetBoolArg("-baz", false));
    BOOST_CHECK(!testArgs.IsArgSet("-nofoo"));
}

BOOST_AUTO_TEST_CASE(util_SoftSetArg)
{
    ArgsManager testArgs;
    BOOST_CHECK(testArgs.SoftSetArg("-foo", "1"));
    BOOST_CHECK(!testArgs.SoftSetArg("-foo", "2"));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-foo", ""), "1");

    BOOST_CHECK(testArgs.SoftSetBoolArg("-bar", false));
    BOOST_CHECK(!testArgs.SoftSetBoolArg("-bar", true));
    BOOST_CHECK(!testArgs.GetBoolArg("-bar", true));

    testArgs.ClearArgs();
    BOOST_CHECK(!testArgs.IsArgSet("-foo"));
}

BOOST_AUTO_TEST_CASE(util_LogCategories)
{
    uint32_t flag = 0;
    std::string eet = "eet";
    BOOST_CHECK(GetLogCategory(&flag, &eet));
    BOOST_CHECK_EQUAL(flag, (uint32_t)BCLog::EET);

    std::string all = "1";
    BOOST_CHECK(GetLogCategory(&flag, &all));
    BOOST_CHECK_EQUAL(flag, (uint32_t)BCLog::ALL);

    std::string bogus = "bogus";
    BOOST_CHECK(!GetLogCategory(&flag, &bogus));

    BOOST_CHECK_EQUAL(ListLogCategories(), "eet, config");
}

BOOST_AUTO_TEST_CASE(util_InitLogging)
{
    gArgs.ForceSetArg("-debug", "eet");
    BOOST_CHECK(InitLogging());
    BOOST_CHECK(LogAcceptCategory(BCLog::EET));
    BOOST_CHECK(!LogAcceptCategory(BCLog::CONFIG));

    gArgs.ForceSetArg("-debug", "1");
    gArgs.ForceSetArg("-debugexclude", "config");
    BOOST_CHECK(InitLogging());
    BOOST_CHECK(LogAcceptCategory(BCLog::EET));
    BOOST_CHECK(!LogAcceptCategory(BCLog::CONFIG));

    gArgs.ForceSetArg("-debug", "bogus");
    BOOST_CHECK(!InitLogging());

    logCategories = BCLog::NONE;
}

BOOST_AUTO_TEST_CASE(util_HelpMessageOpt)
{
    std::string help = HelpMessageOpt("-foo=<n>", "Sets foo");
    BOOST_CHECK(help.find("  -foo=<n>\n") == 0);
    BOOST_CHECK(help.find("Sets foo") != std::string::npos);
    BOOST_CHECK_EQUAL(HelpMessageGroup("Options:"), "Options:\n\n");
}

BOOST_AUTO_TEST_CASE(util_strprintf)
{
    BOOST_CHECK_EQUAL(strprintf("%d %s %u", 42, "eet", 7U), "42 eet 7");
    BOOST_CHECK(!error("expected failure %d", 1));
}

BOOST_AUTO_TEST_CASE(util_DebugLog)
{
    const std::string path = "test_eet_debug.log";
    std::remove(path.c_str());

    BOOST_REQUIRE(OpenDebugLog(path));
    fPrintToDebugLog = true;
    fLogTimestamps = false;
    LogPrintf("minted %d against proof %u\n", 990, 1U);
    LogPrint(BCLog::EET, "filtered out\n");
    CloseDebugLog();
    fPrintToDebugLog = false;
    fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    BOOST_CHECK_EQUAL(contents.str(), "minted 990 against proof 1\n");
    file.close();
    std::remove(path.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
