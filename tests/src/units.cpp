#include "unit-tests.hpp"

#include <string>

using namespace wcc;
using namespace wcc::tests;

TEST_F(UnitTest, Units_ParseEther)
{
    EXPECT_EQ(units::parseEther("1").value(), units::weiPerEther());
    EXPECT_EQ(units::parseEther("1.5").value(), units::BigInt("1500000000000000000"));
    EXPECT_EQ(units::parseEther("0.000000000000000001").value(), 1);
    EXPECT_EQ(units::parseEther(".25").value(), units::BigInt("250000000000000000"));
    EXPECT_EQ(units::parseEther("-2").value(), units::BigInt("-2000000000000000000"));
    EXPECT_EQ(units::parseEther("007").value(), units::BigInt("7000000000000000000"));
}

TEST_F(UnitTest, Units_ParseUnits_TruncatesExtraFractionDigits)
{
    EXPECT_EQ(units::parseUnits("1.239", 2).value(), 123);
    EXPECT_EQ(units::parseUnits("0.0000000001", 9).value(), 0);
}

TEST_F(UnitTest, Units_ParseUnits_RejectsMalformedAmounts)
{
    for(const std::string amount : {"", "-", ".", "1.2.3", "1e18", "abc", " 1", "+1"})
    {
        const auto value = units::parseUnits(amount, 18);
        ASSERT_FALSE(value.has_value()) << amount;
        EXPECT_EQ(value.error().kind, parse::Error::Kind::INVALID_VALUE) << amount;
    }
}

TEST_F(UnitTest, Units_FormatUnits_TrimsTrailingZeros)
{
    EXPECT_EQ(units::formatUnits(units::BigInt("1500000000000000000"), 18), "1.5");
    EXPECT_EQ(units::formatUnits(units::weiPerEther(), 18), "1");
    EXPECT_EQ(units::formatUnits(1, 18), "0.000000000000000001");
    EXPECT_EQ(units::formatUnits(0, 6), "0");
    EXPECT_EQ(units::formatUnits(-1500000, 6), "-1.5");
    EXPECT_EQ(units::formatUnits(42, 0), "42");
}

TEST_F(UnitTest, Units_FormatUnits_InvertsParseUnits)
{
    for(const std::string amount : {"0.1", "123.456", "1000000", "-0.000001"})
    {
        const auto value = units::parseUnits(amount, 18);
        ASSERT_TRUE(value.has_value()) << amount;
        EXPECT_EQ(units::formatUnits(*value, 18), amount);
    }
}

TEST_F(UnitTest, Units_FormatFixed_RoundsHalfAwayFromZero)
{
    EXPECT_EQ(units::formatEther(units::BigInt("1234567890000000000"), 4), "1.2346");
    EXPECT_EQ(units::formatEther(units::BigInt("1000000000000000000"), 2), "1.00");
    EXPECT_EQ(units::formatFixed(5, 1, 0), "1");
    EXPECT_EQ(units::formatFixed(-5, 1, 0), "-1");
    EXPECT_EQ(units::formatFixed(4, 1, 0), "0");
    EXPECT_EQ(units::formatFixed(-4, 1, 0), "0");
    EXPECT_EQ(units::formatFixed(1, 3, 2), "0.00");
    EXPECT_EQ(units::formatFixed(5, 3, 2), "0.01");
}

TEST_F(UnitTest, Units_Gwei)
{
    EXPECT_EQ(units::parseGwei("20").value(), units::BigInt("20000000000"));
    EXPECT_EQ(units::formatGwei(units::BigInt("20000000000"), 1), "20.0");
    EXPECT_EQ(units::weiPerGwei(), units::BigInt(1000000000));
}
