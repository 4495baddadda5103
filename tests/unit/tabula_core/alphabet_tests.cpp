#include "tabula/alphabet.hpp"
#include "tabula/error.hpp"

#include <gtest/gtest.h>

TEST(AlphabetTests, ConvertsKnownValues)
{
    EXPECT_EQ(tabula::int_to_alphabet(0), "");
    EXPECT_EQ(tabula::int_to_alphabet(1), "A");
    EXPECT_EQ(tabula::int_to_alphabet(26), "Z");
    EXPECT_EQ(tabula::int_to_alphabet(27), "AA");
    EXPECT_EQ(tabula::int_to_alphabet(52), "AZ");
    EXPECT_EQ(tabula::int_to_alphabet(18278), "ZZZ");
}

TEST(AlphabetTests, ParsesKnownValues)
{
    EXPECT_EQ(tabula::alphabet_to_int(""), 0);
    EXPECT_EQ(tabula::alphabet_to_int("A"), 1);
    EXPECT_EQ(tabula::alphabet_to_int("AA"), 27);
    EXPECT_EQ(tabula::alphabet_to_int("ZZZ"), 18278);
}

TEST(AlphabetTests, RoundTripsEveryValueUpToThreeLetters)
{
    for (int value = 1; value <= 18278; ++value)
        ASSERT_EQ(tabula::alphabet_to_int(tabula::int_to_alphabet(value)), value) << value;
}

TEST(AlphabetTests, RejectsInvalidInput)
{
    try
    {
        tabula::int_to_alphabet(-1);
        FAIL() << "negative value accepted";
    }
    catch (const tabula::Error &error)
    {
        EXPECT_EQ(error.kind(), tabula::ErrorKind::InvalidArgument);
    }

    EXPECT_THROW(tabula::alphabet_to_int("a"), tabula::Error);
    EXPECT_THROW(tabula::alphabet_to_int("A1"), tabula::Error);
}
