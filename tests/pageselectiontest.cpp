// SPDX-License-Identifier: GPL-2.0-or-later

#include "pageselection.h"

#include <gtest/gtest.h>

using PageSelection::Error;
using PageSelection::resolve;

namespace {

QList<int> range(int first, int last)
{
    QList<int> pages;
    for (int p = first; p <= last; ++p)
        pages.append(p);
    return pages;
}

} // namespace

TEST(PageSelectionTest, EmptyAndAllSelectEveryPage)
{
    for (int pageCount : {1, 2, 5, 17, 250}) {
        for (const char *expr : {"", "   ", "all", "ALL", "  All  "}) {
            auto result = resolve(QString::fromLatin1(expr), pageCount);
            EXPECT_TRUE(result.valid) << expr << " / " << pageCount;
            EXPECT_EQ(result.pages, range(1, pageCount)) << expr << " / " << pageCount;
        }
    }
}

TEST(PageSelectionTest, RepeatedResolveGivesIdenticalResult)
{
    const QStringList exprs = {
        QStringLiteral("9,2,5-7,-6"), QStringLiteral("all"),
        QStringLiteral("1,abc"), QStringLiteral("5-3"),
        QStringLiteral("12"), QStringLiteral("-1-10"),
    };
    for (const QString &expr : exprs) {
        const auto first = resolve(expr, 10);
        const auto second = resolve(expr, 10);
        EXPECT_EQ(first.pages, second.pages) << qPrintable(expr);
        EXPECT_EQ(first.valid, second.valid) << qPrintable(expr);
        EXPECT_EQ(first.error, second.error) << qPrintable(expr);
        EXPECT_EQ(first.token, second.token) << qPrintable(expr);
        EXPECT_EQ(first.errorMessage, second.errorMessage) << qPrintable(expr);
    }
}

TEST(PageSelectionTest, IncludesPagesAndRanges)
{
    auto result = resolve(QStringLiteral("1,3,5-7"), 10);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, (QList<int>{1, 3, 5, 6, 7}));
    EXPECT_EQ(result.error, Error::None);
    EXPECT_TRUE(result.errorMessage.isEmpty());
}

TEST(PageSelectionTest, ExcludesFromAllPages)
{
    auto result = resolve(QStringLiteral("-1,-3"), 10);
    ASSERT_TRUE(result.valid);
    QList<int> expected{2};
    expected.append(range(4, 10));
    EXPECT_EQ(result.pages, expected);
}

TEST(PageSelectionTest, LeadingMinusMakesExcludeRange)
{
    auto result = resolve(QStringLiteral("-1-3"), 10);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, range(4, 10));
}

TEST(PageSelectionTest, DefaultDropsFirstPage)
{
    auto result = resolve(QStringLiteral("-1"), 3);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, (QList<int>{2, 3}));
}

TEST(PageSelectionTest, ExcludesApplyToIncludedSet)
{
    auto result = resolve(QStringLiteral("1-5,-2,-4"), 10);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, (QList<int>{1, 3, 5}));
}

TEST(PageSelectionTest, OrderOfTokensDoesNotMatter)
{
    auto a = resolve(QStringLiteral("7,1,3"), 10);
    auto b = resolve(QStringLiteral("3,7,1"), 10);
    ASSERT_TRUE(a.valid);
    ASSERT_TRUE(b.valid);
    EXPECT_EQ(a.pages, (QList<int>{1, 3, 7}));
    EXPECT_EQ(a.pages, b.pages);

    auto excludeFirst = resolve(QStringLiteral("-2,1-4"), 10);
    ASSERT_TRUE(excludeFirst.valid);
    EXPECT_EQ(excludeFirst.pages, (QList<int>{1, 3, 4}));
}

TEST(PageSelectionTest, OverlapsAreMergedWithoutDuplicates)
{
    auto result = resolve(QStringLiteral("1-4,3-6,5"), 10);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, range(1, 6));
}

TEST(PageSelectionTest, ToleratesWhitespace)
{
    auto result = resolve(QStringLiteral(" 1 , 3 , 5 - 7 "), 10);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, (QList<int>{1, 3, 5, 6, 7}));

    auto exclude = resolve(QStringLiteral("- 2"), 3);
    ASSERT_TRUE(exclude.valid);
    EXPECT_EQ(exclude.pages, (QList<int>{1, 3}));
}

TEST(PageSelectionTest, SinglePageRange)
{
    auto result = resolve(QStringLiteral("4-4"), 10);
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.pages, (QList<int>{4}));
}

TEST(PageSelectionTest, ReversedRangeIsInvalidRange)
{
    auto result = resolve(QStringLiteral("5-3"), 10);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, Error::InvalidRange);
    EXPECT_EQ(result.token, QStringLiteral("5-3"));
    EXPECT_TRUE(result.errorMessage.contains(QStringLiteral("5-3")));
    EXPECT_TRUE(result.pages.isEmpty());

    auto excluded = resolve(QStringLiteral("-3-1"), 10);
    EXPECT_EQ(excluded.error, Error::InvalidRange);
}

TEST(PageSelectionTest, ReversedRangeWinsOverOutOfRange)
{
    auto result = resolve(QStringLiteral("20-15"), 10);
    EXPECT_EQ(result.error, Error::InvalidRange);
}

TEST(PageSelectionTest, PagesOutsideDocumentAreOutOfRange)
{
    EXPECT_EQ(resolve(QStringLiteral("11"), 10).error, Error::OutOfRange);
    EXPECT_EQ(resolve(QStringLiteral("0"), 10).error, Error::OutOfRange);
    EXPECT_EQ(resolve(QStringLiteral("8-12"), 10).error, Error::OutOfRange);
    EXPECT_EQ(resolve(QStringLiteral("-11"), 10).error, Error::OutOfRange);
    EXPECT_EQ(resolve(QStringLiteral("99999999999999999999999"), 10).error,
              Error::OutOfRange);

    auto result = resolve(QStringLiteral("1,11"), 10);
    EXPECT_EQ(result.token, QStringLiteral("11"));
    EXPECT_TRUE(result.errorMessage.contains(QStringLiteral("1,11")));
}

TEST(PageSelectionTest, MalformedTokensAreInvalidToken)
{
    for (const char *expr : {"abc", "1-2-3", "--1", "1,,3", "1,", ",1", "1.5", "3-", "x-2"}) {
        auto result = resolve(QString::fromLatin1(expr), 10);
        EXPECT_FALSE(result.valid) << expr;
        EXPECT_EQ(result.error, Error::InvalidToken) << expr;
    }
}

TEST(PageSelectionTest, CancellingSelectionIsEmptyResult)
{
    auto result = resolve(QStringLiteral("1-3,-1-3"), 10);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, Error::EmptyResult);

    EXPECT_EQ(resolve(QStringLiteral("-1"), 1).error, Error::EmptyResult);
}

TEST(PageSelectionTest, FirstErrorWins)
{
    auto result = resolve(QStringLiteral("1,abc,5-3,99"), 10);
    EXPECT_EQ(result.error, Error::InvalidToken);
    EXPECT_EQ(result.token, QStringLiteral("abc"));

    auto later = resolve(QStringLiteral("99,abc"), 10);
    EXPECT_EQ(later.error, Error::OutOfRange);
}

TEST(PageSelectionTest, EmptyDocumentSelectsNothing)
{
    EXPECT_EQ(resolve(QStringLiteral("all"), 0).error, Error::EmptyResult);
    EXPECT_EQ(resolve(QStringLiteral("1"), 0).error, Error::OutOfRange);
    EXPECT_EQ(resolve(QStringLiteral("1"), -4).error, Error::OutOfRange);
}

TEST(PageSelectionTest, ResultsAreStrictlyAscendingAndInBounds)
{
    const QStringList exprs = {
        QStringLiteral("9,2,5-7,-6"), QStringLiteral("-2-4,-9"),
        QStringLiteral("10,1"), QStringLiteral("3-8,-5"),
    };
    for (const QString &expr : exprs) {
        auto result = resolve(expr, 10);
        ASSERT_TRUE(result.valid) << qPrintable(expr);
        for (int i = 0; i < result.pages.size(); ++i) {
            EXPECT_GE(result.pages.at(i), 1);
            EXPECT_LE(result.pages.at(i), 10);
            if (i > 0)
                EXPECT_LT(result.pages.at(i - 1), result.pages.at(i));
        }
    }
}

TEST(PageSelectionTest, SelectsAll)
{
    EXPECT_TRUE(PageSelection::selectsAll(QString()));
    EXPECT_TRUE(PageSelection::selectsAll(QStringLiteral(" aLl ")));
    EXPECT_FALSE(PageSelection::selectsAll(QStringLiteral("1-3")));
    EXPECT_FALSE(PageSelection::selectsAll(QStringLiteral("allx")));
}

TEST(PageSelectionTest, CheckSyntaxIgnoresDocumentLength)
{
    EXPECT_TRUE(PageSelection::checkSyntax(QStringLiteral("-1")).valid);
    EXPECT_TRUE(PageSelection::checkSyntax(QStringLiteral("500-900,-700")).valid);
    EXPECT_TRUE(PageSelection::checkSyntax(QStringLiteral("all")).valid);
    EXPECT_EQ(PageSelection::checkSyntax(QStringLiteral("1-3,-1-3")).error, Error::None);

    EXPECT_EQ(PageSelection::checkSyntax(QStringLiteral("9-2")).error, Error::InvalidRange);
    EXPECT_EQ(PageSelection::checkSyntax(QStringLiteral("a")).error, Error::InvalidToken);
    EXPECT_EQ(PageSelection::checkSyntax(QStringLiteral("0")).error, Error::OutOfRange);
}

TEST(PageSelectionTest, ErrorNames)
{
    EXPECT_EQ(PageSelection::errorName(Error::InvalidToken), QStringLiteral("InvalidToken"));
    EXPECT_EQ(PageSelection::errorName(Error::OutOfRange), QStringLiteral("OutOfRange"));
    EXPECT_EQ(PageSelection::errorName(Error::InvalidRange), QStringLiteral("InvalidRange"));
    EXPECT_EQ(PageSelection::errorName(Error::EmptyResult), QStringLiteral("EmptyResult"));
}
