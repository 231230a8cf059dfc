#include <gtest/gtest.h>
#include <QSignalSpy>

#include "core/selectionset.h"
#include "testhelpers.h"

TEST(SelectionSetTest, HighlightsAreClippedToPrimary)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1, 2, 3}));
    set.setHighlighted(idSet({2, 3, 7}));

    EXPECT_EQ(set.highlighted(), idSet({2, 3}));
    EXPECT_TRUE(set.isHighlighted(2));
    EXPECT_FALSE(set.isHighlighted(7));
}

TEST(SelectionSetTest, ShrinkingPrimaryDropsHighlights)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1, 2, 3, 4}));
    set.setHighlighted(idSet({1, 4}));

    QSignalSpy highlightSpy(&set, &SelectionSet::highlightChanged);
    set.setPrimary(idSet({1, 2}));

    EXPECT_EQ(set.highlighted(), idSet({1}));
    EXPECT_EQ(highlightSpy.count(), 1);
}

TEST(SelectionSetTest, TargetsFallBackToPrimary)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({5, 6}));
    EXPECT_EQ(set.targets(), idSet({5, 6}));
    EXPECT_EQ(set.targetDescription(), QString("2 selected (cyan)"));

    set.toggle(6);
    EXPECT_EQ(set.targets(), idSet({6}));
    EXPECT_EQ(set.targetDescription(), QString("1 highlighted (yellow)"));
}

TEST(SelectionSetTest, ToggleIgnoresUnselectedFeatures)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1}));
    set.toggle(9);
    EXPECT_FALSE(set.hasHighlights());

    set.toggle(1);
    set.toggle(1);
    EXPECT_FALSE(set.hasHighlights());
}

TEST(SelectionSetTest, InvertAndHighlightAll)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1, 2, 3}));
    set.setHighlighted(idSet({1}));

    set.invert();
    EXPECT_EQ(set.highlighted(), idSet({2, 3}));
    EXPECT_EQ(set.unhighlighted(), idSet({1}));

    set.highlightAll();
    EXPECT_EQ(set.highlighted(), set.primary());

    set.invert();
    EXPECT_FALSE(set.hasHighlights());
}

TEST(SelectionSetTest, NarrowToHighlighted)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1, 2, 3}));
    EXPECT_FALSE(set.narrowToHighlighted());

    set.setHighlighted(idSet({2, 3}));
    QSignalSpy primarySpy(&set, &SelectionSet::primaryChanged);
    EXPECT_TRUE(set.narrowToHighlighted());

    EXPECT_EQ(set.primary(), idSet({2, 3}));
    EXPECT_FALSE(set.hasHighlights());
    EXPECT_EQ(primarySpy.count(), 1);
}

TEST(SelectionSetTest, RemovedFeaturesLeaveBothSets)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1, 2, 3}));
    set.setHighlighted(idSet({2, 3}));

    set.removeFeatures(idSet({3}));
    EXPECT_EQ(set.primary(), idSet({1, 2}));
    EXPECT_EQ(set.highlighted(), idSet({2}));
}

TEST(SelectionSetTest, NoSignalWhenNothingChanges)
{
    ensureApp();
    SelectionSet set;
    set.setPrimary(idSet({1, 2}));
    set.setHighlighted(idSet({1}));

    QSignalSpy primarySpy(&set, &SelectionSet::primaryChanged);
    QSignalSpy highlightSpy(&set, &SelectionSet::highlightChanged);
    set.setPrimary(idSet({1, 2}));
    set.setHighlighted(idSet({1, 42}));

    EXPECT_EQ(primarySpy.count(), 0);
    EXPECT_EQ(highlightSpy.count(), 0);
}
