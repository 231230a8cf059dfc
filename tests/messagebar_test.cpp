#include <gtest/gtest.h>
#include <QSignalSpy>

#include "app/messagebar.h"
#include "testhelpers.h"

TEST(MessageBarTest, PushStoresAndSignals)
{
    ensureApp();
    MessageBar bar;
    QSignalSpy spy(&bar, &MessageBar::messagePushed);

    bar.pushWarning("Delete", "Toggle editing first.");
    EXPECT_EQ(bar.currentTitle(), QString("Delete"));
    EXPECT_EQ(bar.currentText(), QString("Toggle editing first."));
    EXPECT_EQ(bar.currentLevel(), MessageBar::Warning);
    ASSERT_EQ(spy.count(), 1);
    EXPECT_EQ(spy.at(0).at(0).toInt(), static_cast<int>(MessageBar::Warning));
}

TEST(MessageBarTest, ClearHidesTheBar)
{
    ensureApp();
    MessageBar bar;
    bar.pushCritical("Filter", "Expression error");
    EXPECT_FALSE(bar.isHidden());

    bar.clearMessage();
    EXPECT_TRUE(bar.isHidden());
}

TEST(MessageBarTest, LevelNames)
{
    EXPECT_EQ(MessageBar::levelName(MessageBar::Info), QString("Info"));
    EXPECT_EQ(MessageBar::levelName(MessageBar::Success), QString("Success"));
    EXPECT_EQ(MessageBar::levelName(MessageBar::Critical), QString("Critical"));
}
