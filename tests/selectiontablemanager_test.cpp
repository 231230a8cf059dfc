#include <gtest/gtest.h>
#include <QAction>
#include <QCoreApplication>
#include <QEvent>
#include <QPointer>

#include "selection/selectiontablemanager.h"
#include "selection/selectiondialog.h"
#include "selection/selectiondock.h"
#include "selection/selectiontablewidget.h"
#include "app/messagebar.h"
#include "canvas/mapcanvas.h"
#include "core/vectorlayer.h"
#include "testhelpers.h"

namespace {

void flushDeferredDeletes()
{
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
}

} // namespace

class SelectionTableManagerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ensureApp();
        host = new TestHost();
        layer = makeParcelLayer(6);
        host->setActiveLayer(layer);
        layer->selectByIds(idSet({1, 2, 3, 4}));
        manager = new SelectionTableManager(host);
    }

    void TearDown() override
    {
        delete manager;
        flushDeferredDeletes();
        delete host;
        delete layer;
    }

    TestHost* host{nullptr};
    VectorLayer* layer{nullptr};
    SelectionTableManager* manager{nullptr};
};

TEST_F(SelectionTableManagerTest, RefusesLayerWithoutSelection)
{
    layer->removeSelection();

    EXPECT_EQ(manager->openDialog(layer), nullptr);
    EXPECT_EQ(manager->openDock(layer), nullptr);
    EXPECT_EQ(manager->dialogCount(), 0);
    EXPECT_EQ(manager->dockCount(), 0);
    EXPECT_EQ(host->dockAdds(), 0);
    EXPECT_EQ(host->messageBar()->currentText(), QString("Select features first."));
    EXPECT_EQ(host->messageBar()->currentLevel(), MessageBar::Info);
}

TEST_F(SelectionTableManagerTest, WarnsWithoutActiveLayer)
{
    host->setActiveLayer(nullptr);

    manager->runDock();
    EXPECT_EQ(manager->dockCount(), 0);
    EXPECT_EQ(host->messageBar()->currentText(), QString("Select a vector layer."));
    EXPECT_EQ(host->messageBar()->currentLevel(), MessageBar::Warning);

    host->messageBar()->clearMessage();
    manager->runDialog();
    EXPECT_EQ(manager->dialogCount(), 0);
    EXPECT_EQ(host->messageBar()->currentText(), QString("Select a vector layer."));
}

TEST_F(SelectionTableManagerTest, RunUsesActiveLayer)
{
    manager->runDialog();
    SelectionDialog* dialog = manager->dialogFor(layer);
    ASSERT_NE(dialog, nullptr);
    EXPECT_TRUE(dialog->isVisible());
    EXPECT_EQ(dialog->primarySelection(), idSet({1, 2, 3, 4}));
    EXPECT_EQ(host->mapCanvas()->rubberBands().size(), 2);
}

TEST_F(SelectionTableManagerTest, ReopeningReusesTheWindow)
{
    SelectionDialog* first = manager->openDialog(layer);
    ASSERT_NE(first, nullptr);

    // An existing window comes back even when the layer lost its selection
    layer->removeSelection();
    EXPECT_EQ(manager->openDialog(layer), first);
    EXPECT_EQ(manager->dialogCount(), 1);
}

TEST_F(SelectionTableManagerTest, ReopeningReusesTheDock)
{
    SelectionDock* first = manager->openDock(layer);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(manager->openDock(layer), first);
    EXPECT_EQ(manager->dockCount(), 1);
    EXPECT_EQ(host->dockAdds(), 1);
    EXPECT_EQ(first->parentWidget(), host->mainWindow());
}

TEST_F(SelectionTableManagerTest, TablesAreKeptPerLayer)
{
    VectorLayer* other = makeParcelLayer(3);
    host->setActiveLayer(other);
    other->selectByIds(idSet({0, 2}));

    SelectionDialog* forLayer = manager->openDialog(layer);
    SelectionDialog* forOther = manager->openDialog(other);
    ASSERT_NE(forLayer, nullptr);
    ASSERT_NE(forOther, nullptr);
    EXPECT_NE(forLayer, forOther);
    EXPECT_EQ(manager->dialogCount(), 2);
    EXPECT_EQ(forOther->primarySelection(), idSet({0, 2}));

    manager->closeAll();
    flushDeferredDeletes();
    delete other;
}

TEST_F(SelectionTableManagerTest, FinishedWindowLeavesRegistry)
{
    QPointer<SelectionDialog> dialog = manager->openDialog(layer);
    ASSERT_FALSE(dialog.isNull());

    dialog->reject();
    EXPECT_EQ(manager->dialogFor(layer), nullptr);
    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());

    flushDeferredDeletes();
    EXPECT_TRUE(dialog.isNull());
}

TEST_F(SelectionTableManagerTest, ClosingWindowRestoresLayerSelection)
{
    SelectionDialog* dialog = manager->openDialog(layer);
    ASSERT_NE(dialog, nullptr);
    dialog->selectionWidget()->setHighlightedFeatures(idSet({2}));
    dialog->selectionWidget()->zoomToTargets();
    ASSERT_EQ(layer->selectedFeatureIds(), idSet({2}));

    dialog->close();
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 2, 3, 4}));
    EXPECT_EQ(manager->dialogCount(), 0);
}

TEST_F(SelectionTableManagerTest, ClosingDockUnregistersIt)
{
    QPointer<SelectionDock> dock = manager->openDock(layer);
    ASSERT_FALSE(dock.isNull());

    dock->close();
    EXPECT_EQ(manager->dockFor(layer), nullptr);
    EXPECT_EQ(host->dockRemoves(), 1);
    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());

    flushDeferredDeletes();
    EXPECT_TRUE(dock.isNull());
}

TEST_F(SelectionTableManagerTest, ConvertsWindowToDock)
{
    QPointer<SelectionDialog> dialog = manager->openDialog(layer);
    ASSERT_FALSE(dialog.isNull());

    manager->convertToDock(layer);
    flushDeferredDeletes();

    EXPECT_TRUE(dialog.isNull());
    EXPECT_EQ(manager->dialogCount(), 0);
    SelectionDock* dock = manager->dockFor(layer);
    ASSERT_NE(dock, nullptr);
    EXPECT_EQ(dock->selectionWidget()->primarySelection(), idSet({1, 2, 3, 4}));
    EXPECT_EQ(host->dockAdds(), 1);
    // Only the dock's overlays are left
    EXPECT_EQ(host->mapCanvas()->rubberBands().size(), 2);
}

TEST_F(SelectionTableManagerTest, UndockActionConvertsDockToWindow)
{
    QPointer<SelectionDock> dock = manager->openDock(layer);
    ASSERT_FALSE(dock.isNull());

    dock->undockAction()->trigger();
    flushDeferredDeletes();

    EXPECT_TRUE(dock.isNull());
    EXPECT_EQ(manager->dockCount(), 0);
    EXPECT_EQ(host->dockRemoves(), 1);
    ASSERT_NE(manager->dialogFor(layer), nullptr);
    EXPECT_EQ(host->mapCanvas()->rubberBands().size(), 2);
}

TEST_F(SelectionTableManagerTest, CloseForRemovesOverlaysOfOneLayer)
{
    manager->openDialog(layer);
    manager->openDock(layer);
    ASSERT_EQ(host->mapCanvas()->rubberBands().size(), 4);

    manager->closeFor(layer);
    flushDeferredDeletes();

    EXPECT_EQ(manager->dialogCount(), 0);
    EXPECT_EQ(manager->dockCount(), 0);
    EXPECT_EQ(host->dockRemoves(), 1);
    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 2, 3, 4}));
}

TEST_F(SelectionTableManagerTest, CloseForDeletesHiddenWindow)
{
    QPointer<SelectionDialog> dialog = manager->openDialog(layer);
    ASSERT_FALSE(dialog.isNull());
    dialog->selectionWidget()->setHighlightedFeatures(idSet({3}));
    dialog->selectionWidget()->zoomToTargets();
    dialog->hide();

    manager->closeFor(layer);
    flushDeferredDeletes();

    EXPECT_TRUE(dialog.isNull());
    EXPECT_EQ(manager->dialogCount(), 0);
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 2, 3, 4}));
}

TEST_F(SelectionTableManagerTest, CloseAllDeletesHiddenWindows)
{
    QPointer<SelectionDialog> dialog = manager->openDialog(layer);
    ASSERT_FALSE(dialog.isNull());
    dialog->hide();

    manager->closeAll();
    flushDeferredDeletes();

    EXPECT_TRUE(dialog.isNull());
    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());
}

TEST_F(SelectionTableManagerTest, DestructionClosesEverything)
{
    manager->openDialog(layer);
    manager->openDock(layer);

    delete manager;
    manager = nullptr;
    flushDeferredDeletes();

    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());
    EXPECT_EQ(host->dockRemoves(), 1);
}
