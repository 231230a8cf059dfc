#include <gtest/gtest.h>
#include <QSignalSpy>
#include <QTableWidget>

#include "selection/selectiontablewidget.h"
#include "selection/highlightdelegate.h"
#include "app/messagebar.h"
#include "canvas/mapcanvas.h"
#include "canvas/rubberband.h"
#include "core/fieldcalculator.h"
#include "core/vectorlayer.h"
#include "appsettings.h"
#include "testhelpers.h"

class SelectionTableWidgetTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ensureApp();
        host = new TestHost();
        layer = makeParcelLayer(6);
        host->setActiveLayer(layer);
        layer->selectByIds(idSet({1, 2, 3, 4}));
        widget = new SelectionTableWidget(layer, host);
    }

    void TearDown() override
    {
        delete widget;
        delete layer;
        delete host;
    }

    QTableWidgetItem* cell(FeatureId fid, int column) const
    {
        const int row = widget->rowForFid(fid);
        return row < 0 ? nullptr : widget->table()->item(row, column);
    }

    FeatureIds selectedRowIds() const
    {
        FeatureIds ids;
        const QModelIndexList rows = widget->table()->selectionModel()->selectedRows();
        for (const QModelIndex& index : rows) {
            FeatureId fid;
            if (widget->fidForRow(index.row(), &fid)) ids.insert(fid);
        }
        return ids;
    }

    TestHost* host{nullptr};
    VectorLayer* layer{nullptr};
    SelectionTableWidget* widget{nullptr};
};

TEST_F(SelectionTableWidgetTest, ShowsOneRowPerSelectedFeature)
{
    QTableWidget* table = widget->table();
    ASSERT_EQ(table->rowCount(), 4);
    ASSERT_EQ(table->columnCount(), 3);
    EXPECT_EQ(table->horizontalHeaderItem(0)->text(), QString("name"));

    FeatureIds rows;
    for (int row = 0; row < table->rowCount(); ++row) {
        FeatureId fid;
        ASSERT_TRUE(widget->fidForRow(row, &fid));
        rows.insert(fid);
    }
    EXPECT_EQ(rows, idSet({1, 2, 3, 4}));
    EXPECT_EQ(cell(3, 0)->text(), QString("p3"));
    EXPECT_EQ(cell(3, 0)->data(FieldNameRole).toString(), QString("name"));
    EXPECT_EQ(widget->primarySelection(), idSet({1, 2, 3, 4}));
    EXPECT_TRUE(widget->highlightedFeatures().isEmpty());
    EXPECT_TRUE(widget->infoText().contains("4"));
}

TEST_F(SelectionTableWidgetTest, RubberBandsFollowHighlights)
{
    ASSERT_EQ(host->mapCanvas()->rubberBands().size(), 2);
    EXPECT_EQ(widget->primaryRubberBand()->size(), 4);
    EXPECT_EQ(widget->highlightRubberBand()->size(), 0);

    widget->setHighlightedFeatures(idSet({2}));
    EXPECT_EQ(widget->primaryRubberBand()->size(), 3);
    EXPECT_EQ(widget->highlightRubberBand()->size(), 1);
    EXPECT_EQ(widget->highlightRubberBand()->width(), 3);
}

TEST_F(SelectionTableWidgetTest, CleanupRemovesBandsAndIsRepeatable)
{
    widget->cleanupRubberBands();
    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());
    EXPECT_EQ(widget->primaryRubberBand(), nullptr);
    EXPECT_EQ(widget->highlightRubberBand(), nullptr);

    widget->cleanupRubberBands();
    // Highlighting without bands still works
    widget->setHighlightedFeatures(idSet({1}));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({1}));
}

TEST_F(SelectionTableWidgetTest, DeletingWidgetRemovesBands)
{
    delete widget;
    widget = nullptr;
    EXPECT_TRUE(host->mapCanvas()->rubberBands().isEmpty());
}

TEST_F(SelectionTableWidgetTest, RowIdentitySurvivesSorting)
{
    QTableWidget* table = widget->table();
    table->sortItems(1, Qt::DescendingOrder);

    FeatureId first = -1;
    ASSERT_TRUE(widget->fidForRow(0, &first));
    EXPECT_EQ(first, 4);
    EXPECT_EQ(widget->rowForFid(4), 0);

    table->selectRow(0);
    EXPECT_EQ(widget->highlightedFeatures(), idSet({4}));

    table->sortItems(1, Qt::AscendingOrder);
    EXPECT_EQ(widget->highlightedFeatures(), idSet({4}));
    EXPECT_EQ(selectedRowIds(), idSet({4}));
}

TEST_F(SelectionTableWidgetTest, TableSelectionDrivesHighlights)
{
    QSignalSpy spy(widget, &SelectionTableWidget::highlightChanged);

    widget->table()->selectRow(widget->rowForFid(2));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({2}));
    ASSERT_GE(spy.count(), 1);
    EXPECT_EQ(spy.last().at(0).value<FeatureIds>(), idSet({2}));
    EXPECT_EQ(widget->targetFeatures(), idSet({2}));
}

TEST_F(SelectionTableWidgetTest, ProgrammaticHighlightSelectsRows)
{
    widget->setHighlightedFeatures(idSet({1, 3, 99}));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({1, 3}));
    EXPECT_EQ(selectedRowIds(), idSet({1, 3}));
}

TEST_F(SelectionTableWidgetTest, DelegatePaintsHighlightedRowsYellow)
{
    HighlightDelegate* delegate = qobject_cast<HighlightDelegate*>(widget->table()->itemDelegate());
    ASSERT_NE(delegate, nullptr);

    widget->setHighlightedFeatures(idSet({2}));
    QTableWidget* table = widget->table();
    const QModelIndex highlighted = table->model()->index(widget->rowForFid(2), 1);
    const QModelIndex plain = table->model()->index(widget->rowForFid(3), 1);

    EXPECT_EQ(delegate->backgroundFor(highlighted), delegate->highlightColor());
    EXPECT_EQ(delegate->backgroundFor(plain), delegate->primaryColor());
}

TEST_F(SelectionTableWidgetTest, ExternalSelectionChangeKeepsHighlightsInside)
{
    widget->setHighlightedFeatures(idSet({2, 3}));

    layer->selectByIds(idSet({3, 5}));

    EXPECT_EQ(widget->primarySelection(), idSet({3, 5}));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({3}));
    EXPECT_EQ(widget->table()->rowCount(), 2);
    EXPECT_EQ(selectedRowIds(), idSet({3}));
    EXPECT_EQ(host->messageBar()->currentTitle(), QString("Sync"));
}

TEST_F(SelectionTableWidgetTest, HighlightActions)
{
    widget->highlightAll();
    EXPECT_EQ(widget->highlightedFeatures(), idSet({1, 2, 3, 4}));

    widget->setHighlightedFeatures(idSet({1}));
    widget->invertHighlights();
    EXPECT_EQ(widget->highlightedFeatures(), idSet({2, 3, 4}));

    widget->clearHighlights();
    EXPECT_TRUE(widget->highlightedFeatures().isEmpty());
    EXPECT_EQ(host->messageBar()->currentText(), QString("Cleared 3 highlights."));
    EXPECT_TRUE(selectedRowIds().isEmpty());
}

TEST_F(SelectionTableWidgetTest, ReselectNarrowsTheLayerSelection)
{
    widget->reselectToHighlighted();
    EXPECT_EQ(host->messageBar()->currentText(), QString("No features highlighted to re-select."));

    widget->setHighlightedFeatures(idSet({2, 3}));
    widget->reselectToHighlighted();

    EXPECT_EQ(layer->selectedFeatureIds(), idSet({2, 3}));
    EXPECT_EQ(widget->primarySelection(), idSet({2, 3}));
    EXPECT_TRUE(widget->highlightedFeatures().isEmpty());
    EXPECT_EQ(widget->table()->rowCount(), 2);
    EXPECT_EQ(host->messageBar()->currentText(), QString("Selection narrowed to 2 features."));
}

TEST_F(SelectionTableWidgetTest, CellsAreReadOnlyOutsideEditMode)
{
    EXPECT_FALSE(cell(1, 1)->flags() & Qt::ItemIsEditable);

    // A direct text change is ignored while the layer is not editable
    cell(1, 1)->setText("123");
    EXPECT_DOUBLE_EQ(layer->getFeature(1).attribute(1).toDouble(), 10.0);

    ASSERT_TRUE(layer->startEditing());
    EXPECT_TRUE(cell(1, 1)->flags() & Qt::ItemIsEditable);
}

TEST_F(SelectionTableWidgetTest, CellEditsWriteThroughWithConversion)
{
    ASSERT_TRUE(layer->startEditing());

    QTableWidgetItem* area = cell(1, 1);
    ASSERT_NE(area, nullptr);
    area->setText("55.5");
    EXPECT_DOUBLE_EQ(layer->getFeature(1).attribute(1).toDouble(), 55.5);

    QTableWidgetItem* zone = cell(1, 2);
    ASSERT_NE(zone, nullptr);
    zone->setText("abc");
    EXPECT_EQ(layer->getFeature(1).attribute(2).toLongLong(), 1);
    EXPECT_EQ(zone->text(), QString("1"));
    EXPECT_EQ(host->messageBar()->currentLevel(), MessageBar::Warning);
}

TEST_F(SelectionTableWidgetTest, LayerValueChangesUpdateCells)
{
    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(layer->changeAttributeValue(4, 0, "renamed"));
    EXPECT_EQ(cell(4, 0)->text(), QString("renamed"));
}

TEST_F(SelectionTableWidgetTest, DeleteNeedsEditMode)
{
    EXPECT_FALSE(widget->deleteTargetFeatures());
    EXPECT_EQ(layer->featureCount(), 6);
    EXPECT_EQ(host->messageBar()->currentLevel(), MessageBar::Warning);
}

TEST_F(SelectionTableWidgetTest, DeleteIsScopedToHighlights)
{
    ASSERT_TRUE(layer->startEditing());
    widget->setHighlightedFeatures(idSet({2}));

    ASSERT_TRUE(widget->deleteTargetFeatures());

    EXPECT_FALSE(layer->hasFeature(2));
    EXPECT_EQ(layer->featureCount(), 5);
    EXPECT_EQ(widget->primarySelection(), idSet({1, 3, 4}));
    EXPECT_TRUE(widget->highlightedFeatures().isEmpty());
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 3, 4}));
    EXPECT_EQ(widget->table()->rowCount(), 3);
    EXPECT_EQ(host->messageBar()->currentText(), QString("Deleted 1 features."));
}

TEST_F(SelectionTableWidgetTest, DeleteWithoutHighlightsTakesTheWholeSelection)
{
    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(widget->deleteTargetFeatures());

    EXPECT_EQ(layer->featureCount(), 2);
    EXPECT_TRUE(layer->hasFeature(0));
    EXPECT_TRUE(layer->hasFeature(5));
    EXPECT_TRUE(widget->primarySelection().isEmpty());
    EXPECT_EQ(widget->table()->rowCount(), 0);
}

TEST_F(SelectionTableWidgetTest, FeaturesDeletedElsewhereLeaveTheTable)
{
    ASSERT_TRUE(layer->startEditing());
    widget->setHighlightedFeatures(idSet({2, 4}));
    ASSERT_TRUE(layer->deleteFeatures(idSet({2})));

    EXPECT_EQ(widget->primarySelection(), idSet({1, 3, 4}));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({4}));
    EXPECT_EQ(widget->rowForFid(2), -1);
}

TEST_F(SelectionTableWidgetTest, CopyAndPaste)
{
    widget->setHighlightedFeatures(idSet({1}));
    widget->copyFeatures();
    EXPECT_EQ(widget->clipboardCount(), 1);

    // Pasting needs edit mode
    EXPECT_FALSE(widget->pasteFeatures());
    EXPECT_EQ(layer->featureCount(), 6);

    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(widget->pasteFeatures());
    EXPECT_EQ(layer->featureCount(), 7);
    EXPECT_EQ(layer->getFeature(6).attribute(0).toString(), QString("p1"));
    // Pasted features are not selected
    EXPECT_EQ(widget->primarySelection(), idSet({1, 2, 3, 4}));
}

TEST_F(SelectionTableWidgetTest, CutCopiesThenDeletes)
{
    const bool confirm = AppSettings::confirmDelete();
    AppSettings::setConfirmDelete(false);

    ASSERT_TRUE(layer->startEditing());
    widget->setHighlightedFeatures(idSet({3}));
    widget->cutFeatures();

    EXPECT_EQ(widget->clipboardCount(), 1);
    EXPECT_FALSE(layer->hasFeature(3));

    ASSERT_TRUE(widget->pasteFeatures());
    EXPECT_EQ(layer->getFeature(6).attribute(0).toString(), QString("p3"));

    AppSettings::setConfirmDelete(confirm);
}

TEST_F(SelectionTableWidgetTest, FilterExpressionHighlightsMatches)
{
    ASSERT_TRUE(widget->applyFilterExpression("\"area\" >= 30"));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({3, 4}));
    EXPECT_EQ(selectedRowIds(), idSet({3, 4}));

    // Features outside the selection never match
    ASSERT_TRUE(widget->applyFilterExpression("\"zone\" = 0"));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({3}));

    EXPECT_FALSE(widget->applyFilterExpression("\"area\" >="));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({3}));
    EXPECT_EQ(host->messageBar()->currentLevel(), MessageBar::Critical);
}

TEST_F(SelectionTableWidgetTest, CalculationUpdatesTargetsAndTable)
{
    widget->setHighlightedFeatures(idSet({1}));

    FieldCalculation calc;
    calc.expression = "99";
    calc.fieldName = "zone";
    calc.targets = widget->targetFeatures();
    ASSERT_TRUE(widget->runCalculation(calc));

    EXPECT_EQ(layer->getFeature(1).attribute(2).toLongLong(), 99);
    EXPECT_EQ(layer->getFeature(2).attribute(2).toLongLong(), 2);
    EXPECT_EQ(cell(1, 2)->text(), QString("99"));
    EXPECT_EQ(widget->highlightedFeatures(), idSet({1}));
    EXPECT_EQ(host->messageBar()->currentText(), QString("Updated 1 features in field \"zone\"."));
}

TEST_F(SelectionTableWidgetTest, CalculationWithNewFieldAddsColumn)
{
    FieldCalculation calc;
    calc.expression = "\"area\" / 10";
    calc.fieldName = "tenth";
    calc.createField = true;
    calc.fieldType = FieldType::Double;
    calc.targets = widget->targetFeatures();
    ASSERT_TRUE(widget->runCalculation(calc));

    EXPECT_EQ(widget->table()->columnCount(), 4);
    EXPECT_EQ(cell(4, 3)->text(), QString("4"));
}

TEST_F(SelectionTableWidgetTest, CalculationNeedsExpressionAndField)
{
    FieldCalculation calc;
    calc.expression = "1";
    EXPECT_FALSE(widget->runCalculation(calc));
    EXPECT_EQ(host->messageBar()->currentText(), QString("Missing expression or field name."));
}

TEST_F(SelectionTableWidgetTest, ZoomSelectsTargetsOnTheLayer)
{
    widget->setHighlightedFeatures(idSet({2}));
    widget->zoomToTargets();

    EXPECT_EQ(layer->selectedFeatureIds(), idSet({2}));
    // The table keeps its own selection
    EXPECT_EQ(widget->primarySelection(), idSet({1, 2, 3, 4}));
    EXPECT_NEAR(host->mapCanvas()->center().x(), 2.0, 1e-6);

    widget->restoreLayerSelection();
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 2, 3, 4}));
}

TEST_F(SelectionTableWidgetTest, FollowsLayerSelectionThroughEmpty)
{
    layer->removeSelection();
    EXPECT_TRUE(widget->primarySelection().isEmpty());
    EXPECT_EQ(widget->table()->rowCount(), 0);

    layer->selectByIds(idSet({0, 5}));
    EXPECT_EQ(widget->primarySelection(), idSet({0, 5}));

    widget->refreshTable();
    EXPECT_EQ(widget->primarySelection(), idSet({0, 5}));
    EXPECT_EQ(widget->table()->rowCount(), 2);
}

TEST_F(SelectionTableWidgetTest, FeatureNavigation)
{
    widget->panToFeature(3);
    EXPECT_NEAR(host->mapCanvas()->center().x(), 3.0, 1e-6);
    EXPECT_NEAR(host->mapCanvas()->center().y(), 3.0, 1e-6);

    widget->flashFeature(2);
    EXPECT_TRUE(host->mapCanvas()->isFlashing());

    widget->copyFeatureId(4);
    EXPECT_EQ(host->messageBar()->currentText(), QString("Feature ID 4 copied."));
}

TEST(SelectionTableWidgetNoFieldsTest, ShowsFeatureIdColumn)
{
    ensureApp();
    TestHost host;
    VectorLayer* layer = new VectorLayer("bare", GeometryType::Point);
    for (int i = 0; i < 3; ++i) {
        Feature f;
        f.geometry = FeatureGeometry::fromPoint(QPointF(i, 0));
        layer->appendFeature(f);
    }
    host.setActiveLayer(layer);
    layer->selectByIds(idSet({0, 2}));

    SelectionTableWidget* widget = new SelectionTableWidget(layer, &host);
    ASSERT_EQ(widget->table()->columnCount(), 1);
    EXPECT_EQ(widget->table()->horizontalHeaderItem(0)->text(), QString("fid"));
    EXPECT_EQ(widget->table()->rowCount(), 2);
    EXPECT_EQ(widget->rowForFid(1), -1);
    EXPECT_GE(widget->rowForFid(2), 0);

    delete widget;
    delete layer;
}
