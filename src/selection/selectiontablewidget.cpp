#include "selection/selectiontablewidget.h"
#include "selection/highlightdelegate.h"
#include "selection/selectionfilterdialog.h"
#include "selection/fieldcalculatordialog.h"
#include "app/hostinterface.h"
#include "app/messagebar.h"
#include "canvas/mapcanvas.h"
#include "canvas/rubberband.h"
#include "core/fieldcalculator.h"
#include "core/filterbuilder.h"
#include "core/vectorlayer.h"
#include "gdal/geosbridge.h"
#include "appsettings.h"

#include <QAction>
#include <QApplication>
#include <QClipboard>
#include <QHash>
#include <QHeaderView>
#include <QItemSelection>
#include <QItemSelectionModel>
#include <QLabel>
#include <QMenu>
#include <QMessageBox>
#include <QSet>
#include <QTableWidget>
#include <QToolBar>
#include <QVBoxLayout>
#include <QDebug>

SelectionTableWidget::SelectionTableWidget(VectorLayer* layer, HostInterface* host, QWidget *parent)
    : QWidget(parent)
    , m_layer(layer)
    , m_host(host)
{
    if (m_layer) m_selection.setPrimary(m_layer->selectedFeatureIds());

    setupRubberBands();
    setupUi();
    populateTable();
    connectSignals();
    updateButtonStates();
    updateMapHighlighting();
}

SelectionTableWidget::~SelectionTableWidget()
{
    cleanupRubberBands();
}

void SelectionTableWidget::setupRubberBands()
{
    MapCanvas* canvas = m_host ? m_host->mapCanvas() : nullptr;
    if (!canvas || !m_layer) return;

    const GeometryType type = m_layer->geometryType();

    // Primary selection underneath, highlights drawn on top
    QColor primary = AppSettings::primarySelectionColor();
    m_primaryBand = new RubberBand(canvas, type);
    primary.setAlpha(180);
    m_primaryBand->setColor(primary);
    primary.setAlpha(100);
    m_primaryBand->setFillColor(primary);
    m_primaryBand->setWidth(2);

    QColor highlight = AppSettings::highlightColor();
    m_highlightBand = new RubberBand(canvas, type);
    highlight.setAlpha(255);
    m_highlightBand->setColor(highlight);
    highlight.setAlpha(150);
    m_highlightBand->setFillColor(highlight);
    m_highlightBand->setWidth(3);
}

void SelectionTableWidget::cleanupRubberBands()
{
    MapCanvas* canvas = m_primaryBand ? m_primaryBand->canvas() : nullptr;

    // Deleting a band takes it off the canvas
    delete m_primaryBand;
    m_primaryBand = nullptr;
    delete m_highlightBand;
    m_highlightBand = nullptr;

    if (canvas) canvas->refresh();
}

void SelectionTableWidget::setupUi()
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(2, 2, 2, 2);
    layout->setSpacing(2);

    m_infoLabel = new QLabel(this);
    m_infoLabel->setStyleSheet("font-size: 11px; padding: 3px; background-color: #f0f0f0; border-radius: 2px;");
    layout->addWidget(m_infoLabel);

    m_toolbar = new QToolBar(this);
    m_toolbar->setMovable(false);
    m_toolbar->setIconSize(m_toolbar->iconSize() * 0.85);
    m_toolbar->setToolButtonStyle(Qt::ToolButtonTextOnly);
    layout->addWidget(m_toolbar);

    m_table = new QTableWidget(this);
    m_table->setAlternatingRowColors(false);
    m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_table->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_table->setEditTriggers(QAbstractItemView::DoubleClicked | QAbstractItemView::EditKeyPressed);
    m_table->horizontalHeader()->setStretchLastSection(true);
    m_table->horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    m_table->verticalHeader()->setDefaultSectionSize(AppSettings::tableRowHeight());
    m_table->verticalHeader()->setVisible(true);
    m_table->setSortingEnabled(true);
    m_table->setContextMenuPolicy(Qt::CustomContextMenu);

    m_delegate = new HighlightDelegate(&m_selection, m_table);
    m_table->setItemDelegate(m_delegate);
    layout->addWidget(m_table);

    createActions();

    QLabel* helpLabel = new QLabel("<small><b>Click</b>: Select | <b>Ctrl+Click</b>: Add/Remove | "
                                   "<b>Shift+Click</b>: Range | <b>Double-Click</b>: Edit (when editing) | "
                                   "<b>Yellow</b> = Highlighted for operations</small>", this);
    helpLabel->setStyleSheet("color: #666; padding: 2px; font-size: 10px;");
    layout->addWidget(helpLabel);

    updateInfoLabel();
}

void SelectionTableWidget::createActions()
{
    m_actionClearHighlights = m_toolbar->addAction("Clear Highlights", this, &SelectionTableWidget::clearHighlights);
    m_actionClearHighlights->setToolTip("Clear all yellow highlights");
    m_actionHighlightAll = m_toolbar->addAction("Highlight All", this, &SelectionTableWidget::highlightAll);
    m_actionHighlightAll->setToolTip("Highlight all rows");
    m_actionReselect = m_toolbar->addAction("Re-select to Highlighted", this, &SelectionTableWidget::reselectToHighlighted);
    m_actionReselect->setToolTip("Make highlighted features the new selection (narrow down)");

    m_toolbar->addSeparator();
    m_actionSelectExpression = m_toolbar->addAction("Select by Expression", this, &SelectionTableWidget::selectByExpression);
    m_actionSelectExpression->setToolTip("Filter by expression");
    m_actionInvert = m_toolbar->addAction("Invert Highlights", this, &SelectionTableWidget::invertHighlights);

    m_toolbar->addSeparator();
    m_actionDelete = m_toolbar->addAction("Delete", this, &SelectionTableWidget::deleteFeatures);
    m_actionCut = m_toolbar->addAction("Cut", this, &SelectionTableWidget::cutFeatures);
    m_actionCopy = m_toolbar->addAction("Copy", this, &SelectionTableWidget::copyFeatures);
    m_actionPaste = m_toolbar->addAction("Paste", this, [this]() { pasteFeatures(); });

    m_toolbar->addSeparator();
    m_actionZoom = m_toolbar->addAction("Zoom to Highlighted", this, &SelectionTableWidget::zoomToTargets);
    m_actionRefresh = m_toolbar->addAction("Refresh", this, &SelectionTableWidget::refreshTable);
    m_actionRefresh->setToolTip("Reload the table from the layer selection");
    m_actionFieldCalculator = m_toolbar->addAction("Field Calculator", this, &SelectionTableWidget::openFieldCalculator);

    m_toolbar->addSeparator();
    m_actionDock = m_toolbar->addAction("Dock Attribute Table", this, &SelectionTableWidget::dockRequested);
    m_actionDock->setToolTip("Dock this table to the main window");
}

void SelectionTableWidget::connectSignals()
{
    if (m_layer) {
        connect(m_layer, &VectorLayer::selectionChanged, this, &SelectionTableWidget::onLayerSelectionChanged);
        connect(m_layer, &VectorLayer::featuresDeleted, this, &SelectionTableWidget::onFeaturesDeleted);
        connect(m_layer, &VectorLayer::editingStarted, this, &SelectionTableWidget::onEditingModeChanged);
        connect(m_layer, &VectorLayer::editingStopped, this, &SelectionTableWidget::onEditingModeChanged);
        connect(m_layer, &VectorLayer::attributeAdded, this, &SelectionTableWidget::onEditingModeChanged);
        connect(m_layer, &VectorLayer::attributeValueChanged, this, &SelectionTableWidget::onAttributeValueChanged);
    }

    connect(&m_selection, &SelectionSet::highlightChanged, this, &SelectionTableWidget::onHighlightsChanged);
    connect(m_table, &QTableWidget::itemSelectionChanged, this, &SelectionTableWidget::onTableSelectionChanged);
    connect(m_table, &QTableWidget::cellChanged, this, &SelectionTableWidget::onCellChanged);
    connect(m_table, &QTableWidget::customContextMenuRequested, this, &SelectionTableWidget::showContextMenu);
}

// ==================== Table ====================

void SelectionTableWidget::populateTable()
{
    const bool wasUpdating = m_updatingHighlights;
    m_updatingHighlights = true;
    m_table->blockSignals(true);
    m_table->setSortingEnabled(false);

    m_table->clear();
    m_table->setRowCount(0);
    m_table->setColumnCount(0);

    if (m_layer && m_selection.hasPrimary()) {
        const Fields& fields = m_layer->fields();
        // A layer without attributes still gets a row identity column
        QStringList headers = fields.isEmpty() ? QStringList("fid") : fields.names();
        m_table->setColumnCount(headers.size());
        m_table->setHorizontalHeaderLabels(headers);

        const QVector<Feature> features = m_layer->getFeatures(m_selection.primary());
        m_table->setRowCount(features.size());
        const bool editable = m_layer->isEditable();

        for (int row = 0; row < features.size(); ++row) {
            const Feature& feature = features.at(row);
            m_table->setVerticalHeaderItem(row, new QTableWidgetItem(QString::number(row + 1)));

            for (int col = 0; col < headers.size(); ++col) {
                QTableWidgetItem* item = nullptr;
                if (fields.isEmpty()) {
                    item = new QTableWidgetItem(QString::number(feature.id));
                    item->setFlags(item->flags() & ~Qt::ItemIsEditable);
                } else {
                    item = new QTableWidgetItem(displayString(feature.attribute(col)));
                    item->setData(FieldNameRole, fields.at(col).name);
                    if (editable) {
                        item->setFlags(item->flags() | Qt::ItemIsEditable);
                    } else {
                        item->setFlags(item->flags() & ~Qt::ItemIsEditable);
                    }
                }
                item->setData(FeatureIdRole, QVariant(static_cast<qlonglong>(feature.id)));
                m_table->setItem(row, col, item);
            }
        }
        m_table->resizeColumnsToContents();
    }

    m_table->setSortingEnabled(true);
    m_table->blockSignals(false);
    selectHighlightedRows();
    m_updatingHighlights = wasUpdating;
    m_table->viewport()->update();
}

bool SelectionTableWidget::fidForRow(int row, FeatureId* fid) const
{
    QTableWidgetItem* item = m_table->item(row, 0);
    if (!item) return false;
    const QVariant data = item->data(FeatureIdRole);
    if (!data.isValid()) return false;
    if (fid) *fid = data.toLongLong();
    return true;
}

int SelectionTableWidget::rowForFid(FeatureId fid) const
{
    for (int row = 0; row < m_table->rowCount(); ++row) {
        FeatureId rowFid;
        if (fidForRow(row, &rowFid) && rowFid == fid) return row;
    }
    return -1;
}

void SelectionTableWidget::selectHighlightedRows()
{
    QItemSelectionModel* model = m_table->selectionModel();
    if (!model) return;

    QHash<FeatureId, int> rows;
    for (int row = 0; row < m_table->rowCount(); ++row) {
        FeatureId fid;
        if (fidForRow(row, &fid)) rows.insert(fid, row);
    }

    QItemSelection rowSelection;
    const int lastColumn = qMax(0, m_table->columnCount() - 1);
    for (FeatureId fid : m_selection.highlighted()) {
        auto it = rows.constFind(fid);
        if (it == rows.constEnd()) continue;
        rowSelection.select(m_table->model()->index(it.value(), 0),
                            m_table->model()->index(it.value(), lastColumn));
    }

    const bool wasUpdating = m_updatingHighlights;
    m_updatingHighlights = true;
    model->select(rowSelection, QItemSelectionModel::ClearAndSelect | QItemSelectionModel::Rows);
    m_updatingHighlights = wasUpdating;
    m_table->viewport()->update();
}

void SelectionTableWidget::onTableSelectionChanged()
{
    if (m_updatingHighlights) return;

    QSet<int> rows;
    const QModelIndexList indexes = m_table->selectionModel()->selectedIndexes();
    for (const QModelIndex& index : indexes) rows.insert(index.row());

    FeatureIds highlighted;
    for (int row : rows) {
        FeatureId fid;
        if (fidForRow(row, &fid)) highlighted.insert(fid);
    }
    m_selection.setHighlighted(highlighted);
}

void SelectionTableWidget::onHighlightsChanged()
{
    m_table->viewport()->update();
    updateInfoLabel();
    updateButtonStates();
    updateMapHighlighting();
    emit highlightChanged(m_selection.highlighted());
}

void SelectionTableWidget::onCellChanged(int row, int column)
{
    if (!m_layer || !m_layer->isEditable()) return;

    QTableWidgetItem* item = m_table->item(row, column);
    if (!item) return;

    const QString fieldName = item->data(FieldNameRole).toString();
    const QVariant fidData = item->data(FeatureIdRole);
    if (fieldName.isEmpty() || !fidData.isValid()) return;

    const FeatureId fid = fidData.toLongLong();
    const int fieldIndex = m_layer->fields().indexFromName(fieldName);
    if (fieldIndex < 0) return;

    const QString text = item->text();
    const QVariant value = text.isEmpty() ? QVariant() : QVariant(text);
    if (!m_layer->changeAttributeValue(fid, fieldIndex, value)) {
        pushWarning("Edit", m_layer->lastError());
        // Show the stored value again
        m_table->blockSignals(true);
        item->setText(displayString(m_layer->getFeature(fid).attribute(fieldIndex)));
        m_table->blockSignals(false);
    }
}

void SelectionTableWidget::onAttributeValueChanged(FeatureId fid, int fieldIndex, const QVariant& value)
{
    if (fieldIndex < 0 || fieldIndex >= m_table->columnCount()) return;
    const int row = rowForFid(fid);
    if (row < 0) return;

    QTableWidgetItem* item = m_table->item(row, fieldIndex);
    if (!item) return;
    m_table->blockSignals(true);
    item->setText(displayString(value));
    m_table->blockSignals(false);
}

// ==================== Presentation ====================

QString SelectionTableWidget::infoText() const
{
    return m_infoLabel->text();
}

void SelectionTableWidget::updateInfoLabel()
{
    QString text = QString("<b style=\"color:#008B8B;\">Cyan:</b> %1").arg(m_selection.primary().size());
    if (m_selection.hasHighlights()) {
        text += QString(" | <b style=\"color:#DAA520;\">Yellow:</b> %1").arg(m_selection.highlighted().size());
    } else {
        text += " | <span style=\"color:#888;\">Click rows to highlight</span>";
    }
    m_infoLabel->setText(text);
}

void SelectionTableWidget::updateButtonStates()
{
    const bool hasHighlights = m_selection.hasHighlights();
    const bool hasSelection = m_selection.hasPrimary();
    const bool hasClipboard = !m_clipboard.isEmpty();
    const bool editable = m_layer && m_layer->isEditable();
    const QString target = m_selection.targetDescription();
    const QString editHint = editable ? QString() : QString(" (enable editing first!)");

    m_actionClearHighlights->setEnabled(hasHighlights);
    m_actionHighlightAll->setEnabled(hasSelection);
    m_actionReselect->setEnabled(hasHighlights);
    m_actionSelectExpression->setEnabled(hasSelection);
    m_actionInvert->setEnabled(hasSelection);
    m_actionInvert->setToolTip(QString("Invert highlights (will highlight %1 features)")
                                   .arg(m_selection.unhighlighted().size()));

    // Destructive actions need edit mode
    m_actionDelete->setEnabled(hasSelection && editable);
    m_actionDelete->setToolTip(QString("Delete %1 features%2").arg(target, editHint));
    m_actionCut->setEnabled(hasSelection && editable);
    m_actionCut->setToolTip(QString("Cut %1 features%2").arg(target, editHint));
    m_actionCopy->setEnabled(hasSelection);
    m_actionCopy->setToolTip(QString("Copy %1 features").arg(target));
    m_actionPaste->setEnabled(hasClipboard && editable);
    m_actionPaste->setToolTip(QString("Paste %1 features%2").arg(m_clipboard.size()).arg(editHint));

    m_actionZoom->setEnabled(hasSelection);
    m_actionZoom->setToolTip(QString("Zoom to %1 features").arg(target));

    m_actionFieldCalculator->setEnabled(hasSelection);
    m_actionFieldCalculator->setToolTip(editable
        ? QString("Open Field Calculator for %1 features").arg(target)
        : QString("Open Field Calculator for %1 features (an edit session is opened for the update)").arg(target));
}

void SelectionTableWidget::updateMapHighlighting()
{
    if (!m_primaryBand || !m_highlightBand || !m_layer) return;

    const GeometryType type = m_layer->geometryType();
    m_primaryBand->reset(type);
    m_highlightBand->reset(type);

    const QVector<Feature> primary = m_layer->getFeatures(m_selection.unhighlighted());
    for (const Feature& feature : primary) m_primaryBand->addGeometry(feature.geometry);

    const QVector<Feature> highlighted = m_layer->getFeatures(m_selection.highlighted());
    for (const Feature& feature : highlighted) m_highlightBand->addGeometry(feature.geometry);

    if (m_host && m_host->mapCanvas()) m_host->mapCanvas()->refresh();
}

void SelectionTableWidget::selectOnLayer(const FeatureIds& ids)
{
    if (!m_layer) return;
    m_updatingSelection = true;
    m_layer->selectByIds(ids);
    m_updatingSelection = false;
}

void SelectionTableWidget::restoreLayerSelection()
{
    if (m_selection.hasPrimary()) selectOnLayer(m_selection.primary());
}

// ==================== Highlight actions ====================

void SelectionTableWidget::setHighlightedFeatures(const FeatureIds& ids)
{
    m_selection.setHighlighted(ids);
    selectHighlightedRows();
}

void SelectionTableWidget::clearHighlights()
{
    if (!m_selection.hasHighlights()) return;
    const int count = m_selection.highlighted().size();
    m_selection.clearHighlights();
    selectHighlightedRows();
    pushInfo("Selection", QString("Cleared %1 highlights.").arg(count));
}

void SelectionTableWidget::highlightAll()
{
    m_selection.highlightAll();
    selectHighlightedRows();
    pushSuccess("Selection", QString("Highlighted %1 features.").arg(m_selection.highlighted().size()));
}

void SelectionTableWidget::invertHighlights()
{
    if (!m_selection.hasPrimary()) return;
    m_selection.invert();
    selectHighlightedRows();
    pushInfo("Selection", QString("Inverted: %1 highlighted.").arg(m_selection.highlighted().size()));
}

void SelectionTableWidget::reselectToHighlighted()
{
    if (!m_selection.hasHighlights()) {
        pushInfo("Selection", "No features highlighted to re-select.");
        return;
    }

    m_selection.narrowToHighlighted();
    selectOnLayer(m_selection.primary());

    populateTable();
    updateInfoLabel();
    updateButtonStates();
    updateMapHighlighting();
    pushSuccess("Re-select", QString("Selection narrowed to %1 features.").arg(m_selection.primary().size()));
}

void SelectionTableWidget::selectByExpression()
{
    if (!m_selection.hasPrimary()) {
        pushInfo("Filter", "No features selected to filter.");
        return;
    }

    SelectionFilterDialog dialog(m_layer, m_selection.primary(), this);
    if (dialog.exec() != QDialog::Accepted) return;

    const QString text = dialog.expression();
    if (!text.isEmpty()) applyFilterExpression(text);
}

bool SelectionTableWidget::applyFilterExpression(const QString& expression)
{
    if (!m_layer) return false;

    QString error;
    const FeatureIds matches = FilterBuilder::matchingFeatures(*m_layer, m_selection.primary(), expression, &error);
    if (!error.isEmpty()) {
        pushCritical("Filter", QString("Expression error: %1").arg(error));
        return false;
    }

    setHighlightedFeatures(matches);
    pushSuccess("Filter", QString("Highlighted %1 features.").arg(matches.size()));
    return true;
}

// ==================== Editing actions ====================

void SelectionTableWidget::deleteFeatures()
{
    const FeatureIds fids = m_selection.targets();
    if (fids.isEmpty()) return;

    if (AppSettings::confirmDelete()) {
        const QString scope = m_selection.hasHighlights() ? QString("highlighted") : QString("all selected");
        const QMessageBox::StandardButton reply = QMessageBox::question(
            this, "Delete Features",
            QString("Delete %1 %2 features?").arg(fids.size()).arg(scope),
            QMessageBox::Yes | QMessageBox::No);
        if (reply != QMessageBox::Yes) return;
    }

    deleteTargetFeatures();
}

bool SelectionTableWidget::deleteTargetFeatures()
{
    if (!m_layer) return false;
    const FeatureIds fids = m_selection.targets();
    if (fids.isEmpty()) return false;

    if (!m_layer->isEditable()) {
        pushWarning("Delete", "Toggle editing on the layer before deleting features.");
        return false;
    }

    // The layer drops deleted ids from its selection; that is not an outside change
    m_updatingSelection = true;
    const bool ok = m_layer->deleteFeatures(fids);
    m_updatingSelection = false;

    if (!ok) {
        pushCritical("Delete", QString("Failed to delete features: %1").arg(m_layer->lastError()));
        return false;
    }

    restoreLayerSelection();
    pushSuccess("Delete", QString("Deleted %1 features.").arg(fids.size()));
    return true;
}

void SelectionTableWidget::cutFeatures()
{
    copyFeatures();
    deleteFeatures();
}

void SelectionTableWidget::copyFeatures()
{
    if (!m_layer) return;
    const FeatureIds fids = m_selection.targets();
    if (fids.isEmpty()) return;

    m_clipboard = m_layer->getFeatures(fids);
    updateButtonStates();
    pushSuccess("Copy", QString("Copied %1 features.").arg(m_clipboard.size()));
}

bool SelectionTableWidget::pasteFeatures()
{
    if (!m_layer || m_clipboard.isEmpty()) return false;

    if (!m_layer->isEditable()) {
        pushWarning("Paste", "Toggle editing on the layer before pasting features.");
        return false;
    }

    QVector<FeatureId> newIds;
    if (!m_layer->addFeatures(m_clipboard, &newIds)) {
        pushCritical("Paste", QString("Failed to paste features: %1").arg(m_layer->lastError()));
        return false;
    }

    pushSuccess("Paste", QString("Pasted %1 features.").arg(newIds.size()));
    refreshTable();
    return true;
}

void SelectionTableWidget::openFieldCalculator()
{
    if (!m_selection.hasPrimary()) {
        pushInfo("Field Calculator", "No features selected.");
        return;
    }

    FieldCalculatorDialog dialog(m_layer, m_selection.targets(), m_selection.primary(), this);
    connect(&dialog, &FieldCalculatorDialog::applyRequested, this, [this, &dialog]() {
        if (runCalculation(dialog.calculation())) dialog.markApplied();
    });
    // OK after Apply only runs what changed since
    if (dialog.exec() == QDialog::Accepted && dialog.hasPendingChanges()) {
        runCalculation(dialog.calculation());
    }
}

bool SelectionTableWidget::runCalculation(const FieldCalculation& calculation)
{
    if (!m_layer) return false;
    if (calculation.expression.trimmed().isEmpty() || calculation.fieldName.trimmed().isEmpty()) {
        pushWarning("Field Calculator", "Missing expression or field name.");
        return false;
    }

    FieldCalculator calculator(m_layer);
    if (!calculator.run(calculation)) {
        pushCritical("Field Calculator", calculator.lastError());
        return false;
    }

    refreshTable();
    QString message = QString("Updated %1 features in field \"%2\".")
                          .arg(calculator.updatedCount()).arg(calculation.fieldName);
    if (calculator.skippedCount() > 0) {
        message += QString(" %1 skipped on evaluation errors.").arg(calculator.skippedCount());
    }
    pushSuccess("Field Calculator", message);
    return true;
}

// ==================== Navigation ====================

void SelectionTableWidget::zoomToTargets()
{
    const FeatureIds fids = m_selection.targets();
    if (fids.isEmpty() || !m_layer) return;

    selectOnLayer(fids);
    if (m_host && m_host->mapCanvas()) m_host->mapCanvas()->zoomToSelected(m_layer);
}

void SelectionTableWidget::refreshTable()
{
    if (m_layer) {
        const FeatureIds current = m_layer->selectedFeatureIds();
        if (!current.isEmpty()) m_selection.setPrimary(current);
    }

    populateTable();
    updateInfoLabel();
    updateButtonStates();
    updateMapHighlighting();
}

void SelectionTableWidget::zoomToFeature(FeatureId fid)
{
    MapCanvas* canvas = m_host ? m_host->mapCanvas() : nullptr;
    Feature feature;
    if (!canvas || !m_layer || !m_layer->getFeature(fid, &feature)) return;
    if (feature.geometry.isNull()) return;

    canvas->setExtent(feature.geometry.boundingBox());
    canvas->refresh();
}

void SelectionTableWidget::panToFeature(FeatureId fid)
{
    MapCanvas* canvas = m_host ? m_host->mapCanvas() : nullptr;
    Feature feature;
    if (!canvas || !m_layer || !m_layer->getFeature(fid, &feature)) return;

    bool ok = false;
    const QPointF center = GeosBridge::centroid(feature.geometry, &ok);
    if (!ok) {
        pushWarning("Pan", QString("No centroid for feature %1: %2").arg(fid).arg(GeosBridge::lastError()));
        return;
    }
    canvas->setCenter(center);
    canvas->refresh();
}

void SelectionTableWidget::flashFeature(FeatureId fid)
{
    MapCanvas* canvas = m_host ? m_host->mapCanvas() : nullptr;
    if (!canvas || !m_layer) return;
    canvas->flashFeatureIds(m_layer, FeatureIds{fid});
}

void SelectionTableWidget::copyFeatureId(FeatureId fid)
{
    QApplication::clipboard()->setText(QString::number(fid));
    pushInfo("Copy", QString("Feature ID %1 copied.").arg(fid));
}

void SelectionTableWidget::showContextMenu(const QPoint& pos)
{
    QTableWidgetItem* item = m_table->itemAt(pos);
    if (!item) return;
    const QVariant fidData = item->data(FeatureIdRole);
    if (!fidData.isValid()) return;
    const FeatureId fid = fidData.toLongLong();

    QMenu menu(this);
    QAction* zoomAction = menu.addAction("Zoom to Feature");
    QAction* panAction = menu.addAction("Pan to Feature");
    QAction* flashAction = menu.addAction("Flash Feature");
    menu.addSeparator();
    QAction* copyIdAction = menu.addAction("Copy Feature ID");

    QAction* chosen = menu.exec(m_table->viewport()->mapToGlobal(pos));
    if (!chosen) return;

    if (chosen == zoomAction) {
        zoomToFeature(fid);
    } else if (chosen == panAction) {
        panToFeature(fid);
    } else if (chosen == flashAction) {
        flashFeature(fid);
    } else if (chosen == copyIdAction) {
        copyFeatureId(fid);
    }
}

// ==================== Layer sync ====================

void SelectionTableWidget::onLayerSelectionChanged()
{
    if (m_updatingSelection || !m_layer) return;

    const FeatureIds current = m_layer->selectedFeatureIds();
    if (current == m_selection.primary()) return;

    m_selection.setPrimary(current);
    populateTable();
    updateInfoLabel();
    updateButtonStates();
    updateMapHighlighting();
    pushInfo("Sync", QString("Selection updated: %1 features").arg(current.size()));
}

void SelectionTableWidget::onFeaturesDeleted(const FeatureIds& ids)
{
    m_selection.removeFeatures(ids);
    populateTable();
    updateInfoLabel();
    updateButtonStates();
    updateMapHighlighting();
}

void SelectionTableWidget::onEditingModeChanged()
{
    // Highlights live in the selection set and survive the rebuild
    populateTable();
    updateButtonStates();
    updateMapHighlighting();
}

// ==================== Feedback ====================

void SelectionTableWidget::pushInfo(const QString& title, const QString& text)
{
    if (m_host && m_host->messageBar()) m_host->messageBar()->pushInfo(title, text);
    else qDebug().noquote() << title << ":" << text;
}

void SelectionTableWidget::pushSuccess(const QString& title, const QString& text)
{
    if (m_host && m_host->messageBar()) m_host->messageBar()->pushSuccess(title, text);
    else qDebug().noquote() << title << ":" << text;
}

void SelectionTableWidget::pushWarning(const QString& title, const QString& text)
{
    if (m_host && m_host->messageBar()) m_host->messageBar()->pushWarning(title, text);
    else qWarning().noquote() << title << ":" << text;
}

void SelectionTableWidget::pushCritical(const QString& title, const QString& text)
{
    if (m_host && m_host->messageBar()) m_host->messageBar()->pushCritical(title, text);
    else qWarning().noquote() << title << ":" << text;
}
