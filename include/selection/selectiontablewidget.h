#ifndef SELECTIONTABLEWIDGET_H
#define SELECTIONTABLEWIDGET_H

#include <QWidget>
#include <QPointer>
#include <QVector>
#include "core/featuretypes.h"
#include "core/selectionset.h"

class QAction;
class QLabel;
class QTableWidget;
class QToolBar;
class HighlightDelegate;
class HostInterface;
class RubberBand;
class VectorLayer;
struct FieldCalculation;

/**
 * @brief SelectionTableWidget - attribute table over the selected features of one layer
 *
 * Rows are the layer's selected features (cyan). Selecting rows highlights a
 * subset (yellow) that scopes delete, copy, zoom and the field calculator.
 * The layer selection, the table and two map overlays are kept in step.
 *
 * Click replaces the highlights, Ctrl+click toggles a row and Shift+click
 * extends the range.
 */
class SelectionTableWidget : public QWidget
{
    Q_OBJECT

public:
    SelectionTableWidget(VectorLayer* layer, HostInterface* host, QWidget *parent = nullptr);
    ~SelectionTableWidget();

    VectorLayer* layer() const { return m_layer; }
    const SelectionSet& selection() const { return m_selection; }
    FeatureIds primarySelection() const { return m_selection.primary(); }
    FeatureIds highlightedFeatures() const { return m_selection.highlighted(); }
    FeatureIds targetFeatures() const { return m_selection.targets(); }

    QTableWidget* table() const { return m_table; }
    QToolBar* toolBar() const { return m_toolbar; }
    QAction* dockAction() const { return m_actionDock; }
    QString infoText() const;

    // Row lookups read the id stored on the item, so they hold after sorting
    bool fidForRow(int row, FeatureId* fid) const;
    int rowForFid(FeatureId fid) const;

    // Highlights the given features (clipped to the selection) and reselects their rows
    void setHighlightedFeatures(const FeatureIds& ids);

    // Highlights the selected features the expression is true for; false on a parse error
    bool applyFilterExpression(const QString& expression);

    // Runs a calculation on the layer and refreshes the table; false on failure
    bool runCalculation(const FieldCalculation& calculation);

    // Deletes the target features without asking; false when not editable or on failure
    bool deleteTargetFeatures();

    int clipboardCount() const { return m_clipboard.size(); }

    // Pushes the primary set back to the layer selection
    void restoreLayerSelection();

    // Overlays on the map canvas; cleanup is safe to call more than once
    RubberBand* primaryRubberBand() const { return m_primaryBand; }
    RubberBand* highlightRubberBand() const { return m_highlightBand; }
    void cleanupRubberBands();

signals:
    void highlightChanged(const FeatureIds& highlighted);
    void dockRequested();

public slots:
    void clearHighlights();
    void highlightAll();
    void invertHighlights();
    void reselectToHighlighted();
    void selectByExpression();
    void deleteFeatures();
    void cutFeatures();
    void copyFeatures();
    bool pasteFeatures();
    void zoomToTargets();
    void refreshTable();
    void openFieldCalculator();

    void zoomToFeature(FeatureId fid);
    void panToFeature(FeatureId fid);
    void flashFeature(FeatureId fid);
    void copyFeatureId(FeatureId fid);

private slots:
    void onTableSelectionChanged();
    void onCellChanged(int row, int column);
    void onLayerSelectionChanged();
    void onFeaturesDeleted(const FeatureIds& ids);
    void onEditingModeChanged();
    void onAttributeValueChanged(FeatureId fid, int fieldIndex, const QVariant& value);
    void onHighlightsChanged();
    void showContextMenu(const QPoint& pos);

private:
    void setupRubberBands();
    void setupUi();
    void createActions();
    void connectSignals();
    void populateTable();
    void selectHighlightedRows();
    void updateInfoLabel();
    void updateButtonStates();
    void updateMapHighlighting();
    void selectOnLayer(const FeatureIds& ids);
    void pushInfo(const QString& title, const QString& text);
    void pushSuccess(const QString& title, const QString& text);
    void pushWarning(const QString& title, const QString& text);
    void pushCritical(const QString& title, const QString& text);

    QPointer<VectorLayer> m_layer;
    HostInterface* m_host;
    SelectionSet m_selection;
    QVector<Feature> m_clipboard;

    // Owned, deleted by cleanupRubberBands()
    RubberBand* m_primaryBand{nullptr};
    RubberBand* m_highlightBand{nullptr};

    // Re-entrancy guards for changes this widget makes itself
    bool m_updatingSelection{false};
    bool m_updatingHighlights{false};

    QLabel* m_infoLabel{nullptr};
    QToolBar* m_toolbar{nullptr};
    QTableWidget* m_table{nullptr};
    HighlightDelegate* m_delegate{nullptr};

    QAction* m_actionClearHighlights{nullptr};
    QAction* m_actionHighlightAll{nullptr};
    QAction* m_actionReselect{nullptr};
    QAction* m_actionSelectExpression{nullptr};
    QAction* m_actionInvert{nullptr};
    QAction* m_actionDelete{nullptr};
    QAction* m_actionCut{nullptr};
    QAction* m_actionCopy{nullptr};
    QAction* m_actionPaste{nullptr};
    QAction* m_actionZoom{nullptr};
    QAction* m_actionRefresh{nullptr};
    QAction* m_actionFieldCalculator{nullptr};
    QAction* m_actionDock{nullptr};
};

#endif // SELECTIONTABLEWIDGET_H
