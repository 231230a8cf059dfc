#ifndef SELECTIONDIALOG_H
#define SELECTIONDIALOG_H

#include <QDialog>
#include "core/featuretypes.h"

class HostInterface;
class SelectionTableWidget;
class VectorLayer;

/**
 * @brief SelectionDialog - selection table in a floating window
 *
 * Close and reject (Escape, window close button) run the same cleanup as the
 * dock: overlays removed, layer selection restored.
 */
class SelectionDialog : public QDialog
{
    Q_OBJECT

public:
    SelectionDialog(VectorLayer* layer, HostInterface* host, QWidget *parent = nullptr);

    SelectionTableWidget* selectionWidget() const { return m_widget; }
    FeatureIds primarySelection() const;
    FeatureIds highlightedFeatures() const;

signals:
    void highlightChanged(const FeatureIds& highlighted);
    void dockRequested();

public slots:
    void reject() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void cleanup();

    SelectionTableWidget* m_widget{nullptr};
};

#endif // SELECTIONDIALOG_H
