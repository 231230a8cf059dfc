#include "selection/selectiondialog.h"
#include "selection/selectiontablewidget.h"
#include "core/vectorlayer.h"

#include <QCloseEvent>
#include <QVBoxLayout>

SelectionDialog::SelectionDialog(VectorLayer* layer, HostInterface* host, QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(QString("Advanced Selection Table - %1").arg(layer ? layer->name() : QString()));
    setWindowFlags(windowFlags() | Qt::WindowMaximizeButtonHint);
    resize(1100, 650);

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_widget = new SelectionTableWidget(layer, host, this);
    layout->addWidget(m_widget);

    connect(m_widget, &SelectionTableWidget::highlightChanged, this, &SelectionDialog::highlightChanged);
    connect(m_widget, &SelectionTableWidget::dockRequested, this, &SelectionDialog::dockRequested);
}

FeatureIds SelectionDialog::primarySelection() const
{
    return m_widget->primarySelection();
}

FeatureIds SelectionDialog::highlightedFeatures() const
{
    return m_widget->highlightedFeatures();
}

void SelectionDialog::closeEvent(QCloseEvent *event)
{
    cleanup();
    // Rejects the dialog so finished() is emitted
    QDialog::closeEvent(event);
}

void SelectionDialog::reject()
{
    cleanup();
    QDialog::reject();
}

void SelectionDialog::cleanup()
{
    m_widget->cleanupRubberBands();
    m_widget->restoreLayerSelection();
}
