#include "selection/selectiondock.h"
#include "selection/selectiontablewidget.h"
#include "core/vectorlayer.h"

#include <QAction>
#include <QCloseEvent>
#include <QToolBar>

SelectionDock::SelectionDock(VectorLayer* layer, HostInterface* host, QWidget *parent)
    : QDockWidget(QString("Selection Table - %1").arg(layer ? layer->name() : QString()), parent)
{
    setObjectName(QString("SelectionDock_%1").arg(layer ? layer->id() : QString()));
    setAllowedAreas(Qt::AllDockWidgetAreas);
    setFeatures(QDockWidget::DockWidgetClosable | QDockWidget::DockWidgetMovable |
                QDockWidget::DockWidgetFloatable);

    m_widget = new SelectionTableWidget(layer, host, this);
    setWidget(m_widget);

    // Already docked, offer the way back to a window instead
    m_widget->dockAction()->setVisible(false);
    m_actionUndock = m_widget->toolBar()->addAction("Undock (Float Window)", this, &SelectionDock::undockRequested);
    m_actionUndock->setToolTip("Convert to floating window");

    setMinimumWidth(400);
    setMinimumHeight(200);
}

void SelectionDock::closeEvent(QCloseEvent *event)
{
    m_widget->cleanupRubberBands();
    m_widget->restoreLayerSelection();
    emit closed();
    event->accept();
}
