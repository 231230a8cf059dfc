#include "selection/selectiontablemanager.h"
#include "selection/selectiondialog.h"
#include "selection/selectiondock.h"
#include "selection/selectiontablewidget.h"
#include "app/hostinterface.h"
#include "app/messagebar.h"
#include "core/vectorlayer.h"
#include "appsettings.h"

#include <QMainWindow>
#include <QDockWidget>
#include <QDebug>

SelectionTableManager::SelectionTableManager(HostInterface* host, QObject *parent)
    : QObject(parent)
    , m_host(host)
{
}

SelectionTableManager::~SelectionTableManager()
{
    closeAll();
}

bool SelectionTableManager::checkSelection(VectorLayer* layer)
{
    if (layer->selectedFeatureCount() > 0) return true;
    if (m_host && m_host->messageBar()) {
        m_host->messageBar()->pushInfo("Selection", "Select features first.");
    }
    return false;
}

SelectionDialog* SelectionTableManager::openDialog(VectorLayer* layer)
{
    if (!layer) return nullptr;
    const QString layerId = layer->id();

    SelectionDialog* existing = m_dialogs.value(layerId);
    if (existing) {
        existing->show();
        existing->raise();
        return existing;
    }

    if (!checkSelection(layer)) return nullptr;

    SelectionDialog* dialog = new SelectionDialog(layer, m_host, m_host ? m_host->mainWindow() : nullptr);
    m_dialogs.insert(layerId, dialog);

    connect(dialog, &QDialog::finished, this, [this, layerId, dialog]() {
        if (m_dialogs.value(layerId) == dialog) m_dialogs.remove(layerId);
        dialog->deleteLater();
    });
    QPointer<VectorLayer> guard(layer);
    connect(dialog, &SelectionDialog::dockRequested, this, [this, guard]() {
        if (guard) convertToDock(guard);
    });

    dialog->show();
    qDebug() << "Opened selection table window for" << layer->name();
    return dialog;
}

SelectionDock* SelectionTableManager::openDock(VectorLayer* layer)
{
    if (!layer) return nullptr;
    const QString layerId = layer->id();

    SelectionDock* existing = m_docks.value(layerId);
    if (existing) {
        existing->show();
        existing->raise();
        return existing;
    }

    if (!checkSelection(layer)) return nullptr;

    QMainWindow* mainWindow = m_host ? m_host->mainWindow() : nullptr;
    SelectionDock* dock = new SelectionDock(layer, m_host, mainWindow);
    m_docks.insert(layerId, dock);

    connect(dock, &SelectionDock::closed, this, [this, layerId]() { onDockClosed(layerId); });
    QPointer<VectorLayer> guard(layer);
    connect(dock, &SelectionDock::undockRequested, this, [this, guard]() {
        if (guard) convertToDialog(guard);
    });

    const Qt::DockWidgetArea area = static_cast<Qt::DockWidgetArea>(AppSettings::selectionDockArea());
    if (m_host) m_host->addDockWidget(area, dock);

    // Sit as a tab next to a dock already showing in the same area
    if (mainWindow) {
        const QList<QDockWidget*> docks = mainWindow->findChildren<QDockWidget*>();
        for (QDockWidget* other : docks) {
            if (other == dock || !other->isVisible()) continue;
            if (mainWindow->dockWidgetArea(other) != area) continue;
            mainWindow->tabifyDockWidget(other, dock);
            break;
        }
    }

    dock->show();
    dock->raise();
    qDebug() << "Opened selection table dock for" << layer->name();
    return dock;
}

SelectionDialog* SelectionTableManager::dialogFor(VectorLayer* layer) const
{
    return layer ? m_dialogs.value(layer->id()).data() : nullptr;
}

SelectionDock* SelectionTableManager::dockFor(VectorLayer* layer) const
{
    return layer ? m_docks.value(layer->id()).data() : nullptr;
}

void SelectionTableManager::convertToDock(VectorLayer* layer)
{
    if (!layer) return;

    QPointer<SelectionDialog> dialog = m_dialogs.take(layer->id());
    // Closing restores the layer selection the dock starts from
    if (dialog) {
        dialog->close();
        dialog->deleteLater();
    }

    openDock(layer);
}

void SelectionTableManager::convertToDialog(VectorLayer* layer)
{
    if (!layer) return;

    QPointer<SelectionDock> dock = m_docks.take(layer->id());
    if (dock) {
        dock->selectionWidget()->cleanupRubberBands();
        dock->selectionWidget()->restoreLayerSelection();
        if (m_host) m_host->removeDockWidget(dock.data());
        dock->deleteLater();
    }

    openDialog(layer);
}

void SelectionTableManager::onDockClosed(const QString& layerId)
{
    QPointer<SelectionDock> dock = m_docks.take(layerId);
    if (!dock) return;
    if (m_host) m_host->removeDockWidget(dock.data());
    dock->deleteLater();
}

void SelectionTableManager::runDialog()
{
    VectorLayer* layer = m_host ? m_host->activeLayer() : nullptr;
    if (!layer) {
        if (m_host && m_host->messageBar()) m_host->messageBar()->pushWarning("Selection", "Select a vector layer.");
        return;
    }
    openDialog(layer);
}

void SelectionTableManager::runDock()
{
    VectorLayer* layer = m_host ? m_host->activeLayer() : nullptr;
    if (!layer) {
        if (m_host && m_host->messageBar()) m_host->messageBar()->pushWarning("Selection", "Select a vector layer.");
        return;
    }
    openDock(layer);
}

void SelectionTableManager::closeFor(VectorLayer* layer)
{
    if (!layer) return;

    QPointer<SelectionDialog> dialog = m_dialogs.take(layer->id());
    if (dialog) {
        dialog->selectionWidget()->cleanupRubberBands();
        // A hidden dialog is not rejected by close(), so finished() never fires
        dialog->close();
        dialog->deleteLater();
    }

    QPointer<SelectionDock> dock = m_docks.take(layer->id());
    if (dock) {
        dock->selectionWidget()->cleanupRubberBands();
        dock->selectionWidget()->restoreLayerSelection();
        if (m_host) m_host->removeDockWidget(dock.data());
        dock->deleteLater();
    }
}

void SelectionTableManager::closeAll()
{
    const QList<QPointer<SelectionDialog>> dialogs = m_dialogs.values();
    m_dialogs.clear();
    for (const QPointer<SelectionDialog>& dialog : dialogs) {
        if (!dialog) continue;
        dialog->selectionWidget()->cleanupRubberBands();
        dialog->close();
        dialog->deleteLater();
    }

    const QList<QPointer<SelectionDock>> docks = m_docks.values();
    m_docks.clear();
    for (const QPointer<SelectionDock>& dock : docks) {
        if (!dock) continue;
        // Removing a dock does not send it a close event
        dock->selectionWidget()->cleanupRubberBands();
        dock->selectionWidget()->restoreLayerSelection();
        if (m_host) m_host->removeDockWidget(dock.data());
        dock->deleteLater();
    }
}
