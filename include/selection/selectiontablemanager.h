#ifndef SELECTIONTABLEMANAGER_H
#define SELECTIONTABLEMANAGER_H

#include <QObject>
#include <QHash>
#include <QPointer>
#include <QString>

class HostInterface;
class SelectionDialog;
class SelectionDock;
class VectorLayer;

/**
 * @brief SelectionTableManager - one selection table window and one dock per layer
 *
 * Opening a table for a layer that already has one brings the existing one
 * to the front. Windows and docks can be converted into each other.
 */
class SelectionTableManager : public QObject
{
    Q_OBJECT

public:
    explicit SelectionTableManager(HostInterface* host, QObject *parent = nullptr);
    ~SelectionTableManager();

    SelectionDialog* openDialog(VectorLayer* layer);
    SelectionDock* openDock(VectorLayer* layer);

    SelectionDialog* dialogFor(VectorLayer* layer) const;
    SelectionDock* dockFor(VectorLayer* layer) const;
    int dialogCount() const { return m_dialogs.size(); }
    int dockCount() const { return m_docks.size(); }

public slots:
    // Use the host's active layer
    void runDialog();
    void runDock();

    void convertToDock(VectorLayer* layer);
    void convertToDialog(VectorLayer* layer);

    // Close the window and dock of one layer, e.g. before it is removed
    void closeFor(VectorLayer* layer);
    void closeAll();

private:
    void onDockClosed(const QString& layerId);
    bool checkSelection(VectorLayer* layer);

    HostInterface* m_host;
    QHash<QString, QPointer<SelectionDialog>> m_dialogs;
    QHash<QString, QPointer<SelectionDock>> m_docks;
};

#endif // SELECTIONTABLEMANAGER_H
