#ifndef SELECTIONDOCK_H
#define SELECTIONDOCK_H

#include <QDockWidget>

class QAction;
class HostInterface;
class SelectionTableWidget;
class VectorLayer;

/**
 * @brief SelectionDock - selection table docked in the main window
 *
 * Closing removes the map overlays and gives the layer its selection back.
 */
class SelectionDock : public QDockWidget
{
    Q_OBJECT

public:
    SelectionDock(VectorLayer* layer, HostInterface* host, QWidget *parent = nullptr);

    SelectionTableWidget* selectionWidget() const { return m_widget; }
    QAction* undockAction() const { return m_actionUndock; }

signals:
    void closed();
    void undockRequested();

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    SelectionTableWidget* m_widget{nullptr};
    QAction* m_actionUndock{nullptr};
};

#endif // SELECTIONDOCK_H
