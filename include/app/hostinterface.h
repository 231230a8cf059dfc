#ifndef HOSTINTERFACE_H
#define HOSTINTERFACE_H

#include <Qt>

class QMainWindow;
class QDockWidget;
class MapCanvas;
class MessageBar;
class VectorLayer;

/**
 * @brief HostInterface - what the selection table needs from the application
 *
 * MainWindow implements it for the desktop app; tests provide a lightweight
 * implementation around a bare QMainWindow.
 */
class HostInterface {
public:
    virtual ~HostInterface() = default;

    virtual QMainWindow* mainWindow() = 0;
    virtual MapCanvas* mapCanvas() = 0;
    virtual MessageBar* messageBar() = 0;

    // Layer the user is working on, or nullptr
    virtual VectorLayer* activeLayer() = 0;

    virtual void addDockWidget(Qt::DockWidgetArea area, QDockWidget* dock) = 0;
    virtual void removeDockWidget(QDockWidget* dock) = 0;
};

#endif // HOSTINTERFACE_H
