#ifndef TESTHELPERS_H
#define TESTHELPERS_H

#include <QMainWindow>
#include <QString>
#include <initializer_list>
#include "app/hostinterface.h"
#include "core/featuretypes.h"

class QApplication;
class MapCanvas;
class MessageBar;
class VectorLayer;

// One QApplication for the whole test binary, offscreen friendly
QApplication* ensureApp();

// Point layer "parcels" with fields name (string), area (double), zone (int).
// Feature i sits at (i, i) with name "p<i>", area i * 10.0 and zone i % 3.
VectorLayer* makeParcelLayer(int count, QObject* parent = nullptr);

FeatureIds idSet(std::initializer_list<FeatureId> ids);

/**
 * @brief TestHost - bare main window with a canvas and message bar
 */
class TestHost : public HostInterface
{
public:
    TestHost();
    ~TestHost();

    QMainWindow* mainWindow() override { return m_window; }
    MapCanvas* mapCanvas() override { return m_canvas; }
    MessageBar* messageBar() override { return m_messageBar; }
    VectorLayer* activeLayer() override { return m_activeLayer; }
    void addDockWidget(Qt::DockWidgetArea area, QDockWidget* dock) override;
    void removeDockWidget(QDockWidget* dock) override;

    void setActiveLayer(VectorLayer* layer);

    int dockAdds() const { return m_dockAdds; }
    int dockRemoves() const { return m_dockRemoves; }

private:
    QMainWindow* m_window;
    MapCanvas* m_canvas;
    MessageBar* m_messageBar;
    VectorLayer* m_activeLayer{nullptr};
    int m_dockAdds{0};
    int m_dockRemoves{0};
};

#endif // TESTHELPERS_H
