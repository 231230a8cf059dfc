#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QVector>
#include "app/hostinterface.h"

class QAction;
class QDockWidget;
class QLabel;
class QListWidget;
class QMenu;
class QToolBar;
class MapCanvas;
class MessageBar;
class SelectionTableManager;
class VectorLayer;

class MainWindow : public QMainWindow, public HostInterface
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    // HostInterface
    QMainWindow* mainWindow() override { return this; }
    MapCanvas* mapCanvas() override { return m_canvas; }
    MessageBar* messageBar() override { return m_messageBar; }
    VectorLayer* activeLayer() override;
    void addDockWidget(Qt::DockWidgetArea area, QDockWidget* dock) override;
    void removeDockWidget(QDockWidget* dock) override;

    // Takes ownership of the layer
    void addLayer(VectorLayer* layer);
    void removeLayer(VectorLayer* layer);
    const QVector<VectorLayer*>& layers() const { return m_layers; }

    bool loadVectorFile(const QString& fileName);

    SelectionTableManager* selectionManager() const { return m_selectionManager; }

    // Fusion palette, dark or the style's default
    static void applyTheme(bool dark);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void openVectorFile();
    void exportLayer();
    void toggleEditing();
    void saveEdits();
    void updateCoordinates(const QPointF& pos);
    void updateZoom();
    void updateLayerPanel();
    void updateEditActions();
    void onLayerContextMenu(const QPoint& pos);
    void openRecentFile();
    void updateRecentFilesMenu();

private:
    void setupMenus();
    void setupToolbar();
    void setupStatusBar();
    void setupLayerPanel();
    bool finishEditing(VectorLayer* layer);

    MapCanvas* m_canvas{nullptr};
    MessageBar* m_messageBar{nullptr};
    SelectionTableManager* m_selectionManager{nullptr};
    QVector<VectorLayer*> m_layers;

    QLabel* m_coordLabel{nullptr};
    QLabel* m_zoomLabel{nullptr};
    QLabel* m_layerLabel{nullptr};

    QDockWidget* m_layerDock{nullptr};
    QListWidget* m_layerList{nullptr};

    QToolBar* m_toolbar{nullptr};
    QMenu* m_recentMenu{nullptr};
    QAction* m_toggleEditingAction{nullptr};
    QAction* m_saveEditsAction{nullptr};
    QAction* m_selectionDockAction{nullptr};
    QAction* m_selectionWindowAction{nullptr};
    QAction* m_darkModeAction{nullptr};
};

#endif // MAINWINDOW_H
