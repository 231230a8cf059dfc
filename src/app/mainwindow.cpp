#include "app/mainwindow.h"
#include "app/messagebar.h"
#include "canvas/mapcanvas.h"
#include "core/vectorlayer.h"
#include "gdal/gdalreader.h"
#include "gdal/gdalwriter.h"
#include "selection/selectiontablemanager.h"
#include "appsettings.h"

#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QFileDialog>
#include <QStatusBar>
#include <QLabel>
#include <QMessageBox>
#include <QApplication>
#include <QDockWidget>
#include <QListWidget>
#include <QVBoxLayout>
#include <QFile>
#include <QFileInfo>
#include <QPixmap>
#include <QIcon>
#include <QToolBar>
#include <QCloseEvent>
#include <QDebug>
#include <QPalette>
#include <QStyle>
#include <QStyleFactory>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle("SubSelect");
    resize(1200, 800);

    // Message bar sits above the map
    QWidget* central = new QWidget(this);
    QVBoxLayout* centralLayout = new QVBoxLayout(central);
    centralLayout->setContentsMargins(0, 0, 0, 0);
    centralLayout->setSpacing(0);

    m_messageBar = new MessageBar(central);
    centralLayout->addWidget(m_messageBar);

    m_canvas = new MapCanvas(central);
    centralLayout->addWidget(m_canvas, 1);
    setCentralWidget(central);

    m_selectionManager = new SelectionTableManager(this, this);

    setupStatusBar();
    setupLayerPanel();
    setupMenus();
    setupToolbar();

    connect(m_canvas, &MapCanvas::xyCoordinates, this, &MainWindow::updateCoordinates);
    connect(m_canvas, &MapCanvas::extentsChanged, this, &MainWindow::updateZoom);
    connect(m_canvas, &MapCanvas::layersChanged, this, &MainWindow::updateLayerPanel);
    connect(m_canvas, &MapCanvas::currentLayerChanged, this, [this](VectorLayer*) {
        updateLayerPanel();
        updateEditActions();
    });

    updateEditActions();
}

MainWindow::~MainWindow()
{
    // Panels call back into this window while closing
    delete m_selectionManager;
    m_selectionManager = nullptr;
}

VectorLayer* MainWindow::activeLayer()
{
    return m_canvas ? m_canvas->currentLayer() : nullptr;
}

void MainWindow::addDockWidget(Qt::DockWidgetArea area, QDockWidget* dock)
{
    QMainWindow::addDockWidget(area, dock);
}

void MainWindow::removeDockWidget(QDockWidget* dock)
{
    QMainWindow::removeDockWidget(dock);
}

void MainWindow::applyTheme(bool dark)
{
    QApplication::setStyle(QStyleFactory::create("Fusion"));
    if (!dark) {
        QApplication::setPalette(QApplication::style()->standardPalette());
        return;
    }

    QPalette palette;
    palette.setColor(QPalette::Window, QColor(45, 45, 48));
    palette.setColor(QPalette::WindowText, QColor(220, 220, 220));
    palette.setColor(QPalette::Base, QColor(30, 30, 30));
    palette.setColor(QPalette::AlternateBase, QColor(45, 45, 48));
    palette.setColor(QPalette::ToolTipBase, QColor(45, 45, 48));
    palette.setColor(QPalette::ToolTipText, QColor(220, 220, 220));
    palette.setColor(QPalette::Text, QColor(220, 220, 220));
    palette.setColor(QPalette::Button, QColor(55, 55, 58));
    palette.setColor(QPalette::ButtonText, QColor(220, 220, 220));
    palette.setColor(QPalette::Highlight, QColor(0, 120, 212));
    palette.setColor(QPalette::HighlightedText, Qt::white);
    palette.setColor(QPalette::Disabled, QPalette::Text, QColor(120, 120, 120));
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(120, 120, 120));
    QApplication::setPalette(palette);
}

void MainWindow::setupMenus()
{
    // File menu
    QMenu* fileMenu = menuBar()->addMenu("&File");

    QAction* openAction = fileMenu->addAction("&Open Vector Layer...");
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::openVectorFile);

    m_recentMenu = fileMenu->addMenu("Recent Files");
    updateRecentFilesMenu();

    QAction* exportAction = fileMenu->addAction("&Export Layer...");
    connect(exportAction, &QAction::triggered, this, &MainWindow::exportLayer);

    fileMenu->addSeparator();

    QAction* exitAction = fileMenu->addAction("E&xit");
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    // Edit menu
    QMenu* editMenu = menuBar()->addMenu("&Edit");

    m_toggleEditingAction = editMenu->addAction("Toggle &Editing");
    m_toggleEditingAction->setCheckable(true);
    m_toggleEditingAction->setShortcut(QKeySequence("Ctrl+E"));
    connect(m_toggleEditingAction, &QAction::triggered, this, &MainWindow::toggleEditing);

    m_saveEditsAction = editMenu->addAction("&Save Layer Edits");
    m_saveEditsAction->setShortcut(QKeySequence::Save);
    connect(m_saveEditsAction, &QAction::triggered, this, &MainWindow::saveEdits);

    editMenu->addSeparator();

    QAction* selectAllAction = editMenu->addAction("Select &All Features");
    connect(selectAllAction, &QAction::triggered, this, [this]() {
        VectorLayer* layer = activeLayer();
        if (!layer) return;
        const QVector<FeatureId> ids = layer->featureIds();
        FeatureIds all;
        for (FeatureId fid : ids) all.insert(fid);
        layer->selectByIds(all);
    });

    QAction* clearSelectionAction = editMenu->addAction("&Clear Selection");
    connect(clearSelectionAction, &QAction::triggered, this, [this]() {
        if (VectorLayer* layer = activeLayer()) layer->removeSelection();
    });

    // View menu
    QMenu* viewMenu = menuBar()->addMenu("&View");

    QAction* zoomInAction = viewMenu->addAction("Zoom &In");
    zoomInAction->setShortcut(QKeySequence::ZoomIn);
    connect(zoomInAction, &QAction::triggered, m_canvas, &MapCanvas::zoomIn);

    QAction* zoomOutAction = viewMenu->addAction("Zoom &Out");
    zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    connect(zoomOutAction, &QAction::triggered, m_canvas, &MapCanvas::zoomOut);

    QAction* zoomFullAction = viewMenu->addAction("Zoom &Full");
    connect(zoomFullAction, &QAction::triggered, m_canvas, &MapCanvas::zoomToFullExtent);

    QAction* zoomSelectedAction = viewMenu->addAction("Zoom to &Selection");
    connect(zoomSelectedAction, &QAction::triggered, this, [this]() {
        m_canvas->zoomToSelected(activeLayer());
    });

    viewMenu->addSeparator();
    viewMenu->addAction(m_layerDock->toggleViewAction());

    m_darkModeAction = viewMenu->addAction("&Dark Mode");
    m_darkModeAction->setCheckable(true);
    m_darkModeAction->setChecked(AppSettings::darkMode());
    connect(m_darkModeAction, &QAction::toggled, this, [this](bool on) {
        AppSettings::setDarkMode(on);
        applyTheme(on);
        m_canvas->refresh();
    });

    // Vector menu
    QMenu* vectorMenu = menuBar()->addMenu("Vec&tor");
    QMenu* selectionMenu = vectorMenu->addMenu("&Selection Tools");

    m_selectionDockAction = selectionMenu->addAction("Advanced Selection Table (Dock)");
    m_selectionDockAction->setToolTip("Open a docked table of the selected features");
    connect(m_selectionDockAction, &QAction::triggered, m_selectionManager, &SelectionTableManager::runDock);

    m_selectionWindowAction = selectionMenu->addAction("Advanced Selection Table (Window)");
    m_selectionWindowAction->setToolTip("Open a table of the selected features in its own window");
    connect(m_selectionWindowAction, &QAction::triggered, m_selectionManager, &SelectionTableManager::runDialog);

    // Help menu
    QMenu* helpMenu = menuBar()->addMenu("&Help");
    QAction* aboutAction = helpMenu->addAction("&About SubSelect");
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, "About SubSelect",
            "SubSelect\n\n"
            "Work on a subset of the selected features: highlight rows, "
            "narrow the selection, filter by expression and calculate fields "
            "on the highlighted features only.");
    });
}

void MainWindow::setupToolbar()
{
    m_toolbar = addToolBar("Selection Tools");
    m_toolbar->setObjectName("SelectionToolbar");
    m_toolbar->setMovable(true);

    m_toolbar->addAction(m_toggleEditingAction);
    m_toolbar->addAction(m_saveEditsAction);
    m_toolbar->addSeparator();
    m_toolbar->addAction(m_selectionDockAction);
    m_toolbar->addAction(m_selectionWindowAction);
}

void MainWindow::setupStatusBar()
{
    m_coordLabel = new QLabel("X: 0.000  Y: 0.000");
    m_coordLabel->setMinimumWidth(200);
    statusBar()->addWidget(m_coordLabel);

    m_layerLabel = new QLabel("");
    m_layerLabel->setMinimumWidth(100);
    statusBar()->addWidget(m_layerLabel);

    m_zoomLabel = new QLabel("Zoom: 100%");
    m_zoomLabel->setMinimumWidth(100);
    statusBar()->addPermanentWidget(m_zoomLabel);
}

void MainWindow::setupLayerPanel()
{
    m_layerDock = new QDockWidget("Layers", this);
    m_layerDock->setObjectName("LayersDock");
    m_layerDock->setAllowedAreas(Qt::LeftDockWidgetArea | Qt::RightDockWidgetArea);

    m_layerList = new QListWidget();
    m_layerList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_layerList->setContextMenuPolicy(Qt::CustomContextMenu);
    m_layerDock->setWidget(m_layerList);
    QMainWindow::addDockWidget(Qt::LeftDockWidgetArea, m_layerDock);

    connect(m_layerList, &QListWidget::customContextMenuRequested, this, &MainWindow::onLayerContextMenu);
    connect(m_layerList, &QListWidget::currentRowChanged, this, [this](int row) {
        if (row < 0 || row >= m_layers.size()) return;
        m_canvas->setCurrentLayer(m_layers.at(row));
    });
}

void MainWindow::updateLayerPanel()
{
    if (!m_layerList || !m_canvas) return;

    m_layerList->blockSignals(true);
    m_layerList->clear();

    VectorLayer* current = m_canvas->currentLayer();
    for (VectorLayer* layer : m_layers) {
        QListWidgetItem* item = new QListWidgetItem(layer->name());
        QString tip = QString("%1 - %2 features").arg(geometryTypeName(layer->geometryType()))
                          .arg(layer->featureCount());
        if (!layer->dataSourcePath().isEmpty()) {
            tip += QString("\n%1 (%2)").arg(layer->dataSourcePath(), layer->dataSourceLayerName());
        }
        item->setToolTip(tip);

        // Color indicator
        QPixmap pm(16, 16);
        pm.fill(layer->color());
        item->setIcon(QIcon(pm));

        if (layer->isEditable()) {
            item->setText(QString("%1 [editing]").arg(layer->name()));
        }

        m_layerList->addItem(item);
        if (layer == current) {
            QFont font = item->font();
            font.setBold(true);
            item->setFont(font);
            m_layerList->setCurrentItem(item);
        }
    }

    m_layerList->blockSignals(false);

    if (m_layerLabel) {
        if (current) {
            m_layerLabel->setText(QString("%1: %2 selected%3")
                                      .arg(current->name())
                                      .arg(current->selectedFeatureCount())
                                      .arg(current->isEditable() ? " (editing)" : ""));
        } else {
            m_layerLabel->clear();
        }
    }
}

void MainWindow::updateEditActions()
{
    VectorLayer* layer = activeLayer();
    const bool hasLayer = layer != nullptr;

    m_toggleEditingAction->setEnabled(hasLayer);
    m_toggleEditingAction->setChecked(hasLayer && layer->isEditable());
    m_saveEditsAction->setEnabled(hasLayer && layer->isEditable());
    m_selectionDockAction->setEnabled(hasLayer);
    m_selectionWindowAction->setEnabled(hasLayer);
}

void MainWindow::addLayer(VectorLayer* layer)
{
    if (!layer || m_layers.contains(layer)) return;

    layer->setParent(this);
    m_layers.append(layer);

    connect(layer, &VectorLayer::editingStarted, this, [this]() {
        updateLayerPanel();
        updateEditActions();
    });
    connect(layer, &VectorLayer::editingStopped, this, [this]() {
        updateLayerPanel();
        updateEditActions();
    });
    connect(layer, &VectorLayer::selectionChanged, this, &MainWindow::updateLayerPanel);

    m_canvas->addLayer(layer);
    m_canvas->setCurrentLayer(layer);
    updateLayerPanel();
    updateEditActions();
}

void MainWindow::removeLayer(VectorLayer* layer)
{
    if (!layer || !m_layers.contains(layer)) return;

    if (layer->isEditable() && !finishEditing(layer)) return;

    m_selectionManager->closeFor(layer);
    m_layers.removeAll(layer);
    m_canvas->removeLayer(layer);
    layer->deleteLater();

    updateLayerPanel();
    updateEditActions();
}

bool MainWindow::loadVectorFile(const QString& fileName)
{
    QApplication::setOverrideCursor(Qt::WaitCursor);

    GdalReader reader;
    bool success = reader.readFile(fileName, this);

    QApplication::restoreOverrideCursor();

    if (!success) {
        QMessageBox::warning(this, "Open Vector Layer",
            QString("Failed to load GIS file:\n%1\n\nError: %2")
                .arg(fileName)
                .arg(reader.lastError()));
        return false;
    }

    int featureCount = 0;
    for (VectorLayer* layer : reader.layers()) {
        featureCount += layer->featureCount();
        addLayer(layer);
    }
    if (!reader.layers().isEmpty()) {
        m_canvas->setCurrentLayer(reader.layers().first());
        m_canvas->zoomToFullExtent();
    }

    AppSettings::setLastVectorFile(fileName);
    AppSettings::addRecentFile(fileName);
    updateRecentFilesMenu();

    setWindowTitle(QString("SubSelect - %1").arg(QFileInfo(fileName).fileName()));
    statusBar()->showMessage(QString("Loaded: %1 layers, %2 features")
        .arg(reader.layers().size())
        .arg(featureCount), 5000);
    return true;
}

void MainWindow::openVectorFile()
{
    QString startDir;
    const QString last = AppSettings::lastVectorFile();
    if (!last.isEmpty()) startDir = QFileInfo(last).absolutePath();

    QString fileName = QFileDialog::getOpenFileName(this,
        "Open Vector Layer", startDir,
        GdalReader::fileFilter());

    if (fileName.isEmpty()) return;
    loadVectorFile(fileName);
}

void MainWindow::exportLayer()
{
    VectorLayer* layer = activeLayer();
    if (!layer) {
        m_messageBar->pushWarning("Export", "Select a vector layer.");
        return;
    }

    QString selectedFilter;
    QString fileName = QFileDialog::getSaveFileName(this, "Export Layer", layer->name(),
        "GeoPackage (*.gpkg);;GeoJSON (*.geojson);;ESRI Shapefile (*.shp)", &selectedFilter);
    if (fileName.isEmpty()) return;

    QString driver = "GPKG";
    if (selectedFilter.startsWith("GeoJSON") || fileName.endsWith(".geojson", Qt::CaseInsensitive)) {
        driver = "GeoJSON";
    } else if (selectedFilter.startsWith("ESRI") || fileName.endsWith(".shp", Qt::CaseInsensitive)) {
        driver = "ESRI Shapefile";
    }

    QApplication::setOverrideCursor(Qt::WaitCursor);
    GdalWriter writer;
    bool success = writer.exportLayer(*layer, fileName, driver);
    QApplication::restoreOverrideCursor();

    if (success) {
        statusBar()->showMessage(QString("Exported %1 features to %2")
            .arg(layer->featureCount()).arg(QFileInfo(fileName).fileName()), 5000);
    } else {
        QMessageBox::warning(this, "Export Layer",
            QString("Failed to export layer:\n%1").arg(writer.lastError()));
    }
}

bool MainWindow::finishEditing(VectorLayer* layer)
{
    if (!layer->isModified()) return layer->rollBack();

    QMessageBox::StandardButton reply = QMessageBox::question(
        this, "Stop Editing",
        QString("Save changes to layer %1?").arg(layer->name()),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save
    );

    if (reply == QMessageBox::Cancel) return false;
    if (reply == QMessageBox::Discard) return layer->rollBack();

    if (!layer->commitChanges()) {
        QMessageBox::critical(this, "Save Layer Edits", layer->lastError());
        return false;
    }
    return true;
}

void MainWindow::toggleEditing()
{
    VectorLayer* layer = activeLayer();
    if (!layer) {
        m_messageBar->pushWarning("Editing", "Select a vector layer.");
        updateEditActions();
        return;
    }

    if (layer->isEditable()) {
        finishEditing(layer);
    } else {
        layer->startEditing();
    }
    updateEditActions();
}

void MainWindow::saveEdits()
{
    VectorLayer* layer = activeLayer();
    if (!layer || !layer->isEditable()) return;

    if (!layer->commitChanges()) {
        QMessageBox::critical(this, "Save Layer Edits", layer->lastError());
        return;
    }
    // Saving keeps the layer in edit mode
    layer->startEditing();
    statusBar()->showMessage(QString("Saved edits to %1").arg(layer->name()), 5000);
}

void MainWindow::updateCoordinates(const QPointF& pos)
{
    m_coordLabel->setText(QString("X: %1  Y: %2")
        .arg(pos.x(), 0, 'f', 3)
        .arg(pos.y(), 0, 'f', 3));
}

void MainWindow::updateZoom()
{
    m_zoomLabel->setText(QString("Zoom: %1%").arg(int(m_canvas->zoom() * 100)));
}

void MainWindow::onLayerContextMenu(const QPoint& pos)
{
    QListWidgetItem* item = m_layerList->itemAt(pos);
    if (!item) return;

    const int row = m_layerList->row(item);
    if (row < 0 || row >= m_layers.size()) return;
    VectorLayer* layer = m_layers.at(row);
    m_canvas->setCurrentLayer(layer);

    QMenu menu(this);
    QAction* dockAction = menu.addAction("Open Selection Table (Dock)");
    QAction* windowAction = menu.addAction("Open Selection Table (Window)");
    menu.addSeparator();
    QAction* zoomAction = menu.addAction("Zoom to Layer");
    QAction* removeAction = menu.addAction("Remove Layer");

    QAction* selected = menu.exec(m_layerList->mapToGlobal(pos));
    if (selected == dockAction) {
        m_selectionManager->openDock(layer);
    } else if (selected == windowAction) {
        m_selectionManager->openDialog(layer);
    } else if (selected == zoomAction) {
        m_canvas->setExtent(layer->extent());
    } else if (selected == removeAction) {
        removeLayer(layer);
    }
}

void MainWindow::updateRecentFilesMenu()
{
    if (!m_recentMenu) return;

    m_recentMenu->clear();

    const QStringList recentFiles = AppSettings::recentFiles();

    if (recentFiles.isEmpty()) {
        QAction* emptyAction = m_recentMenu->addAction("(No recent files)");
        emptyAction->setEnabled(false);
        return;
    }

    for (const QString& filePath : recentFiles) {
        if (QFile::exists(filePath)) {
            QAction* action = m_recentMenu->addAction(QFileInfo(filePath).fileName());
            action->setData(filePath);
            action->setToolTip(filePath);
            connect(action, &QAction::triggered, this, &MainWindow::openRecentFile);
        }
    }

    m_recentMenu->addSeparator();

    QAction* clearAction = m_recentMenu->addAction("Clear Recent Files");
    connect(clearAction, &QAction::triggered, this, [this]() {
        AppSettings::clearRecentFiles();
        updateRecentFilesMenu();
    });
}

void MainWindow::openRecentFile()
{
    QAction* action = qobject_cast<QAction*>(sender());
    if (!action) return;

    QString filePath = action->data().toString();
    if (filePath.isEmpty() || !QFile::exists(filePath)) {
        QMessageBox::warning(this, "Error", "File not found.");
        return;
    }

    loadVectorFile(filePath);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    for (VectorLayer* layer : m_layers) {
        if (layer->isEditable() && !finishEditing(layer)) {
            event->ignore();
            return;
        }
    }

    m_selectionManager->closeAll();
    qDebug() << "Closing SubSelect";
    event->accept();
}
