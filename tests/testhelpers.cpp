#include "testhelpers.h"
#include "app/messagebar.h"
#include "canvas/mapcanvas.h"
#include "core/vectorlayer.h"

#include <QApplication>
#include <QDockWidget>
#include <QVBoxLayout>

QApplication* ensureApp()
{
    static int argc = 1;
    static char arg0[] = "subselect_tests";
    static char* argv[] = {arg0, nullptr};
    static QApplication* app = nullptr;
    if (!app) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
        QCoreApplication::setOrganizationName("SubSelectTests");
        QCoreApplication::setApplicationName("subselect_tests");
        app = new QApplication(argc, argv);
        qRegisterMetaType<FeatureIds>("FeatureIds");
        qRegisterMetaType<FeatureId>("FeatureId");
    }
    return app;
}

VectorLayer* makeParcelLayer(int count, QObject* parent)
{
    Fields fields;
    fields.append(Field("name", FieldType::String, 32));
    fields.append(Field("area", FieldType::Double, 12, 2));
    fields.append(Field("zone", FieldType::Integer));

    VectorLayer* layer = new VectorLayer("parcels", GeometryType::Point, fields, parent);
    for (int i = 0; i < count; ++i) {
        Feature f;
        f.geometry = FeatureGeometry::fromPoint(QPointF(i, i));
        f.attributes = {QString("p%1").arg(i), i * 10.0, static_cast<qlonglong>(i % 3)};
        layer->appendFeature(f);
    }
    return layer;
}

FeatureIds idSet(std::initializer_list<FeatureId> ids)
{
    FeatureIds result;
    for (FeatureId fid : ids) result.insert(fid);
    return result;
}

TestHost::TestHost()
{
    ensureApp();
    m_window = new QMainWindow();
    QWidget* central = new QWidget(m_window);
    QVBoxLayout* layout = new QVBoxLayout(central);
    m_messageBar = new MessageBar(central);
    layout->addWidget(m_messageBar);
    m_canvas = new MapCanvas(central);
    layout->addWidget(m_canvas);
    m_window->setCentralWidget(central);
    m_window->resize(800, 600);
}

TestHost::~TestHost()
{
    delete m_window;
}

void TestHost::addDockWidget(Qt::DockWidgetArea area, QDockWidget* dock)
{
    ++m_dockAdds;
    m_window->addDockWidget(area, dock);
}

void TestHost::removeDockWidget(QDockWidget* dock)
{
    ++m_dockRemoves;
    m_window->removeDockWidget(dock);
}

void TestHost::setActiveLayer(VectorLayer* layer)
{
    m_activeLayer = layer;
    if (layer && !m_canvas->layers().contains(layer)) m_canvas->addLayer(layer);
}
