#include <gtest/gtest.h>
#include <QSignalSpy>

#include "canvas/mapcanvas.h"
#include "canvas/rubberband.h"
#include "core/vectorlayer.h"
#include "testhelpers.h"

class MapCanvasTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ensureApp();
        canvas = new MapCanvas();
        canvas->resize(400, 400);
    }

    void TearDown() override
    {
        delete canvas;
    }

    MapCanvas* canvas{nullptr};
};

TEST_F(MapCanvasTest, RubberBandRegistersAndUnregisters)
{
    RubberBand* band = new RubberBand(canvas, GeometryType::Point);
    EXPECT_TRUE(band->isOnCanvas());
    EXPECT_EQ(canvas->rubberBands().size(), 1);

    band->removeFromCanvas();
    EXPECT_FALSE(band->isOnCanvas());
    EXPECT_TRUE(canvas->rubberBands().isEmpty());

    // Second removal is harmless
    band->removeFromCanvas();
    delete band;
    EXPECT_TRUE(canvas->rubberBands().isEmpty());
}

TEST_F(MapCanvasTest, DeletingBandTakesItOffTheCanvas)
{
    RubberBand* first = new RubberBand(canvas);
    RubberBand* second = new RubberBand(canvas);
    ASSERT_EQ(canvas->rubberBands().size(), 2);

    delete first;
    ASSERT_EQ(canvas->rubberBands().size(), 1);
    EXPECT_EQ(canvas->rubberBands().first(), second);
    delete second;
}

TEST_F(MapCanvasTest, BandSurvivesCanvasDeletion)
{
    RubberBand band(canvas, GeometryType::Line);
    delete canvas;
    canvas = nullptr;
    EXPECT_FALSE(band.isOnCanvas());
    EXPECT_EQ(band.canvas(), nullptr);
}

TEST_F(MapCanvasTest, BandResetKeepsStyle)
{
    RubberBand band(canvas, GeometryType::Point);
    band.setColor(Qt::yellow);
    band.setWidth(0);
    band.addGeometry(FeatureGeometry::fromPoint(QPointF(1, 1)));
    band.addGeometry(FeatureGeometry::fromPoint(QPointF(2, 2)));
    EXPECT_EQ(band.size(), 2);
    EXPECT_EQ(band.width(), 1);

    band.reset(GeometryType::Polygon);
    EXPECT_TRUE(band.isEmpty());
    EXPECT_EQ(band.geometryType(), GeometryType::Polygon);
    EXPECT_EQ(band.color(), QColor(Qt::yellow));
}

TEST_F(MapCanvasTest, SetExtentOnSinglePointOnlyCenters)
{
    canvas->setExtent(QRectF(0, 0, 100, 100));
    const double zoom = canvas->zoom();

    QSignalSpy spy(canvas, &MapCanvas::extentsChanged);
    canvas->setExtent(QRectF(QPointF(40, 60), QPointF(40, 60)));
    EXPECT_DOUBLE_EQ(canvas->zoom(), zoom);
    EXPECT_NEAR(canvas->center().x(), 40.0, 1e-9);
    EXPECT_NEAR(canvas->center().y(), 60.0, 1e-9);
    EXPECT_EQ(spy.count(), 1);
}

TEST_F(MapCanvasTest, ZoomToSelectedCoversTheSelection)
{
    VectorLayer* layer = makeParcelLayer(10, canvas);
    canvas->addLayer(layer);
    EXPECT_EQ(canvas->currentLayer(), layer);

    layer->selectByIds(idSet({2, 6}));
    canvas->zoomToSelected(layer);

    const QRectF extent = canvas->extent();
    EXPECT_TRUE(extent.contains(QPointF(2, 2)));
    EXPECT_TRUE(extent.contains(QPointF(6, 6)));
    EXPECT_FALSE(extent.contains(QPointF(9, 9)));
}

TEST_F(MapCanvasTest, FlashRunsOnATimer)
{
    VectorLayer* layer = makeParcelLayer(3, canvas);
    canvas->addLayer(layer);

    canvas->flashFeatureIds(layer, idSet({1}), 1, 10);
    EXPECT_TRUE(canvas->isFlashing());

    // Unknown ids do nothing
    canvas->flashFeatureIds(layer, idSet({42}));
}

TEST_F(MapCanvasTest, RemovingCurrentLayerPicksAnother)
{
    VectorLayer* a = makeParcelLayer(1, canvas);
    VectorLayer* b = makeParcelLayer(1, canvas);
    canvas->addLayer(a);
    canvas->addLayer(b);
    canvas->setCurrentLayer(a);

    QSignalSpy spy(canvas, &MapCanvas::currentLayerChanged);
    canvas->removeLayer(a);
    EXPECT_EQ(canvas->currentLayer(), b);
    EXPECT_EQ(spy.count(), 1);
}
