#ifndef MAPCANVAS_H
#define MAPCANVAS_H

#include <QWidget>
#include <QPointF>
#include <QRectF>
#include <QTransform>
#include <QVector>
#include <QList>
#include <QColor>
#include "core/featuretypes.h"

class QTimer;
class RubberBand;
class VectorLayer;

/**
 * @brief MapCanvas - draws vector layers, their selection and rubber band overlays
 *
 * Left click selects the feature under the cursor on the current layer, a
 * left drag selects by rectangle. Shift adds to the selection, Ctrl removes.
 * The wheel zooms around the cursor and the middle button pans.
 */
class MapCanvas : public QWidget {
    Q_OBJECT

public:
    explicit MapCanvas(QWidget *parent = nullptr);
    ~MapCanvas();

    // Layers (not owned)
    void addLayer(VectorLayer* layer);
    void removeLayer(VectorLayer* layer);
    const QVector<VectorLayer*>& layers() const { return m_layers; }
    void setCurrentLayer(VectorLayer* layer);
    VectorLayer* currentLayer() const { return m_currentLayer; }

    QColor selectionColor() const { return m_selectionColor; }

    // View
    QRectF extent() const;
    void setExtent(const QRectF& rect);
    QPointF center() const { return -m_offset; }
    void setCenter(const QPointF& point);
    double zoom() const { return m_zoom; }
    void zoomIn();
    void zoomOut();
    void zoomToFullExtent();
    void zoomToSelected(VectorLayer* layer = nullptr);
    void zoomToFeatureIds(VectorLayer* layer, const FeatureIds& ids);
    void flashFeatureIds(VectorLayer* layer, const FeatureIds& ids, int flashes = 3, int durationMs = 200);
    bool isFlashing() const;
    void refresh();

    QPointF toMapCoordinates(const QPoint& screen) const;
    QPointF toCanvasCoordinates(const QPointF& world) const;

    // Overlays currently drawn on the canvas
    const QList<RubberBand*>& rubberBands() const { return m_rubberBands; }

signals:
    void extentsChanged();
    void xyCoordinates(const QPointF& pos);
    void layersChanged();
    void currentLayerChanged(VectorLayer* layer);

protected:
    void paintEvent(QPaintEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;

private:
    friend class RubberBand;
    void registerRubberBand(RubberBand* band);
    void unregisterRubberBand(RubberBand* band);

    void updateTransform();
    void drawLayer(QPainter& painter, const VectorLayer* layer);
    void drawGeometry(QPainter& painter, const FeatureGeometry& geometry,
                      const QColor& color, const QColor& fill, double width);
    void selectAt(const QPoint& screen, Qt::KeyboardModifiers modifiers);
    void onFlashTimeout();

    QVector<VectorLayer*> m_layers;
    VectorLayer* m_currentLayer{nullptr};
    QList<RubberBand*> m_rubberBands;

    double m_zoom{1.0};
    QPointF m_offset{0.0, 0.0};
    QTransform m_worldToScreen;
    QTransform m_screenToWorld;
    QColor m_selectionColor;

    // Mouse state
    bool m_isPanning{false};
    bool m_isSelectingBox{false};
    QPoint m_pressPos;
    QPoint m_lastMousePos;
    QPointF m_selectionBoxStart;
    QPointF m_selectionBoxEnd;

    // Flash
    QTimer* m_flashTimer{nullptr};
    QVector<FeatureGeometry> m_flashGeometries;
    int m_flashTicks{0};
    bool m_flashOn{false};
};

#endif // MAPCANVAS_H
