#ifndef RUBBERBAND_H
#define RUBBERBAND_H

#include <QColor>
#include <QPointer>
#include <QVector>
#include "core/featuretypes.h"

class MapCanvas;
class QPainter;
class QTransform;

/**
 * @brief RubberBand - overlay of geometries drawn on top of a map canvas
 *
 * The band registers itself with the canvas on construction and is owned by
 * whoever created it. Deleting it or calling removeFromCanvas() takes it off
 * the canvas.
 */
class RubberBand {
public:
    explicit RubberBand(MapCanvas* canvas, GeometryType type = GeometryType::Polygon);
    ~RubberBand();

    RubberBand(const RubberBand&) = delete;
    RubberBand& operator=(const RubberBand&) = delete;

    MapCanvas* canvas() const { return m_canvas; }
    bool isOnCanvas() const;
    void removeFromCanvas();

    GeometryType geometryType() const { return m_type; }

    QColor color() const { return m_color; }
    void setColor(const QColor& color);
    QColor fillColor() const { return m_fillColor; }
    void setFillColor(const QColor& color);
    int width() const { return m_width; }
    void setWidth(int width);

    bool isVisible() const { return m_visible; }
    void setVisible(bool visible);

    // Drops all geometries; the type applies to geometries added afterwards
    void reset(GeometryType type);
    void reset() { reset(m_type); }
    void addGeometry(const FeatureGeometry& geometry);

    const QVector<FeatureGeometry>& geometries() const { return m_geometries; }
    int size() const { return m_geometries.size(); }
    bool isEmpty() const { return m_geometries.isEmpty(); }

    void paint(QPainter& painter, const QTransform& worldToScreen) const;

private:
    void updateCanvas();

    QPointer<MapCanvas> m_canvas;
    GeometryType m_type;
    QColor m_color{255, 0, 0};
    QColor m_fillColor{255, 0, 0, 60};
    int m_width{1};
    bool m_visible{true};
    QVector<FeatureGeometry> m_geometries;
};

#endif // RUBBERBAND_H
