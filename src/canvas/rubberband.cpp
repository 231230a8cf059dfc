#include "canvas/rubberband.h"
#include "canvas/mapcanvas.h"

#include <QPainter>
#include <QPainterPath>
#include <QTransform>

RubberBand::RubberBand(MapCanvas* canvas, GeometryType type)
    : m_canvas(canvas)
    , m_type(type)
{
    if (m_canvas) m_canvas->registerRubberBand(this);
}

RubberBand::~RubberBand()
{
    removeFromCanvas();
}

bool RubberBand::isOnCanvas() const
{
    return m_canvas && m_canvas->rubberBands().contains(const_cast<RubberBand*>(this));
}

void RubberBand::removeFromCanvas()
{
    if (m_canvas) {
        m_canvas->unregisterRubberBand(this);
        m_canvas = nullptr;
    }
}

void RubberBand::setColor(const QColor& color)
{
    m_color = color;
    updateCanvas();
}

void RubberBand::setFillColor(const QColor& color)
{
    m_fillColor = color;
    updateCanvas();
}

void RubberBand::setWidth(int width)
{
    m_width = qMax(1, width);
    updateCanvas();
}

void RubberBand::setVisible(bool visible)
{
    m_visible = visible;
    updateCanvas();
}

void RubberBand::reset(GeometryType type)
{
    m_type = type;
    m_geometries.clear();
    updateCanvas();
}

void RubberBand::addGeometry(const FeatureGeometry& geometry)
{
    if (geometry.isNull()) return;
    m_geometries.append(geometry);
    updateCanvas();
}

void RubberBand::updateCanvas()
{
    if (m_canvas) m_canvas->update();
}

void RubberBand::paint(QPainter& painter, const QTransform& worldToScreen) const
{
    if (!m_visible || m_geometries.isEmpty()) return;

    painter.save();
    QPen pen(m_color, m_width);
    pen.setCosmetic(true);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);

    for (const auto& geometry : m_geometries) {
        for (const auto& part : geometry.parts) {
            if (part.rings.isEmpty() || part.rings.first().isEmpty()) continue;

            switch (geometry.type) {
                case GeometryType::Point: {
                    const QPointF p = worldToScreen.map(part.rings.first().first());
                    const double r = 3.0 + m_width * 1.5;
                    painter.setBrush(m_fillColor);
                    painter.drawEllipse(p, r, r);
                    break;
                }
                case GeometryType::Line: {
                    QPolygonF line;
                    for (const auto& pt : part.rings.first()) line.append(worldToScreen.map(pt));
                    painter.setBrush(Qt::NoBrush);
                    painter.drawPolyline(line);
                    break;
                }
                case GeometryType::Polygon: {
                    QPainterPath path;
                    path.setFillRule(Qt::OddEvenFill);
                    for (const auto& ring : part.rings) {
                        if (ring.size() < 3) continue;
                        QPolygonF screenRing;
                        for (const auto& pt : ring) screenRing.append(worldToScreen.map(pt));
                        path.addPolygon(screenRing);
                        path.closeSubpath();
                    }
                    painter.setBrush(m_fillColor);
                    painter.drawPath(path);
                    break;
                }
                case GeometryType::Unknown:
                    break;
            }
        }
    }
    painter.restore();
}
