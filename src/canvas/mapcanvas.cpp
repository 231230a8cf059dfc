#include "canvas/mapcanvas.h"
#include "canvas/rubberband.h"
#include "core/vectorlayer.h"
#include "appsettings.h"

#include <QPainter>
#include <QPainterPath>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QTimer>
#include <QLineF>
#include <QtMath>
#include <QDebug>

namespace {

const double kPickTolerancePx = 6.0;
const int kDragThresholdPx = 4;

double distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const double dx = b.x() - a.x();
    const double dy = b.y() - a.y();
    const double len2 = dx * dx + dy * dy;
    if (len2 <= 0.0) return QLineF(p, a).length();
    double t = ((p.x() - a.x()) * dx + (p.y() - a.y()) * dy) / len2;
    t = qBound(0.0, t, 1.0);
    return QLineF(p, QPointF(a.x() + t * dx, a.y() + t * dy)).length();
}

bool geometryHit(const FeatureGeometry& g, const QPointF& p, double tolerance)
{
    for (const auto& part : g.parts) {
        if (part.rings.isEmpty()) continue;
        switch (g.type) {
            case GeometryType::Point:
                if (!part.rings.first().isEmpty() && QLineF(p, part.rings.first().first()).length() <= tolerance) {
                    return true;
                }
                break;
            case GeometryType::Line: {
                const auto& pts = part.rings.first();
                for (int i = 1; i < pts.size(); ++i) {
                    if (distanceToSegment(p, pts[i - 1], pts[i]) <= tolerance) return true;
                }
                break;
            }
            case GeometryType::Polygon: {
                if (!QPolygonF(part.rings.first()).containsPoint(p, Qt::OddEvenFill)) break;
                bool inHole = false;
                for (int r = 1; r < part.rings.size() && !inHole; ++r) {
                    inHole = QPolygonF(part.rings[r]).containsPoint(p, Qt::OddEvenFill);
                }
                if (!inHole) return true;
                break;
            }
            case GeometryType::Unknown:
                break;
        }
    }
    return false;
}

} // namespace

MapCanvas::MapCanvas(QWidget *parent) : QWidget(parent)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(400, 300);
    m_selectionColor = AppSettings::canvasSelectionColor();
    updateTransform();

    m_flashTimer = new QTimer(this);
    connect(m_flashTimer, &QTimer::timeout, this, &MapCanvas::onFlashTimeout);
}

MapCanvas::~MapCanvas()
{
    // Bands outlive the canvas in their owners; their QPointer clears itself
    m_rubberBands.clear();
}

void MapCanvas::addLayer(VectorLayer* layer)
{
    if (!layer || m_layers.contains(layer)) return;
    m_layers.append(layer);

    connect(layer, &VectorLayer::selectionChanged, this, [this]() { update(); });
    connect(layer, &VectorLayer::dataChanged, this, [this]() { update(); });
    connect(layer, &QObject::destroyed, this, [this, layer]() {
        m_layers.removeAll(layer);
        if (m_currentLayer == layer) m_currentLayer = nullptr;
        update();
        emit layersChanged();
    });

    if (!m_currentLayer) m_currentLayer = layer;
    if (m_layers.size() == 1) zoomToFullExtent();
    update();
    emit layersChanged();
}

void MapCanvas::removeLayer(VectorLayer* layer)
{
    if (!m_layers.removeAll(layer)) return;
    disconnect(layer, nullptr, this, nullptr);
    if (m_currentLayer == layer) {
        m_currentLayer = m_layers.isEmpty() ? nullptr : m_layers.first();
        emit currentLayerChanged(m_currentLayer);
    }
    update();
    emit layersChanged();
}

void MapCanvas::setCurrentLayer(VectorLayer* layer)
{
    if (layer && !m_layers.contains(layer)) return;
    if (m_currentLayer == layer) return;
    m_currentLayer = layer;
    emit currentLayerChanged(layer);
}

void MapCanvas::registerRubberBand(RubberBand* band)
{
    if (!m_rubberBands.contains(band)) m_rubberBands.append(band);
    update();
}

void MapCanvas::unregisterRubberBand(RubberBand* band)
{
    m_rubberBands.removeAll(band);
    update();
}

void MapCanvas::updateTransform()
{
    m_worldToScreen = QTransform();
    m_worldToScreen.translate(width() / 2.0, height() / 2.0);
    m_worldToScreen.scale(m_zoom, -m_zoom);
    m_worldToScreen.translate(m_offset.x(), m_offset.y());
    m_screenToWorld = m_worldToScreen.inverted();
}

QPointF MapCanvas::toMapCoordinates(const QPoint& screen) const
{
    return m_screenToWorld.map(QPointF(screen));
}

QPointF MapCanvas::toCanvasCoordinates(const QPointF& world) const
{
    return m_worldToScreen.map(world);
}

QRectF MapCanvas::extent() const
{
    const QPointF topLeft = m_screenToWorld.map(QPointF(0, 0));
    const QPointF bottomRight = m_screenToWorld.map(QPointF(width(), height()));
    return QRectF(topLeft, bottomRight).normalized();
}

void MapCanvas::setExtent(const QRectF& rect)
{
    const QRectF r = rect.normalized();

    // Single point: keep the scale, just center
    if (r.width() <= 0.0 && r.height() <= 0.0) {
        setCenter(r.center());
        return;
    }

    const double w = qMax(r.width(), 1e-9);
    const double h = qMax(r.height(), 1e-9);
    double zoom = qMin(width() / w, height() / h);
    m_zoom = qBound(1e-6, zoom, 1e9);
    m_offset = -r.center();
    updateTransform();
    update();
    emit extentsChanged();
}

void MapCanvas::setCenter(const QPointF& point)
{
    m_offset = -point;
    updateTransform();
    update();
    emit extentsChanged();
}

void MapCanvas::zoomIn()
{
    m_zoom = qBound(1e-6, m_zoom * 1.5, 1e9);
    updateTransform();
    update();
    emit extentsChanged();
}

void MapCanvas::zoomOut()
{
    m_zoom = qBound(1e-6, m_zoom / 1.5, 1e9);
    updateTransform();
    update();
    emit extentsChanged();
}

void MapCanvas::zoomToFullExtent()
{
    QRectF full;
    bool hasData = false;
    for (const VectorLayer* layer : m_layers) {
        if (layer->featureCount() == 0) continue;
        const QRectF e = layer->extent();
        if (!hasData) {
            full = e;
            hasData = true;
        } else {
            full.setLeft(qMin(full.left(), e.left()));
            full.setRight(qMax(full.right(), e.right()));
            full.setTop(qMin(full.top(), e.top()));
            full.setBottom(qMax(full.bottom(), e.bottom()));
        }
    }
    if (!hasData) return;
    const double mx = full.width() * 0.05;
    const double my = full.height() * 0.05;
    setExtent(full.adjusted(-mx, -my, mx, my));
}

void MapCanvas::zoomToSelected(VectorLayer* layer)
{
    if (!layer) layer = m_currentLayer;
    if (!layer) return;
    zoomToFeatureIds(layer, layer->selectedFeatureIds());
}

void MapCanvas::zoomToFeatureIds(VectorLayer* layer, const FeatureIds& ids)
{
    if (!layer || ids.isEmpty()) return;

    // QRectF::united() drops empty rects, so point bounds are merged by hand
    double minX = 0, maxX = 0, minY = 0, maxY = 0;
    bool hasBox = false;
    for (const Feature& f : layer->getFeatures(ids)) {
        if (f.geometry.isNull()) continue;
        const QRectF b = f.geometry.boundingBox();
        if (!hasBox) {
            minX = b.left(); maxX = b.right();
            minY = b.top(); maxY = b.bottom();
            hasBox = true;
        } else {
            minX = qMin(minX, b.left()); maxX = qMax(maxX, b.right());
            minY = qMin(minY, b.top()); maxY = qMax(maxY, b.bottom());
        }
    }
    if (!hasBox) return;

    const QRectF box(QPointF(minX, minY), QPointF(maxX, maxY));
    const double mx = box.width() * 0.05;
    const double my = box.height() * 0.05;
    setExtent(box.adjusted(-mx, -my, mx, my));
}

void MapCanvas::flashFeatureIds(VectorLayer* layer, const FeatureIds& ids, int flashes, int durationMs)
{
    if (!layer || ids.isEmpty()) return;

    m_flashGeometries.clear();
    for (const Feature& f : layer->getFeatures(ids)) {
        if (!f.geometry.isNull()) m_flashGeometries.append(f.geometry);
    }
    if (m_flashGeometries.isEmpty()) return;

    m_flashTicks = qMax(1, flashes) * 2;
    m_flashOn = true;
    m_flashTimer->start(qMax(10, durationMs));
    update();
}

bool MapCanvas::isFlashing() const
{
    return m_flashTimer->isActive();
}

void MapCanvas::onFlashTimeout()
{
    --m_flashTicks;
    m_flashOn = !m_flashOn;
    if (m_flashTicks <= 0) {
        m_flashTimer->stop();
        m_flashOn = false;
        m_flashGeometries.clear();
    }
    update();
}

void MapCanvas::refresh()
{
    update();
}

void MapCanvas::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    painter.fillRect(rect(), AppSettings::canvasBackgroundColor());

    for (const VectorLayer* layer : m_layers) {
        drawLayer(painter, layer);
    }

    // Overlays on top of the layers, in creation order
    for (const RubberBand* band : m_rubberBands) {
        band->paint(painter, m_worldToScreen);
    }

    if (m_flashOn) {
        const QColor flash(255, 0, 0);
        for (const auto& g : m_flashGeometries) {
            drawGeometry(painter, g, flash, QColor(255, 0, 0, 120), 3.0);
        }
    }

    if (m_isSelectingBox) {
        QPoint startScreen = m_worldToScreen.map(m_selectionBoxStart).toPoint();
        QPoint endScreen = m_worldToScreen.map(m_selectionBoxEnd).toPoint();
        QRect boxRect = QRect(startScreen, endScreen).normalized();
        painter.fillRect(boxRect, QColor(0, 120, 255, 60));
        QPen boxPen(QColor(0, 150, 255), 1);
        painter.setPen(boxPen);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(boxRect);
    }
}

void MapCanvas::drawLayer(QPainter& painter, const VectorLayer* layer)
{
    const QColor base = layer->color();
    QColor fill = base;
    fill.setAlpha(90);
    QColor selectedFill = m_selectionColor;
    selectedFill.setAlpha(110);

    const FeatureIds selected = layer->selectedFeatureIds();
    for (const Feature& f : layer->allFeatures()) {
        if (f.geometry.isNull()) continue;
        if (selected.contains(f.id)) {
            drawGeometry(painter, f.geometry, m_selectionColor, selectedFill, 2.0);
        } else {
            drawGeometry(painter, f.geometry, base.darker(130), fill, 1.0);
        }
    }
}

void MapCanvas::drawGeometry(QPainter& painter, const FeatureGeometry& geometry,
                             const QColor& color, const QColor& fill, double width)
{
    QPen pen(color, width);
    pen.setCosmetic(true);
    painter.setPen(pen);

    for (const auto& part : geometry.parts) {
        if (part.rings.isEmpty() || part.rings.first().isEmpty()) continue;
        switch (geometry.type) {
            case GeometryType::Point: {
                const QPointF p = m_worldToScreen.map(part.rings.first().first());
                painter.setBrush(fill);
                painter.drawEllipse(p, 3.0 + width, 3.0 + width);
                break;
            }
            case GeometryType::Line: {
                QPolygonF line;
                for (const auto& pt : part.rings.first()) line.append(m_worldToScreen.map(pt));
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
                    for (const auto& pt : ring) screenRing.append(m_worldToScreen.map(pt));
                    path.addPolygon(screenRing);
                    path.closeSubpath();
                }
                painter.setBrush(fill);
                painter.drawPath(path);
                break;
            }
            case GeometryType::Unknown:
                break;
        }
    }
}

void MapCanvas::wheelEvent(QWheelEvent *event)
{
    const double zoomFactor = 1.15;

    // Keep the world point under the cursor fixed
    QPointF cursorWorldBefore = toMapCoordinates(event->position().toPoint());

    double targetZoom = m_zoom;
    if (event->angleDelta().y() > 0) {
        targetZoom *= zoomFactor;
    } else {
        targetZoom /= zoomFactor;
    }
    m_zoom = qBound(1e-6, targetZoom, 1e9);
    updateTransform();

    QPointF cursorWorldAfter = toMapCoordinates(event->position().toPoint());
    m_offset += cursorWorldAfter - cursorWorldBefore;
    updateTransform();
    update();
    emit extentsChanged();
}

void MapCanvas::mousePressEvent(QMouseEvent *event)
{
    m_pressPos = event->pos();
    m_lastMousePos = event->pos();

    if (event->button() == Qt::MiddleButton) {
        m_isPanning = true;
        setCursor(Qt::ClosedHandCursor);
        return;
    }
    if (event->button() == Qt::LeftButton) {
        m_selectionBoxStart = toMapCoordinates(event->pos());
        m_selectionBoxEnd = m_selectionBoxStart;
    }
}

void MapCanvas::mouseMoveEvent(QMouseEvent *event)
{
    const QPointF worldPos = toMapCoordinates(event->pos());
    emit xyCoordinates(worldPos);

    if (m_isPanning) {
        QPointF delta = toMapCoordinates(event->pos()) - toMapCoordinates(m_lastMousePos);
        m_offset += delta;
        m_lastMousePos = event->pos();
        updateTransform();
        update();
        emit extentsChanged();
        return;
    }

    if ((event->buttons() & Qt::LeftButton)
        && (m_isSelectingBox || (event->pos() - m_pressPos).manhattanLength() > kDragThresholdPx)) {
        m_isSelectingBox = true;
        m_selectionBoxEnd = worldPos;
        update();
    }
}

void MapCanvas::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() == Qt::MiddleButton && m_isPanning) {
        m_isPanning = false;
        setCursor(Qt::ArrowCursor);
        return;
    }
    if (event->button() != Qt::LeftButton) return;

    VectorLayer::SelectBehavior behavior = VectorLayer::SetSelection;
    if (event->modifiers() & Qt::ShiftModifier) behavior = VectorLayer::AddToSelection;
    else if (event->modifiers() & Qt::ControlModifier) behavior = VectorLayer::RemoveFromSelection;

    if (m_isSelectingBox) {
        m_isSelectingBox = false;
        if (m_currentLayer) {
            m_currentLayer->selectByRect(QRectF(m_selectionBoxStart, m_selectionBoxEnd).normalized(), behavior);
        }
        update();
        return;
    }

    selectAt(event->pos(), event->modifiers());
}

void MapCanvas::selectAt(const QPoint& screen, Qt::KeyboardModifiers modifiers)
{
    if (!m_currentLayer) return;

    const QPointF p = toMapCoordinates(screen);
    const double tolerance = kPickTolerancePx / m_zoom;

    // Topmost feature is drawn last
    FeatureId hit = -1;
    const QVector<Feature> features = m_currentLayer->allFeatures();
    for (int i = features.size() - 1; i >= 0; --i) {
        if (geometryHit(features[i].geometry, p, tolerance)) {
            hit = features[i].id;
            break;
        }
    }

    if (hit < 0) {
        if (!(modifiers & (Qt::ShiftModifier | Qt::ControlModifier))) m_currentLayer->removeSelection();
        return;
    }

    VectorLayer::SelectBehavior behavior = VectorLayer::SetSelection;
    if (modifiers & Qt::ShiftModifier) behavior = VectorLayer::AddToSelection;
    else if (modifiers & Qt::ControlModifier) behavior = VectorLayer::RemoveFromSelection;
    m_currentLayer->selectByIds(FeatureIds{hit}, behavior);
}

void MapCanvas::resizeEvent(QResizeEvent *event)
{
    Q_UNUSED(event);
    updateTransform();
    emit extentsChanged();
}
