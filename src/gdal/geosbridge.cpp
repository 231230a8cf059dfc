#include "gdal/geosbridge.h"
#include "core/featuretypes.h"

#include <geos_c.h>
#include <cpl_error.h>
#include <QDebug>
#include <QVector>

// Static GEOS context
static GEOSContextHandle_t s_geosContext = nullptr;
static QString s_lastError;

// Error handlers
static void geosErrorHandler(const char* message, void* /*userdata*/) {
    s_lastError = QString::fromUtf8(message);
    qDebug() << "GEOS Bridge Error:" << message;
}

static void geosNoticeHandler(const char* /*message*/, void* /*userdata*/) {
    // Ignore notices
}

namespace GeosBridge {

void initialize()
{
    if (!s_geosContext) {
        s_geosContext = GEOS_init_r();
        if (s_geosContext) {
            GEOSContext_setErrorMessageHandler_r(s_geosContext, geosErrorHandler, nullptr);
            GEOSContext_setNoticeMessageHandler_r(s_geosContext, geosNoticeHandler, nullptr);
        }
    }
}

void cleanup()
{
    if (s_geosContext) {
        GEOS_finish_r(s_geosContext);
        s_geosContext = nullptr;
    }
}

// Helper class for RAII CPL Error Handling scope
class ScopedCPLHandler {
public:
    ScopedCPLHandler() {
        initialize();
        CPLPushErrorHandler(CPLQuietErrorHandler);
    }
    ~ScopedCPLHandler() {
        CPLPopErrorHandler();
    }
};

QString lastError()
{
    return s_lastError;
}

// Helper: create a GEOS coordinate sequence from points
static GEOSCoordSequence* createCoordSeq(const QVector<QPointF>& points, bool closeRing)
{
    int n = points.size();
    bool needsClose = closeRing && n > 0 && points.first() != points.last();
    int size = needsClose ? n + 1 : n;

    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(s_geosContext, size, 2);
    if (!seq) return nullptr;

    for (int i = 0; i < n; ++i) {
        GEOSCoordSeq_setX_r(s_geosContext, seq, i, points[i].x());
        GEOSCoordSeq_setY_r(s_geosContext, seq, i, points[i].y());
    }
    if (needsClose) {
        GEOSCoordSeq_setX_r(s_geosContext, seq, n, points[0].x());
        GEOSCoordSeq_setY_r(s_geosContext, seq, n, points[0].y());
    }
    return seq;
}

static GEOSGeometry* createPart(GeometryType type, const GeometryPart& part)
{
    if (part.rings.isEmpty() || part.rings.first().isEmpty()) return nullptr;

    switch (type) {
        case GeometryType::Point: {
            GEOSCoordSequence* seq = createCoordSeq(QVector<QPointF>{part.rings.first().first()}, false);
            return seq ? GEOSGeom_createPoint_r(s_geosContext, seq) : nullptr;
        }
        case GeometryType::Line: {
            if (part.rings.first().size() < 2) return nullptr;
            GEOSCoordSequence* seq = createCoordSeq(part.rings.first(), false);
            return seq ? GEOSGeom_createLineString_r(s_geosContext, seq) : nullptr;
        }
        case GeometryType::Polygon: {
            if (part.rings.first().size() < 3) return nullptr;
            GEOSCoordSequence* shellSeq = createCoordSeq(part.rings.first(), true);
            GEOSGeometry* shell = shellSeq ? GEOSGeom_createLinearRing_r(s_geosContext, shellSeq) : nullptr;
            if (!shell) return nullptr;

            QVector<GEOSGeometry*> holes;
            for (int r = 1; r < part.rings.size(); ++r) {
                if (part.rings[r].size() < 3) continue;
                GEOSCoordSequence* holeSeq = createCoordSeq(part.rings[r], true);
                GEOSGeometry* hole = holeSeq ? GEOSGeom_createLinearRing_r(s_geosContext, holeSeq) : nullptr;
                if (hole) holes.append(hole);
            }
            return GEOSGeom_createPolygon_r(s_geosContext, shell,
                                            holes.isEmpty() ? nullptr : holes.data(),
                                            static_cast<unsigned int>(holes.size()));
        }
        case GeometryType::Unknown:
            break;
    }
    return nullptr;
}

// Helper: build a (multi) GEOS geometry, caller owns the result
static GEOSGeometry* createGeometry(const FeatureGeometry& geometry)
{
    QVector<GEOSGeometry*> parts;
    for (const auto& part : geometry.parts) {
        GEOSGeometry* g = createPart(geometry.type, part);
        if (g) parts.append(g);
    }
    if (parts.isEmpty()) return nullptr;
    if (parts.size() == 1) return parts.first();

    int collectionType = GEOS_GEOMETRYCOLLECTION;
    switch (geometry.type) {
        case GeometryType::Point:   collectionType = GEOS_MULTIPOINT; break;
        case GeometryType::Line:    collectionType = GEOS_MULTILINESTRING; break;
        case GeometryType::Polygon: collectionType = GEOS_MULTIPOLYGON; break;
        case GeometryType::Unknown: break;
    }
    return GEOSGeom_createCollection_r(s_geosContext, collectionType, parts.data(),
                                       static_cast<unsigned int>(parts.size()));
}

QPointF centroid(const FeatureGeometry& geometry, bool* ok)
{
    ScopedCPLHandler handler;
    s_lastError.clear();
    if (ok) *ok = false;

    GEOSGeometry* g = createGeometry(geometry);
    if (!g) {
        s_lastError = "Failed to create geometry for centroid";
        return QPointF(0, 0);
    }

    GEOSGeometry* c = GEOSGetCentroid_r(s_geosContext, g);
    GEOSGeom_destroy_r(s_geosContext, g);

    if (!c) {
        s_lastError = "Centroid calculation failed";
        return QPointF(0, 0);
    }

    double x = 0.0, y = 0.0;
    const bool valid = GEOSGeomGetX_r(s_geosContext, c, &x) == 1
                    && GEOSGeomGetY_r(s_geosContext, c, &y) == 1;
    GEOSGeom_destroy_r(s_geosContext, c);

    if (!valid) {
        s_lastError = "Centroid of empty geometry";
        return QPointF(0, 0);
    }
    if (ok) *ok = true;
    return QPointF(x, y);
}

double area(const FeatureGeometry& geometry)
{
    if (geometry.type != GeometryType::Polygon) return 0.0;

    ScopedCPLHandler handler;
    s_lastError.clear();

    GEOSGeometry* g = createGeometry(geometry);
    if (!g) return 0.0;

    double result = 0.0;
    if (GEOSArea_r(s_geosContext, g, &result) != 1) result = 0.0;
    GEOSGeom_destroy_r(s_geosContext, g);
    return result;
}

double length(const FeatureGeometry& geometry)
{
    if (geometry.type != GeometryType::Line) return 0.0;

    ScopedCPLHandler handler;
    s_lastError.clear();

    GEOSGeometry* g = createGeometry(geometry);
    if (!g) return 0.0;

    double result = 0.0;
    if (GEOSLength_r(s_geosContext, g, &result) != 1) result = 0.0;
    GEOSGeom_destroy_r(s_geosContext, g);
    return result;
}

double perimeter(const FeatureGeometry& geometry)
{
    if (geometry.type != GeometryType::Polygon) return 0.0;

    ScopedCPLHandler handler;
    s_lastError.clear();

    GEOSGeometry* g = createGeometry(geometry);
    if (!g) return 0.0;

    // GEOSLength of a polygon is the length of all its rings
    double result = 0.0;
    if (GEOSLength_r(s_geosContext, g, &result) != 1) result = 0.0;
    GEOSGeom_destroy_r(s_geosContext, g);
    return result;
}

} // namespace GeosBridge
