#ifndef GEOSBRIDGE_H
#define GEOSBRIDGE_H

#include <QString>
#include <QPointF>

struct FeatureGeometry;

/**
 * @brief GeosBridge - GEOS utility functions for feature geometries
 *
 * Provides measurements used by the map tools and the expression engine
 * through the GEOS C API.
 */
namespace GeosBridge {

/**
 * @brief Initialize GEOS context (call once at startup)
 */
void initialize();

/**
 * @brief Cleanup GEOS context (call at shutdown)
 */
void cleanup();

/**
 * @brief Get last error message
 */
QString lastError();

/**
 * @brief Calculate the centroid (center of mass) of a geometry
 * @param geometry Any point, line or polygon geometry
 * @param ok Set to false when the geometry is empty or GEOS fails
 * @return Centroid point
 */
QPointF centroid(const FeatureGeometry& geometry, bool* ok = nullptr);

/**
 * @brief Planar area of a polygon geometry (0 for points and lines)
 */
double area(const FeatureGeometry& geometry);

/**
 * @brief Length of a line geometry (0 for points and polygons)
 */
double length(const FeatureGeometry& geometry);

/**
 * @brief Perimeter of a polygon geometry, rings included (0 for points and lines)
 */
double perimeter(const FeatureGeometry& geometry);

} // namespace GeosBridge

#endif // GEOSBRIDGE_H
