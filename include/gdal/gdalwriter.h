#ifndef GDALWRITER_H
#define GDALWRITER_H

#include <QString>

class VectorLayer;

/**
 * @brief GdalWriter - Write vector layers back to GIS formats using GDAL/OGR
 */
class GdalWriter {
public:
    GdalWriter();
    ~GdalWriter();

    /**
     * @brief Replace the contents of an existing OGR layer with a layer's fields and features
     * @param layer Source layer
     * @param filePath Dataset path, opened in update mode
     * @param layerName OGR layer name (first layer when empty)
     * @return true if successful
     */
    bool writeLayer(const VectorLayer& layer, const QString& filePath, const QString& layerName);

    /**
     * @brief Export a layer to a new dataset
     * @param layer Source layer
     * @param filePath Output file path
     * @param driverName GDAL driver short name (e.g. "GeoJSON", "ESRI Shapefile", "GPKG")
     * @return true if successful
     */
    bool exportLayer(const VectorLayer& layer, const QString& filePath, const QString& driverName);

    /**
     * @brief Get last error message
     */
    QString lastError() const { return m_lastError; }

private:
    QString m_lastError;
};

#endif // GDALWRITER_H
