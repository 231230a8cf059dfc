#ifndef GDALREADER_H
#define GDALREADER_H

#include <QString>
#include <QStringList>
#include <QColor>
#include <QVector>
#include "core/featuretypes.h"

// Forward declaration of GDAL types
class GDALDataset;
class OGRLayer;
class OGRGeometry;
class VectorLayer;
class QObject;

// GDAL Reader class
class GdalReader {
public:
    GdalReader();
    ~GdalReader();

    // Initialize GDAL (call once at startup)
    static void initialize();
    static void cleanup();

    // Read every vector layer of a file. Layers are parented to 'owner'.
    bool readFile(const QString& fileName, QObject* owner = nullptr);

    // Layers produced by the last successful read
    const QVector<VectorLayer*>& layers() const { return m_layers; }

    // Get supported formats
    static QString fileFilter();

    // Get last error message
    QString lastError() const { return m_lastError; }

    static FeatureGeometry convertGeometry(const OGRGeometry* geometry);

private:
    VectorLayer* readLayer(OGRLayer* layer, const QString& fileName, QObject* owner);
    QColor getLayerColor(int index);

    QVector<VectorLayer*> m_layers;
    QString m_lastError;
};

#endif // GDALREADER_H
