#include "gdal/gdalreader.h"
#include "core/vectorlayer.h"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <QColor>
#include <QDate>
#include <QDateTime>
#include <QFileInfo>
#include <QDebug>

// Color palette for layers
static const QColor s_layerColors[] = {
    QColor(255, 0, 0),      // Red
    QColor(0, 160, 0),      // Green
    QColor(0, 0, 255),      // Blue
    QColor(255, 0, 255),    // Magenta
    QColor(255, 128, 0),    // Orange
    QColor(128, 0, 255),    // Purple
    QColor(0, 128, 255),    // Light Blue
    QColor(255, 0, 128),    // Pink
};
static const int s_numColors = sizeof(s_layerColors) / sizeof(s_layerColors[0]);

namespace {

FieldType fieldTypeFromOgr(OGRFieldType type, OGRFieldSubType subType)
{
    switch (type) {
        case OFTInteger:
            return subType == OFSTBoolean ? FieldType::Boolean : FieldType::Integer;
        case OFTInteger64:
            return FieldType::Integer;
        case OFTReal:
            return FieldType::Double;
        case OFTDate:
            return FieldType::Date;
        case OFTDateTime:
            return FieldType::DateTime;
        default:
            return FieldType::String;
    }
}

GeometryType geometryTypeFromOgr(OGRwkbGeometryType type)
{
    switch (wkbFlatten(type)) {
        case wkbPoint:
        case wkbMultiPoint:
            return GeometryType::Point;
        case wkbLineString:
        case wkbMultiLineString:
            return GeometryType::Line;
        case wkbPolygon:
        case wkbMultiPolygon:
            return GeometryType::Polygon;
        default:
            return GeometryType::Unknown;
    }
}

QVector<QPointF> readCurve(const OGRSimpleCurve* curve)
{
    QVector<QPointF> points;
    if (!curve) return points;
    points.reserve(curve->getNumPoints());
    for (int j = 0; j < curve->getNumPoints(); ++j) {
        points.append(QPointF(curve->getX(j), curve->getY(j)));
    }
    return points;
}

GeometryPart readPolygon(const OGRPolygon* polygon)
{
    GeometryPart part;
    if (!polygon) return part;
    part.rings.append(readCurve(polygon->getExteriorRing()));
    for (int r = 0; r < polygon->getNumInteriorRings(); ++r) {
        part.rings.append(readCurve(polygon->getInteriorRing(r)));
    }
    return part;
}

QVariant readField(OGRFeature* feature, int index, FieldType type)
{
    if (!feature->IsFieldSetAndNotNull(index)) return QVariant();

    switch (type) {
        case FieldType::Integer:
            return QVariant(static_cast<qlonglong>(feature->GetFieldAsInteger64(index)));
        case FieldType::Double:
            return QVariant(feature->GetFieldAsDouble(index));
        case FieldType::Boolean:
            return QVariant(feature->GetFieldAsInteger(index) != 0);
        case FieldType::Date:
        case FieldType::DateTime: {
            int year = 0, month = 0, day = 0, hour = 0, minute = 0, tz = 0;
            float second = 0.0f;
            if (!feature->GetFieldAsDateTime(index, &year, &month, &day, &hour, &minute, &second, &tz)) {
                return QVariant();
            }
            if (type == FieldType::Date) return QVariant(QDate(year, month, day));
            return QVariant(QDateTime(QDate(year, month, day),
                                      QTime(hour, minute, static_cast<int>(second))));
        }
        case FieldType::String:
            break;
    }
    return QVariant(QString::fromUtf8(feature->GetFieldAsString(index)));
}

} // namespace

GdalReader::GdalReader() {}

GdalReader::~GdalReader() {}

void GdalReader::initialize()
{
    GDALAllRegister();
}

void GdalReader::cleanup()
{
    // GDAL cleanup is automatic in recent versions
}

bool GdalReader::readFile(const QString& fileName, QObject* owner)
{
    m_layers.clear();
    m_lastError.clear();

    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(fileName.toUtf8().constData(),
                   GDAL_OF_READONLY | GDAL_OF_VECTOR,
                   nullptr, nullptr, nullptr));

    if (!dataset) {
        m_lastError = QString("Failed to open file: %1").arg(CPLGetLastErrorMsg());
        return false;
    }

    const int layerCount = dataset->GetLayerCount();
    for (int i = 0; i < layerCount; ++i) {
        OGRLayer* layer = dataset->GetLayer(i);
        if (!layer) continue;
        VectorLayer* vl = readLayer(layer, fileName, owner);
        vl->setColor(getLayerColor(i));
        m_layers.append(vl);
    }

    GDALClose(dataset);

    if (m_layers.isEmpty()) {
        m_lastError = "No vector data found in file";
        return false;
    }

    qDebug() << "Loaded" << m_layers.size() << "vector layer(s) from" << fileName;
    return true;
}

VectorLayer* GdalReader::readLayer(OGRLayer* layer, const QString& fileName, QObject* owner)
{
    const QString layerName = QString::fromUtf8(layer->GetName());
    OGRFeatureDefn* defn = layer->GetLayerDefn();

    Fields fields;
    for (int f = 0; f < defn->GetFieldCount(); ++f) {
        OGRFieldDefn* fd = defn->GetFieldDefn(f);
        fields.append(Field(QString::fromUtf8(fd->GetNameRef()),
                            fieldTypeFromOgr(fd->GetType(), fd->GetSubType()),
                            fd->GetWidth(), fd->GetPrecision()));
    }

    VectorLayer* vl = new VectorLayer(layerName, geometryTypeFromOgr(layer->GetGeomType()), fields, owner);
    vl->setDataSource(fileName, layerName);

    GeometryType detected = vl->geometryType();

    layer->ResetReading();
    OGRFeature* feature;
    while ((feature = layer->GetNextFeature()) != nullptr) {
        Feature f;
        f.attributes.resize(fields.count());
        for (int i = 0; i < fields.count(); ++i) {
            f.attributes[i] = readField(feature, i, fields.at(i).type);
        }
        f.geometry = convertGeometry(feature->GetGeometryRef());
        if (detected == GeometryType::Unknown && !f.geometry.isNull()) {
            detected = f.geometry.type;
        }
        vl->appendFeature(f);
        OGRFeature::DestroyFeature(feature);
    }

    if (vl->geometryType() == GeometryType::Unknown && detected != GeometryType::Unknown) {
        // Layers declared as wkbUnknown take the type of their first geometry
        VectorLayer* typed = new VectorLayer(layerName, detected, fields, owner);
        typed->setDataSource(fileName, layerName);
        for (const Feature& f : vl->allFeatures()) typed->appendFeature(f);
        delete vl;
        vl = typed;
    }

    return vl;
}

FeatureGeometry GdalReader::convertGeometry(const OGRGeometry* geometry)
{
    FeatureGeometry g;
    if (!geometry) return g;

    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPoint: {
            const OGRPoint* point = geometry->toPoint();
            return FeatureGeometry::fromPoint(QPointF(point->getX(), point->getY()));
        }

        case wkbMultiPoint: {
            const OGRMultiPoint* multiPoint = geometry->toMultiPoint();
            g.type = GeometryType::Point;
            for (int j = 0; j < multiPoint->getNumGeometries(); ++j) {
                const OGRPoint* point = multiPoint->getGeometryRef(j);
                GeometryPart part;
                part.rings.append(QVector<QPointF>{QPointF(point->getX(), point->getY())});
                g.parts.append(part);
            }
            break;
        }

        case wkbLineString: {
            g.type = GeometryType::Line;
            GeometryPart part;
            part.rings.append(readCurve(geometry->toLineString()));
            g.parts.append(part);
            break;
        }

        case wkbMultiLineString: {
            const OGRMultiLineString* multiLine = geometry->toMultiLineString();
            g.type = GeometryType::Line;
            for (int k = 0; k < multiLine->getNumGeometries(); ++k) {
                GeometryPart part;
                part.rings.append(readCurve(multiLine->getGeometryRef(k)));
                g.parts.append(part);
            }
            break;
        }

        case wkbPolygon:
            g.type = GeometryType::Polygon;
            g.parts.append(readPolygon(geometry->toPolygon()));
            break;

        case wkbMultiPolygon: {
            const OGRMultiPolygon* multiPolygon = geometry->toMultiPolygon();
            g.type = GeometryType::Polygon;
            for (int k = 0; k < multiPolygon->getNumGeometries(); ++k) {
                g.parts.append(readPolygon(multiPolygon->getGeometryRef(k)));
            }
            break;
        }

        default:
            qDebug() << "Skipping unsupported geometry type" << geometry->getGeometryName();
            break;
    }
    return g;
}

QString GdalReader::fileFilter()
{
    return "All Supported Files (*.shp *.geojson *.json *.gpkg *.kml *.gpx *.tab *.mif *.csv);;"
           "Shapefile (*.shp);;"
           "GeoJSON (*.geojson *.json);;"
           "GeoPackage (*.gpkg);;"
           "KML (*.kml);;"
           "All Files (*)";
}

QColor GdalReader::getLayerColor(int index)
{
    return s_layerColors[index % s_numColors];
}
