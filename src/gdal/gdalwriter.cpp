#include "gdal/gdalwriter.h"
#include "core/vectorlayer.h"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <QDate>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

namespace {

OGRFieldType ogrFieldType(FieldType type)
{
    switch (type) {
        case FieldType::Integer:  return OFTInteger64;
        case FieldType::Double:   return OFTReal;
        case FieldType::Date:     return OFTDate;
        case FieldType::DateTime: return OFTDateTime;
        case FieldType::Boolean:  return OFTInteger;
        case FieldType::String:   break;
    }
    return OFTString;
}

OGRwkbGeometryType ogrGeometryType(GeometryType type)
{
    switch (type) {
        case GeometryType::Point:   return wkbPoint;
        case GeometryType::Line:    return wkbLineString;
        case GeometryType::Polygon: return wkbPolygon;
        case GeometryType::Unknown: break;
    }
    return wkbUnknown;
}

OGRGeometry* buildGeometry(const FeatureGeometry& g)
{
    if (g.isNull()) return nullptr;

    switch (g.type) {
        case GeometryType::Point: {
            if (g.parts.size() == 1) {
                const QPointF p = g.parts.first().rings.value(0).value(0);
                return new OGRPoint(p.x(), p.y());
            }
            OGRMultiPoint* multi = new OGRMultiPoint();
            for (const auto& part : g.parts) {
                const QPointF p = part.rings.value(0).value(0);
                OGRPoint point(p.x(), p.y());
                multi->addGeometry(&point);
            }
            return multi;
        }
        case GeometryType::Line: {
            auto toLine = [](const QVector<QPointF>& pts) {
                OGRLineString* line = new OGRLineString();
                for (const auto& pt : pts) line->addPoint(pt.x(), pt.y());
                return line;
            };
            if (g.parts.size() == 1) return toLine(g.parts.first().rings.value(0));
            OGRMultiLineString* multi = new OGRMultiLineString();
            for (const auto& part : g.parts) {
                multi->addGeometryDirectly(toLine(part.rings.value(0)));
            }
            return multi;
        }
        case GeometryType::Polygon: {
            auto toPolygon = [](const GeometryPart& part) {
                OGRPolygon* polygon = new OGRPolygon();
                for (const auto& ring : part.rings) {
                    OGRLinearRing r;
                    for (const auto& pt : ring) r.addPoint(pt.x(), pt.y());
                    r.closeRings();
                    polygon->addRing(&r);
                }
                return polygon;
            };
            if (g.parts.size() == 1) return toPolygon(g.parts.first());
            OGRMultiPolygon* multi = new OGRMultiPolygon();
            for (const auto& part : g.parts) multi->addGeometryDirectly(toPolygon(part));
            return multi;
        }
        case GeometryType::Unknown:
            break;
    }
    return nullptr;
}

void setOgrField(OGRFeature* feature, int index, const Field& field, const QVariant& value)
{
    if (!value.isValid() || value.isNull()) {
        feature->SetFieldNull(index);
        return;
    }
    switch (field.type) {
        case FieldType::Integer:
            feature->SetField(index, static_cast<GIntBig>(value.toLongLong()));
            break;
        case FieldType::Double:
            feature->SetField(index, value.toDouble());
            break;
        case FieldType::Boolean:
            feature->SetField(index, value.toBool() ? 1 : 0);
            break;
        case FieldType::Date: {
            QDate d = value.toDate();
            feature->SetField(index, d.year(), d.month(), d.day());
            break;
        }
        case FieldType::DateTime: {
            QDateTime dt = value.toDateTime();
            feature->SetField(index, dt.date().year(), dt.date().month(), dt.date().day(),
                              dt.time().hour(), dt.time().minute(),
                              static_cast<float>(dt.time().second()));
            break;
        }
        case FieldType::String:
            feature->SetField(index, value.toString().toUtf8().constData());
            break;
    }
}

// Appends a field and returns the OGR index it got, -1 on failure.
// Drivers may launder the name, so the index is the only reliable handle.
int createOgrField(OGRLayer* ogrLayer, const Field& field, QString* error)
{
    OGRFieldDefn fieldDefn(field.name.toUtf8().constData(), ogrFieldType(field.type));
    if (field.type == FieldType::Boolean) fieldDefn.SetSubType(OFSTBoolean);
    if (field.length > 0) fieldDefn.SetWidth(field.length);
    if (field.precision > 0) fieldDefn.SetPrecision(field.precision);
    if (ogrLayer->CreateField(&fieldDefn) != OGRERR_NONE) {
        *error = QString("Failed to create field %1: %2").arg(field.name, CPLGetLastErrorMsg());
        return -1;
    }
    return ogrLayer->GetLayerDefn()->GetFieldCount() - 1;
}

// ogrIndexes maps layer field index to OGR field index
bool writeFeatures(OGRLayer* ogrLayer, const VectorLayer& layer, const QVector<int>& ogrIndexes, QString* error)
{
    const Fields& fields = layer.fields();
    OGRFeatureDefn* defn = ogrLayer->GetLayerDefn();
    for (const Feature& f : layer.allFeatures()) {
        OGRFeature* out = OGRFeature::CreateFeature(defn);
        for (int i = 0; i < fields.count(); ++i) {
            setOgrField(out, ogrIndexes.at(i), fields.at(i), f.attribute(i));
        }
        OGRGeometry* geometry = buildGeometry(f.geometry);
        if (geometry) out->SetGeometryDirectly(geometry);
        const OGRErr err = ogrLayer->CreateFeature(out);
        OGRFeature::DestroyFeature(out);
        if (err != OGRERR_NONE) {
            *error = QString("Failed to write feature %1: %2").arg(f.id).arg(CPLGetLastErrorMsg());
            return false;
        }
    }
    return true;
}

QString siblingPath(const QString& filePath, const QString& tag)
{
    const QFileInfo info(filePath);
    QString name = QString("%1_%2").arg(info.completeBaseName(), tag);
    if (!info.suffix().isEmpty()) name += "." + info.suffix();
    return info.dir().filePath(name);
}

// Replaces the layer's rows inside one transaction
bool rewriteInPlace(GDALDataset* dataset, OGRLayer* ogrLayer, const VectorLayer& layer, QString* error)
{
    if (dataset->StartTransaction() != OGRERR_NONE) {
        *error = QString("Failed to start transaction: %1").arg(CPLGetLastErrorMsg());
        return false;
    }

    bool ok = true;
    QVector<int> ogrIndexes;
    for (const Field& field : layer.fields()) {
        int index = ogrLayer->GetLayerDefn()->GetFieldIndex(field.name.toUtf8().constData());
        // Fields added during the edit session
        if (index < 0) index = createOgrField(ogrLayer, field, error);
        if (index < 0) {
            ok = false;
            break;
        }
        ogrIndexes.append(index);
    }

    if (ok) {
        QVector<GIntBig> existing;
        ogrLayer->ResetReading();
        OGRFeature* old;
        while ((old = ogrLayer->GetNextFeature()) != nullptr) {
            existing.append(old->GetFID());
            OGRFeature::DestroyFeature(old);
        }
        for (GIntBig fid : existing) {
            if (ogrLayer->DeleteFeature(fid) != OGRERR_NONE) {
                *error = QString("Failed to delete feature %1: %2").arg(fid).arg(CPLGetLastErrorMsg());
                ok = false;
                break;
            }
        }
    }

    if (ok) ok = writeFeatures(ogrLayer, layer, ogrIndexes, error);

    if (!ok) {
        dataset->RollbackTransaction();
        return false;
    }
    if (dataset->CommitTransaction() != OGRERR_NONE) {
        *error = QString("Failed to commit transaction: %1").arg(CPLGetLastErrorMsg());
        return false;
    }
    return true;
}

// Writes a complete copy next to the source, other layers copied as they are.
// The source is only replaced once the copy is complete. Closes source.
bool rewriteViaCopy(GDALDataset* source, OGRLayer* target, const VectorLayer& layer,
                    const QString& filePath, QString* error)
{
    GDALDriver* driver = source->GetDriver();
    const QString tempPath = siblingPath(filePath, "commit");
    const QString backupPath = siblingPath(filePath, "backup");

    GDALDataset* copy = driver->Create(tempPath.toUtf8().constData(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!copy) {
        *error = QString("Failed to create %1: %2").arg(tempPath, CPLGetLastErrorMsg());
        GDALClose(source);
        return false;
    }

    bool ok = true;
    for (int i = 0; ok && i < source->GetLayerCount(); ++i) {
        OGRLayer* sourceLayer = source->GetLayer(i);
        if (sourceLayer != target) {
            if (!copy->CopyLayer(sourceLayer, sourceLayer->GetName())) {
                *error = QString("Failed to copy layer %1: %2").arg(sourceLayer->GetName(), CPLGetLastErrorMsg());
                ok = false;
            }
            continue;
        }

        OGRLayer* out = copy->CreateLayer(target->GetName(), target->GetSpatialRef(),
                                          target->GetGeomType(), nullptr);
        if (!out) {
            *error = QString("Failed to create layer: %1").arg(CPLGetLastErrorMsg());
            ok = false;
            break;
        }
        QVector<int> ogrIndexes;
        for (const Field& field : layer.fields()) {
            const int index = createOgrField(out, field, error);
            if (index < 0) {
                ok = false;
                break;
            }
            ogrIndexes.append(index);
        }
        if (ok) ok = writeFeatures(out, layer, ogrIndexes, error);
    }

    GDALClose(copy);
    GDALClose(source);
    if (!ok) {
        driver->Delete(tempPath.toUtf8().constData());
        return false;
    }

    if (driver->Rename(backupPath.toUtf8().constData(), filePath.toUtf8().constData()) != CE_None) {
        *error = QString("Failed to move %1 aside: %2").arg(filePath, CPLGetLastErrorMsg());
        driver->Delete(tempPath.toUtf8().constData());
        return false;
    }
    if (driver->Rename(filePath.toUtf8().constData(), tempPath.toUtf8().constData()) != CE_None) {
        *error = QString("Failed to replace %1: %2").arg(filePath, CPLGetLastErrorMsg());
        driver->Rename(filePath.toUtf8().constData(), backupPath.toUtf8().constData());
        driver->Delete(tempPath.toUtf8().constData());
        return false;
    }
    if (driver->Delete(backupPath.toUtf8().constData()) != CE_None) {
        qWarning() << "Could not remove" << backupPath << CPLGetLastErrorMsg();
    }
    return true;
}

} // namespace

GdalWriter::GdalWriter() {}
GdalWriter::~GdalWriter() {}

bool GdalWriter::writeLayer(const VectorLayer& layer, const QString& filePath, const QString& layerName)
{
    m_lastError.clear();

    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(filePath.toUtf8().constData(), GDAL_OF_UPDATE | GDAL_OF_VECTOR,
                   nullptr, nullptr, nullptr));
    if (!dataset) {
        m_lastError = QString("Failed to open file for update: %1").arg(CPLGetLastErrorMsg());
        return false;
    }

    OGRLayer* ogrLayer = layerName.isEmpty() ? dataset->GetLayer(0)
                                             : dataset->GetLayerByName(layerName.toUtf8().constData());
    if (!ogrLayer) {
        m_lastError = QString("Layer '%1' not found in %2").arg(layerName, filePath);
        GDALClose(dataset);
        return false;
    }

    bool ok = false;
    if (dataset->TestCapability(ODsCTransactions)) {
        ok = rewriteInPlace(dataset, ogrLayer, layer, &m_lastError);
        GDALClose(dataset);
    } else {
        ok = rewriteViaCopy(dataset, ogrLayer, layer, filePath, &m_lastError);
    }

    if (ok) {
        qDebug() << "Wrote" << layer.featureCount() << "features to" << filePath;
    } else {
        qWarning() << m_lastError;
    }
    return ok;
}

bool GdalWriter::exportLayer(const VectorLayer& layer, const QString& filePath, const QString& driverName)
{
    m_lastError.clear();

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driverName.toUtf8().constData());
    if (!driver) {
        m_lastError = QString("%1 driver not available").arg(driverName);
        return false;
    }

    GDALDataset* dataset = driver->Create(filePath.toUtf8().constData(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        m_lastError = QString("Failed to create file: %1").arg(CPLGetLastErrorMsg());
        return false;
    }

    OGRLayer* ogrLayer = dataset->CreateLayer(layer.name().toUtf8().constData(), nullptr,
                                              ogrGeometryType(layer.geometryType()), nullptr);
    if (!ogrLayer) {
        m_lastError = QString("Failed to create layer: %1").arg(CPLGetLastErrorMsg());
        GDALClose(dataset);
        return false;
    }

    bool ok = true;
    QVector<int> ogrIndexes;
    for (const auto& field : layer.fields()) {
        const int index = createOgrField(ogrLayer, field, &m_lastError);
        if (index < 0) {
            ok = false;
            break;
        }
        ogrIndexes.append(index);
    }
    if (ok) ok = writeFeatures(ogrLayer, layer, ogrIndexes, &m_lastError);

    GDALClose(dataset);
    if (!ok) {
        qWarning() << m_lastError;
        driver->Delete(filePath.toUtf8().constData());
    }
    return ok;
}
