#include "core/vectorlayer.h"
#include "gdal/gdalwriter.h"
#include <QUuid>
#include <QDebug>
#include <algorithm>

VectorLayer::VectorLayer(const QString& name, GeometryType geometryType,
                         const Fields& fields, QObject* parent)
    : QObject(parent)
    , m_id(QString("%1_%2").arg(name, QUuid::createUuid().toString(QUuid::WithoutBraces)))
    , m_name(name)
    , m_geometryType(geometryType)
    , m_fields(fields)
{
}

void VectorLayer::setDataSource(const QString& path, const QString& layerName)
{
    m_sourcePath = path;
    m_sourceLayerName = layerName;
}

QVector<FeatureId> VectorLayer::featureIds() const
{
    QVector<FeatureId> ids;
    ids.reserve(m_features.size());
    for (auto it = m_features.constBegin(); it != m_features.constEnd(); ++it) {
        ids.append(it.key());
    }
    return ids;
}

bool VectorLayer::getFeature(FeatureId fid, Feature* feature) const
{
    auto it = m_features.constFind(fid);
    if (it == m_features.constEnd()) return false;
    if (feature) *feature = it.value();
    return true;
}

Feature VectorLayer::getFeature(FeatureId fid) const
{
    return m_features.value(fid, Feature());
}

QVector<Feature> VectorLayer::getFeatures(const FeatureIds& ids) const
{
    QVector<FeatureId> sorted;
    sorted.reserve(ids.size());
    for (FeatureId fid : ids) sorted.append(fid);
    std::sort(sorted.begin(), sorted.end());

    QVector<Feature> out;
    out.reserve(sorted.size());
    for (FeatureId fid : sorted) {
        auto it = m_features.constFind(fid);
        if (it != m_features.constEnd()) out.append(it.value());
    }
    return out;
}

QVector<Feature> VectorLayer::allFeatures() const
{
    QVector<Feature> out;
    out.reserve(m_features.size());
    for (auto it = m_features.constBegin(); it != m_features.constEnd(); ++it) {
        out.append(it.value());
    }
    return out;
}

QRectF VectorLayer::extent() const
{
    // QRectF::united() ignores zero-size boxes, which points have
    QRectF result;
    bool any = false;
    for (auto it = m_features.constBegin(); it != m_features.constEnd(); ++it) {
        if (it.value().geometry.isNull()) continue;
        const QRectF box = it.value().geometry.boundingBox();
        if (!any) {
            result = box;
            any = true;
            continue;
        }
        result.setLeft(qMin(result.left(), box.left()));
        result.setRight(qMax(result.right(), box.right()));
        result.setTop(qMin(result.top(), box.top()));
        result.setBottom(qMax(result.bottom(), box.bottom()));
    }
    return result;
}

FeatureId VectorLayer::appendFeature(const Feature& feature)
{
    Feature f = feature;
    f.id = m_nextId++;
    f.attributes.resize(m_fields.count());
    m_features.insert(f.id, f);
    return f.id;
}

void VectorLayer::applySelection(const FeatureIds& newSelection, bool clearAndSelect)
{
    if (newSelection == m_selected) return;

    FeatureIds selected = newSelection - m_selected;
    FeatureIds deselected = m_selected - newSelection;
    m_selected = newSelection;
    emit selectionChanged(selected, deselected, clearAndSelect);
}

void VectorLayer::selectByIds(const FeatureIds& ids, SelectBehavior behavior)
{
    FeatureIds valid;
    for (FeatureId fid : ids) {
        if (m_features.contains(fid)) valid.insert(fid);
    }

    switch (behavior) {
        case SetSelection:
            applySelection(valid, true);
            break;
        case AddToSelection:
            applySelection(m_selected + valid, false);
            break;
        case RemoveFromSelection:
            applySelection(m_selected - valid, false);
            break;
    }
}

void VectorLayer::selectByRect(const QRectF& rect, SelectBehavior behavior)
{
    const QRectF r = rect.normalized();
    FeatureIds hits;
    for (auto it = m_features.constBegin(); it != m_features.constEnd(); ++it) {
        const FeatureGeometry& g = it.value().geometry;
        if (g.isNull()) continue;
        QRectF box = g.boundingBox();
        // Points have an empty box, test containment instead
        if (box.width() == 0.0 && box.height() == 0.0) {
            if (r.contains(box.topLeft())) hits.insert(it.key());
        } else if (r.intersects(box)) {
            hits.insert(it.key());
        }
    }
    selectByIds(hits, behavior);
}

void VectorLayer::removeSelection()
{
    applySelection(FeatureIds(), true);
}

QRectF VectorLayer::boundingBoxOfSelected() const
{
    QRectF result;
    bool any = false;
    for (FeatureId fid : m_selected) {
        auto it = m_features.constFind(fid);
        if (it == m_features.constEnd() || it.value().geometry.isNull()) continue;
        const QRectF box = it.value().geometry.boundingBox();
        if (!any) {
            result = box;
            any = true;
            continue;
        }
        result.setLeft(qMin(result.left(), box.left()));
        result.setRight(qMax(result.right(), box.right()));
        result.setTop(qMin(result.top(), box.top()));
        result.setBottom(qMax(result.bottom(), box.bottom()));
    }
    return result;
}

bool VectorLayer::startEditing()
{
    m_lastError.clear();
    if (m_editable) return false;

    m_snapshot.fields = m_fields;
    m_snapshot.features = m_features;
    m_snapshot.selected = m_selected;
    m_editable = true;
    m_modified = false;
    emit editingStarted();
    return true;
}

bool VectorLayer::commitChanges()
{
    m_lastError.clear();
    if (!m_editable) {
        m_lastError = "Layer is not in edit mode";
        return false;
    }

    emit beforeCommitChanges();

    if (m_modified && !m_sourcePath.isEmpty()) {
        GdalWriter writer;
        if (!writer.writeLayer(*this, m_sourcePath, m_sourceLayerName)) {
            m_lastError = QString("Could not commit changes to %1: %2").arg(m_sourcePath, writer.lastError());
            qWarning() << m_lastError;
            return false;
        }
    }

    m_editable = false;
    m_modified = false;
    m_snapshot = Snapshot();
    emit editingStopped();
    return true;
}

bool VectorLayer::rollBack()
{
    m_lastError.clear();
    if (!m_editable) {
        m_lastError = "Layer is not in edit mode";
        return false;
    }

    const bool wasModified = m_modified;
    m_fields = m_snapshot.fields;
    m_features = m_snapshot.features;
    FeatureIds restoredSelection;
    for (FeatureId fid : m_snapshot.selected) {
        if (m_features.contains(fid)) restoredSelection.insert(fid);
    }
    m_snapshot = Snapshot();
    m_editable = false;
    m_modified = false;

    applySelection(restoredSelection, true);
    if (wasModified) emit dataChanged();
    emit editingStopped();
    return true;
}

bool VectorLayer::requireEditable(const char* operation)
{
    m_lastError.clear();
    if (m_editable) return true;
    m_lastError = QString("Cannot %1: layer '%2' is not in edit mode").arg(QString::fromLatin1(operation), m_name);
    qWarning() << m_lastError;
    return false;
}

bool VectorLayer::deleteFeatures(const FeatureIds& ids)
{
    if (!requireEditable("delete features")) return false;

    FeatureIds removed;
    for (FeatureId fid : ids) {
        if (m_features.remove(fid) > 0) removed.insert(fid);
    }
    if (removed.isEmpty()) {
        m_lastError = "None of the requested features exist";
        return false;
    }

    m_modified = true;
    applySelection(m_selected - removed, false);
    emit featuresDeleted(removed);
    emit dataChanged();
    return true;
}

bool VectorLayer::changeAttributeValue(FeatureId fid, int fieldIndex, const QVariant& value)
{
    if (!requireEditable("change attribute")) return false;

    auto it = m_features.find(fid);
    if (it == m_features.end()) {
        m_lastError = QString("Feature %1 not found").arg(fid);
        return false;
    }
    if (fieldIndex < 0 || fieldIndex >= m_fields.count()) {
        m_lastError = QString("Field index %1 out of range").arg(fieldIndex);
        return false;
    }

    bool ok = true;
    QVariant converted = m_fields.at(fieldIndex).convert(value, &ok);
    if (!ok) {
        m_lastError = QString("Value '%1' is not a valid %2")
                          .arg(value.toString(), m_fields.at(fieldIndex).typeName());
        return false;
    }

    it.value().setAttribute(fieldIndex, converted);
    m_modified = true;
    emit attributeValueChanged(fid, fieldIndex, converted);
    return true;
}

bool VectorLayer::addFeatures(const QVector<Feature>& features, QVector<FeatureId>* newIds)
{
    if (!requireEditable("add features")) return false;

    for (const auto& source : features) {
        Feature f;
        f.geometry = source.geometry;
        f.attributes.resize(m_fields.count());
        for (int i = 0; i < m_fields.count() && i < source.attributes.size(); ++i) {
            f.attributes[i] = source.attributes.at(i);
        }
        f.id = m_nextId++;
        m_features.insert(f.id, f);
        if (newIds) newIds->append(f.id);
        emit featureAdded(f.id);
    }

    if (!features.isEmpty()) {
        m_modified = true;
        emit dataChanged();
    }
    return true;
}

bool VectorLayer::addAttribute(const Field& field)
{
    if (!requireEditable("add field")) return false;

    Field f = field;
    f.name = field.name.trimmed();
    if (f.name.isEmpty()) {
        m_lastError = "Field name is empty";
        return false;
    }
    if (m_fields.contains(f.name)) {
        m_lastError = QString("Field '%1' already exists").arg(f.name);
        return false;
    }

    m_fields.append(f);
    for (auto it = m_features.begin(); it != m_features.end(); ++it) {
        it.value().attributes.append(QVariant());
    }
    m_modified = true;
    emit attributeAdded(m_fields.count() - 1);
    return true;
}
