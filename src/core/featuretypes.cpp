#include "core/featuretypes.h"

#include <QDate>
#include <QDateTime>
#include <cmath>
#include <limits>

QString Field::typeName() const
{
    switch (type) {
        case FieldType::String:   return "String";
        case FieldType::Integer:  return "Integer";
        case FieldType::Double:   return "Real";
        case FieldType::Date:     return "Date";
        case FieldType::DateTime: return "DateTime";
        case FieldType::Boolean:  return "Boolean";
    }
    return "String";
}

QVariant Field::convert(const QVariant& value, bool* ok) const
{
    if (ok) *ok = true;
    if (!value.isValid() || value.isNull()) return QVariant();

    const QString text = value.toString().trimmed();
    if (text.isEmpty() && type != FieldType::String) return QVariant();

    bool converted = true;
    QVariant result;
    switch (type) {
        case FieldType::String:
            result = value.toString();
            if (length > 0 && result.toString().size() > length) {
                result = result.toString().left(length);
            }
            break;
        case FieldType::Integer: {
            qlonglong v = text.toLongLong(&converted);
            if (!converted) {
                double d = text.toDouble(&converted);
                if (converted) converted = doubleToInteger(d, &v);
            }
            if (converted) result = v;
            break;
        }
        case FieldType::Double: {
            double d = text.toDouble(&converted);
            if (converted) result = d;
            break;
        }
        case FieldType::Date: {
            QDate d = value.userType() == QMetaType::QDate ? value.toDate()
                                                            : QDate::fromString(text, Qt::ISODate);
            converted = d.isValid();
            if (converted) result = d;
            break;
        }
        case FieldType::DateTime: {
            QDateTime dt = value.userType() == QMetaType::QDateTime ? value.toDateTime()
                                                                    : QDateTime::fromString(text, Qt::ISODate);
            converted = dt.isValid();
            if (converted) result = dt;
            break;
        }
        case FieldType::Boolean: {
            const QString lower = text.toLower();
            if (lower == "true" || lower == "1" || lower == "yes" || lower == "t") {
                result = true;
            } else if (lower == "false" || lower == "0" || lower == "no" || lower == "f") {
                result = false;
            } else {
                converted = false;
            }
            break;
        }
    }

    if (ok) *ok = converted;
    return converted ? result : QVariant();
}

int Fields::indexFromName(const QString& name) const
{
    for (int i = 0; i < m_fields.size(); ++i) {
        if (m_fields[i].name.compare(name, Qt::CaseInsensitive) == 0) return i;
    }
    return -1;
}

QStringList Fields::names() const
{
    QStringList out;
    for (const auto& f : m_fields) out << f.name;
    return out;
}

bool FeatureGeometry::isNull() const
{
    if (type == GeometryType::Unknown) return true;
    return vertexCount() == 0;
}

QRectF FeatureGeometry::boundingBox() const
{
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    bool any = false;

    for (const auto& part : parts) {
        for (const auto& ring : part.rings) {
            for (const auto& p : ring) {
                minX = qMin(minX, p.x());
                minY = qMin(minY, p.y());
                maxX = qMax(maxX, p.x());
                maxY = qMax(maxY, p.y());
                any = true;
            }
        }
    }
    if (!any) return QRectF();
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

int FeatureGeometry::vertexCount() const
{
    int count = 0;
    for (const auto& part : parts) {
        for (const auto& ring : part.rings) count += ring.size();
    }
    return count;
}

FeatureGeometry FeatureGeometry::fromPoint(const QPointF& point)
{
    FeatureGeometry g;
    g.type = GeometryType::Point;
    GeometryPart part;
    part.rings.append(QVector<QPointF>{point});
    g.parts.append(part);
    return g;
}

FeatureGeometry FeatureGeometry::fromPolygon(const QVector<QPointF>& exterior)
{
    FeatureGeometry g;
    g.type = GeometryType::Polygon;
    GeometryPart part;
    QVector<QPointF> ring = exterior;
    if (!ring.isEmpty() && ring.first() != ring.last()) ring.append(ring.first());
    part.rings.append(ring);
    g.parts.append(part);
    return g;
}

QVariant Feature::attribute(int index) const
{
    if (index < 0 || index >= attributes.size()) return QVariant();
    return attributes.at(index);
}

QVariant Feature::attribute(const QString& name, const Fields& fields) const
{
    return attribute(fields.indexFromName(name));
}

bool Feature::setAttribute(int index, const QVariant& value)
{
    if (index < 0 || index >= attributes.size()) return false;
    attributes[index] = value;
    return true;
}

QString geometryTypeName(GeometryType type)
{
    switch (type) {
        case GeometryType::Point:   return "Point";
        case GeometryType::Line:    return "Line";
        case GeometryType::Polygon: return "Polygon";
        case GeometryType::Unknown: break;
    }
    return "Unknown";
}

QString displayString(const QVariant& value)
{
    if (!value.isValid() || value.isNull()) return QString();
    switch (value.userType()) {
        case QMetaType::Double:
            return QString::number(value.toDouble(), 'g', 15);
        case QMetaType::Bool:
            return value.toBool() ? "true" : "false";
        case QMetaType::QDate:
            return value.toDate().toString(Qt::ISODate);
        case QMetaType::QDateTime:
            return value.toDateTime().toString(Qt::ISODate);
        default:
            break;
    }
    return value.toString();
}

bool doubleToInteger(double value, qlonglong* out)
{
    // 2^63 is exact in a double, the largest qlonglong is not
    const double limit = 9223372036854775808.0;
    if (!std::isfinite(value) || value < -limit || value >= limit) return false;
    *out = static_cast<qlonglong>(value);
    return true;
}
