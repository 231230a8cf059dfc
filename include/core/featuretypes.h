#ifndef FEATURETYPES_H
#define FEATURETYPES_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QVariant>
#include <QPointF>
#include <QRectF>
#include <QSet>

typedef qint64 FeatureId;
typedef QSet<FeatureId> FeatureIds;

enum class FieldType {
    String,
    Integer,
    Double,
    Date,
    DateTime,
    Boolean
};

struct Field {
    QString name;
    FieldType type{FieldType::String};
    int length{0};
    int precision{0};

    Field() = default;
    Field(const QString& n, FieldType t, int len = 0, int prec = 0)
        : name(n), type(t), length(len), precision(prec) {}

    QString typeName() const;
    bool isNumeric() const { return type == FieldType::Integer || type == FieldType::Double; }

    // Converts an arbitrary value (usually cell text) into this field's type.
    // Returns an invalid QVariant (NULL) when the value is empty or not convertible.
    QVariant convert(const QVariant& value, bool* ok = nullptr) const;
};

class Fields {
public:
    Fields() = default;

    void append(const Field& field) { m_fields.append(field); }
    int count() const { return m_fields.size(); }
    bool isEmpty() const { return m_fields.isEmpty(); }
    const Field& at(int index) const { return m_fields.at(index); }
    Field& operator[](int index) { return m_fields[index]; }

    int indexFromName(const QString& name) const;
    bool contains(const QString& name) const { return indexFromName(name) >= 0; }
    QStringList names() const;

    QVector<Field>::const_iterator begin() const { return m_fields.constBegin(); }
    QVector<Field>::const_iterator end() const { return m_fields.constEnd(); }

private:
    QVector<Field> m_fields;
};

enum class GeometryType {
    Unknown,
    Point,
    Line,
    Polygon
};

// Parts of a geometry. For points each part holds one ring with a single
// vertex, for lines one ring with the vertex list, for polygons the first
// ring is the exterior and the rest are holes.
struct GeometryPart {
    QVector<QVector<QPointF>> rings;
};

struct FeatureGeometry {
    GeometryType type{GeometryType::Unknown};
    QVector<GeometryPart> parts;

    bool isNull() const;
    QRectF boundingBox() const;
    int vertexCount() const;

    static FeatureGeometry fromPoint(const QPointF& point);
    static FeatureGeometry fromPolygon(const QVector<QPointF>& exterior);
};

struct Feature {
    FeatureId id{-1};
    QVector<QVariant> attributes;
    FeatureGeometry geometry;

    bool isValid() const { return id >= 0; }
    QVariant attribute(int index) const;
    QVariant attribute(const QString& name, const Fields& fields) const;
    bool setAttribute(int index, const QVariant& value);
};

QString geometryTypeName(GeometryType type);

// Display text for an attribute value, empty for NULL
QString displayString(const QVariant& value);

// Truncates toward zero; false for NaN, infinities and values outside the qlonglong range
bool doubleToInteger(double value, qlonglong* out);

#endif // FEATURETYPES_H
