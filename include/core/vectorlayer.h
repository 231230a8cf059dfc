#ifndef VECTORLAYER_H
#define VECTORLAYER_H

#include <QObject>
#include <QString>
#include <QMap>
#include <QColor>
#include <QRectF>
#include "core/featuretypes.h"

/**
 * @brief VectorLayer - in-memory feature store with a host selection and an edit session
 *
 * Features are kept by id. Mutations are only accepted while the layer is in
 * edit mode; commitChanges() writes through to the data source when the layer
 * was loaded from a file.
 */
class VectorLayer : public QObject {
    Q_OBJECT
public:
    enum SelectBehavior {
        SetSelection,
        AddToSelection,
        RemoveFromSelection
    };

    explicit VectorLayer(const QString& name, GeometryType geometryType,
                         const Fields& fields = Fields(), QObject* parent = nullptr);

    QString id() const { return m_id; }
    QString name() const { return m_name; }
    GeometryType geometryType() const { return m_geometryType; }
    QColor color() const { return m_color; }
    void setColor(const QColor& color) { m_color = color; }

    // Data source (empty for memory layers)
    QString dataSourcePath() const { return m_sourcePath; }
    QString dataSourceLayerName() const { return m_sourceLayerName; }
    void setDataSource(const QString& path, const QString& layerName);

    const Fields& fields() const { return m_fields; }
    int featureCount() const { return m_features.size(); }
    QVector<FeatureId> featureIds() const;
    bool hasFeature(FeatureId fid) const { return m_features.contains(fid); }
    bool getFeature(FeatureId fid, Feature* feature) const;
    Feature getFeature(FeatureId fid) const;
    // Ordered by id; ids not present are skipped
    QVector<Feature> getFeatures(const FeatureIds& ids) const;
    QVector<Feature> allFeatures() const;
    QRectF extent() const;

    // Loading bypasses the edit buffer (used by readers and tests)
    FeatureId appendFeature(const Feature& feature);

    // Host selection
    void selectByIds(const FeatureIds& ids, SelectBehavior behavior = SetSelection);
    void selectByRect(const QRectF& rect, SelectBehavior behavior = SetSelection);
    void removeSelection();
    QRectF boundingBoxOfSelected() const;
    FeatureIds selectedFeatureIds() const { return m_selected; }
    int selectedFeatureCount() const { return m_selected.size(); }
    bool isSelected(FeatureId fid) const { return m_selected.contains(fid); }

    // Edit session
    bool isEditable() const { return m_editable; }
    bool isModified() const { return m_modified; }
    bool startEditing();
    bool commitChanges();
    bool rollBack();

    bool deleteFeatures(const FeatureIds& ids);
    bool changeAttributeValue(FeatureId fid, int fieldIndex, const QVariant& value);
    bool addFeatures(const QVector<Feature>& features, QVector<FeatureId>* newIds = nullptr);
    bool addAttribute(const Field& field);

    QString lastError() const { return m_lastError; }

signals:
    void selectionChanged(const FeatureIds& selected, const FeatureIds& deselected, bool clearAndSelect);
    void featuresDeleted(const FeatureIds& ids);
    void featureAdded(FeatureId fid);
    void attributeValueChanged(FeatureId fid, int fieldIndex, const QVariant& value);
    void attributeAdded(int fieldIndex);
    void editingStarted();
    void editingStopped();
    void beforeCommitChanges();
    void dataChanged();

private:
    bool requireEditable(const char* operation);
    void applySelection(const FeatureIds& newSelection, bool clearAndSelect);

    struct Snapshot {
        Fields fields;
        QMap<FeatureId, Feature> features;
        FeatureIds selected;
    };

    QString m_id;
    QString m_name;
    GeometryType m_geometryType;
    QColor m_color{200, 200, 200};
    QString m_sourcePath;
    QString m_sourceLayerName;

    Fields m_fields;
    QMap<FeatureId, Feature> m_features;
    FeatureIds m_selected;
    // Only grows, ids are not reused after a rollback
    FeatureId m_nextId{0};

    bool m_editable{false};
    bool m_modified{false};
    Snapshot m_snapshot;

    QString m_lastError;
};

#endif // VECTORLAYER_H
