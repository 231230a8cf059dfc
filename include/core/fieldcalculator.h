#ifndef FIELDCALCULATOR_H
#define FIELDCALCULATOR_H

#include <QString>
#include <QVariant>
#include "core/featuretypes.h"

class VectorLayer;

struct FieldCalculation {
    QString expression;
    QString fieldName;
    bool createField{false};
    FieldType fieldType{FieldType::Double};
    int fieldLength{0};
    int fieldPrecision{0};
    FeatureIds targets;
};

/**
 * @brief FieldCalculator - writes the result of an expression into a field
 * for a set of features
 *
 * When the layer is not editable an edit session is opened for the run and
 * committed afterwards, or rolled back if anything fails.
 */
class FieldCalculator {
public:
    explicit FieldCalculator(VectorLayer* layer);

    bool run(const FieldCalculation& calculation);

    // Result for one feature without writing it; sets ok to false on errors
    QVariant preview(const QString& expression, FeatureId fid, bool* ok = nullptr, QString* error = nullptr) const;

    int updatedCount() const { return m_updated; }
    int skippedCount() const { return m_skipped; }
    QString lastError() const { return m_lastError; }

private:
    bool fail(const QString& message, bool rollBack);

    VectorLayer* m_layer;
    bool m_startedEditing{false};
    int m_updated{0};
    int m_skipped{0};
    QString m_lastError;
};

#endif // FIELDCALCULATOR_H
