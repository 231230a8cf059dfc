#ifndef FILTERBUILDER_H
#define FILTERBUILDER_H

#include <QHash>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>
#include "core/featuretypes.h"

class VectorLayer;

/**
 * @brief FilterBuilder - turns a field, an operator and picked values into
 * one expression condition
 */
namespace FilterBuilder {

struct OperatorInfo {
    QString symbol;  // "=", "NOT LIKE", "IS NULL", ...
    QString label;   // text shown in the operator combo
};

// Operators in combo order
const QVector<OperatorInfo>& operators();
QStringList operatorLabels();

// Maps a combo label (or a bare symbol) back to its operator symbol.
// Longer operators win, so "NOT LIKE" is never read as "LIKE".
QString operatorFromLabel(const QString& label);

bool isNullOperator(const QString& op);
bool isNumericLiteral(const QString& value);

// Value as it appears in an expression: numbers bare, text single-quoted
QString literal(const QString& value);

/**
 * @brief Build a single condition
 * @return Condition text, or an empty string when the operator needs a
 *         value and none was given
 */
QString buildCondition(const QString& field, const QString& op, const QStringList& values);

/**
 * @brief Evaluate an expression over a subset of a layer's features
 * @param error Receives the parser error, cleared on success
 * @return Ids of the features the expression is true for
 */
FeatureIds matchingFeatures(const VectorLayer& layer, const FeatureIds& ids,
                            const QString& expression, QString* error = nullptr);

} // namespace FilterBuilder

// Ordered conditions joined by AND/OR
class FilterConditionList {
public:
    struct Entry {
        QString logic;      // "AND", "OR" or empty
        QString condition;
    };

    void add(const QString& logic, const QString& condition);
    void removeAt(QList<int> rows);
    void clear() { m_entries.clear(); }

    int count() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    const Entry& at(int i) const { return m_entries.at(i); }

    // One line per condition, logic prefix from the second entry on
    QStringList displayLines() const;
    QString expression() const;

private:
    QVector<Entry> m_entries;
};

// Distinct values per field over a subset of features
class ValueCache {
public:
    struct ValueCount {
        QString value;
        int count;
    };

    void build(const VectorLayer& layer, const FeatureIds& ids);
    void clear() { m_values.clear(); }

    bool hasField(const QString& field) const { return m_values.contains(field); }

    // Sorted values, optionally restricted to those containing filter (case-insensitive)
    QVector<ValueCount> values(const QString& field, const QString& filter = QString()) const;
    int distinctCount(const QString& field) const;
    // Non-NULL occurrences of the field in the subset
    int totalCount(const QString& field) const;

private:
    QHash<QString, QMap<QString, int>> m_values;
};

#endif // FILTERBUILDER_H
