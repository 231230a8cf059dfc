#include "core/filterbuilder.h"
#include "core/featureexpression.h"
#include "core/vectorlayer.h"

#include <algorithm>
#include <functional>

namespace FilterBuilder {

const QVector<OperatorInfo>& operators()
{
    static const QVector<OperatorInfo> ops = {
        {"=",           "= (equals)"},
        {"!=",          "!= (not equals)"},
        {">",           "> (greater)"},
        {"<",           "< (less)"},
        {">=",          ">= (greater/equal)"},
        {"<=",          "<= (less/equal)"},
        {"LIKE",        "LIKE (contains)"},
        {"NOT LIKE",    "NOT LIKE"},
        {"IN",          "IN (any of)"},
        {"NOT IN",      "NOT IN"},
        {"IS NULL",     "IS NULL"},
        {"IS NOT NULL", "IS NOT NULL"},
        {"BETWEEN",     "BETWEEN"}
    };
    return ops;
}

QStringList operatorLabels()
{
    QStringList labels;
    for (const auto& op : operators()) labels << op.label;
    return labels;
}

QString operatorFromLabel(const QString& label)
{
    // Checked longest first: "IS NOT NULL" before "IS NULL", ">=" before ">"
    static const QStringList bySpecificity = {
        "IS NOT NULL", "IS NULL", "NOT LIKE", "LIKE", "NOT IN", "BETWEEN", "IN",
        "!=", ">=", "<=", ">", "<", "="
    };
    const QString text = label.trimmed();
    for (const QString& symbol : bySpecificity) {
        if (text.startsWith(symbol, Qt::CaseInsensitive)) return symbol;
    }
    for (const QString& symbol : bySpecificity) {
        if (text.contains(symbol, Qt::CaseInsensitive)) return symbol;
    }
    return "=";
}

bool isNullOperator(const QString& op)
{
    return op == "IS NULL" || op == "IS NOT NULL";
}

bool isNumericLiteral(const QString& value)
{
    const QString text = value.trimmed();
    if (text.isEmpty()) return false;
    bool ok = false;
    text.toDouble(&ok);
    return ok;
}

QString literal(const QString& value)
{
    if (isNumericLiteral(value)) return value.trimmed();
    QString escaped = value;
    escaped.replace("'", "''");
    return QString("'%1'").arg(escaped);
}

QString buildCondition(const QString& field, const QString& op, const QStringList& values)
{
    const QString column = FeatureExpression::quotedColumnRef(field);

    if (isNullOperator(op)) {
        return QString("%1 %2").arg(column, op);
    }

    QStringList picked;
    for (const QString& v : values) {
        if (!v.isEmpty()) picked << v;
    }
    if (picked.isEmpty()) return QString();

    if (op == "BETWEEN") {
        if (picked.size() >= 2) {
            return QString("%1 BETWEEN %2 AND %3").arg(column, literal(picked.at(0)), literal(picked.at(1)));
        }
        // Typed as "low AND high"
        if (picked.first().contains(" AND ", Qt::CaseInsensitive)) {
            return QString("%1 BETWEEN %2").arg(column, picked.first().trimmed());
        }
        return QString();
    }

    if (op == "IN" || op == "NOT IN" || picked.size() > 1) {
        QStringList quoted;
        for (const QString& v : picked) quoted << literal(v);
        const QString listOp = op == "NOT IN" ? QString("NOT IN") : QString("IN");
        return QString("%1 %2 (%3)").arg(column, listOp, quoted.join(", "));
    }

    const QString value = picked.first();
    if (op == "LIKE" || op == "NOT LIKE") {
        QString escaped = value;
        escaped.replace("'", "''");
        return QString("%1 %2 '%%3%'").arg(column, op, escaped);
    }
    return QString("%1 %2 %3").arg(column, op, literal(value));
}

FeatureIds matchingFeatures(const VectorLayer& layer, const FeatureIds& ids,
                            const QString& expression, QString* error)
{
    FeatureIds matches;
    FeatureExpression expr(expression);
    if (expr.hasParserError()) {
        if (error) *error = expr.parserErrorString();
        return matches;
    }

    const QVector<Feature> features = layer.getFeatures(ids);
    for (const Feature& feature : features) {
        const QVariant result = expr.evaluate(ExpressionContext(layer.fields(), feature));
        // Features the expression cannot evaluate simply do not match
        if (expr.hasEvalError()) continue;
        if (FeatureExpression::isTruthy(result)) matches.insert(feature.id);
    }
    if (error) error->clear();
    return matches;
}

} // namespace FilterBuilder

void FilterConditionList::add(const QString& logic, const QString& condition)
{
    if (condition.trimmed().isEmpty()) return;
    m_entries.append({logic.trimmed().toUpper(), condition});
}

void FilterConditionList::removeAt(QList<int> rows)
{
    std::sort(rows.begin(), rows.end(), std::greater<int>());
    int previous = -1;
    for (int row : rows) {
        if (row == previous) continue;
        previous = row;
        if (row >= 0 && row < m_entries.size()) m_entries.removeAt(row);
    }
}

QStringList FilterConditionList::displayLines() const
{
    QStringList lines;
    for (int i = 0; i < m_entries.size(); ++i) {
        const Entry& e = m_entries.at(i);
        if (i > 0 && !e.logic.isEmpty()) {
            lines << QString("%1 %2").arg(e.logic, e.condition);
        } else {
            lines << e.condition;
        }
    }
    return lines;
}

QString FilterConditionList::expression() const
{
    QStringList parts;
    for (int i = 0; i < m_entries.size(); ++i) {
        const Entry& e = m_entries.at(i);
        if (i > 0 && !e.logic.isEmpty()) parts << e.logic;
        parts << e.condition;
    }
    return parts.join(' ');
}

void ValueCache::build(const VectorLayer& layer, const FeatureIds& ids)
{
    m_values.clear();
    const Fields& fields = layer.fields();
    for (const auto& field : fields) m_values.insert(field.name, QMap<QString, int>());

    for (const Feature& feature : layer.getFeatures(ids)) {
        for (int i = 0; i < fields.count(); ++i) {
            const QVariant value = feature.attribute(i);
            if (!value.isValid() || value.isNull()) continue;
            m_values[fields.at(i).name][displayString(value)] += 1;
        }
    }
}

QVector<ValueCache::ValueCount> ValueCache::values(const QString& field, const QString& filter) const
{
    QVector<ValueCount> out;
    auto it = m_values.constFind(field);
    if (it == m_values.constEnd()) return out;

    // QMap iterates in key order
    for (auto v = it->constBegin(); v != it->constEnd(); ++v) {
        if (!filter.isEmpty() && !v.key().contains(filter, Qt::CaseInsensitive)) continue;
        out.append({v.key(), v.value()});
    }
    return out;
}

int ValueCache::distinctCount(const QString& field) const
{
    return m_values.value(field).size();
}

int ValueCache::totalCount(const QString& field) const
{
    int total = 0;
    const QMap<QString, int> counts = m_values.value(field);
    for (int c : counts) total += c;
    return total;
}
