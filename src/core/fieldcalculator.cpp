#include "core/fieldcalculator.h"
#include "core/featureexpression.h"
#include "core/vectorlayer.h"

#include <QDebug>

FieldCalculator::FieldCalculator(VectorLayer* layer)
    : m_layer(layer)
{
}

bool FieldCalculator::fail(const QString& message, bool rollBack)
{
    m_lastError = message;
    qWarning() << "Field calculator:" << message;
    if (rollBack && m_startedEditing) {
        m_layer->rollBack();
        m_startedEditing = false;
    }
    return false;
}

bool FieldCalculator::run(const FieldCalculation& calculation)
{
    m_updated = 0;
    m_skipped = 0;
    m_lastError.clear();
    m_startedEditing = false;

    if (!m_layer) return fail("No layer", false);

    const QString fieldName = calculation.fieldName.trimmed();
    if (calculation.expression.trimmed().isEmpty() || fieldName.isEmpty()) {
        return fail("Missing expression or field name.", false);
    }

    FeatureExpression expression(calculation.expression);
    if (expression.hasParserError()) {
        return fail(QString("Expression error: %1").arg(expression.parserErrorString()), false);
    }

    if (calculation.createField) {
        if (m_layer->fields().contains(fieldName)) {
            return fail(QString("Field '%1' already exists").arg(fieldName), false);
        }
    } else if (!m_layer->fields().contains(fieldName)) {
        return fail(QString("Field '%1' not found").arg(fieldName), false);
    }

    if (!m_layer->isEditable()) {
        if (!m_layer->startEditing()) {
            return fail(QString("Could not start editing: %1").arg(m_layer->lastError()), false);
        }
        m_startedEditing = true;
    }

    if (calculation.createField) {
        Field field(fieldName, calculation.fieldType, calculation.fieldLength, calculation.fieldPrecision);
        if (field.type == FieldType::String && field.length <= 0) field.length = 254;
        if (!m_layer->addAttribute(field)) {
            return fail(QString("Failed to add new field: %1").arg(m_layer->lastError()), true);
        }
    }

    const int fieldIndex = m_layer->fields().indexFromName(fieldName);
    if (fieldIndex < 0) {
        return fail(QString("Field '%1' not found").arg(fieldName), true);
    }

    const Fields fields = m_layer->fields();
    for (const Feature& feature : m_layer->getFeatures(calculation.targets)) {
        const QVariant result = expression.evaluate(ExpressionContext(fields, feature));
        if (expression.hasEvalError()) {
            ++m_skipped;
            qDebug() << "Skipping feature" << feature.id << ":" << expression.evalErrorString();
            continue;
        }
        if (!m_layer->changeAttributeValue(feature.id, fieldIndex, result)) {
            return fail(m_layer->lastError(), true);
        }
        ++m_updated;
    }

    if (m_startedEditing) {
        m_startedEditing = false;
        if (!m_layer->commitChanges()) {
            const QString error = m_layer->lastError();
            m_layer->rollBack();
            return fail(QString("Commit failed: %1").arg(error), false);
        }
    }

    qDebug() << "Field calculator updated" << m_updated << "features in" << fieldName;
    return true;
}

QVariant FieldCalculator::preview(const QString& expression, FeatureId fid, bool* ok, QString* error) const
{
    if (ok) *ok = false;

    FeatureExpression expr(expression);
    if (expr.hasParserError()) {
        if (error) *error = expr.parserErrorString();
        return QVariant();
    }

    Feature feature;
    if (!m_layer || !m_layer->getFeature(fid, &feature)) {
        if (error) *error = QString("Feature %1 not found").arg(fid);
        return QVariant();
    }

    const QVariant result = expr.evaluate(ExpressionContext(m_layer->fields(), feature));
    if (expr.hasEvalError()) {
        if (error) *error = expr.evalErrorString();
        return QVariant();
    }
    if (ok) *ok = true;
    return result;
}
