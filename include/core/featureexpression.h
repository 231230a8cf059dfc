#ifndef FEATUREEXPRESSION_H
#define FEATUREEXPRESSION_H

#include <QString>
#include <QStringList>
#include <QVariant>
#include <QSharedPointer>
#include "core/featuretypes.h"

// Values an expression is evaluated against
struct ExpressionContext {
    const Fields* fields{nullptr};
    Feature feature;

    ExpressionContext() = default;
    ExpressionContext(const Fields& f, const Feature& feat) : fields(&f), feature(feat) {}
};

/**
 * @brief FeatureExpression - filter and calculation expressions evaluated per feature
 *
 * The text is parsed once on construction. evaluate() may be called for any
 * number of features; the eval error state reflects the last call only.
 * An invalid QVariant stands for NULL.
 */
class FeatureExpression {
public:
    explicit FeatureExpression(const QString& expression);
    ~FeatureExpression();

    QString expression() const { return m_expression; }
    bool isEmpty() const { return m_expression.trimmed().isEmpty(); }

    bool hasParserError() const { return !m_parserError.isEmpty(); }
    QString parserErrorString() const { return m_parserError; }

    bool hasEvalError() const { return !m_evalError.isEmpty(); }
    QString evalErrorString() const { return m_evalError; }

    QVariant evaluate(const ExpressionContext& context);

    // Field names the expression reads, in order of first use
    QStringList referencedColumns() const;

    static QString quotedColumnRef(const QString& name);
    static QString quotedString(const QString& value);

    // NULL and false-like values are false; numbers by value; strings when
    // non-empty (numeric strings by their value)
    static bool isTruthy(const QVariant& value);

    struct Node;
    typedef QSharedPointer<Node> NodePtr;

private:
    QString m_expression;
    NodePtr m_root;
    QString m_parserError;
    QString m_evalError;
};

#endif // FEATUREEXPRESSION_H
