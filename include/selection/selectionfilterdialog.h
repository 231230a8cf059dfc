#ifndef SELECTIONFILTERDIALOG_H
#define SELECTIONFILTERDIALOG_H

#include <QDialog>
#include "core/featuretypes.h"
#include "core/filterbuilder.h"

class QComboBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QTextEdit;
class VectorLayer;

/**
 * @brief SelectionFilterDialog - expression builder over the selected features
 *
 * Only values that occur in the selected features are offered. Conditions
 * are collected in a list and joined into an editable expression.
 */
class SelectionFilterDialog : public QDialog
{
    Q_OBJECT

public:
    SelectionFilterDialog(VectorLayer* layer, const FeatureIds& selectedIds, QWidget *parent = nullptr);

    QString expression() const;
    void setExpression(const QString& text);

    // Builder state, exposed for scripting the dialog
    void setCurrentField(const QString& name);
    void setCurrentOperator(const QString& symbol);
    void setManualValue(const QString& value);
    void selectValues(const QStringList& values);
    QStringList visibleValues() const;
    const FilterConditionList& conditions() const { return m_conditions; }

    // Number of selected features matching the expression, -1 on a parse error
    int testExpression();
    QString matchText() const;

public slots:
    void addCondition(const QString& logic);
    void removeSelectedConditions();
    void clearConditions();
    void rebuildExpression();
    void copyExpression();

private slots:
    void onFieldChanged(int index);
    void onOperatorChanged(int index);
    void filterValues(const QString& text);
    void insertLogicOperator(const QString& op);

private:
    void setupUi();
    void loadFields();
    void populateValueList(const QString& field, const QString& filter = QString());
    void updateConditionsDisplay();
    QString currentField() const;
    QString buildSingleCondition() const;

    VectorLayer* m_layer;
    FeatureIds m_selectedIds;
    ValueCache m_valueCache;
    FilterConditionList m_conditions;

    QComboBox* m_fieldCombo{nullptr};
    QLabel* m_fieldTypeLabel{nullptr};
    QComboBox* m_operatorCombo{nullptr};
    QLineEdit* m_searchEdit{nullptr};
    QListWidget* m_valueList{nullptr};
    QLabel* m_statsLabel{nullptr};
    QLineEdit* m_manualValue{nullptr};
    QListWidget* m_conditionList{nullptr};
    QTextEdit* m_expressionEdit{nullptr};
    QLabel* m_matchLabel{nullptr};
};

#endif // SELECTIONFILTERDIALOG_H
