#ifndef FIELDCALCULATORDIALOG_H
#define FIELDCALCULATORDIALOG_H

#include <QDialog>
#include "core/featuretypes.h"
#include "core/fieldcalculator.h"
#include "core/filterbuilder.h"

class QCheckBox;
class QComboBox;
class QGroupBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QSpinBox;
class QTextEdit;
class QTreeWidget;
class QTreeWidgetItem;
class VectorLayer;

/**
 * @brief FieldCalculatorDialog - builds a field calculation for the target features
 *
 * The dialog only collects the request; the selection table runs it. When a
 * highlighted subset is given the user can widen the run to every selected
 * feature.
 */
class FieldCalculatorDialog : public QDialog
{
    Q_OBJECT

public:
    FieldCalculatorDialog(VectorLayer* layer, const FeatureIds& targetIds,
                          const FeatureIds& selectionIds, QWidget *parent = nullptr);

    QString expression() const;
    void setExpression(const QString& text);

    bool createsField() const;
    void setCreateField(bool create);
    void setNewField(const QString& name, FieldType type, int length = 0, int precision = 0);
    void setUpdateField(const QString& name);
    QString outputFieldName() const;
    FieldType outputFieldType() const;

    // Highlighted subset only, or every selected feature
    bool targetsHighlightedOnly() const;
    void setTargetsHighlightedOnly(bool only);
    FeatureIds activeIds() const { return m_activeIds; }

    FieldCalculation calculation() const;

    // Records a successful run. A field created by it becomes the field to update.
    void markApplied();
    bool hasPendingChanges() const;

    QString previewText() const;
    int previewFeatureCount() const;
    void setPreviewFeature(int index);

signals:
    void applyRequested();

private slots:
    void onCreateToggled(bool checked);
    void onUpdateToggled(bool checked);
    void onTargetModeChanged(bool highlightedOnly);
    void insertOperator(const QString& op);
    void filterFields(const QString& text);
    void filterValueList(const QString& text);
    void onFieldClicked(QListWidgetItem* item);
    void onFieldDoubleClicked(QListWidgetItem* item);
    void onFunctionClicked(QTreeWidgetItem* item, int column);
    void onFunctionDoubleClicked(QTreeWidgetItem* item, int column);
    void onValueDoubleClicked(QListWidgetItem* item);
    void loadAllUniqueValues();
    void loadSampleValues();
    void previousFeature();
    void nextFeature();
    void updatePreview();

private:
    void setupUi();
    void setupFunctionTree();
    void loadFields();
    void loadPreviewFeatures();
    QString featureDisplayName(const Feature& feature) const;
    void loadValues(int limit);

    VectorLayer* m_layer;
    FeatureIds m_targetIds;
    FeatureIds m_selectionIds;
    FeatureIds m_activeIds;
    QString m_currentField;
    ValueCache m_valueCache;
    FieldCalculation m_applied;
    bool m_hasApplied{false};

    QCheckBox* m_targetCheck{nullptr};
    QGroupBox* m_newFieldGroup{nullptr};
    QLineEdit* m_newFieldName{nullptr};
    QComboBox* m_newFieldType{nullptr};
    QSpinBox* m_newFieldLength{nullptr};
    QSpinBox* m_newFieldPrecision{nullptr};
    QGroupBox* m_updateGroup{nullptr};
    QComboBox* m_fieldCombo{nullptr};
    QTextEdit* m_expressionEdit{nullptr};
    QComboBox* m_featureCombo{nullptr};
    QLabel* m_previewLabel{nullptr};
    QLineEdit* m_fieldSearch{nullptr};
    QListWidget* m_fieldList{nullptr};
    QTreeWidget* m_functionTree{nullptr};
    QLabel* m_helpText{nullptr};
    QLineEdit* m_valueSearch{nullptr};
    QListWidget* m_valueList{nullptr};
};

#endif // FIELDCALCULATORDIALOG_H
