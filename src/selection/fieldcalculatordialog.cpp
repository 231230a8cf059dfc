#include "selection/fieldcalculatordialog.h"
#include "core/featureexpression.h"
#include "core/vectorlayer.h"
#include "appsettings.h"

#include <QCheckBox>
#include <QComboBox>
#include <QFormLayout>
#include <QFrame>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QPushButton>
#include <QSpinBox>
#include <QSplitter>
#include <QTabWidget>
#include <QTextEdit>
#include <QTreeWidget>
#include <QVBoxLayout>

namespace {

struct FunctionEntry {
    const char* label;
    const char* insert;
};

struct FunctionGroup {
    const char* title;
    const char* help;
    QVector<FunctionEntry> functions;
};

QString typePrefix(FieldType type)
{
    switch (type) {
        case FieldType::String:   return "abc";
        case FieldType::Integer:  return "123";
        case FieldType::Double:   return "1.2";
        case FieldType::Date:
        case FieldType::DateTime: return "dt";
        case FieldType::Boolean:  return "t/f";
    }
    return "?";
}

const QVector<FunctionGroup>& functionGroups()
{
    static const QVector<FunctionGroup> groups = {
        {"Conditionals",
         "<b>Conditionals:</b><br>if(condition, true, false) - returns the true value if the condition holds, "
         "else the false value<br><br>CASE WHEN...THEN...END - multiple conditions<br><br>"
         "coalesce(a, b) - returns the first non-null value",
         {{"if(condition, true, false)", "if()"},
          {"CASE WHEN...THEN...END", "CASE WHEN  THEN  ELSE  END"},
          {"coalesce(a, b)", "coalesce()"},
          {"nullif(a, b)", "nullif()"},
          {"try(expr)", "try()"}}},
        {"String Functions",
         "<b>String Functions:</b><br>upper(), lower(), length(), substr(), concat(), replace(), trim(), left(), right()",
         {{"upper(str)", "upper()"},
          {"lower(str)", "lower()"},
          {"length(str)", "length()"},
          {"substr(str,start,len)", "substr()"},
          {"concat(a,b)", "concat()"},
          {"replace(str,old,new)", "replace()"},
          {"trim(str)", "trim()"},
          {"left(str,n)", "left()"},
          {"right(str,n)", "right()"}}},
        {"Math Functions",
         "<b>Math Functions:</b><br>abs(), round(), floor(), ceil(), sqrt(), sin(), cos(), tan(), log(), log10(), exp(), pow()",
         {{"abs(x)", "abs()"},
          {"round(x,n)", "round()"},
          {"floor(x)", "floor()"},
          {"ceil(x)", "ceil()"},
          {"sqrt(x)", "sqrt()"},
          {"sin(x)", "sin()"},
          {"cos(x)", "cos()"},
          {"tan(x)", "tan()"},
          {"log(x)", "log()"},
          {"log10(x)", "log10()"},
          {"exp(x)", "exp()"},
          {"pow(x,y)", "pow()"}}},
        {"Conversions",
         "<b>Conversions:</b><br>to_int(), to_real(), to_string(), to_date()",
         {{"to_int(value)", "to_int()"},
          {"to_real(value)", "to_real()"},
          {"to_string(value)", "to_string()"},
          {"to_date(str)", "to_date()"}}},
        {"Date/Time Functions",
         "<b>Date/Time Functions:</b><br>now(), day(), month(), year(), hour(), minute(), second()",
         {{"now()", "now()"},
          {"day(date)", "day()"},
          {"month(date)", "month()"},
          {"year(date)", "year()"},
          {"hour(datetime)", "hour()"},
          {"minute(datetime)", "minute()"},
          {"second(datetime)", "second()"}}},
        {"Geometry Functions",
         "<b>Geometry Functions:</b><br>$area, $length, $perimeter, $x, $y, $id",
         {{"$area", "$area"},
          {"$length", "$length"},
          {"$perimeter", "$perimeter"},
          {"$x", "$x"},
          {"$y", "$y"},
          {"$id", "$id"}}}
    };
    return groups;
}

} // namespace

FieldCalculatorDialog::FieldCalculatorDialog(VectorLayer* layer, const FeatureIds& targetIds,
                                             const FeatureIds& selectionIds, QWidget *parent)
    : QDialog(parent)
    , m_layer(layer)
    , m_targetIds(targetIds)
    , m_selectionIds(selectionIds.isEmpty() ? targetIds : selectionIds)
    , m_activeIds(targetIds)
{
    setWindowTitle(QString("%1 - Field Calculator").arg(m_layer ? m_layer->name() : QString()));
    setMinimumSize(850, 650);
    setupUi();
    loadFields();
    loadPreviewFeatures();
    updatePreview();
}

void FieldCalculatorDialog::setupUi()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(6);

    // Target
    const bool hasHighlights = m_targetIds.size() < m_selectionIds.size();
    if (hasHighlights) {
        m_targetCheck = new QCheckBox(QString("Only update %1 highlighted feature(s) (uncheck to update all %2 selected)")
                                          .arg(m_targetIds.size()).arg(m_selectionIds.size()));
        m_targetCheck->setChecked(true);
        connect(m_targetCheck, &QCheckBox::toggled, this, &FieldCalculatorDialog::onTargetModeChanged);
    } else {
        m_targetCheck = new QCheckBox(QString("Update all %1 selected feature(s)").arg(m_selectionIds.size()));
        m_targetCheck->setChecked(true);
        m_targetCheck->setEnabled(false);
    }
    m_targetCheck->setStyleSheet("font-weight: bold; color: #1976D2;");
    mainLayout->addWidget(m_targetCheck);

    // Output field
    QFrame* optionsFrame = new QFrame();
    optionsFrame->setFrameShape(QFrame::StyledPanel);
    QHBoxLayout* optionsLayout = new QHBoxLayout(optionsFrame);
    optionsLayout->setSpacing(20);

    m_newFieldGroup = new QGroupBox("Create a new field");
    m_newFieldGroup->setCheckable(true);
    m_newFieldGroup->setChecked(false);
    QFormLayout* newLayout = new QFormLayout(m_newFieldGroup);
    newLayout->setSpacing(4);
    m_newFieldName = new QLineEdit();
    m_newFieldName->setPlaceholderText("field_name");
    newLayout->addRow("Output field name:", m_newFieldName);
    m_newFieldType = new QComboBox();
    m_newFieldType->addItem("Text (string)", static_cast<int>(FieldType::String));
    m_newFieldType->addItem("Whole number (integer)", static_cast<int>(FieldType::Integer));
    m_newFieldType->addItem("Decimal number (double)", static_cast<int>(FieldType::Double));
    m_newFieldType->addItem("Date", static_cast<int>(FieldType::Date));
    m_newFieldType->addItem("Boolean", static_cast<int>(FieldType::Boolean));
    newLayout->addRow("Output field type:", m_newFieldType);
    QHBoxLayout* lengthLayout = new QHBoxLayout();
    m_newFieldLength = new QSpinBox();
    m_newFieldLength->setRange(1, 254);
    m_newFieldLength->setValue(50);
    lengthLayout->addWidget(m_newFieldLength);
    lengthLayout->addWidget(new QLabel("Precision"));
    m_newFieldPrecision = new QSpinBox();
    m_newFieldPrecision->setRange(0, 15);
    m_newFieldPrecision->setValue(3);
    lengthLayout->addWidget(m_newFieldPrecision);
    lengthLayout->addStretch();
    newLayout->addRow("Output field length:", lengthLayout);
    optionsLayout->addWidget(m_newFieldGroup, 1);

    m_updateGroup = new QGroupBox("Update existing field");
    m_updateGroup->setCheckable(true);
    m_updateGroup->setChecked(true);
    QVBoxLayout* updateLayout = new QVBoxLayout(m_updateGroup);
    m_fieldCombo = new QComboBox();
    updateLayout->addWidget(m_fieldCombo);
    updateLayout->addStretch();
    optionsLayout->addWidget(m_updateGroup, 1);

    connect(m_newFieldGroup, &QGroupBox::toggled, this, &FieldCalculatorDialog::onCreateToggled);
    connect(m_updateGroup, &QGroupBox::toggled, this, &FieldCalculatorDialog::onUpdateToggled);
    mainLayout->addWidget(optionsFrame);

    QSplitter* splitter = new QSplitter(Qt::Horizontal);

    // Expression editor
    QWidget* leftPanel = new QWidget();
    QVBoxLayout* leftLayout = new QVBoxLayout(leftPanel);
    leftLayout->setContentsMargins(0, 0, 0, 0);
    QTabWidget* exprTabs = new QTabWidget();
    QWidget* exprWidget = new QWidget();
    QVBoxLayout* exprLayout = new QVBoxLayout(exprWidget);
    exprLayout->setContentsMargins(4, 4, 4, 4);

    m_expressionEdit = new QTextEdit();
    m_expressionEdit->setAcceptRichText(false);
    m_expressionEdit->setStyleSheet("QTextEdit { font-family: 'Consolas', 'Courier New', monospace; font-size: 11px; "
                                    "background-color: #FFFEF0; border: 1px solid #ccc; }");
    m_expressionEdit->setPlaceholderText("Expression...");
    connect(m_expressionEdit, &QTextEdit::textChanged, this, &FieldCalculatorDialog::updatePreview);
    exprLayout->addWidget(m_expressionEdit, 1);

    QHBoxLayout* opsLayout = new QHBoxLayout();
    opsLayout->setSpacing(2);
    const QStringList ops = {"=", "+", "-", "/", "*", "^", "||", "(", ")", "'\\n'"};
    for (const QString& op : ops) {
        QPushButton* btn = new QPushButton(op);
        btn->setFixedSize(28, 24);
        btn->setStyleSheet("font-size: 11px; padding: 0;");
        connect(btn, &QPushButton::clicked, this, [this, op]() { insertOperator(op); });
        opsLayout->addWidget(btn);
    }
    opsLayout->addStretch();
    exprLayout->addLayout(opsLayout);

    QHBoxLayout* navLayout = new QHBoxLayout();
    navLayout->addWidget(new QLabel("Feature"));
    m_featureCombo = new QComboBox();
    m_featureCombo->setMinimumWidth(100);
    connect(m_featureCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &FieldCalculatorDialog::updatePreview);
    navLayout->addWidget(m_featureCombo);
    QPushButton* prevBtn = new QPushButton("<");
    prevBtn->setFixedWidth(24);
    connect(prevBtn, &QPushButton::clicked, this, &FieldCalculatorDialog::previousFeature);
    navLayout->addWidget(prevBtn);
    QPushButton* nextBtn = new QPushButton(">");
    nextBtn->setFixedWidth(24);
    connect(nextBtn, &QPushButton::clicked, this, &FieldCalculatorDialog::nextFeature);
    navLayout->addWidget(nextBtn);
    navLayout->addStretch();
    exprLayout->addLayout(navLayout);

    QHBoxLayout* previewLayout = new QHBoxLayout();
    previewLayout->addWidget(new QLabel("Preview:"));
    m_previewLabel = new QLabel();
    m_previewLabel->setStyleSheet("color: #666; font-style: italic;");
    previewLayout->addWidget(m_previewLabel, 1);
    exprLayout->addLayout(previewLayout);

    exprTabs->addTab(exprWidget, "Expression");
    leftLayout->addWidget(exprTabs);
    splitter->addWidget(leftPanel);

    // Fields and functions
    QWidget* centerPanel = new QWidget();
    QVBoxLayout* centerLayout = new QVBoxLayout(centerPanel);
    centerLayout->setContentsMargins(0, 0, 0, 0);
    m_fieldSearch = new QLineEdit();
    m_fieldSearch->setPlaceholderText("Search...");
    m_fieldSearch->setClearButtonEnabled(true);
    connect(m_fieldSearch, &QLineEdit::textChanged, this, &FieldCalculatorDialog::filterFields);
    centerLayout->addWidget(m_fieldSearch);

    m_fieldList = new QListWidget();
    m_fieldList->setStyleSheet("font-family: monospace; font-size: 11px;");
    connect(m_fieldList, &QListWidget::itemClicked, this, &FieldCalculatorDialog::onFieldClicked);
    connect(m_fieldList, &QListWidget::itemDoubleClicked, this, &FieldCalculatorDialog::onFieldDoubleClicked);
    centerLayout->addWidget(m_fieldList);

    m_functionTree = new QTreeWidget();
    m_functionTree->setHeaderHidden(true);
    m_functionTree->setStyleSheet("font-size: 11px;");
    setupFunctionTree();
    connect(m_functionTree, &QTreeWidget::itemClicked, this, &FieldCalculatorDialog::onFunctionClicked);
    connect(m_functionTree, &QTreeWidget::itemDoubleClicked, this, &FieldCalculatorDialog::onFunctionDoubleClicked);
    centerLayout->addWidget(m_functionTree);
    splitter->addWidget(centerPanel);

    // Help and values
    QWidget* rightPanel = new QWidget();
    QVBoxLayout* rightLayout = new QVBoxLayout(rightPanel);
    rightLayout->setContentsMargins(0, 0, 0, 0);
    m_helpText = new QLabel();
    m_helpText->setWordWrap(true);
    m_helpText->setStyleSheet("background-color: #FFF8DC; padding: 8px; border: 1px solid #E0D8B8; color: #8B4513;");
    m_helpText->setText("<b>Fields</b><br><br>Double-click to add a field name to the expression.<br><br>"
                        "Use the value buttons to list values of the clicked field.");
    m_helpText->setMinimumHeight(80);
    rightLayout->addWidget(m_helpText);

    QGroupBox* valuesGroup = new QGroupBox("Values");
    QVBoxLayout* valuesLayout = new QVBoxLayout(valuesGroup);
    m_valueSearch = new QLineEdit();
    m_valueSearch->setPlaceholderText("Search...");
    connect(m_valueSearch, &QLineEdit::textChanged, this, &FieldCalculatorDialog::filterValueList);
    valuesLayout->addWidget(m_valueSearch);
    QHBoxLayout* valueButtons = new QHBoxLayout();
    QPushButton* uniqueBtn = new QPushButton("All Unique");
    connect(uniqueBtn, &QPushButton::clicked, this, &FieldCalculatorDialog::loadAllUniqueValues);
    valueButtons->addWidget(uniqueBtn);
    QPushButton* samplesBtn = new QPushButton(QString("%1 Samples").arg(AppSettings::sampleValueCount()));
    connect(samplesBtn, &QPushButton::clicked, this, &FieldCalculatorDialog::loadSampleValues);
    valueButtons->addWidget(samplesBtn);
    valuesLayout->addLayout(valueButtons);
    m_valueList = new QListWidget();
    m_valueList->setStyleSheet("font-size: 11px;");
    connect(m_valueList, &QListWidget::itemDoubleClicked, this, &FieldCalculatorDialog::onValueDoubleClicked);
    valuesLayout->addWidget(m_valueList);
    rightLayout->addWidget(valuesGroup, 1);
    splitter->addWidget(rightPanel);

    splitter->setSizes({350, 200, 250});
    mainLayout->addWidget(splitter, 1);

    QFrame* infoFrame = new QFrame();
    infoFrame->setStyleSheet("background-color: #E3F2FD; padding: 8px; border-radius: 4px;");
    QHBoxLayout* infoLayout = new QHBoxLayout(infoFrame);
    infoLayout->setContentsMargins(8, 4, 8, 4);
    QLabel* infoText = new QLabel(QString("Only the %1 targeted features will be updated. "
                                          "Non-targeted features will retain their current values.")
                                      .arg(m_targetIds.size()));
    infoText->setWordWrap(true);
    infoLayout->addWidget(infoText, 1);
    mainLayout->addWidget(infoFrame);

    QHBoxLayout* buttonLayout = new QHBoxLayout();
    buttonLayout->addStretch();
    QPushButton* okBtn = new QPushButton("OK");
    okBtn->setDefault(true);
    okBtn->setMinimumWidth(80);
    connect(okBtn, &QPushButton::clicked, this, &QDialog::accept);
    buttonLayout->addWidget(okBtn);
    QPushButton* cancelBtn = new QPushButton("Cancel");
    cancelBtn->setMinimumWidth(80);
    connect(cancelBtn, &QPushButton::clicked, this, &QDialog::reject);
    buttonLayout->addWidget(cancelBtn);
    QPushButton* applyBtn = new QPushButton("Apply");
    applyBtn->setMinimumWidth(80);
    connect(applyBtn, &QPushButton::clicked, this, &FieldCalculatorDialog::applyRequested);
    buttonLayout->addWidget(applyBtn);
    mainLayout->addLayout(buttonLayout);
}

void FieldCalculatorDialog::setupFunctionTree()
{
    for (const FunctionGroup& group : functionGroups()) {
        QTreeWidgetItem* groupItem = new QTreeWidgetItem(QStringList() << group.title);
        groupItem->setData(0, Qt::UserRole + 1, QString(group.help));
        for (const FunctionEntry& entry : group.functions) {
            QTreeWidgetItem* child = new QTreeWidgetItem(QStringList() << entry.label);
            child->setData(0, Qt::UserRole, QString(entry.insert));
            groupItem->addChild(child);
        }
        m_functionTree->addTopLevelItem(groupItem);
    }
    m_functionTree->expandAll();
}

void FieldCalculatorDialog::loadFields()
{
    m_fieldCombo->clear();
    m_fieldList->clear();
    if (!m_layer) return;

    for (const Field& field : m_layer->fields()) {
        const QString text = QString("%1 %2").arg(typePrefix(field.type), field.name);
        m_fieldCombo->addItem(text, field.name);
        QListWidgetItem* item = new QListWidgetItem(text);
        item->setData(Qt::UserRole, field.name);
        m_fieldList->addItem(item);
    }
}

QString FieldCalculatorDialog::featureDisplayName(const Feature& feature) const
{
    static const QStringList candidates = {"name", "objectid", "id"};
    for (const QString& candidate : candidates) {
        const int index = m_layer->fields().indexFromName(candidate);
        if (index < 0) continue;
        const QString text = displayString(feature.attribute(index));
        if (!text.isEmpty()) return text;
    }
    return QString::number(feature.id);
}

void FieldCalculatorDialog::loadPreviewFeatures()
{
    m_featureCombo->blockSignals(true);
    m_featureCombo->clear();
    if (m_layer) {
        const QVector<Feature> features = m_layer->getFeatures(m_activeIds);
        const int limit = qMin(features.size(), AppSettings::previewFeatureLimit());
        for (int i = 0; i < limit; ++i) {
            m_featureCombo->addItem(featureDisplayName(features.at(i)), features.at(i).id);
        }
    }
    m_featureCombo->blockSignals(false);
}

void FieldCalculatorDialog::onCreateToggled(bool checked)
{
    if (checked == m_updateGroup->isChecked()) m_updateGroup->setChecked(!checked);
}

void FieldCalculatorDialog::onUpdateToggled(bool checked)
{
    if (checked == m_newFieldGroup->isChecked()) m_newFieldGroup->setChecked(!checked);
}

void FieldCalculatorDialog::onTargetModeChanged(bool highlightedOnly)
{
    m_activeIds = highlightedOnly ? m_targetIds : m_selectionIds;
    m_valueCache.clear();
    loadPreviewFeatures();
    updatePreview();
}

void FieldCalculatorDialog::insertOperator(const QString& op)
{
    m_expressionEdit->insertPlainText(QString(" %1 ").arg(op));
}

void FieldCalculatorDialog::filterFields(const QString& text)
{
    for (int i = 0; i < m_fieldList->count(); ++i) {
        QListWidgetItem* item = m_fieldList->item(i);
        item->setHidden(!item->text().contains(text, Qt::CaseInsensitive));
    }
}

void FieldCalculatorDialog::filterValueList(const QString& text)
{
    for (int i = 0; i < m_valueList->count(); ++i) {
        QListWidgetItem* item = m_valueList->item(i);
        item->setHidden(!item->text().contains(text, Qt::CaseInsensitive));
    }
}

void FieldCalculatorDialog::onFieldClicked(QListWidgetItem* item)
{
    m_currentField = item->data(Qt::UserRole).toString();
    m_helpText->setText(QString("<b>%1</b><br><br>Double-click to add field name to expression string.")
                            .arg(m_currentField.toHtmlEscaped()));
}

void FieldCalculatorDialog::onFieldDoubleClicked(QListWidgetItem* item)
{
    m_expressionEdit->insertPlainText(FeatureExpression::quotedColumnRef(item->data(Qt::UserRole).toString()));
}

void FieldCalculatorDialog::onFunctionClicked(QTreeWidgetItem* item, int column)
{
    Q_UNUSED(column);
    if (!item->parent()) {
        m_helpText->setText(item->data(0, Qt::UserRole + 1).toString());
    } else {
        m_helpText->setText(QString("<b>%1</b><br><br>Double-click to insert into expression.")
                                .arg(item->text(0).toHtmlEscaped()));
    }
}

void FieldCalculatorDialog::onFunctionDoubleClicked(QTreeWidgetItem* item, int column)
{
    Q_UNUSED(column);
    if (!item->parent()) return;
    const QString text = item->data(0, Qt::UserRole).toString();
    if (!text.isEmpty()) m_expressionEdit->insertPlainText(text);
}

void FieldCalculatorDialog::onValueDoubleClicked(QListWidgetItem* item)
{
    const QString value = item->data(Qt::UserRole).toString();
    const int index = m_layer ? m_layer->fields().indexFromName(m_currentField) : -1;
    const bool numeric = index >= 0 && m_layer->fields().at(index).isNumeric();
    m_expressionEdit->insertPlainText(numeric ? value : FeatureExpression::quotedString(value));
}

void FieldCalculatorDialog::loadValues(int limit)
{
    m_valueList->clear();
    if (m_currentField.isEmpty() || !m_layer) return;

    if (!m_valueCache.hasField(m_currentField)) m_valueCache.build(*m_layer, m_activeIds);

    const QVector<ValueCache::ValueCount> values = m_valueCache.values(m_currentField);
    const int count = qMin(values.size(), limit);
    for (int i = 0; i < count; ++i) {
        QListWidgetItem* item = new QListWidgetItem(values.at(i).value);
        item->setData(Qt::UserRole, values.at(i).value);
        m_valueList->addItem(item);
    }
    filterValueList(m_valueSearch->text());
}

void FieldCalculatorDialog::loadAllUniqueValues()
{
    loadValues(AppSettings::uniqueValueLimit());
}

void FieldCalculatorDialog::loadSampleValues()
{
    m_valueList->clear();
    if (m_currentField.isEmpty() || !m_layer) return;

    const int index = m_layer->fields().indexFromName(m_currentField);
    if (index < 0) return;

    const QVector<Feature> features = m_layer->getFeatures(m_activeIds);
    const int limit = qMin(features.size(), AppSettings::sampleValueCount());
    for (int i = 0; i < limit; ++i) {
        const QVariant value = features.at(i).attribute(index);
        if (!value.isValid() || value.isNull()) continue;
        QListWidgetItem* item = new QListWidgetItem(displayString(value));
        item->setData(Qt::UserRole, displayString(value));
        m_valueList->addItem(item);
    }
    filterValueList(m_valueSearch->text());
}

void FieldCalculatorDialog::previousFeature()
{
    const int index = m_featureCombo->currentIndex();
    if (index > 0) m_featureCombo->setCurrentIndex(index - 1);
}

void FieldCalculatorDialog::nextFeature()
{
    const int index = m_featureCombo->currentIndex();
    if (index < m_featureCombo->count() - 1) m_featureCombo->setCurrentIndex(index + 1);
}

void FieldCalculatorDialog::updatePreview()
{
    const QString text = expression();
    if (text.isEmpty()) {
        m_previewLabel->clear();
        m_previewLabel->setStyleSheet("color: #666;");
        return;
    }
    const QVariant fidData = m_featureCombo->currentData();
    if (!fidData.isValid()) return;

    bool ok = false;
    QString error;
    const QVariant result = FieldCalculator(m_layer).preview(text, fidData.toLongLong(), &ok, &error);
    if (!ok) {
        m_previewLabel->setText(error);
        m_previewLabel->setStyleSheet("color: #c62828;");
        return;
    }
    m_previewLabel->setText(result.isValid() && !result.isNull() ? displayString(result) : QString("NULL"));
    m_previewLabel->setStyleSheet("color: #2e7d32; font-weight: bold;");
}

QString FieldCalculatorDialog::expression() const
{
    return m_expressionEdit->toPlainText().trimmed();
}

void FieldCalculatorDialog::setExpression(const QString& text)
{
    m_expressionEdit->setPlainText(text);
}

bool FieldCalculatorDialog::createsField() const
{
    return m_newFieldGroup->isChecked();
}

void FieldCalculatorDialog::setCreateField(bool create)
{
    m_newFieldGroup->setChecked(create);
}

void FieldCalculatorDialog::setNewField(const QString& name, FieldType type, int length, int precision)
{
    setCreateField(true);
    m_newFieldName->setText(name);
    const int index = m_newFieldType->findData(static_cast<int>(type));
    if (index >= 0) m_newFieldType->setCurrentIndex(index);
    if (length > 0) m_newFieldLength->setValue(length);
    m_newFieldPrecision->setValue(precision);
}

void FieldCalculatorDialog::setUpdateField(const QString& name)
{
    setCreateField(false);
    const int index = m_fieldCombo->findData(name);
    if (index >= 0) m_fieldCombo->setCurrentIndex(index);
}

QString FieldCalculatorDialog::outputFieldName() const
{
    if (createsField()) return m_newFieldName->text().trimmed();
    return m_fieldCombo->currentData().toString();
}

FieldType FieldCalculatorDialog::outputFieldType() const
{
    if (createsField()) return static_cast<FieldType>(m_newFieldType->currentData().toInt());
    const int index = m_layer ? m_layer->fields().indexFromName(outputFieldName()) : -1;
    return index >= 0 ? m_layer->fields().at(index).type : FieldType::String;
}

bool FieldCalculatorDialog::targetsHighlightedOnly() const
{
    return m_targetCheck->isEnabled() && m_targetCheck->isChecked();
}

void FieldCalculatorDialog::setTargetsHighlightedOnly(bool only)
{
    if (m_targetCheck->isEnabled()) m_targetCheck->setChecked(only);
}

FieldCalculation FieldCalculatorDialog::calculation() const
{
    FieldCalculation calc;
    calc.expression = expression();
    calc.fieldName = outputFieldName();
    calc.createField = createsField();
    calc.fieldType = outputFieldType();
    if (calc.createField) {
        calc.fieldLength = m_newFieldLength->value();
        calc.fieldPrecision = m_newFieldPrecision->value();
    }
    calc.targets = m_activeIds;
    return calc;
}

void FieldCalculatorDialog::markApplied()
{
    const FieldCalculation applied = calculation();
    if (applied.createField) {
        loadFields();
        setUpdateField(applied.fieldName);
    }
    m_applied = calculation();
    m_hasApplied = true;
}

bool FieldCalculatorDialog::hasPendingChanges() const
{
    if (!m_hasApplied) return true;
    const FieldCalculation current = calculation();
    return current.expression != m_applied.expression
        || current.fieldName != m_applied.fieldName
        || current.createField != m_applied.createField
        || current.fieldType != m_applied.fieldType
        || current.fieldLength != m_applied.fieldLength
        || current.fieldPrecision != m_applied.fieldPrecision
        || current.targets != m_applied.targets;
}

QString FieldCalculatorDialog::previewText() const
{
    return m_previewLabel->text();
}

int FieldCalculatorDialog::previewFeatureCount() const
{
    return m_featureCombo->count();
}

void FieldCalculatorDialog::setPreviewFeature(int index)
{
    m_featureCombo->setCurrentIndex(index);
}
