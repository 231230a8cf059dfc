#include "selection/selectionfilterdialog.h"
#include "core/vectorlayer.h"

#include <QApplication>
#include <QClipboard>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QPushButton>
#include <QSplitter>
#include <QTextEdit>
#include <QVBoxLayout>

SelectionFilterDialog::SelectionFilterDialog(VectorLayer* layer, const FeatureIds& selectedIds, QWidget *parent)
    : QDialog(parent)
    , m_layer(layer)
    , m_selectedIds(selectedIds)
{
    setWindowTitle("Advanced Filter Builder");
    setMinimumSize(800, 650);
    setupUi();
    if (m_layer) m_valueCache.build(*m_layer, m_selectedIds);
    loadFields();
}

void SelectionFilterDialog::setupUi()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(6);

    QLabel* header = new QLabel(QString("<b style=\"color:#006064;\">Filter within %1 selected features</b>")
                                    .arg(m_selectedIds.size()));
    header->setStyleSheet("padding: 8px; background-color: #e0f7fa; border-radius: 4px;");
    mainLayout->addWidget(header);

    QSplitter* splitter = new QSplitter(Qt::Horizontal);

    // Left: field, operator, logic
    QWidget* leftWidget = new QWidget();
    QVBoxLayout* leftLayout = new QVBoxLayout(leftWidget);
    leftLayout->setContentsMargins(0, 0, 0, 0);

    QGroupBox* fieldGroup = new QGroupBox("Field");
    QVBoxLayout* fieldLayout = new QVBoxLayout(fieldGroup);
    m_fieldCombo = new QComboBox();
    connect(m_fieldCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &SelectionFilterDialog::onFieldChanged);
    fieldLayout->addWidget(m_fieldCombo);
    m_fieldTypeLabel = new QLabel();
    m_fieldTypeLabel->setStyleSheet("color: #666; font-size: 10px;");
    fieldLayout->addWidget(m_fieldTypeLabel);
    leftLayout->addWidget(fieldGroup);

    QGroupBox* opGroup = new QGroupBox("Operator");
    QVBoxLayout* opLayout = new QVBoxLayout(opGroup);
    m_operatorCombo = new QComboBox();
    m_operatorCombo->addItems(FilterBuilder::operatorLabels());
    connect(m_operatorCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &SelectionFilterDialog::onOperatorChanged);
    opLayout->addWidget(m_operatorCombo);
    leftLayout->addWidget(opGroup);

    QGroupBox* logicGroup = new QGroupBox("Logical Operators");
    QVBoxLayout* logicLayout = new QVBoxLayout(logicGroup);
    QHBoxLayout* logicRow1 = new QHBoxLayout();
    QHBoxLayout* logicRow2 = new QHBoxLayout();
    const QStringList logicOps = {"AND", "OR", "NOT"};
    for (const QString& op : logicOps) {
        QPushButton* btn = new QPushButton(op);
        btn->setToolTip(QString("Insert %1 operator").arg(op));
        connect(btn, &QPushButton::clicked, this, [this, op]() { insertLogicOperator(op); });
        logicRow1->addWidget(btn);
    }
    const QStringList parens = {"(", ")"};
    for (const QString& op : parens) {
        QPushButton* btn = new QPushButton(op);
        connect(btn, &QPushButton::clicked, this, [this, op]() { insertLogicOperator(op); });
        logicRow2->addWidget(btn);
    }
    logicLayout->addLayout(logicRow1);
    logicLayout->addLayout(logicRow2);
    leftLayout->addWidget(logicGroup);
    leftLayout->addStretch();
    splitter->addWidget(leftWidget);

    // Right: values from the selection
    QWidget* rightWidget = new QWidget();
    QVBoxLayout* rightLayout = new QVBoxLayout(rightWidget);
    rightLayout->setContentsMargins(0, 0, 0, 0);

    QGroupBox* valueGroup = new QGroupBox("Values (from selection only)");
    QVBoxLayout* valueLayout = new QVBoxLayout(valueGroup);
    m_searchEdit = new QLineEdit();
    m_searchEdit->setPlaceholderText("Search values...");
    m_searchEdit->setClearButtonEnabled(true);
    connect(m_searchEdit, &QLineEdit::textChanged, this, &SelectionFilterDialog::filterValues);
    valueLayout->addWidget(m_searchEdit);

    m_valueList = new QListWidget();
    m_valueList->setSelectionMode(QAbstractItemView::ExtendedSelection);
    connect(m_valueList, &QListWidget::itemDoubleClicked, this, [this]() { addCondition("AND"); });
    valueLayout->addWidget(m_valueList);

    m_statsLabel = new QLabel();
    m_statsLabel->setStyleSheet("color: #666; font-size: 10px;");
    valueLayout->addWidget(m_statsLabel);

    m_manualValue = new QLineEdit();
    m_manualValue->setPlaceholderText("Or enter custom value...");
    valueLayout->addWidget(m_manualValue);

    rightLayout->addWidget(valueGroup);
    splitter->addWidget(rightWidget);
    splitter->setSizes({280, 450});
    mainLayout->addWidget(splitter);

    // Condition builder buttons
    QHBoxLayout* addLayout = new QHBoxLayout();
    QPushButton* addAndBtn = new QPushButton("Add with AND");
    addAndBtn->setStyleSheet("background-color: #c8e6c9; font-weight: bold; padding: 6px;");
    connect(addAndBtn, &QPushButton::clicked, this, [this]() { addCondition("AND"); });
    addLayout->addWidget(addAndBtn);
    QPushButton* addOrBtn = new QPushButton("Add with OR");
    addOrBtn->setStyleSheet("background-color: #ffe0b2; font-weight: bold; padding: 6px;");
    connect(addOrBtn, &QPushButton::clicked, this, [this]() { addCondition("OR"); });
    addLayout->addWidget(addOrBtn);
    QPushButton* addPlainBtn = new QPushButton("Add (no logic)");
    connect(addPlainBtn, &QPushButton::clicked, this, [this]() { addCondition(QString()); });
    addLayout->addWidget(addPlainBtn);
    mainLayout->addLayout(addLayout);

    // Conditions
    QGroupBox* condGroup = new QGroupBox("Conditions (click to select, then remove)");
    QVBoxLayout* condLayout = new QVBoxLayout(condGroup);
    m_conditionList = new QListWidget();
    m_conditionList->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_conditionList->setMinimumHeight(80);
    m_conditionList->setStyleSheet("font-family: monospace; font-size: 11px;");
    condLayout->addWidget(m_conditionList);

    QHBoxLayout* removeLayout = new QHBoxLayout();
    QPushButton* removeBtn = new QPushButton("Remove Selected");
    connect(removeBtn, &QPushButton::clicked, this, &SelectionFilterDialog::removeSelectedConditions);
    removeLayout->addWidget(removeBtn);
    QPushButton* clearBtn = new QPushButton("Clear All");
    connect(clearBtn, &QPushButton::clicked, this, &SelectionFilterDialog::clearConditions);
    removeLayout->addWidget(clearBtn);
    removeLayout->addStretch();
    condLayout->addLayout(removeLayout);
    mainLayout->addWidget(condGroup);

    // Expression editor
    QGroupBox* exprGroup = new QGroupBox("Expression (editable - you can type directly)");
    QVBoxLayout* exprLayout = new QVBoxLayout(exprGroup);
    m_expressionEdit = new QTextEdit();
    m_expressionEdit->setAcceptRichText(false);
    m_expressionEdit->setMinimumHeight(80);
    m_expressionEdit->setStyleSheet("font-family: 'Consolas', 'Monaco', monospace; font-size: 12px; "
                                    "padding: 8px; background-color: #fffde7; border: 1px solid #ddd;");
    m_expressionEdit->setPlaceholderText("Expression will appear here...\nYou can also edit directly.");
    exprLayout->addWidget(m_expressionEdit);

    QHBoxLayout* actionLayout = new QHBoxLayout();
    QPushButton* testBtn = new QPushButton("Test Expression");
    connect(testBtn, &QPushButton::clicked, this, [this]() { testExpression(); });
    actionLayout->addWidget(testBtn);
    QPushButton* copyBtn = new QPushButton("Copy");
    connect(copyBtn, &QPushButton::clicked, this, &SelectionFilterDialog::copyExpression);
    actionLayout->addWidget(copyBtn);
    QPushButton* rebuildBtn = new QPushButton("Rebuild from Conditions");
    connect(rebuildBtn, &QPushButton::clicked, this, &SelectionFilterDialog::rebuildExpression);
    actionLayout->addWidget(rebuildBtn);
    actionLayout->addStretch();
    m_matchLabel = new QLabel();
    m_matchLabel->setStyleSheet("font-weight: bold; font-size: 12px;");
    actionLayout->addWidget(m_matchLabel);
    exprLayout->addLayout(actionLayout);
    mainLayout->addWidget(exprGroup);

    QDialogButtonBox* buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    buttonBox->button(QDialogButtonBox::Ok)->setText("Apply Filter");
    buttonBox->button(QDialogButtonBox::Ok)->setStyleSheet(
        "background-color: #4CAF50; color: white; font-weight: bold; padding: 8px 20px;");
    connect(buttonBox, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttonBox);
}

void SelectionFilterDialog::loadFields()
{
    m_fieldCombo->clear();
    if (!m_layer) return;
    for (const Field& field : m_layer->fields()) {
        m_fieldCombo->addItem(field.name, field.name);
    }
}

QString SelectionFilterDialog::currentField() const
{
    const QString data = m_fieldCombo->currentData().toString();
    return data.isEmpty() ? m_fieldCombo->currentText() : data;
}

void SelectionFilterDialog::onFieldChanged(int index)
{
    if (index < 0 || !m_layer) return;
    const QString name = currentField();
    const int fieldIndex = m_layer->fields().indexFromName(name);
    if (fieldIndex >= 0) {
        m_fieldTypeLabel->setText(QString("Type: %1").arg(m_layer->fields().at(fieldIndex).typeName()));
    }
    populateValueList(name, m_searchEdit->text());
}

void SelectionFilterDialog::populateValueList(const QString& field, const QString& filter)
{
    m_valueList->clear();
    if (!m_valueCache.hasField(field)) {
        m_statsLabel->clear();
        return;
    }

    const QVector<ValueCache::ValueCount> values = m_valueCache.values(field, filter);
    for (const auto& entry : values) {
        QListWidgetItem* item = new QListWidgetItem(QString("%1  (%2)").arg(entry.value).arg(entry.count));
        // The clean value, the text carries the count
        item->setData(Qt::UserRole, entry.value);
        m_valueList->addItem(item);
    }

    m_statsLabel->setText(QString("%1 of %2 values (%3 features)")
                              .arg(values.size())
                              .arg(m_valueCache.distinctCount(field))
                              .arg(m_valueCache.totalCount(field)));
}

void SelectionFilterDialog::filterValues(const QString& text)
{
    populateValueList(currentField(), text);
}

void SelectionFilterDialog::onOperatorChanged(int index)
{
    Q_UNUSED(index);
    const bool needsValue = !FilterBuilder::isNullOperator(
        FilterBuilder::operatorFromLabel(m_operatorCombo->currentText()));
    m_valueList->setEnabled(needsValue);
    m_manualValue->setEnabled(needsValue);
}

void SelectionFilterDialog::insertLogicOperator(const QString& op)
{
    m_expressionEdit->textCursor().insertText(QString(" %1 ").arg(op));
}

QString SelectionFilterDialog::buildSingleCondition() const
{
    const QString op = FilterBuilder::operatorFromLabel(m_operatorCombo->currentText());

    QStringList values;
    const QString manual = m_manualValue->text().trimmed();
    if (!manual.isEmpty()) {
        values << manual;
    } else {
        // Keep list order so BETWEEN gets its bounds in display order
        for (int i = 0; i < m_valueList->count(); ++i) {
            QListWidgetItem* item = m_valueList->item(i);
            if (item->isSelected()) values << item->data(Qt::UserRole).toString();
        }
    }
    return FilterBuilder::buildCondition(currentField(), op, values);
}

void SelectionFilterDialog::addCondition(const QString& logic)
{
    const QString condition = buildSingleCondition();
    if (condition.isEmpty()) return;

    m_conditions.add(logic, condition);
    updateConditionsDisplay();
    rebuildExpression();
}

void SelectionFilterDialog::removeSelectedConditions()
{
    QList<int> rows;
    for (QListWidgetItem* item : m_conditionList->selectedItems()) {
        rows << m_conditionList->row(item);
    }
    m_conditions.removeAt(rows);
    updateConditionsDisplay();
    rebuildExpression();
}

void SelectionFilterDialog::clearConditions()
{
    m_conditions.clear();
    m_conditionList->clear();
    m_expressionEdit->clear();
    m_matchLabel->clear();
}

void SelectionFilterDialog::updateConditionsDisplay()
{
    m_conditionList->clear();
    m_conditionList->addItems(m_conditions.displayLines());
}

void SelectionFilterDialog::rebuildExpression()
{
    m_expressionEdit->setPlainText(m_conditions.expression());
}

int SelectionFilterDialog::testExpression()
{
    const QString text = expression();
    if (text.isEmpty() || !m_layer) {
        m_matchLabel->setText("No expression");
        m_matchLabel->setStyleSheet("color: #666;");
        return 0;
    }

    QString error;
    const FeatureIds matches = FilterBuilder::matchingFeatures(*m_layer, m_selectedIds, text, &error);
    if (!error.isEmpty()) {
        m_matchLabel->setText(QString("Parse error: %1").arg(error.left(40)));
        m_matchLabel->setStyleSheet("color: #c62828;");
        return -1;
    }

    m_matchLabel->setText(QString("%1 matches out of %2").arg(matches.size()).arg(m_selectedIds.size()));
    m_matchLabel->setStyleSheet("color: #2e7d32; font-weight: bold;");
    return matches.size();
}

QString SelectionFilterDialog::matchText() const
{
    return m_matchLabel->text();
}

void SelectionFilterDialog::copyExpression()
{
    QApplication::clipboard()->setText(m_expressionEdit->toPlainText());
}

QString SelectionFilterDialog::expression() const
{
    return m_expressionEdit->toPlainText().trimmed();
}

void SelectionFilterDialog::setExpression(const QString& text)
{
    m_expressionEdit->setPlainText(text);
}

void SelectionFilterDialog::setCurrentField(const QString& name)
{
    const int index = m_fieldCombo->findData(name);
    if (index >= 0) m_fieldCombo->setCurrentIndex(index);
}

void SelectionFilterDialog::setCurrentOperator(const QString& symbol)
{
    const auto& ops = FilterBuilder::operators();
    for (int i = 0; i < ops.size(); ++i) {
        if (ops.at(i).symbol == symbol) {
            m_operatorCombo->setCurrentIndex(i);
            return;
        }
    }
}

void SelectionFilterDialog::setManualValue(const QString& value)
{
    m_manualValue->setText(value);
}

void SelectionFilterDialog::selectValues(const QStringList& values)
{
    for (int i = 0; i < m_valueList->count(); ++i) {
        QListWidgetItem* item = m_valueList->item(i);
        item->setSelected(values.contains(item->data(Qt::UserRole).toString()));
    }
}

QStringList SelectionFilterDialog::visibleValues() const
{
    QStringList values;
    for (int i = 0; i < m_valueList->count(); ++i) {
        values << m_valueList->item(i)->data(Qt::UserRole).toString();
    }
    return values;
}
