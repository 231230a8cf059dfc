#include <gtest/gtest.h>
#include <QSignalSpy>

#include "core/fieldcalculator.h"
#include "core/vectorlayer.h"
#include "testhelpers.h"

class FieldCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ensureApp();
        layer = makeParcelLayer(5);
    }

    void TearDown() override
    {
        delete layer;
    }

    VectorLayer* layer{nullptr};
};

TEST_F(FieldCalculatorTest, UpdatesOnlyTargetFeatures)
{
    FieldCalculation calc;
    calc.expression = "\"area\" * 2";
    calc.fieldName = "area";
    calc.targets = idSet({1, 3});

    FieldCalculator calculator(layer);
    ASSERT_TRUE(calculator.run(calc)) << qPrintable(calculator.lastError());

    EXPECT_EQ(calculator.updatedCount(), 2);
    EXPECT_DOUBLE_EQ(layer->getFeature(1).attribute(1).toDouble(), 20.0);
    EXPECT_DOUBLE_EQ(layer->getFeature(3).attribute(1).toDouble(), 60.0);
    EXPECT_DOUBLE_EQ(layer->getFeature(2).attribute(1).toDouble(), 20.0);
}

TEST_F(FieldCalculatorTest, OpensAndCommitsItsOwnEditSession)
{
    QSignalSpy startedSpy(layer, &VectorLayer::editingStarted);
    QSignalSpy stoppedSpy(layer, &VectorLayer::editingStopped);

    FieldCalculation calc;
    calc.expression = "1";
    calc.fieldName = "zone";
    calc.targets = idSet({0});

    FieldCalculator calculator(layer);
    ASSERT_TRUE(calculator.run(calc));
    EXPECT_EQ(startedSpy.count(), 1);
    EXPECT_EQ(stoppedSpy.count(), 1);
    EXPECT_FALSE(layer->isEditable());
    EXPECT_FALSE(layer->isModified());
}

TEST_F(FieldCalculatorTest, KeepsAnOpenEditSession)
{
    ASSERT_TRUE(layer->startEditing());

    FieldCalculation calc;
    calc.expression = "'x'";
    calc.fieldName = "name";
    calc.targets = idSet({0, 1});

    FieldCalculator calculator(layer);
    ASSERT_TRUE(calculator.run(calc));
    EXPECT_TRUE(layer->isEditable());
    EXPECT_TRUE(layer->isModified());
}

TEST_F(FieldCalculatorTest, CreatesNewField)
{
    FieldCalculation calc;
    calc.expression = "concat(\"name\", '-', \"zone\")";
    calc.fieldName = "label";
    calc.createField = true;
    calc.fieldType = FieldType::String;
    calc.targets = idSet({2, 4});

    FieldCalculator calculator(layer);
    ASSERT_TRUE(calculator.run(calc)) << qPrintable(calculator.lastError());

    const int index = layer->fields().indexFromName("label");
    ASSERT_GE(index, 0);
    EXPECT_EQ(layer->fields().at(index).length, 254);
    EXPECT_EQ(layer->getFeature(2).attribute(index).toString(), QString("p2-2"));
    EXPECT_EQ(layer->getFeature(4).attribute(index).toString(), QString("p4-1"));
    // Untouched features stay NULL
    EXPECT_FALSE(layer->getFeature(0).attribute(index).isValid());
}

TEST_F(FieldCalculatorTest, RefusesExistingNewField)
{
    FieldCalculation calc;
    calc.expression = "1";
    calc.fieldName = "zone";
    calc.createField = true;
    calc.targets = idSet({0});

    FieldCalculator calculator(layer);
    EXPECT_FALSE(calculator.run(calc));
    EXPECT_TRUE(calculator.lastError().contains("already exists"));
    EXPECT_FALSE(layer->isEditable());
}

TEST_F(FieldCalculatorTest, RejectsMissingInput)
{
    FieldCalculator calculator(layer);

    FieldCalculation noExpression;
    noExpression.fieldName = "zone";
    EXPECT_FALSE(calculator.run(noExpression));
    EXPECT_EQ(calculator.lastError(), QString("Missing expression or field name."));

    FieldCalculation badField;
    badField.expression = "1";
    badField.fieldName = "nope";
    EXPECT_FALSE(calculator.run(badField));

    FieldCalculation badExpression;
    badExpression.expression = "1 +";
    badExpression.fieldName = "zone";
    EXPECT_FALSE(calculator.run(badExpression));
    EXPECT_TRUE(calculator.lastError().startsWith("Expression error"));
}

TEST_F(FieldCalculatorTest, ConversionFailureRollsBack)
{
    FieldCalculation calc;
    calc.expression = "\"name\"";
    calc.fieldName = "zone";
    calc.targets = idSet({0, 1});

    FieldCalculator calculator(layer);
    EXPECT_FALSE(calculator.run(calc));
    EXPECT_FALSE(layer->isEditable());
    EXPECT_EQ(layer->getFeature(0).attribute(2).toLongLong(), 0);
    EXPECT_EQ(layer->getFeature(1).attribute(2).toLongLong(), 1);
}

TEST_F(FieldCalculatorTest, EvaluationErrorsSkipFeatures)
{
    // to_int fails on the text of every name
    FieldCalculation calc;
    calc.expression = "to_int(\"name\")";
    calc.fieldName = "zone";
    calc.targets = idSet({0, 1});

    FieldCalculator calculator(layer);
    ASSERT_TRUE(calculator.run(calc));
    EXPECT_EQ(calculator.updatedCount(), 0);
    EXPECT_EQ(calculator.skippedCount(), 2);
}

TEST_F(FieldCalculatorTest, PreviewDoesNotWrite)
{
    FieldCalculator calculator(layer);
    bool ok = false;
    QString error;
    const QVariant value = calculator.preview("\"area\" + 1", 3, &ok, &error);

    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(value.toDouble(), 31.0);
    EXPECT_DOUBLE_EQ(layer->getFeature(3).attribute(1).toDouble(), 30.0);

    calculator.preview("\"area\" +", 3, &ok, &error);
    EXPECT_FALSE(ok);
    EXPECT_FALSE(error.isEmpty());

    calculator.preview("1", 99, &ok, &error);
    EXPECT_FALSE(ok);
}
