#include <gtest/gtest.h>
#include <QSignalSpy>

#include "core/vectorlayer.h"
#include "testhelpers.h"

class VectorLayerTest : public ::testing::Test {
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

TEST_F(VectorLayerTest, LoadedFeaturesGetSequentialIds)
{
    EXPECT_EQ(layer->featureCount(), 5);
    EXPECT_TRUE(layer->hasFeature(0));
    EXPECT_TRUE(layer->hasFeature(4));
    EXPECT_EQ(layer->getFeature(3).attribute("name", layer->fields()).toString(), QString("p3"));
    EXPECT_FALSE(layer->isModified());
}

TEST_F(VectorLayerTest, GetFeaturesIsOrderedAndSkipsMissing)
{
    const QVector<Feature> features = layer->getFeatures(idSet({4, 1, 99}));
    ASSERT_EQ(features.size(), 2);
    EXPECT_EQ(features.at(0).id, 1);
    EXPECT_EQ(features.at(1).id, 4);
}

TEST_F(VectorLayerTest, SelectionBehaviours)
{
    QSignalSpy spy(layer, &VectorLayer::selectionChanged);

    layer->selectByIds(idSet({0, 1}));
    layer->selectByIds(idSet({2}), VectorLayer::AddToSelection);
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({0, 1, 2}));

    layer->selectByIds(idSet({0}), VectorLayer::RemoveFromSelection);
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 2}));

    // Unknown ids are not selectable
    layer->selectByIds(idSet({3, 77}));
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({3}));

    layer->removeSelection();
    EXPECT_EQ(layer->selectedFeatureCount(), 0);
    EXPECT_EQ(spy.count(), 5);
}

TEST_F(VectorLayerTest, SelectByRect)
{
    layer->selectByRect(QRectF(QPointF(0.5, 0.5), QPointF(3.5, 3.5)));
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1, 2, 3}));
}

TEST_F(VectorLayerTest, SelectedBoundsCoverOnlySelectedFeatures)
{
    EXPECT_TRUE(layer->boundingBoxOfSelected().isNull());

    layer->selectByIds(idSet({1, 3}));
    const QRectF box = layer->boundingBoxOfSelected();
    EXPECT_DOUBLE_EQ(box.left(), 1.0);
    EXPECT_DOUBLE_EQ(box.top(), 1.0);
    EXPECT_DOUBLE_EQ(box.right(), 3.0);
    EXPECT_DOUBLE_EQ(box.bottom(), 3.0);
}

TEST_F(VectorLayerTest, MutationsNeedEditMode)
{
    EXPECT_FALSE(layer->deleteFeatures(idSet({1})));
    EXPECT_FALSE(layer->lastError().isEmpty());
    EXPECT_FALSE(layer->changeAttributeValue(1, 0, "x"));
    EXPECT_FALSE(layer->addAttribute(Field("extra", FieldType::String)));
    EXPECT_EQ(layer->featureCount(), 5);
}

TEST_F(VectorLayerTest, DeleteDropsIdsFromSelection)
{
    layer->selectByIds(idSet({1, 2, 3}));
    ASSERT_TRUE(layer->startEditing());

    QSignalSpy deletedSpy(layer, &VectorLayer::featuresDeleted);
    ASSERT_TRUE(layer->deleteFeatures(idSet({2, 3})));

    EXPECT_EQ(layer->featureCount(), 3);
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({1}));
    ASSERT_EQ(deletedSpy.count(), 1);
    EXPECT_EQ(deletedSpy.at(0).at(0).value<FeatureIds>(), idSet({2, 3}));
    EXPECT_TRUE(layer->isModified());
}

TEST_F(VectorLayerTest, ChangeAttributeConvertsToFieldType)
{
    ASSERT_TRUE(layer->startEditing());
    const int area = layer->fields().indexFromName("area");
    const int zone = layer->fields().indexFromName("zone");

    EXPECT_TRUE(layer->changeAttributeValue(1, area, "12.5"));
    EXPECT_DOUBLE_EQ(layer->getFeature(1).attribute(area).toDouble(), 12.5);

    EXPECT_FALSE(layer->changeAttributeValue(1, zone, "not a number"));
    EXPECT_EQ(layer->getFeature(1).attribute(zone).toLongLong(), 1);

    // Empty text clears the value
    EXPECT_TRUE(layer->changeAttributeValue(1, zone, QVariant()));
    EXPECT_FALSE(layer->getFeature(1).attribute(zone).isValid());
}

TEST_F(VectorLayerTest, RollBackRestoresEverything)
{
    layer->selectByIds(idSet({0, 4}));
    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(layer->deleteFeatures(idSet({4})));
    ASSERT_TRUE(layer->addAttribute(Field("owner", FieldType::String)));
    ASSERT_TRUE(layer->changeAttributeValue(0, 0, "changed"));

    QSignalSpy stoppedSpy(layer, &VectorLayer::editingStopped);
    ASSERT_TRUE(layer->rollBack());

    EXPECT_EQ(stoppedSpy.count(), 1);
    EXPECT_EQ(layer->featureCount(), 5);
    EXPECT_EQ(layer->fields().count(), 3);
    EXPECT_EQ(layer->getFeature(0).attribute(0).toString(), QString("p0"));
    EXPECT_EQ(layer->selectedFeatureIds(), idSet({0, 4}));
    EXPECT_FALSE(layer->isEditable());
}

TEST_F(VectorLayerTest, IdsAreNotReusedAfterRollBack)
{
    ASSERT_TRUE(layer->startEditing());
    QVector<FeatureId> discarded;
    Feature extra;
    extra.geometry = FeatureGeometry::fromPoint(QPointF(9, 9));
    ASSERT_TRUE(layer->addFeatures({extra, extra}, &discarded));
    ASSERT_EQ(discarded.size(), 2);
    ASSERT_TRUE(layer->rollBack());
    EXPECT_FALSE(layer->hasFeature(discarded.at(0)));

    ASSERT_TRUE(layer->startEditing());
    QVector<FeatureId> added;
    ASSERT_TRUE(layer->addFeatures({extra}, &added));
    ASSERT_EQ(added.size(), 1);
    for (FeatureId earlier : discarded) {
        EXPECT_GT(added.first(), earlier);
    }
    EXPECT_GT(added.first(), 4);
}

TEST_F(VectorLayerTest, AddAttributeTrimsBeforeDuplicateCheck)
{
    ASSERT_TRUE(layer->startEditing());
    EXPECT_FALSE(layer->addAttribute(Field(" zone ", FieldType::Integer)));
    EXPECT_EQ(layer->lastError(), QString("Field 'zone' already exists"));
    EXPECT_FALSE(layer->addAttribute(Field("   ", FieldType::String)));
    EXPECT_EQ(layer->fields().count(), 3);

    ASSERT_TRUE(layer->addAttribute(Field(" owner ", FieldType::String)));
    EXPECT_EQ(layer->fields().at(3).name, QString("owner"));
}

TEST_F(VectorLayerTest, CommitWithoutDataSourceKeepsChanges)
{
    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(layer->deleteFeatures(idSet({0})));
    ASSERT_TRUE(layer->commitChanges());

    EXPECT_FALSE(layer->isEditable());
    EXPECT_FALSE(layer->isModified());
    EXPECT_EQ(layer->featureCount(), 4);
}

TEST_F(VectorLayerTest, AddFeaturesAssignsNewIds)
{
    ASSERT_TRUE(layer->startEditing());
    QVector<Feature> copies = layer->getFeatures(idSet({0, 1}));
    QVector<FeatureId> newIds;
    ASSERT_TRUE(layer->addFeatures(copies, &newIds));

    ASSERT_EQ(newIds.size(), 2);
    EXPECT_EQ(newIds.at(0), 5);
    EXPECT_EQ(newIds.at(1), 6);
    EXPECT_EQ(layer->getFeature(6).attribute(0).toString(), QString("p1"));
}

TEST_F(VectorLayerTest, AddAttributeRejectsDuplicates)
{
    ASSERT_TRUE(layer->startEditing());
    EXPECT_FALSE(layer->addAttribute(Field("name", FieldType::String)));
    EXPECT_TRUE(layer->addAttribute(Field("owner", FieldType::String)));
    EXPECT_FALSE(layer->getFeature(2).attribute("owner", layer->fields()).isValid());
}
