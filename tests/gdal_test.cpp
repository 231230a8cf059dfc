#include <gtest/gtest.h>
#include <QDir>
#include <QTemporaryDir>

#include "gdal/gdalreader.h"
#include "gdal/gdalwriter.h"
#include "core/vectorlayer.h"
#include "testhelpers.h"

class GdalRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ensureApp();
        GdalReader::initialize();
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("parcels.gpkg");

        VectorLayer* source = makeParcelLayer(4);
        GdalWriter writer;
        ASSERT_TRUE(writer.exportLayer(*source, path, "GPKG")) << qPrintable(writer.lastError());
        delete source;
    }

    VectorLayer* readBack()
    {
        GdalReader reader;
        if (!reader.readFile(path)) {
            ADD_FAILURE() << qPrintable(reader.lastError());
            return nullptr;
        }
        EXPECT_EQ(reader.layers().size(), 1);
        return reader.layers().value(0);
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(GdalRoundTripTest, ExportedLayerReadsBack)
{
    VectorLayer* layer = readBack();
    ASSERT_NE(layer, nullptr);

    EXPECT_EQ(layer->name(), QString("parcels"));
    EXPECT_EQ(layer->geometryType(), GeometryType::Point);
    EXPECT_EQ(layer->featureCount(), 4);
    EXPECT_EQ(layer->dataSourcePath(), path);
    EXPECT_EQ(layer->dataSourceLayerName(), QString("parcels"));

    const Fields& fields = layer->fields();
    ASSERT_EQ(fields.count(), 3);
    EXPECT_EQ(fields.at(fields.indexFromName("area")).type, FieldType::Double);
    EXPECT_TRUE(fields.at(fields.indexFromName("zone")).isNumeric());

    QStringList names;
    for (FeatureId fid : layer->featureIds()) {
        names << layer->getFeature(fid).attribute("name", fields).toString();
    }
    names.sort();
    EXPECT_EQ(names, QStringList({"p0", "p1", "p2", "p3"}));
    delete layer;
}

TEST_F(GdalRoundTripTest, CommitWritesThroughToFile)
{
    VectorLayer* layer = readBack();
    ASSERT_NE(layer, nullptr);

    FeatureId target = -1;
    FeatureId doomed = -1;
    for (FeatureId fid : layer->featureIds()) {
        const QString name = layer->getFeature(fid).attribute("name", layer->fields()).toString();
        if (name == "p2") target = fid;
        if (name == "p0") doomed = fid;
    }
    ASSERT_GE(target, 0);
    ASSERT_GE(doomed, 0);

    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(layer->changeAttributeValue(target, layer->fields().indexFromName("name"), "renamed"));
    ASSERT_TRUE(layer->deleteFeatures(idSet({doomed})));
    ASSERT_TRUE(layer->commitChanges()) << qPrintable(layer->lastError());
    delete layer;

    VectorLayer* reloaded = readBack();
    ASSERT_NE(reloaded, nullptr);
    EXPECT_EQ(reloaded->featureCount(), 3);
    QStringList names;
    for (FeatureId fid : reloaded->featureIds()) {
        names << reloaded->getFeature(fid).attribute("name", reloaded->fields()).toString();
    }
    EXPECT_TRUE(names.contains("renamed"));
    EXPECT_FALSE(names.contains("p2"));
    EXPECT_FALSE(names.contains("p0"));
    delete reloaded;
}

TEST_F(GdalRoundTripTest, MissingFileReportsError)
{
    GdalReader reader;
    EXPECT_FALSE(reader.readFile(dir.filePath("missing.gpkg")));
    EXPECT_FALSE(reader.lastError().isEmpty());
    EXPECT_TRUE(reader.layers().isEmpty());
}

TEST_F(GdalRoundTripTest, ExportFailsWhenFieldIsRejected)
{
    VectorLayer* layer = makeParcelLayer(2);
    ASSERT_TRUE(layer->startEditing());
    // GeoPackage keeps "fid" for the integer primary key
    ASSERT_TRUE(layer->addAttribute(Field("fid", FieldType::String, 10)));

    const QString out = dir.filePath("rejected.gpkg");
    GdalWriter writer;
    EXPECT_FALSE(writer.exportLayer(*layer, out, "GPKG"));
    EXPECT_TRUE(writer.lastError().contains("fid")) << qPrintable(writer.lastError());
    EXPECT_FALSE(QFileInfo::exists(out));
    delete layer;
}

class ShapefileCommitTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ensureApp();
        GdalReader::initialize();
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("parcels.shp");

        VectorLayer* source = makeParcelLayer(3);
        ASSERT_TRUE(source->startEditing());
        ASSERT_TRUE(source->addAttribute(Field("ownership_class", FieldType::String, 16)));
        ASSERT_TRUE(source->addAttribute(Field("ownership_code", FieldType::Integer, 6)));
        for (FeatureId fid : source->featureIds()) {
            ASSERT_TRUE(source->changeAttributeValue(fid, 3, QString("class%1").arg(fid)));
            ASSERT_TRUE(source->changeAttributeValue(fid, 4, fid + 100));
        }
        GdalWriter writer;
        ASSERT_TRUE(writer.exportLayer(*source, path, "ESRI Shapefile")) << qPrintable(writer.lastError());
        delete source;
    }

    VectorLayer* readBack()
    {
        GdalReader reader;
        if (!reader.readFile(path)) {
            ADD_FAILURE() << qPrintable(reader.lastError());
            return nullptr;
        }
        return reader.layers().value(0);
    }

    QStringList nameColumn(VectorLayer* layer)
    {
        QStringList names;
        for (FeatureId fid : layer->featureIds()) {
            names << layer->getFeature(fid).attribute(0).toString();
        }
        names.sort();
        return names;
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(ShapefileCommitTest, TruncatedFieldNamesKeepTheirColumns)
{
    VectorLayer* layer = readBack();
    ASSERT_NE(layer, nullptr);
    ASSERT_EQ(layer->fields().count(), 5);

    for (FeatureId fid : layer->featureIds()) {
        const Feature f = layer->getFeature(fid);
        const QString name = f.attribute(0).toString();
        ASSERT_TRUE(name.startsWith("p"));
        const int i = name.mid(1).toInt();
        EXPECT_EQ(f.attribute(3).toString(), QString("class%1").arg(i));
        EXPECT_EQ(f.attribute(4).toLongLong(), i + 100);
    }
    delete layer;
}

TEST_F(ShapefileCommitTest, CommitAddsLongNamedFieldOnce)
{
    VectorLayer* layer = readBack();
    ASSERT_NE(layer, nullptr);
    ASSERT_TRUE(layer->startEditing());
    ASSERT_TRUE(layer->addAttribute(Field("surveyed_by_office", FieldType::String, 20)));
    const int column = layer->fields().count() - 1;
    for (FeatureId fid : layer->featureIds()) {
        ASSERT_TRUE(layer->changeAttributeValue(fid, column, "north"));
    }
    ASSERT_TRUE(layer->commitChanges()) << qPrintable(layer->lastError());
    delete layer;

    VectorLayer* reloaded = readBack();
    ASSERT_NE(reloaded, nullptr);
    ASSERT_EQ(reloaded->fields().count(), 6);
    EXPECT_EQ(reloaded->featureCount(), 3);
    for (FeatureId fid : reloaded->featureIds()) {
        EXPECT_EQ(reloaded->getFeature(fid).attribute(5).toString(), QString("north"));
    }

    // A second commit must not grow the schema again
    ASSERT_TRUE(reloaded->startEditing());
    const FeatureId first = reloaded->featureIds().first();
    ASSERT_TRUE(reloaded->changeAttributeValue(first, 5, "south"));
    ASSERT_TRUE(reloaded->commitChanges()) << qPrintable(reloaded->lastError());
    delete reloaded;

    VectorLayer* again = readBack();
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(again->fields().count(), 6);
    delete again;

    const QStringList leftovers = QDir(dir.path()).entryList({"*_commit.*", "*_backup.*"}, QDir::Files);
    EXPECT_TRUE(leftovers.isEmpty()) << qPrintable(leftovers.join(", "));
}

TEST_F(ShapefileCommitTest, FailedCommitLeavesFileIntact)
{
    VectorLayer* layer = readBack();
    ASSERT_NE(layer, nullptr);
    ASSERT_TRUE(layer->startEditing());
    const FeatureId first = layer->featureIds().first();
    ASSERT_TRUE(layer->changeAttributeValue(first, 0, "changed"));

    // A point shapefile refuses polygons, so the write stops partway
    Feature square;
    square.geometry = FeatureGeometry::fromPolygon({QPointF(0, 0), QPointF(1, 0), QPointF(1, 1), QPointF(0, 1)});
    ASSERT_TRUE(layer->addFeatures({square}));

    EXPECT_FALSE(layer->commitChanges());
    EXPECT_TRUE(layer->isEditable());
    EXPECT_FALSE(layer->lastError().isEmpty());
    delete layer;

    VectorLayer* reloaded = readBack();
    ASSERT_NE(reloaded, nullptr);
    EXPECT_EQ(reloaded->featureCount(), 3);
    EXPECT_EQ(nameColumn(reloaded), QStringList({"p0", "p1", "p2"}));
    delete reloaded;

    const QStringList leftovers = QDir(dir.path()).entryList({"*_commit.*", "*_backup.*"}, QDir::Files);
    EXPECT_TRUE(leftovers.isEmpty()) << qPrintable(leftovers.join(", "));
}
