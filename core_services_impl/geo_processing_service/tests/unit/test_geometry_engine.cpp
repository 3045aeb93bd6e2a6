/**
 * @file test_geometry_engine.cpp
 * @brief 几何引擎单元测试 - 基于真实GEOS库
 *
 * 🎯 测试目标：
 * ✅ 缓冲区（正负距离、端点与连接样式）
 * ✅ 交集、并集、相交谓词、外包框
 * ❌ 不使用Mock - 直接测试真实GEOS功能
 */

#include <gtest/gtest.h>

#include "engine/geometry_engine.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"

#include <ogr_api.h>
#include <ogr_geometry.h>

#include <cmath>
#include <vector>

using namespace geobridge::core_services::geo_processing;
using geobridge::core_services::geo_processing::engine::GeometryEngine;

namespace {

OGRGeometryUniquePtr fromWkt(const char* wkt) {
    OGRGeometry* geom = nullptr;
    OGRGeometryFactory::createFromWkt(wkt, nullptr, &geom);
    return OGRGeometryUniquePtr(geom);
}

double areaOf(const OGRGeometry& geom) {
    return OGR_G_Area(OGRGeometry::ToHandle(const_cast<OGRGeometry*>(&geom)));
}

} // anonymous namespace

class GeometryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        geometryEngine = std::make_unique<GeometryEngine>();
        square = fromWkt("POLYGON((0 0, 10 0, 10 10, 0 10, 0 0))");
        overlapping = fromWkt("POLYGON((5 5, 15 5, 15 15, 5 15, 5 5))");
        line = fromWkt("LINESTRING(0 0, 10 0)");
        ASSERT_TRUE(square && overlapping && line);
    }

    std::unique_ptr<GeometryEngine> geometryEngine;
    OGRGeometryUniquePtr square;
    OGRGeometryUniquePtr overlapping;
    OGRGeometryUniquePtr line;
};

// ========== 缓冲区 ==========

TEST_F(GeometryEngineTest, PositiveBufferGrowsPolygon) {
    BufferOptions options;
    auto result = geometryEngine->buffer(*square, 1.0, options);
    ASSERT_TRUE(result);
    EXPECT_GT(areaOf(*result), areaOf(*square));
    // 100 + 4*10 + pi, within the tolerance of a 16-segment quadrant
    EXPECT_NEAR(areaOf(*result), 100.0 + 40.0 + M_PI, 0.01);
}

TEST_F(GeometryEngineTest, NegativeBufferShrinksAndCanErode) {
    BufferOptions options;
    auto shrunk = geometryEngine->buffer(*square, -1.0, options);
    EXPECT_NEAR(areaOf(*shrunk), 64.0, 1e-9);

    auto eroded = geometryEngine->buffer(*square, -6.0, options);
    EXPECT_TRUE(eroded->IsEmpty());
}

TEST_F(GeometryEngineTest, FlatCapBufferOfLineIsRectangle) {
    BufferOptions options;
    options.capStyle = BufferCapStyle::FLAT;
    auto result = geometryEngine->buffer(*line, 1.0, options);
    EXPECT_NEAR(areaOf(*result), 20.0, 1e-9);

    options.capStyle = BufferCapStyle::SQUARE;
    auto squared = geometryEngine->buffer(*line, 1.0, options);
    EXPECT_NEAR(areaOf(*squared), 24.0, 1e-9);
}

TEST_F(GeometryEngineTest, MitreJoinKeepsSquareCorners) {
    BufferOptions options;
    options.joinStyle = BufferJoinStyle::MITRE;
    auto result = geometryEngine->buffer(*square, 1.0, options);
    EXPECT_NEAR(areaOf(*result), 144.0, 1e-9);
}

TEST_F(GeometryEngineTest, SingleSidedBufferCoversOneSide) {
    BufferOptions options;
    options.singleSided = true;
    options.capStyle = BufferCapStyle::FLAT;
    auto result = geometryEngine->buffer(*line, 2.0, options);
    EXPECT_NEAR(areaOf(*result), 20.0, 1e-9);
}

// ========== 叠加 ==========

TEST_F(GeometryEngineTest, IntersectionOfOverlappingSquares) {
    auto result = geometryEngine->intersection(*square, *overlapping);
    ASSERT_TRUE(result);
    EXPECT_NEAR(areaOf(*result), 25.0, 1e-9);
}

TEST_F(GeometryEngineTest, IntersectionOfDisjointGeometriesIsEmpty) {
    auto far = fromWkt("POLYGON((100 100, 101 100, 101 101, 100 101, 100 100))");
    auto result = geometryEngine->intersection(*square, *far);
    EXPECT_TRUE(result->IsEmpty());
    EXPECT_FALSE(geometryEngine->intersects(*square, *far));
    EXPECT_TRUE(geometryEngine->intersects(*square, *overlapping));
}

TEST_F(GeometryEngineTest, UnaryUnionMergesOverlaps) {
    std::vector<const OGRGeometry*> inputs = {square.get(), overlapping.get()};
    auto result = geometryEngine->unaryUnion(inputs);
    EXPECT_NEAR(areaOf(*result), 175.0, 1e-9);
    EXPECT_EQ(wkbFlatten(result->getGeometryType()), wkbPolygon);
}

TEST_F(GeometryEngineTest, UnaryUnionOfNothingIsRejected) {
    EXPECT_THROW(geometryEngine->unaryUnion({}), InvalidParameterException);
}

// ========== 外包框 ==========

TEST_F(GeometryEngineTest, EnvelopeOfPolygon) {
    const OGREnvelope envelope = geometryEngine->envelope(*overlapping);
    EXPECT_DOUBLE_EQ(envelope.MinX, 5.0);
    EXPECT_DOUBLE_EQ(envelope.MinY, 5.0);
    EXPECT_DOUBLE_EQ(envelope.MaxX, 15.0);
    EXPECT_DOUBLE_EQ(envelope.MaxY, 15.0);
}

TEST_F(GeometryEngineTest, EnginesAreIndependent) {
    GeometryEngine other;
    auto a = geometryEngine->intersection(*square, *overlapping);
    auto b = other.intersection(*square, *overlapping);
    EXPECT_TRUE(a->Equals(b.get()));
}
