#include <gtest/gtest.h>

#include "CoordinateTransform.hpp"

using namespace vat;

namespace
{
void ExpectFloat3Eq(simd::float3 expected, simd::float3 actual)
{
    EXPECT_FLOAT_EQ(expected.x, actual.x);
    EXPECT_FLOAT_EQ(expected.y, actual.y);
    EXPECT_FLOAT_EQ(expected.z, actual.z);
}

CoordinateTransform CreateTransform(CoordinateSystem system)
{
    CoordinateTransform transform;
    EXPECT_TRUE(CoordinateTransform::Create(system, transform).IsOk());
    return transform;
}
}

TEST(CoordinateTransformTests, SourceNativeFlipsY)
{
    const CoordinateTransform transform = CreateTransform(CoordinateSystem::SourceNative);
    ExpectFloat3Eq(simd_make_float3(1.0f, -2.0f, 3.0f), transform.Apply(simd_make_float3(1.0f, 2.0f, 3.0f)));
}

TEST(CoordinateTransformTests, AltEngineSwapsAndNegatesXY)
{
    const CoordinateTransform transform = CreateTransform(CoordinateSystem::AltEngine);
    ExpectFloat3Eq(simd_make_float3(-2.0f, -1.0f, 3.0f), transform.Apply(simd_make_float3(1.0f, 2.0f, 3.0f)));
}

TEST(CoordinateTransformTests, InverseUndoesApply)
{
    const simd::float3 v = simd_make_float3(0.25f, -4.0f, 7.5f);
    for (CoordinateSystem system : { CoordinateSystem::SourceNative, CoordinateSystem::AltEngine })
    {
        const CoordinateTransform transform = CreateTransform(system);
        ExpectFloat3Eq(v, transform.ApplyInverse(transform.Apply(v)));
        // both conventions are their own inverse
        ExpectFloat3Eq(v, transform.Apply(transform.Apply(v)));
    }
}

TEST(CoordinateTransformTests, EncodeNormalRangeCompresses)
{
    const CoordinateTransform transform = CoordinateTransform::SourceNative();

    simd::float4 up = transform.EncodeNormal(simd_make_float3(0.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(0.5f, up.x);
    EXPECT_FLOAT_EQ(0.5f, up.y);
    EXPECT_FLOAT_EQ(1.0f, up.z);
    EXPECT_FLOAT_EQ(1.0f, up.w);

    simd::float4 forward = transform.EncodeNormal(simd_make_float3(0.0f, 1.0f, 0.0f));
    EXPECT_FLOAT_EQ(0.5f, forward.x);
    EXPECT_FLOAT_EQ(0.0f, forward.y);
    EXPECT_FLOAT_EQ(0.5f, forward.z);
    EXPECT_FLOAT_EQ(1.0f, forward.w);
}

TEST(CoordinateTransformTests, UnknownSystemIsConfigurationError)
{
    CoordinateTransform transform;
    BakeStatus status = CoordinateTransform::Create(CoordinateSystem::Count, transform);
    EXPECT_FALSE(status.IsOk());
    EXPECT_EQ(BakeErrorKind::ConfigurationError, status.GetKind());
}

TEST(CoordinateTransformTests, ParsesConventionNames)
{
    EXPECT_EQ(CoordinateSystem::SourceNative, ParseCoordinateSystem("BLENDER"));
    EXPECT_EQ(CoordinateSystem::SourceNative, ParseCoordinateSystem("SOURCE_NATIVE"));
    EXPECT_EQ(CoordinateSystem::AltEngine, ParseCoordinateSystem("UE"));
    EXPECT_EQ(CoordinateSystem::AltEngine, ParseCoordinateSystem("ALT_ENGINE"));
    EXPECT_EQ(CoordinateSystem::Count, ParseCoordinateSystem("UNITY"));
}
