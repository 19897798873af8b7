#include <gtest/gtest.h>

#include "FrameBake.hpp"
#include "ImageLibrary.hpp"
#include "Mesh.hpp"
#include "TestMeshes.hpp"

using namespace vat;

namespace
{
class FrameBakeTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_Body = test::MakeMesh("Cube", 3);
        m_Body->SetModifiers({ "ARMATURE", "SMOOTH" });
        m_Cape = test::MakeMesh("Cape", 2);

        m_Settings.frameRange.start = 1;
        m_Settings.frameRange.end = 5;
        m_Settings.frameRange.step = 1;
        RecordFrames(simd_make_float3(0.0f, 0.0f, 0.004f));
    }

    // frame f moves every vertex by (f - 1) * step
    void RecordFrames(simd::float3 step)
    {
        const std::vector<simd::float3> base = test::MakeLine(5);
        for (int32_t frame = 1; frame < 5; ++frame)
        {
            m_Source.SetFrame(frame, test::MakeOffsetSnapshot(base, step * (float)(frame - 1)));
        }
    }

    std::vector<Mesh*> GetObjects() { return { m_Body.get(), m_Cape.get() }; }

    std::unique_ptr<Mesh> m_Body;
    std::unique_ptr<Mesh> m_Cape;
    RecordedSnapshotSource m_Source;
    ImageLibrary m_Images;
    FrameBakeSettings m_Settings;
};
}

TEST(FrameBakeLimitTests, LargestMergedMeshPasses)
{
    EXPECT_TRUE(FrameBake::ValidateCounts(2000u + 3000u + 3193u, 8192u).IsOk());
}

TEST(FrameBakeLimitTests, OneMoreVertexOrFrameFails)
{
    BakeStatus vertexStatus = FrameBake::ValidateCounts(2000u + 3000u + 3194u, 8192u);
    EXPECT_EQ(BakeErrorKind::CapacityError, vertexStatus.GetKind());
    EXPECT_EQ("Vertex count of 8,194, exceeds limit of 8,192!", vertexStatus.GetMessage());

    BakeStatus frameStatus = FrameBake::ValidateCounts(8192u, 8193u);
    EXPECT_EQ(BakeErrorKind::CapacityError, frameStatus.GetKind());
    EXPECT_EQ("Frame count of 8,193, exceeds limit of 8,192!", frameStatus.GetMessage());
}

TEST(FrameBakeLimitTests, TextureNames)
{
    EXPECT_EQ("T_Hero_Scale3_O", FrameBake::GetOffsetTextureName("Hero", 3u));
    EXPECT_EQ("T_Hero_N", FrameBake::GetNormalTextureName("Hero"));
}

TEST_F(FrameBakeTests, BakesMergedObjects)
{
    FrameBakeResult result;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).IsOk());

    EXPECT_EQ(1u, m_Source.GetCollectCount());
    EXPECT_EQ(5u, result.vertexCount);
    EXPECT_EQ(5u, result.activeVertexCount);
    EXPECT_EQ(4u, result.frameCount);
    EXPECT_NEAR(0.012, result.maxDeviation, 1e-6);
    EXPECT_EQ(2u, result.scaleFactor);
    EXPECT_EQ("T_Cube_Scale2_O", result.offsetTextureName);
    EXPECT_EQ("T_Cube_N", result.normalTextureName);

    const Image* offsets = m_Images.FindImage(result.offsetTextureName);
    ASSERT_NE(nullptr, offsets);
    EXPECT_EQ(PixelFormat::RGBA32Float, offsets->GetFormat());
    EXPECT_EQ(5u, offsets->GetWidth());
    EXPECT_EQ(4u, offsets->GetHeight());
    // last frame in row 0, stored at twice its size
    EXPECT_NEAR(0.024f, offsets->GetPixel(4, 0).z, 1e-6f);
    EXPECT_FLOAT_EQ(0.0f, offsets->GetPixel(4, 3).z);

    const Image* normals = m_Images.FindImage(result.normalTextureName);
    ASSERT_NE(nullptr, normals);
    EXPECT_EQ(PixelFormat::RGBA8Unorm, normals->GetFormat());
    EXPECT_FLOAT_EQ(1.0f, normals->GetPixel(0, 0).z);

    for (const Mesh* object : { m_Body.get(), m_Cape.get() })
    {
        EXPECT_NE(nullptr, object->FindUVLayer("vertex_anim")) << object->GetName();
    }
    EXPECT_FLOAT_EQ(4.5f / 5.0f, m_Cape->FindUVLayer("vertex_anim")->uvs[1].x);
}

TEST_F(FrameBakeTests, OutputNameOverridesObjectName)
{
    m_Settings.outputName = "Crowd";
    FrameBakeResult result;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).IsOk());
    EXPECT_EQ("T_Crowd_N", result.normalTextureName);
    EXPECT_NE(nullptr, m_Images.FindImage("T_Crowd_Scale2_O"));
}

TEST_F(FrameBakeTests, RepeatedPassesAreIdempotent)
{
    FrameBakeResult first;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, first).IsOk());
    const std::vector<float> offsets = m_Images.FindImage(first.offsetTextureName)->GetPixels();
    const std::vector<float> normals = m_Images.FindImage(first.normalTextureName)->GetPixels();

    FrameBakeResult second;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, second).IsOk());
    EXPECT_EQ(2u, m_Images.GetImageCount());
    EXPECT_EQ(offsets, m_Images.FindImage(second.offsetTextureName)->GetPixels());
    EXPECT_EQ(normals, m_Images.FindImage(second.normalTextureName)->GetPixels());
    EXPECT_EQ(1u, m_Body->GetUVLayerCount());
}

TEST_F(FrameBakeTests, ShorterRangeResizesInPlace)
{
    FrameBakeResult result;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).IsOk());

    m_Settings.frameRange.step = 2;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).IsOk());
    EXPECT_EQ(2u, result.frameCount);
    EXPECT_EQ(2u, m_Images.FindImage(result.normalTextureName)->GetHeight());
    EXPECT_EQ(3u, m_Images.GetImageCount());
}

TEST_F(FrameBakeTests, VertexGroupNarrowsTheTexture)
{
    m_Cape->SetVertexGroup("Cloth", { 0u, 1u });
    m_Settings.vertexGroup = "Cloth";

    FrameBakeResult result;
    ASSERT_TRUE(FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).IsOk());
    EXPECT_EQ(2u, result.activeVertexCount);
    EXPECT_EQ(2u, m_Images.FindImage(result.offsetTextureName)->GetWidth());
    EXPECT_FLOAT_EQ(0.0f, m_Body->FindUVLayer("vertex_anim")->uvs[0].x);
    EXPECT_FLOAT_EQ(0.25f, m_Cape->FindUVLayer("vertex_anim")->uvs[0].x);
}

TEST_F(FrameBakeTests, EmptyGroupFails)
{
    m_Cape->SetVertexGroup("Cloth", {});
    m_Settings.vertexGroup = "Cloth";

    FrameBakeResult result;
    BakeStatus status = FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result);
    EXPECT_EQ(BakeErrorKind::PreconditionError, status.GetKind());
    EXPECT_EQ(0u, m_Images.GetImageCount());
    EXPECT_EQ(0u, m_Cape->GetUVLayerCount());
}

TEST_F(FrameBakeTests, UnsupportedModifierStopsBeforeSampling)
{
    m_Cape->SetModifiers({ "SUBSURF" });

    FrameBakeResult result;
    BakeStatus status = FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result);
    EXPECT_EQ(BakeErrorKind::PreconditionError, status.GetKind());
    EXPECT_NE(std::string::npos, status.GetMessage().find("Subsurf"));
    EXPECT_NE(std::string::npos, status.GetMessage().find("Cape"));
    EXPECT_EQ(0u, m_Source.GetCollectCount());
    EXPECT_EQ(0u, m_Images.GetImageCount());
    EXPECT_EQ(0u, m_Body->GetUVLayerCount());
}

TEST_F(FrameBakeTests, TooManyFramesStopsBeforeSampling)
{
    m_Settings.frameRange.end = 8194;

    FrameBakeResult result;
    BakeStatus status = FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result);
    EXPECT_EQ(BakeErrorKind::CapacityError, status.GetKind());
    EXPECT_EQ(0u, m_Source.GetCollectCount());
}

TEST_F(FrameBakeTests, EmptyFrameRangeFails)
{
    m_Settings.frameRange.step = 0;
    FrameBakeResult result;
    EXPECT_EQ(BakeErrorKind::PreconditionError, FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).GetKind());

    m_Settings.frameRange.step = 1;
    m_Settings.frameRange.end = m_Settings.frameRange.start;
    EXPECT_EQ(BakeErrorKind::PreconditionError, FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).GetKind());
    EXPECT_EQ(0u, m_Source.GetCollectCount());
}

TEST_F(FrameBakeTests, UnknownConventionIsConfigurationError)
{
    m_Settings.coordinateSystem = CoordinateSystem::Count;
    FrameBakeResult result;
    EXPECT_EQ(BakeErrorKind::ConfigurationError, FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result).GetKind());
}

TEST_F(FrameBakeTests, MissingFrameWritesNothing)
{
    m_Settings.frameRange.end = 7;

    FrameBakeResult result;
    BakeStatus status = FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result);
    EXPECT_EQ(BakeErrorKind::PreconditionError, status.GetKind());
    EXPECT_EQ(0u, m_Images.GetImageCount());
    EXPECT_EQ(0u, m_Cape->GetUVLayerCount());
}

TEST_F(FrameBakeTests, UnboundedDeviationWritesNothing)
{
    m_Settings.targetUnit = TargetUnit::MM;
    RecordFrames(simd_make_float3(0.0f, 0.0f, 5.0e6f));

    FrameBakeResult result;
    BakeStatus status = FrameBake::Bake(GetObjects(), m_Source, m_Images, m_Settings, result);
    EXPECT_EQ(BakeErrorKind::CapacityError, status.GetKind());
    EXPECT_EQ(0u, m_Images.GetImageCount());
    EXPECT_EQ(0u, m_Cape->GetUVLayerCount());
}
