#include <gtest/gtest.h>

#include "DeviationAnalyzer.hpp"
#include "TestMeshes.hpp"

using namespace vat;

TEST(DeviationAnalyzerTests, IdenticalSnapshotsHaveNoDeviation)
{
    const std::vector<simd::float3> base = test::MakeLine(4);
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(base, {}));
    snapshots.push_back(MakeSnapshot(base, {}));

    double maxDeviation = -1.0;
    ASSERT_TRUE(DeviationAnalyzer::FindMaxDeviation(snapshots, maxDeviation).IsOk());
    EXPECT_DOUBLE_EQ(0.0, maxDeviation);
}

TEST(DeviationAnalyzerTests, FindsLargestOffsetOverAllFrames)
{
    const std::vector<simd::float3> base = test::MakeLine(3);
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(base, {}));
    snapshots.push_back(test::MakeOffsetSnapshot(base, simd_make_float3(1.0f, 0.0f, 0.0f)));
    snapshots.push_back(test::MakeOffsetSnapshot(base, simd_make_float3(0.0f, 3.0f, 4.0f)));
    snapshots.push_back(test::MakeOffsetSnapshot(base, simd_make_float3(0.0f, -2.0f, 0.0f)));

    double maxDeviation = 0.0;
    ASSERT_TRUE(DeviationAnalyzer::FindMaxDeviation(snapshots, maxDeviation).IsOk());
    EXPECT_NEAR(5.0, maxDeviation, 1e-6);
}

TEST(DeviationAnalyzerTests, SamplesAreMatchedByHandle)
{
    const std::vector<simd::float3> base = test::MakeLine(2);
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(base, {}));

    // same positions listed in reverse order
    Snapshot shuffled;
    shuffled.samples.resize(2);
    shuffled.samples[0].index = VertexHandle(1u);
    shuffled.samples[0].position = base[1];
    shuffled.samples[1].index = VertexHandle(0u);
    shuffled.samples[1].position = base[0];
    snapshots.push_back(shuffled);

    double maxDeviation = -1.0;
    ASSERT_TRUE(DeviationAnalyzer::FindMaxDeviation(snapshots, maxDeviation).IsOk());
    EXPECT_DOUBLE_EQ(0.0, maxDeviation);
}

TEST(DeviationAnalyzerTests, RejectsEmptySnapshotList)
{
    double maxDeviation = 0.0;
    BakeStatus status = DeviationAnalyzer::FindMaxDeviation({}, maxDeviation);
    EXPECT_EQ(BakeErrorKind::PreconditionError, status.GetKind());
}

TEST(DeviationAnalyzerTests, RejectsVertexCountMismatch)
{
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(test::MakeLine(3), {}));
    snapshots.push_back(MakeSnapshot(test::MakeLine(2), {}));

    double maxDeviation = 0.0;
    BakeStatus status = DeviationAnalyzer::FindMaxDeviation(snapshots, maxDeviation);
    EXPECT_EQ(BakeErrorKind::PreconditionError, status.GetKind());
}

TEST(DeviationAnalyzerTests, RejectsUnboundHandles)
{
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(test::MakeLine(2), {}));
    snapshots.push_back(MakeSnapshot(test::MakeLine(2), {}));
    snapshots[1].samples[1].index = VertexHandle();

    EXPECT_EQ(BakeErrorKind::PreconditionError, DeviationAnalyzer::ValidateSnapshots(snapshots).GetKind());

    snapshots[1].samples[1].index = VertexHandle(7u);
    EXPECT_EQ(BakeErrorKind::PreconditionError, DeviationAnalyzer::ValidateSnapshots(snapshots).GetKind());
}

TEST(DeviationAnalyzerTests, BaseMustBeInHandleOrder)
{
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(test::MakeLine(2), {}));
    snapshots[0].samples[0].index = VertexHandle(1u);
    snapshots[0].samples[1].index = VertexHandle(0u);

    EXPECT_EQ(BakeErrorKind::PreconditionError, DeviationAnalyzer::ValidateSnapshots(snapshots).GetKind());
}

TEST(DeviationAnalyzerTests, RejectsDuplicateHandles)
{
    std::vector<Snapshot> snapshots;
    snapshots.push_back(MakeSnapshot(test::MakeLine(2), {}));
    snapshots.push_back(MakeSnapshot(test::MakeLine(2), {}));
    snapshots[1].samples[1].index = VertexHandle(0u);

    EXPECT_EQ(BakeErrorKind::PreconditionError, DeviationAnalyzer::ValidateSnapshots(snapshots).GetKind());

    double maxDeviation = 0.0;
    EXPECT_EQ(BakeErrorKind::PreconditionError, DeviationAnalyzer::FindMaxDeviation(snapshots, maxDeviation).GetKind());
}
