#include <gtest/gtest.h>

#include "GroupPartitioner.hpp"
#include "TestMeshes.hpp"

using namespace vat;

TEST(GroupPartitionerTests, WithoutGroupEveryVertexIsEvenlySpaced)
{
    auto mesh = test::MakeMesh("Crowd", 100);
    const GroupPartition partition = GroupPartitioner::Partition({ mesh.get() }, "");

    EXPECT_FALSE(partition.restricted);
    ASSERT_EQ(100u, partition.totalActive);
    for (uint32_t v = 0; v < 100; ++v)
    {
        const simd::float2 uv = GroupPartitioner::GetAddressUV(partition, v);
        EXPECT_FLOAT_EQ((v + 0.5f) / 100.0f, uv.x);
        EXPECT_FLOAT_EQ(128.0f / 255.0f, uv.y);
    }
}

TEST(GroupPartitionerTests, GroupMembersAreSpacedAmongThemselves)
{
    auto mesh = test::MakeMesh("Crowd", 100);
    std::vector<uint32_t> members;
    for (uint32_t k = 0; k < 10; ++k)
    {
        members.push_back(k * 10u + 3u);
    }
    mesh->SetVertexGroup("Flag", std::move(members));

    const GroupPartition partition = GroupPartitioner::Partition({ mesh.get() }, "Flag");
    EXPECT_TRUE(partition.restricted);
    ASSERT_EQ(10u, partition.totalActive);

    uint32_t pinned = 0u;
    for (uint32_t v = 0; v < 100; ++v)
    {
        const simd::float2 uv = GroupPartitioner::GetAddressUV(partition, v);
        EXPECT_FLOAT_EQ(GroupPartitioner::kAddressV, uv.y);
        if (v % 10u == 3u)
        {
            EXPECT_FLOAT_EQ((v / 10u + 0.5f) / 10.0f, uv.x) << v;
        }
        else
        {
            EXPECT_FLOAT_EQ(GroupPartitioner::kInactiveU, uv.x) << v;
            ++pinned;
        }
    }
    EXPECT_EQ(90u, pinned);
}

TEST(GroupPartitionerTests, UnknownGroupKeepsAllVertices)
{
    auto mesh = test::MakeMesh("Crowd", 5);
    mesh->SetVertexGroup("Flag", { 1u });

    const GroupPartition partition = GroupPartitioner::Partition({ mesh.get() }, "Cape");
    EXPECT_FALSE(partition.restricted);
    EXPECT_EQ(5u, partition.totalActive);
}

TEST(GroupPartitionerTests, ObjectsWithoutTheGroupAreInactive)
{
    auto body = test::MakeMesh("Body", 4);
    auto cape = test::MakeMesh("Cape", 3);
    cape->SetVertexGroup("Cloth", { 0u, 2u });

    const GroupPartition partition = GroupPartitioner::Partition({ body.get(), cape.get() }, "Cloth");
    ASSERT_EQ(7u, partition.GetVertexCount());
    EXPECT_EQ(2u, partition.totalActive);
    for (uint32_t v = 0; v < 4; ++v)
    {
        EXPECT_FALSE(partition.IsActive(v));
    }
    EXPECT_EQ(0u, partition.activeOrdinals[4]);
    EXPECT_FALSE(partition.IsActive(5));
    EXPECT_EQ(1u, partition.activeOrdinals[6]);
}

TEST(GroupPartitionerTests, OutOfRangeMembersAreIgnored)
{
    auto mesh = test::MakeMesh("Crowd", 3);
    mesh->SetVertexGroup("Flag", { 1u, 9u });

    const GroupPartition partition = GroupPartitioner::Partition({ mesh.get() }, "Flag");
    EXPECT_EQ(1u, partition.totalActive);
    EXPECT_TRUE(partition.IsActive(1));
}
