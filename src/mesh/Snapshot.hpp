#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include <simd/simd.h>

#include "BakeStatus.hpp"

namespace vat
{

class Mesh;

// Identity of a vertex across all snapshots of one pass. Bound by whoever
// collects the snapshots, never recomputed by the codec.
class VertexHandle
{
public:
    VertexHandle() = default;
    explicit VertexHandle(uint32_t value) : m_Value(value) {}

    uint32_t GetValue() const { return m_Value; }
    bool IsValid() const { return m_Value != UINT32_MAX; }

private:
    uint32_t m_Value { UINT32_MAX };
};

struct VertexSample
{
    VertexHandle index;
    simd::float3 position { 0.0f, 0.0f, 0.0f };
    simd::float3 normal { 0.0f, 0.0f, 1.0f };
};

// One frame or one shape key. In a snapshot list, element 0 is the base.
struct Snapshot
{
    std::vector<VertexSample> samples;

    uint32_t GetVertexCount() const { return (uint32_t)samples.size(); }
};

// Handles are bound to the position in the arrays.
Snapshot MakeSnapshot(const std::vector<simd::float3>& positions, const std::vector<simd::float3>& normals);

// Python-style range(start, end, step) over scene frames.
struct FrameRange
{
    int32_t start { 1 };
    int32_t end { 250 };
    int32_t step { 1 };

    bool IsValid() const { return step > 0; }
    uint32_t GetFrameCount() const;
    int32_t GetFrame(uint32_t sampleIndex) const { return (int32_t)((int64_t)start + (int64_t)sampleIndex * step); }
};

// Evaluates the merged source objects once per sampled frame.
class SnapshotSource
{
public:
    virtual ~SnapshotSource() = default;

    // Vertices of the objects are concatenated in the order given; the
    // returned list holds one snapshot per frame of the range, first frame first.
    virtual BakeStatus CollectFrameSnapshots(const std::vector<const Mesh*>& objects, const FrameRange& frameRange,
                                             std::vector<Snapshot>& outSnapshots) = 0;
};

// Serves frames that were evaluated ahead of time.
class RecordedSnapshotSource : public SnapshotSource
{
public:
    RecordedSnapshotSource() = default;
    ~RecordedSnapshotSource() override = default;

    void SetFrame(int32_t frame, Snapshot&& snapshot) { m_Frames[frame] = std::move(snapshot); }
    uint32_t GetRecordedFrameCount() const { return (uint32_t)m_Frames.size(); }

    uint32_t GetCollectCount() const { return m_CollectCount; }

    BakeStatus CollectFrameSnapshots(const std::vector<const Mesh*>& objects, const FrameRange& frameRange,
                                     std::vector<Snapshot>& outSnapshots) override;

private:
    std::map<int32_t, Snapshot> m_Frames;
    uint32_t m_CollectCount { 0u };
};

} // namespace vat
