#include "Snapshot.hpp"

#include <cassert>
#include <string>

#include "Logging.hpp"
#include "Mesh.hpp"

namespace vat
{

Snapshot MakeSnapshot(const std::vector<simd::float3>& positions, const std::vector<simd::float3>& normals)
{
    assert(normals.empty() || normals.size() == positions.size());

    Snapshot snapshot;
    snapshot.samples.resize(positions.size());
    for (uint32_t i = 0, sz = (uint32_t)positions.size(); i < sz; ++i)
    {
        VertexSample& sample = snapshot.samples[i];
        sample.index = VertexHandle(i);
        sample.position = positions[i];
        if (!normals.empty())
            sample.normal = normals[i];
    }
    return snapshot;
}

uint32_t FrameRange::GetFrameCount() const
{
    if (step <= 0 || end <= start)
        return 0u;
    int64_t span = (int64_t)end - (int64_t)start;
    return (uint32_t)((span + step - 1) / step);
}

BakeStatus RecordedSnapshotSource::CollectFrameSnapshots(const std::vector<const Mesh*>& objects, const FrameRange& frameRange,
                                                         std::vector<Snapshot>& outSnapshots)
{
    ++m_CollectCount;

    uint32_t vertexCount = 0u;
    for (const Mesh* object : objects)
    {
        vertexCount += object->GetVertexCount();
    }

    std::vector<Snapshot> snapshots;
    const uint32_t frameCount = frameRange.GetFrameCount();
    snapshots.reserve(frameCount);
    for (uint32_t i = 0; i < frameCount; ++i)
    {
        const int32_t frame = frameRange.GetFrame(i);
        auto it = m_Frames.find(frame);
        if (it == m_Frames.end())
        {
            std::string message = "No recorded snapshot for frame " + std::to_string(frame) + "!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
        if (it->second.GetVertexCount() != vertexCount)
        {
            std::string message = "Recorded frame " + std::to_string(frame) + " has " + FormatCount(it->second.GetVertexCount())
                + " vertices, the selected objects have " + FormatCount(vertexCount) + "!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
        snapshots.push_back(it->second);
    }

    outSnapshots = std::move(snapshots);
    return BakeStatus::Ok();
}

} // namespace vat
