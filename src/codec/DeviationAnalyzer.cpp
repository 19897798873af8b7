#include "DeviationAnalyzer.hpp"

#include <string>

#include "Logging.hpp"

namespace vat
{

BakeStatus DeviationAnalyzer::ValidateSnapshots(const std::vector<Snapshot>& snapshots)
{
    if (snapshots.empty())
    {
        LOG_ERROR("No snapshots to analyze!");
        return BakeStatus::Error(BakeErrorKind::PreconditionError, "No snapshots to analyze!");
    }

    const Snapshot& base = snapshots[0];
    const uint32_t vertexCount = base.GetVertexCount();
    for (uint32_t i = 0; i < vertexCount; ++i)
    {
        if (base.samples[i].index.GetValue() != i)
        {
            std::string message = "Base snapshot sample " + std::to_string(i) + " is bound to vertex "
                + std::to_string(base.samples[i].index.GetValue()) + "!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
    }

    for (uint32_t s = 1, cnt = (uint32_t)snapshots.size(); s < cnt; ++s)
    {
        const Snapshot& snapshot = snapshots[s];
        if (snapshot.GetVertexCount() != vertexCount)
        {
            std::string message = "Snapshot " + std::to_string(s) + " has " + FormatCount(snapshot.GetVertexCount())
                + " vertices, base has " + FormatCount(vertexCount) + "!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
        std::vector<bool> seen(vertexCount, false);
        for (const VertexSample& sample : snapshot.samples)
        {
            if (!sample.index.IsValid() || sample.index.GetValue() >= vertexCount)
            {
                std::string message = "Snapshot " + std::to_string(s) + " references unknown vertex "
                    + std::to_string(sample.index.GetValue()) + "!";
                LOG_ERROR("%s", message.c_str());
                return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
            }
            if (seen[sample.index.GetValue()])
            {
                std::string message = "Snapshot " + std::to_string(s) + " references vertex "
                    + std::to_string(sample.index.GetValue()) + " twice!";
                LOG_ERROR("%s", message.c_str());
                return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
            }
            seen[sample.index.GetValue()] = true;
        }
    }
    return BakeStatus::Ok();
}

BakeStatus DeviationAnalyzer::FindMaxDeviation(const std::vector<Snapshot>& snapshots, double& outMaxDeviation)
{
    BakeStatus status = ValidateSnapshots(snapshots);
    if (!status)
        return status;

    const Snapshot& base = snapshots[0];
    double maxDeviation = 0.0;
    // reverse order, base excluded
    for (size_t s = snapshots.size(); s-- > 1;)
    {
        for (const VertexSample& sample : snapshots[s].samples)
        {
            double offset = (double)simd::length(GetDelta(base, sample));
            if (offset > maxDeviation)
                maxDeviation = offset;
        }
    }

    LOG_DEBUG("max deviation over %u snapshots: %f", (uint32_t)snapshots.size(), maxDeviation);
    outMaxDeviation = maxDeviation;
    return BakeStatus::Ok();
}

} // namespace vat
