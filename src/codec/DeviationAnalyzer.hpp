#pragma once

#include <vector>

#include "BakeStatus.hpp"
#include "Snapshot.hpp"

namespace vat
{

class DeviationAnalyzer
{
public:
    // Every snapshot must address the same vertices as the base (element 0),
    // and the base must hold handle i at position i.
    static BakeStatus ValidateSnapshots(const std::vector<Snapshot>& snapshots);

    // Largest |position - base position| over all non-base snapshots.
    // Snapshots are visited last to first, the order the texture rows use.
    static BakeStatus FindMaxDeviation(const std::vector<Snapshot>& snapshots, double& outMaxDeviation);

    static simd::float3 GetDelta(const Snapshot& base, const VertexSample& sample)
    {
        return sample.position - base.samples[sample.index.GetValue()].position;
    }
};

} // namespace vat
