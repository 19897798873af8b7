#pragma once

#include <cstdint>
#include <string>

#include "BakeStatus.hpp"

namespace vat
{

enum class TargetUnit : uint8_t
{
    MM,
    CM,
    DM,
    M,
    Count
};

// "MM", "CM", "DM", "M"; anything else is TargetUnit::Count
TargetUnit ParseTargetUnit(const std::string& name);
const char* GetTargetUnitName(TargetUnit unit);

class ScaleResolver
{
public:
    // Largest offset in meters a texel may hold before clipping.
    // Unknown units use the centimeter constant.
    static double GetMaxAllowedDeviation(TargetUnit unit);

    // ceil(maxDeviation / maxAllowed), at least 1. Fails with CapacityError
    // for a non-finite deviation or a factor past UINT32_MAX.
    static BakeStatus CalculateScale(double maxDeviation, TargetUnit unit, uint32_t& outScaleFactor);
};

} // namespace vat
