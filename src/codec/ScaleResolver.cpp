#include "ScaleResolver.hpp"

#include <cmath>
#include <cstdio>

#include "Logging.hpp"

namespace vat
{

TargetUnit ParseTargetUnit(const std::string& name)
{
    if (name == "MM")
        return TargetUnit::MM;
    if (name == "CM")
        return TargetUnit::CM;
    if (name == "DM")
        return TargetUnit::DM;
    if (name == "M")
        return TargetUnit::M;
    return TargetUnit::Count;
}

const char* GetTargetUnitName(TargetUnit unit)
{
    switch (unit)
    {
    case TargetUnit::MM:
        return "MM";
    case TargetUnit::CM:
        return "CM";
    case TargetUnit::DM:
        return "DM";
    case TargetUnit::M:
        return "M";
    default:
        return "UNKNOWN";
    }
}

double ScaleResolver::GetMaxAllowedDeviation(TargetUnit unit)
{
    switch (unit)
    {
    case TargetUnit::MM:
        return 0.001;
    case TargetUnit::CM:
        return 0.01;
    case TargetUnit::DM:
        return 0.1;
    case TargetUnit::M:
        return 1.0;
    default:
        LOG_WARNING("Unknown target unit %d, using centimeters", static_cast<int>(unit));
        return 0.01;
    }
}

BakeStatus ScaleResolver::CalculateScale(double maxDeviation, TargetUnit unit, uint32_t& outScaleFactor)
{
    const double maxAllowedDeviation = GetMaxAllowedDeviation(unit);

    double scaleFactor = 1.0;
    if (maxDeviation > 0.0)
        scaleFactor = std::ceil(maxDeviation / maxAllowedDeviation);

    if (!std::isfinite(maxDeviation) || !std::isfinite(scaleFactor) || scaleFactor > (double)UINT32_MAX)
    {
        char buffer[160];
        std::snprintf(buffer, sizeof(buffer), "Max deviation of %g exceeds limit of %g for unit %s!",
                      maxDeviation, maxAllowedDeviation * (double)UINT32_MAX, GetTargetUnitName(unit));
        LOG_ERROR("%s", buffer);
        return BakeStatus::Error(BakeErrorKind::CapacityError, buffer);
    }

    outScaleFactor = scaleFactor < 1.0 ? 1u : (uint32_t)scaleFactor;
    return BakeStatus::Ok();
}

} // namespace vat
