#include "BakeSettings.hpp"

namespace vat
{

UnitSystem ParseUnitSystem(const std::string& name)
{
    if (name == "NONE")
        return UnitSystem::None;
    if (name == "METRIC")
        return UnitSystem::Metric;
    if (name == "IMPERIAL")
        return UnitSystem::Imperial;
    return UnitSystem::Count;
}

const char* GetUnitSystemName(UnitSystem system)
{
    switch (system)
    {
    case UnitSystem::None:
        return "NONE";
    case UnitSystem::Metric:
        return "METRIC";
    case UnitSystem::Imperial:
        return "IMPERIAL";
    default:
        return "UNKNOWN";
    }
}

} // namespace vat
