#pragma once

#include <cstdint>
#include <string>

#include "CoordinateTransform.hpp"
#include "ScaleResolver.hpp"
#include "Snapshot.hpp"

namespace vat
{

enum class UnitSystem : uint8_t
{
    None,
    Metric,
    Imperial,
    Count
};

// "NONE", "METRIC", "IMPERIAL"; anything else is UnitSystem::Count
UnitSystem ParseUnitSystem(const std::string& name);
const char* GetUnitSystemName(UnitSystem system);

// unit setup of the host scene the shape keys were authored in
struct SceneUnits
{
    UnitSystem system { UnitSystem::Metric };
    float scaleLength { 0.01f };
};

struct FrameBakeSettings
{
    FrameRange frameRange;
    TargetUnit targetUnit { TargetUnit::CM };
    CoordinateSystem coordinateSystem { CoordinateSystem::SourceNative };
    std::string vertexGroup;  // empty: every vertex is active
    std::string outputName;   // empty: name of the first object
};

struct ShapeKeyBakeSettings
{
    bool bakeNormal { true };
    int32_t normalShapeKeyIndex { 1 };
    int32_t numShapeKeys { 1 };
    int32_t startUVIndex { 1 };
    TargetUnit targetUnit { TargetUnit::CM };
    CoordinateSystem coordinateSystem { CoordinateSystem::AltEngine };
    SceneUnits sceneUnits;
};

} // namespace vat
