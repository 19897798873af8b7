#pragma once

#include <cstdint>
#include <string>

#include <simd/simd.h>

#include "BakeStatus.hpp"

namespace vat
{

enum class CoordinateSystem : uint8_t
{
    SourceNative,  // Y forward, Z up
    AltEngine,     // X forward, Z up
    Count
};

// "SOURCE_NATIVE"/"BLENDER", "ALT_ENGINE"/"UE"; anything else is CoordinateSystem::Count
CoordinateSystem ParseCoordinateSystem(const std::string& name);
const char* GetCoordinateSystemName(CoordinateSystem system);

// Axis remap + sign table between the authoring convention and a target
// convention: out[i] = sign[i] * in[axis[i]].
class CoordinateTransform
{
public:
    CoordinateTransform() = default;

    // Fails with ConfigurationError for an unknown convention.
    static BakeStatus Create(CoordinateSystem system, CoordinateTransform& outTransform);

    static CoordinateTransform SourceNative();

    CoordinateSystem GetCoordinateSystem() const { return m_System; }

    simd::float3 Apply(simd::float3 v) const;
    simd::float3 ApplyInverse(simd::float3 v) const;

    // [-1, 1] -> [0, 1] after the remap, alpha 1
    simd::float4 EncodeNormal(simd::float3 n) const;

private:
    CoordinateTransform(CoordinateSystem system, const uint8_t axes[3], const float signs[3]);

    CoordinateSystem m_System { CoordinateSystem::SourceNative };
    uint8_t m_Axes[3] { 0u, 1u, 2u };
    float m_Signs[3] { 1.0f, -1.0f, 1.0f };
};

} // namespace vat
