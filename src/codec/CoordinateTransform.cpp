#include "CoordinateTransform.hpp"

#include "Logging.hpp"

namespace
{
    // (x, -y, z)
    const uint8_t kSourceNativeAxes[3] = { 0u, 1u, 2u };
    const float kSourceNativeSigns[3] = { 1.0f, -1.0f, 1.0f };

    // (-y, -x, z)
    const uint8_t kAltEngineAxes[3] = { 1u, 0u, 2u };
    const float kAltEngineSigns[3] = { -1.0f, -1.0f, 1.0f };
}

namespace vat
{

CoordinateSystem ParseCoordinateSystem(const std::string& name)
{
    if (name == "SOURCE_NATIVE" || name == "BLENDER")
        return CoordinateSystem::SourceNative;
    if (name == "ALT_ENGINE" || name == "UE")
        return CoordinateSystem::AltEngine;
    return CoordinateSystem::Count;
}

const char* GetCoordinateSystemName(CoordinateSystem system)
{
    switch (system)
    {
    case CoordinateSystem::SourceNative:
        return "SOURCE_NATIVE";
    case CoordinateSystem::AltEngine:
        return "ALT_ENGINE";
    default:
        return "UNKNOWN";
    }
}

CoordinateTransform::CoordinateTransform(CoordinateSystem system, const uint8_t axes[3], const float signs[3])
: m_System(system)
{
    for (uint32_t i = 0; i < 3; ++i)
    {
        m_Axes[i] = axes[i];
        m_Signs[i] = signs[i];
    }
}

BakeStatus CoordinateTransform::Create(CoordinateSystem system, CoordinateTransform& outTransform)
{
    switch (system)
    {
    case CoordinateSystem::SourceNative:
        outTransform = CoordinateTransform(system, kSourceNativeAxes, kSourceNativeSigns);
        return BakeStatus::Ok();
    case CoordinateSystem::AltEngine:
        outTransform = CoordinateTransform(system, kAltEngineAxes, kAltEngineSigns);
        return BakeStatus::Ok();
    default:
        LOG_ERROR("Unsupported coordinate system: %d", static_cast<int>(system));
        return BakeStatus::Error(BakeErrorKind::ConfigurationError,
                                 "Unsupported coordinate system: " + std::to_string(static_cast<int>(system)));
    }
}

CoordinateTransform CoordinateTransform::SourceNative()
{
    return CoordinateTransform(CoordinateSystem::SourceNative, kSourceNativeAxes, kSourceNativeSigns);
}

simd::float3 CoordinateTransform::Apply(simd::float3 v) const
{
    simd::float3 out;
    for (uint32_t i = 0; i < 3; ++i)
    {
        out[i] = m_Signs[i] * v[m_Axes[i]];
    }
    return out;
}

simd::float3 CoordinateTransform::ApplyInverse(simd::float3 v) const
{
    simd::float3 out;
    for (uint32_t i = 0; i < 3; ++i)
    {
        out[m_Axes[i]] = m_Signs[i] * v[i];
    }
    return out;
}

simd::float4 CoordinateTransform::EncodeNormal(simd::float3 n) const
{
    simd::float3 t = Apply(n);
    return simd_make_float4((t.x + 1.0f) * 0.5f, (t.y + 1.0f) * 0.5f, (t.z + 1.0f) * 0.5f, 1.0f);
}

} // namespace vat
