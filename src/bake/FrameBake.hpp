#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "BakeSettings.hpp"
#include "BakeStatus.hpp"
#include "Snapshot.hpp"

namespace vat
{

class Mesh;
class ImageLibrary;

struct FrameBakeResult
{
    double maxDeviation { 0.0 };
    uint32_t scaleFactor { 1u };
    uint32_t vertexCount { 0u };
    uint32_t activeVertexCount { 0u };
    uint32_t frameCount { 0u };

    std::string offsetTextureName;
    std::string normalTextureName;
};

// Per frame vertex offsets and normals of a set of merged objects, stored in
// an offset texture, a normal texture and a "vertex_anim" UV layer on every
// object.
class FrameBake
{
public:
    static constexpr uint32_t kMaxVertexCount = 8192u;
    static constexpr uint32_t kMaxFrameCount = 8192u;

    // deformers whose result keeps the vertex count and order stable
    static const std::vector<std::string>& GetAllowedModifiers();

    // T_<name>_Scale<scale>_O
    static std::string GetOffsetTextureName(const std::string& name, uint32_t scaleFactor);
    // T_<name>_N
    static std::string GetNormalTextureName(const std::string& name);

    static BakeStatus ValidateModifiers(const std::vector<const Mesh*>& objects);
    static BakeStatus ValidateCounts(uint32_t vertexCount, uint32_t frameCount);

    // All checks that can run before a single frame is evaluated.
    static BakeStatus Validate(const std::vector<const Mesh*>& objects, const FrameBakeSettings& settings);

    // Runs one complete pass. On failure neither the objects nor the image
    // library have been touched.
    static BakeStatus Bake(const std::vector<Mesh*>& objects, SnapshotSource& source, ImageLibrary& images,
                           const FrameBakeSettings& settings, FrameBakeResult& outResult);
};

} // namespace vat
