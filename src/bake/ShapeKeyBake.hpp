#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "BakeSettings.hpp"
#include "BakeStatus.hpp"

namespace vat
{

class Mesh;

struct ShapeKeyBakeResult
{
    double maxDeviation { 0.0 };
    uint32_t scaleFactor { 1u };
    uint32_t layersUsed { 0u };
    std::vector<std::string> layerNames;
    bool normalsBaked { false };
};

// Offsets of up to four shape keys, two channels per UV layer, plus the
// normals of one shape key in the "normals" colour attribute.
class ShapeKeyBake
{
public:
    static BakeStatus ValidateSceneUnits(const SceneUnits& sceneUnits);

    static BakeStatus Validate(const Mesh& mesh, const ShapeKeyBakeSettings& settings);

    // On failure the mesh is left untouched.
    static BakeStatus Bake(Mesh& mesh, const ShapeKeyBakeSettings& settings, ShapeKeyBakeResult& outResult);
};

} // namespace vat
