#include "ShapeKeyBake.hpp"

#include <cmath>

#include "ChannelPacker.hpp"
#include "CoordinateTransform.hpp"
#include "DeviationAnalyzer.hpp"
#include "Logging.hpp"
#include "Mesh.hpp"
#include "ScaleResolver.hpp"
#include "Snapshot.hpp"
#include "Timer.hpp"

namespace vat
{

BakeStatus ShapeKeyBake::ValidateSceneUnits(const SceneUnits& sceneUnits)
{
    const double roundedScale = std::round((double)sceneUnits.scaleLength * 100.0) / 100.0;
    if (sceneUnits.system != UnitSystem::Metric || std::fabs(roundedScale - 0.01) > 1e-9)
    {
        LOG_ERROR("Scene Units must be Metric with a Unit Scale of 0.01! (%s, %f)",
                  GetUnitSystemName(sceneUnits.system), sceneUnits.scaleLength);
        return BakeStatus::Error(BakeErrorKind::PreconditionError, "Scene Units must be Metric with a Unit Scale of 0.01!");
    }
    return BakeStatus::Ok();
}

BakeStatus ShapeKeyBake::Validate(const Mesh& mesh, const ShapeKeyBakeSettings& settings)
{
    BakeStatus status = ValidateSceneUnits(settings.sceneUnits);
    if (!status)
        return status;

    const uint32_t shapeKeyCount = mesh.GetShapeKeyCount();
    if (shapeKeyCount == 0u)
    {
        LOG_ERROR("Object has no shape keys! (%s)", mesh.GetName().c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, "Object has no shape keys!");
    }

    status = ChannelPacker::ValidateLayout(settings.numShapeKeys, settings.startUVIndex);
    if (!status)
        return status;

    if (shapeKeyCount < 1u + (uint32_t)settings.numShapeKeys)
    {
        LOG_ERROR("Object needs additional shape keys! (%s has %u, needs %d)",
                  mesh.GetName().c_str(), shapeKeyCount, 1 + settings.numShapeKeys);
        return BakeStatus::Error(BakeErrorKind::PreconditionError, "Object needs additional shape keys!");
    }

    const ShapeKeyData* shapeKeyData = mesh.GetShapeKeyData();
    for (const ShapeKey& key : shapeKeyData->keys)
    {
        if (key.positions.size() != mesh.GetVertexCount() || key.normals.size() != mesh.GetVertexCount())
        {
            std::string message = "Shape key " + key.name + " of " + mesh.GetName() + " does not match the vertex count of "
                + FormatCount(mesh.GetVertexCount()) + "!";
            LOG_ERROR("%s", message.c_str());
            return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
        }
    }

    CoordinateTransform transform;
    status = CoordinateTransform::Create(settings.coordinateSystem, transform);
    if (!status)
        return status;

    if (settings.bakeNormal
        && (settings.normalShapeKeyIndex < 0 || (uint32_t)settings.normalShapeKeyIndex >= shapeKeyCount))
    {
        LOG_ERROR("Invalid shape key index for baking normals. (%d, %u shape keys)", settings.normalShapeKeyIndex, shapeKeyCount);
        return BakeStatus::Error(BakeErrorKind::IndexError, "Invalid shape key index for baking normals.");
    }

    return mesh.ValidateLoops();
}

BakeStatus ShapeKeyBake::Bake(Mesh& mesh, const ShapeKeyBakeSettings& settings, ShapeKeyBakeResult& outResult)
{
    Timer timer;

    BakeStatus status = Validate(mesh, settings);
    if (!status)
        return status;

    CoordinateTransform transform;
    status = CoordinateTransform::Create(settings.coordinateSystem, transform);
    if (!status)
        return status;

    LOG_INFO("Baking %d shape keys of %s starting at UV layer %d", settings.numShapeKeys, mesh.GetName().c_str(), settings.startUVIndex);

    const std::vector<ShapeKey>& keys = mesh.GetShapeKeyData()->keys;
    const uint32_t numShapeKeys = (uint32_t)settings.numShapeKeys;

    std::vector<Snapshot> snapshots;
    snapshots.reserve(numShapeKeys + 1u);
    for (uint32_t k = 0; k <= numShapeKeys; ++k)
    {
        snapshots.push_back(MakeSnapshot(keys[k].positions, keys[k].normals));
    }

    double maxDeviation = 0.0;
    status = DeviationAnalyzer::FindMaxDeviation(snapshots, maxDeviation);
    if (!status)
        return status;
    uint32_t scaleFactor = 1u;
    status = ScaleResolver::CalculateScale(maxDeviation, settings.targetUnit, scaleFactor);
    if (!status)
        return status;
    LOG_INFO("Max deviation %f, target unit %s, scale factor %u", maxDeviation, GetTargetUnitName(settings.targetUnit), scaleFactor);

    const Snapshot& base = snapshots[0];
    std::vector<std::vector<simd::float3>> keyDeltas(numShapeKeys);
    for (uint32_t k = 0; k < numShapeKeys; ++k)
    {
        const Snapshot& snapshot = snapshots[k + 1u];
        std::vector<simd::float3>& deltas = keyDeltas[k];
        deltas.resize(snapshot.GetVertexCount());
        for (const VertexSample& sample : snapshot.samples)
        {
            deltas[sample.index.GetValue()] = transform.Apply(DeviationAnalyzer::GetDelta(base, sample));
        }
    }

    std::vector<PackedUVLayer> layout;
    status = ChannelPacker::BuildLayout(settings.numShapeKeys, settings.startUVIndex, layout);
    if (!status)
        return status;

    if (settings.bakeNormal)
    {
        status = ChannelPacker::PackNormals(mesh, keys[settings.normalShapeKeyIndex].normals);
        if (!status)
            return status;
    }

    status = ChannelPacker::PackOffsets(mesh, keyDeltas, settings.startUVIndex);
    if (!status)
        return status;

    ShapeKeyBakeResult result;
    result.maxDeviation = maxDeviation;
    result.scaleFactor = scaleFactor;
    result.layersUsed = (uint32_t)layout.size();
    for (const PackedUVLayer& packed : layout)
    {
        result.layerNames.push_back(packed.name);
    }
    result.normalsBaked = settings.bakeNormal;
    outResult = std::move(result);

    timer.LogElapsed("Shape key bake");
    return BakeStatus::Ok();
}

} // namespace vat
