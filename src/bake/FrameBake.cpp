#include "FrameBake.hpp"

#include <algorithm>
#include <cctype>

#include "CoordinateTransform.hpp"
#include "DeviationAnalyzer.hpp"
#include "GroupPartitioner.hpp"
#include "ImageLibrary.hpp"
#include "Logging.hpp"
#include "Mesh.hpp"
#include "ScaleResolver.hpp"
#include "TexturePacker.hpp"
#include "Timer.hpp"

namespace
{
    // "MESH_DEFORM" -> "Mesh_Deform"
    std::string TitleCase(const std::string& text)
    {
        std::string result = text;
        bool startOfWord = true;
        for (char& c : result)
        {
            unsigned char uc = static_cast<unsigned char>(c);
            if (std::isalpha(uc))
            {
                c = startOfWord ? (char)std::toupper(uc) : (char)std::tolower(uc);
                startOfWord = false;
            }
            else
            {
                startOfWord = true;
            }
        }
        return result;
    }

    uint32_t GetTotalVertexCount(const std::vector<const vat::Mesh*>& objects)
    {
        uint32_t vertexCount = 0u;
        for (const vat::Mesh* object : objects)
        {
            vertexCount += object->GetVertexCount();
        }
        return vertexCount;
    }
}

namespace vat
{

const std::vector<std::string>& FrameBake::GetAllowedModifiers()
{
    static const std::vector<std::string> allowedModifiers = {
        "ARMATURE", "CAST", "CURVE", "DISPLACE", "HOOK",
        "LAPLACIANDEFORM", "LATTICE", "MESH_DEFORM",
        "SHRINKWRAP", "SIMPLE_DEFORM", "SMOOTH",
        "CORRECTIVE_SMOOTH", "LAPLACIANSMOOTH",
        "SURFACE_DEFORM", "WARP", "WAVE",
    };
    return allowedModifiers;
}

std::string FrameBake::GetOffsetTextureName(const std::string& name, uint32_t scaleFactor)
{
    return "T_" + name + "_Scale" + std::to_string(scaleFactor) + "_O";
}

std::string FrameBake::GetNormalTextureName(const std::string& name)
{
    return "T_" + name + "_N";
}

BakeStatus FrameBake::ValidateModifiers(const std::vector<const Mesh*>& objects)
{
    const std::vector<std::string>& allowedModifiers = GetAllowedModifiers();
    for (const Mesh* object : objects)
    {
        for (const std::string& modifier : object->GetModifiers())
        {
            if (std::find(allowedModifiers.begin(), allowedModifiers.end(), modifier) == allowedModifiers.end())
            {
                std::string message = "Objects with " + TitleCase(modifier) + " modifiers are not allowed! ("
                    + object->GetName() + ")";
                LOG_ERROR("%s", message.c_str());
                return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
            }
        }
    }
    return BakeStatus::Ok();
}

BakeStatus FrameBake::ValidateCounts(uint32_t vertexCount, uint32_t frameCount)
{
    if (vertexCount > kMaxVertexCount)
    {
        std::string message = "Vertex count of " + FormatCount(vertexCount) + ", exceeds limit of "
            + FormatCount(kMaxVertexCount) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::CapacityError, message);
    }
    if (frameCount > kMaxFrameCount)
    {
        std::string message = "Frame count of " + FormatCount(frameCount) + ", exceeds limit of "
            + FormatCount(kMaxFrameCount) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::CapacityError, message);
    }
    return BakeStatus::Ok();
}

BakeStatus FrameBake::Validate(const std::vector<const Mesh*>& objects, const FrameBakeSettings& settings)
{
    if (objects.empty())
    {
        LOG_ERROR("No mesh objects to bake!");
        return BakeStatus::Error(BakeErrorKind::PreconditionError, "No mesh objects to bake!");
    }

    BakeStatus status = ValidateModifiers(objects);
    if (!status)
        return status;

    const FrameRange& frameRange = settings.frameRange;
    if (!frameRange.IsValid() || frameRange.GetFrameCount() == 0u)
    {
        std::string message = "Frame range " + std::to_string(frameRange.start) + " to " + std::to_string(frameRange.end)
            + " with step " + std::to_string(frameRange.step) + " contains no frames!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
    }

    status = ValidateCounts(GetTotalVertexCount(objects), frameRange.GetFrameCount());
    if (!status)
        return status;

    CoordinateTransform transform;
    status = CoordinateTransform::Create(settings.coordinateSystem, transform);
    if (!status)
        return status;

    return TexturePacker::ValidateAddressUVs(objects);
}

BakeStatus FrameBake::Bake(const std::vector<Mesh*>& objects, SnapshotSource& source, ImageLibrary& images,
                           const FrameBakeSettings& settings, FrameBakeResult& outResult)
{
    Timer timer;
    const std::vector<const Mesh*> constObjects(objects.begin(), objects.end());

    BakeStatus status = Validate(constObjects, settings);
    if (!status)
        return status;

    CoordinateTransform transform;
    status = CoordinateTransform::Create(settings.coordinateSystem, transform);
    if (!status)
        return status;

    const uint32_t vertexCount = GetTotalVertexCount(constObjects);
    const uint32_t frameCount = settings.frameRange.GetFrameCount();
    LOG_INFO("Baking %u frames of %u vertices from %u objects", frameCount, vertexCount, (uint32_t)objects.size());

    std::vector<Snapshot> snapshots;
    status = source.CollectFrameSnapshots(constObjects, settings.frameRange, snapshots);
    if (!status)
        return status;
    if (snapshots.size() != frameCount)
    {
        std::string message = "Snapshot source returned " + FormatCount(snapshots.size()) + " frames, expected "
            + FormatCount(frameCount) + "!";
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
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

    const GroupPartition partition = GroupPartitioner::Partition(constObjects, settings.vertexGroup);
    if (partition.totalActive == 0u)
    {
        std::string message = partition.restricted ? "Vertex group " + settings.vertexGroup + " has no vertices!"
                                                   : std::string("Selected objects have no vertices!");
        LOG_ERROR("%s", message.c_str());
        return BakeStatus::Error(BakeErrorKind::PreconditionError, message);
    }

    FrameTextures textures;
    status = TexturePacker::PackFrames(snapshots, scaleFactor, partition, transform, textures);
    if (!status)
        return status;

    // everything below writes outputs
    status = TexturePacker::WriteAddressUVs(objects, partition);
    if (!status)
        return status;

    const std::string& name = settings.outputName.empty() ? objects[0]->GetName() : settings.outputName;
    const std::string offsetTextureName = GetOffsetTextureName(name, scaleFactor);
    const std::string normalTextureName = GetNormalTextureName(name);

    Image* offsetTexture = images.AcquireImage(offsetTextureName, textures.width, textures.height, PixelFormat::RGBA32Float);
    offsetTexture->SetPixels(std::move(textures.offsets));
    Image* normalTexture = images.AcquireImage(normalTextureName, textures.width, textures.height, PixelFormat::RGBA8Unorm);
    normalTexture->SetPixels(std::move(textures.normals));

    FrameBakeResult result;
    result.maxDeviation = maxDeviation;
    result.scaleFactor = scaleFactor;
    result.vertexCount = vertexCount;
    result.activeVertexCount = partition.totalActive;
    result.frameCount = frameCount;
    result.offsetTextureName = offsetTextureName;
    result.normalTextureName = normalTextureName;
    outResult = std::move(result);

    LOG_INFO("Wrote %s and %s (%ux%u)", offsetTextureName.c_str(), normalTextureName.c_str(), textures.width, textures.height);
    timer.LogElapsed("Frame bake");
    return BakeStatus::Ok();
}

} // namespace vat
