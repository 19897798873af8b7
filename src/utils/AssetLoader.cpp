#include "AssetLoader.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>

#include <simd/simd.h>

#include "Image.hpp"
#include "Logging.hpp"
#include "Mesh.hpp"
#include "ShapeKeyData.hpp"
#include "Snapshot.hpp"

namespace
{
template<typename T>
void AppendDataToBuffer(std::vector<uint8_t>& buffer, const T& value) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
    buffer.insert(buffer.end(), bytes, bytes + sizeof(T));
}

vat::BakeStatus MakeConfigurationError(const std::string& message)
{
    LOG_ERROR("%s", message.c_str());
    return vat::BakeStatus::Error(vat::BakeErrorKind::ConfigurationError, message);
}

// { "offset": .., "size": .. } inside a blob, size in bytes
vat::BakeStatus GetSection(const std::vector<uint8_t>& data, const nlohmann::json& record, const std::string& what,
                           size_t elementSize, const uint8_t*& outBegin, uint32_t& outCount)
{
    const size_t offset = record.at("offset").get<size_t>();
    const size_t size = record.at("size").get<size_t>();
    if (offset > data.size() || size > data.size() - offset)
        return MakeConfigurationError("Section " + what + " is out of bounds of its data file!");
    if (size % elementSize != 0)
        return MakeConfigurationError("Section " + what + " is not a whole number of elements!");

    outBegin = data.data() + offset;
    outCount = (uint32_t)(size / elementSize);
    return vat::BakeStatus::Ok();
}

// packed little-endian float32 x 3
vat::BakeStatus ReadFloat3Section(const std::vector<uint8_t>& data, const nlohmann::json& record, const std::string& what,
                                  std::vector<simd::float3>& outValues)
{
    const uint8_t* begin = nullptr;
    uint32_t count = 0u;
    vat::BakeStatus status = GetSection(data, record, what, sizeof(float) * 3, begin, count);
    if (!status)
        return status;

    outValues.resize(count);
    for (uint32_t i = 0; i < count; ++i)
    {
        float xyz[3];
        std::memcpy(xyz, begin + i * sizeof(xyz), sizeof(xyz));
        outValues[i] = simd_make_float3(xyz[0], xyz[1], xyz[2]);
    }
    return vat::BakeStatus::Ok();
}

vat::BakeStatus ReadUInt32Section(const std::vector<uint8_t>& data, const nlohmann::json& record, const std::string& what,
                                  std::vector<uint32_t>& outValues)
{
    const uint8_t* begin = nullptr;
    uint32_t count = 0u;
    vat::BakeStatus status = GetSection(data, record, what, sizeof(uint32_t), begin, count);
    if (!status)
        return status;

    outValues.resize(count);
    if (count > 0u)
        std::memcpy(outValues.data(), begin, count * sizeof(uint32_t));
    return vat::BakeStatus::Ok();
}

vat::BakeStatus LoadMesh(const std::string& jobDir, const nlohmann::json& meshDesc, std::unique_ptr<vat::Mesh>& outMesh)
{
    const std::string name = meshDesc.at("name").get<std::string>();
    const std::string dataPath = jobDir + meshDesc.at("data").get<std::string>();
    const std::vector<uint8_t> data = vat::ReadBinaryFile(dataPath);

    auto mesh = std::make_unique<vat::Mesh>(name);
    mesh->SetVertexCount(meshDesc.at("vertex_count").get<uint32_t>());

    std::vector<uint32_t> loops;
    vat::BakeStatus status = ReadUInt32Section(data, meshDesc.at("loops"), name + ".loops", loops);
    if (!status)
        return status;
    mesh->SetLoopVertexIndices(std::move(loops));

    mesh->SetModifiers(meshDesc.value("modifiers", std::vector<std::string>()));

    if (meshDesc.contains("vertex_groups"))
    {
        for (const auto& groupDesc : meshDesc["vertex_groups"])
        {
            const std::string groupName = groupDesc.at("name").get<std::string>();
            std::vector<uint32_t> members;
            status = ReadUInt32Section(data, groupDesc.at("data"), name + "." + groupName, members);
            if (!status)
                return status;
            mesh->SetVertexGroup(groupName, std::move(members));
        }
    }

    if (meshDesc.contains("shape_keys"))
    {
        auto shapeKeyData = std::make_unique<vat::ShapeKeyData>();
        for (const auto& keyDesc : meshDesc["shape_keys"])
        {
            vat::ShapeKey key;
            key.name = keyDesc.at("name").get<std::string>();
            status = ReadFloat3Section(data, keyDesc.at("positions"), name + "." + key.name + ".positions", key.positions);
            if (!status)
                return status;
            status = ReadFloat3Section(data, keyDesc.at("normals"), name + "." + key.name + ".normals", key.normals);
            if (!status)
                return status;
            shapeKeyData->keys.push_back(std::move(key));
        }
        if (!shapeKeyData->keys.empty())
            mesh->SetShapeKeyData(std::move(shapeKeyData));
    }

    if (meshDesc.contains("uv_layers"))
    {
        for (const auto& layerDesc : meshDesc["uv_layers"])
        {
            vat::UVLayer* layer = mesh->AddUVLayer(layerDesc.at("name").get<std::string>());
            if (layer == nullptr)
                return MakeConfigurationError("Mesh " + name + " lists more than " + std::to_string(vat::kMaxUVLayers) + " UV layers!");
        }
    }

    outMesh = std::move(mesh);
    return vat::BakeStatus::Ok();
}

// Frame i of the blob is recorded as frame range sample i.
vat::BakeStatus LoadFrames(const std::string& jobDir, const nlohmann::json& framesDesc, const vat::FrameRange& frameRange,
                           uint32_t vertexCount, vat::RecordedSnapshotSource& outSource)
{
    const std::string dataPath = jobDir + framesDesc.at("data").get<std::string>();
    const std::vector<uint8_t> data = vat::ReadBinaryFile(dataPath);
    const uint32_t frameCount = framesDesc.at("count").get<uint32_t>();

    std::vector<simd::float3> positions;
    vat::BakeStatus status = ReadFloat3Section(data, framesDesc.at("positions"), "frames.positions", positions);
    if (!status)
        return status;
    std::vector<simd::float3> normals;
    if (framesDesc.contains("normals"))
    {
        status = ReadFloat3Section(data, framesDesc["normals"], "frames.normals", normals);
        if (!status)
            return status;
    }

    const size_t expected = (size_t)frameCount * vertexCount;
    if (positions.size() != expected || (!normals.empty() && normals.size() != expected))
    {
        return MakeConfigurationError("Frame data holds " + vat::FormatCount(positions.size()) + " positions, expected "
            + vat::FormatCount(frameCount) + " frames of " + vat::FormatCount(vertexCount) + " vertices!");
    }

    for (uint32_t i = 0; i < frameCount; ++i)
    {
        const auto first = positions.begin() + (size_t)i * vertexCount;
        std::vector<simd::float3> framePositions(first, first + vertexCount);
        std::vector<simd::float3> frameNormals;
        if (!normals.empty())
        {
            const auto firstNormal = normals.begin() + (size_t)i * vertexCount;
            frameNormals.assign(firstNormal, firstNormal + vertexCount);
        }
        outSource.SetFrame(frameRange.GetFrame(i), vat::MakeSnapshot(framePositions, frameNormals));
    }
    return vat::BakeStatus::Ok();
}

void ParseFrameBakeSettings(const nlohmann::json& desc, vat::FrameBakeSettings& settings)
{
    settings.frameRange.start = desc.value("frame_start", settings.frameRange.start);
    settings.frameRange.end = desc.value("frame_end", settings.frameRange.end);
    settings.frameRange.step = desc.value("frame_step", settings.frameRange.step);
    settings.targetUnit = vat::ParseTargetUnit(desc.value("target_units", std::string("CM")));
    settings.coordinateSystem = vat::ParseCoordinateSystem(desc.value("coord_system", std::string("SOURCE_NATIVE")));
    settings.vertexGroup = desc.value("vertex_group", std::string());
    settings.outputName = desc.value("output_name", std::string());
}

void ParseShapeKeyBakeSettings(const nlohmann::json& desc, vat::ShapeKeyBakeSettings& settings)
{
    settings.bakeNormal = desc.value("bake_normal", settings.bakeNormal);
    settings.normalShapeKeyIndex = desc.value("normal_shape_key_index", settings.normalShapeKeyIndex);
    settings.numShapeKeys = desc.value("num_shape_keys", settings.numShapeKeys);
    settings.startUVIndex = desc.value("start_uv_index", settings.startUVIndex);
    settings.targetUnit = vat::ParseTargetUnit(desc.value("target_units", std::string("CM")));
    settings.coordinateSystem = vat::ParseCoordinateSystem(desc.value("coord_system", std::string("ALT_ENGINE")));
    settings.sceneUnits.system = vat::ParseUnitSystem(desc.value("unit_system", std::string("METRIC")));
    settings.sceneUnits.scaleLength = desc.value("unit_scale", settings.sceneUnits.scaleLength);
}

std::string GetParentDir(const std::string& filePath)
{
    const std::string parent = std::filesystem::path(filePath).parent_path().string();
    return parent.empty() ? std::string() : parent + '/';
}

std::string GetOutputPath(const std::string& outputDir, const std::string& fileName)
{
    return (std::filesystem::path(outputDir) / fileName).string();
}

vat::BakeStatus WriteDescriptor(const std::string& path, const nlohmann::json& desc)
{
    std::ofstream file(path);
    if (!file.is_open())
        return MakeConfigurationError("Failed to write descriptor: " + path);
    file << desc.dump(4) << '\n';
    file.close();
    return vat::BakeStatus::Ok();
}

vat::BakeStatus CreateOutputDir(const std::string& outputDir)
{
    if (outputDir.empty())
        return vat::BakeStatus::Ok();
    std::error_code error;
    std::filesystem::create_directories(outputDir, error);
    if (error)
        return MakeConfigurationError("Failed to create output directory " + outputDir + ": " + error.message());
    return vat::BakeStatus::Ok();
}
}

namespace vat
{

BakeMode ParseBakeMode(const std::string& name)
{
    if (name == "frames")
        return BakeMode::Frames;
    if (name == "shape_keys")
        return BakeMode::ShapeKeys;
    return BakeMode::Count;
}

std::vector<uint8_t> ReadBinaryFile(const std::string& absPath)
{
    std::ifstream file(absPath, std::ios::binary);
    if (!file.is_open())
    {
        LOG_ERROR("Failed to read binary file: %s", absPath.c_str());
        return {};
    }
    file.seekg(0, std::ios::end);
    const std::streamoff end = file.tellg();
    if (end < 0)
    {
        LOG_ERROR("Failed to get size of binary file: %s", absPath.c_str());
        return {};
    }
    size_t size = (size_t)end;
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(size);
    file.read(reinterpret_cast<char*>(data.data()), size);
    file.close();
    return data;
}

bool WriteBinaryFile(const std::string& absPath, const std::vector<uint8_t>& data)
{
    std::ofstream file(absPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        LOG_ERROR("Failed to write binary file: %s", absPath.c_str());
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    file.close();
    return !file.fail();
}

BakeStatus AssetLoader::LoadBakeJob(const std::string& filePath, BakeJob& outJob)
{
    std::ifstream jobFile(filePath);
    if (!jobFile.is_open())
        return MakeConfigurationError("Failed to load bake job: " + filePath);

    const std::string jobDir = GetParentDir(filePath);
    BakeJob job;
    try
    {
        nlohmann::json jobDesc = nlohmann::json::parse(jobFile);

        const std::string modeName = jobDesc.at("mode").get<std::string>();
        job.mode = ParseBakeMode(modeName);
        if (job.mode == BakeMode::Count)
            return MakeConfigurationError("Unsupported bake mode: " + modeName);

        job.outputDir = jobDesc.value("output_dir", std::string("."));
        if (std::filesystem::path(job.outputDir).is_relative())
            job.outputDir = jobDir + job.outputDir;

        const nlohmann::json settingsDesc = jobDesc.value("settings", nlohmann::json::object());
        if (job.mode == BakeMode::Frames)
            ParseFrameBakeSettings(settingsDesc, job.frameSettings);
        else
            ParseShapeKeyBakeSettings(settingsDesc, job.shapeKeySettings);

        uint32_t vertexCount = 0u;
        for (const auto& meshDesc : jobDesc.at("meshes"))
        {
            std::unique_ptr<Mesh> mesh;
            BakeStatus status = LoadMesh(jobDir, meshDesc, mesh);
            if (!status)
                return status;
            vertexCount += mesh->GetVertexCount();
            job.meshes.push_back(std::move(mesh));
        }
        if (job.meshes.empty())
            return MakeConfigurationError("Bake job " + filePath + " lists no meshes!");
        if (job.mode == BakeMode::ShapeKeys && job.meshes.size() != 1u)
            return MakeConfigurationError("A shape key bake takes exactly one mesh!");

        if (job.mode == BakeMode::Frames)
        {
            job.snapshotSource = std::make_unique<RecordedSnapshotSource>();
            BakeStatus status = LoadFrames(jobDir, jobDesc.at("frames"), job.frameSettings.frameRange, vertexCount, *job.snapshotSource);
            if (!status)
                return status;
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        return MakeConfigurationError("Malformed bake job " + filePath + ": " + e.what());
    }
    jobFile.close();

    LOG_INFO("Loaded %s bake job %s with %u meshes", job.mode == BakeMode::Frames ? "frame" : "shape key",
             filePath.c_str(), (uint32_t)job.meshes.size());
    outJob = std::move(job);
    return BakeStatus::Ok();
}

BakeStatus AssetLoader::WriteImage(const Image& image, const std::string& outputDir)
{
    BakeStatus status = CreateOutputDir(outputDir);
    if (!status)
        return status;

    const std::vector<uint8_t> texels = image.GetTexelData();
    const std::string dataName = image.GetName() + ".bin";
    if (!WriteBinaryFile(GetOutputPath(outputDir, dataName), texels))
        return MakeConfigurationError("Failed to write image data: " + dataName);

    nlohmann::json imageDesc;
    imageDesc["name"] = image.GetName();
    imageDesc["width"] = image.GetWidth();
    imageDesc["height"] = image.GetHeight();
    imageDesc["format"] = GetPixelFormatName(image.GetFormat());
    imageDesc["data"] = dataName;
    imageDesc["pixel_data"] = { { "offset", 0u }, { "size", texels.size() } };

    status = WriteDescriptor(GetOutputPath(outputDir, image.GetName() + ".json"), imageDesc);
    if (!status)
        return status;

    LOG_INFO("Wrote image %s (%ux%u %s)", image.GetName().c_str(), image.GetWidth(), image.GetHeight(),
             GetPixelFormatName(image.GetFormat()));
    return BakeStatus::Ok();
}

BakeStatus AssetLoader::WriteMeshChannels(const Mesh& mesh, const std::string& outputDir)
{
    BakeStatus status = CreateOutputDir(outputDir);
    if (!status)
        return status;

    const std::string baseName = mesh.GetName() + "_channels";
    std::vector<uint8_t> data;
    nlohmann::json meshDesc;
    meshDesc["name"] = mesh.GetName();
    meshDesc["loop_count"] = mesh.GetLoopCount();
    meshDesc["data"] = baseName + ".bin";

    nlohmann::json uvLayersDesc = nlohmann::json::array();
    for (uint32_t i = 0; i < mesh.GetUVLayerCount(); ++i)
    {
        const UVLayer* layer = mesh.GetUVLayer(i);
        const size_t offset = data.size();
        for (const simd::float2& uv : layer->uvs)
        {
            AppendDataToBuffer(data, uv.x);
            AppendDataToBuffer(data, uv.y);
        }
        uvLayersDesc.push_back({ { "name", layer->name }, { "data", { { "offset", offset }, { "size", data.size() - offset } } } });
    }
    meshDesc["uv_layers"] = uvLayersDesc;

    nlohmann::json colorsDesc = nlohmann::json::array();
    for (uint32_t i = 0; i < mesh.GetColorAttributeCount(); ++i)
    {
        const ColorAttribute* attribute = mesh.GetColorAttribute(i);
        const size_t offset = data.size();
        for (const simd::float4& color : attribute->colors)
        {
            AppendDataToBuffer(data, color.x);
            AppendDataToBuffer(data, color.y);
            AppendDataToBuffer(data, color.z);
            AppendDataToBuffer(data, color.w);
        }
        colorsDesc.push_back({ { "name", attribute->name }, { "data", { { "offset", offset }, { "size", data.size() - offset } } } });
    }
    meshDesc["color_attributes"] = colorsDesc;

    if (!WriteBinaryFile(GetOutputPath(outputDir, baseName + ".bin"), data))
        return MakeConfigurationError("Failed to write mesh channels of " + mesh.GetName());

    status = WriteDescriptor(GetOutputPath(outputDir, baseName + ".json"), meshDesc);
    if (!status)
        return status;

    LOG_INFO("Wrote %u UV layers and %u colour attributes of %s", mesh.GetUVLayerCount(), mesh.GetColorAttributeCount(),
             mesh.GetName().c_str());
    return BakeStatus::Ok();
}

} // namespace vat
