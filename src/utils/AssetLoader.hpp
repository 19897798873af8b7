#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "BakeSettings.hpp"
#include "BakeStatus.hpp"
#include "Mesh.hpp"
#include "Snapshot.hpp"

namespace vat
{

class Image;

enum class BakeMode : uint8_t
{
    Frames,
    ShapeKeys,
    Count
};

// "frames", "shape_keys"; anything else is BakeMode::Count
BakeMode ParseBakeMode(const std::string& name);

struct BakeJob
{
    BakeMode mode { BakeMode::Count };
    std::string outputDir;

    FrameBakeSettings frameSettings;
    ShapeKeyBakeSettings shapeKeySettings;

    std::vector<std::unique_ptr<Mesh>> meshes;
    // frames mode only
    std::unique_ptr<RecordedSnapshotSource> snapshotSource;
};

std::vector<uint8_t> ReadBinaryFile(const std::string& absPath);
bool WriteBinaryFile(const std::string& absPath, const std::vector<uint8_t>& data);

class AssetLoader
{
public:
    // Parses a job descriptor and the binary blob it points at. Relative
    // paths inside the descriptor are resolved against its directory.
    static BakeStatus LoadBakeJob(const std::string& filePath, BakeJob& outJob);

    // <dir>/<name>.json + <dir>/<name>.bin
    static BakeStatus WriteImage(const Image& image, const std::string& outputDir);

    // UV layers and colour attributes of the mesh:
    // <dir>/<mesh>_channels.json + <dir>/<mesh>_channels.bin
    static BakeStatus WriteMeshChannels(const Mesh& mesh, const std::string& outputDir);
};

} // namespace vat
