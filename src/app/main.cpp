#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "AssetLoader.hpp"
#include "FrameBake.hpp"
#include "ImageLibrary.hpp"
#include "Logging.hpp"
#include "Mesh.hpp"
#include "ShapeKeyBake.hpp"
#include "Snapshot.hpp"

namespace
{
void PrintUsage(const char* program)
{
    std::fprintf(stderr, "Usage: %s <job.json> [--quiet]\n", program);
}

vat::BakeStatus RunFrameBake(vat::BakeJob& job)
{
    std::vector<vat::Mesh*> objects;
    for (const auto& mesh : job.meshes)
    {
        objects.push_back(mesh.get());
    }

    vat::ImageLibrary images;
    vat::FrameBakeResult result;
    vat::BakeStatus status = vat::FrameBake::Bake(objects, *job.snapshotSource, images, job.frameSettings, result);
    if (!status)
        return status;

    for (const vat::Image* image : images.GetImages())
    {
        status = vat::AssetLoader::WriteImage(*image, job.outputDir);
        if (!status)
            return status;
    }
    for (const vat::Mesh* object : objects)
    {
        status = vat::AssetLoader::WriteMeshChannels(*object, job.outputDir);
        if (!status)
            return status;
    }
    return vat::BakeStatus::Ok();
}

vat::BakeStatus RunShapeKeyBake(vat::BakeJob& job)
{
    vat::Mesh& mesh = *job.meshes[0];
    vat::ShapeKeyBakeResult result;
    vat::BakeStatus status = vat::ShapeKeyBake::Bake(mesh, job.shapeKeySettings, result);
    if (!status)
        return status;

    LOG_INFO("Packed %u UV layers, scale factor %u", result.layersUsed, result.scaleFactor);
    return vat::AssetLoader::WriteMeshChannels(mesh, job.outputDir);
}
}

int main(int argc, char* argv[])
{
    std::string jobPath;
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--quiet") == 0)
        {
            vat::SetLogLevel(vat::LogLevel::Warning);
        }
        else if (jobPath.empty() && argv[i][0] != '-')
        {
            jobPath = argv[i];
        }
        else
        {
            PrintUsage(argv[0]);
            return 1;
        }
    }
    if (jobPath.empty())
    {
        PrintUsage(argv[0]);
        return 1;
    }

    vat::BakeJob job;
    vat::BakeStatus status = vat::AssetLoader::LoadBakeJob(jobPath, job);
    if (status)
        status = job.mode == vat::BakeMode::Frames ? RunFrameBake(job) : RunShapeKeyBake(job);

    if (!status)
    {
        LOG_ERROR("Bake failed with %s: %s", vat::GetBakeErrorKindName(status.GetKind()), status.GetMessage().c_str());
        return 1;
    }
    return 0;
}
