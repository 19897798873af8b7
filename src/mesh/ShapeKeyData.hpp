#pragma once

#include <string>
#include <vector>

#include <simd/simd.h>

namespace vat
{

struct ShapeKey
{
    std::string name;

    // absolute shape, one entry per mesh vertex
    std::vector<simd::float3> positions;
    std::vector<simd::float3> normals;
};

struct ShapeKeyData
{
    // keys[0] is the basis every other key is measured against
    std::vector<ShapeKey> keys;
};

} // namespace vat
