#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <simd/simd.h>

namespace vat
{

enum class PixelFormat : uint8_t
{
    RGBA32Float,  // 16 bytes: 32F.32F.32F.32F, unrestricted range
    RGBA8Unorm,   // 4 bytes: 8.8.8.8, values clamped to [0, 1]
    Count
};

uint32_t GetBytesPerPixel(PixelFormat format);
const char* GetPixelFormatName(PixelFormat format);

// RGBA pixel grid, row-major, row 0 first.
class Image
{
public:
    Image(const std::string& name, uint32_t width, uint32_t height, PixelFormat format);
    ~Image() = default;

    const std::string& GetName() const { return m_Name; }
    uint32_t GetWidth() const { return m_Width; }
    uint32_t GetHeight() const { return m_Height; }
    PixelFormat GetFormat() const { return m_Format; }

    // contents are cleared
    void Resize(uint32_t width, uint32_t height);

    // 4 floats per pixel, width * height pixels
    void SetPixels(std::vector<float>&& pixels);
    void SetPixels(const std::vector<float>& pixels);
    const std::vector<float>& GetPixels() const { return m_Pixels; }

    simd::float4 GetPixel(uint32_t x, uint32_t y) const;

    // raw texel bytes in the image's pixel format
    std::vector<uint8_t> GetTexelData() const;

private:
    void ClampToFormat();

    std::string m_Name;
    uint32_t m_Width { 0u };
    uint32_t m_Height { 0u };
    PixelFormat m_Format { PixelFormat::Count };

    std::vector<float> m_Pixels;
};

}  // namespace vat
