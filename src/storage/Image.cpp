#include "Image.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>
#include <utility>

#include "Logging.hpp"

namespace vat
{

uint32_t GetBytesPerPixel(PixelFormat format)
{
    switch (format)
    {
    case PixelFormat::RGBA32Float:
        return 16u;
    case PixelFormat::RGBA8Unorm:
        return 4u;
    default:
        LOG_ERROR("Unsupported pixel format: %d", static_cast<int>(format));
        return 0u;
    }
}

const char* GetPixelFormatName(PixelFormat format)
{
    switch (format)
    {
    case PixelFormat::RGBA32Float:
        return "rgba32f";
    case PixelFormat::RGBA8Unorm:
        return "rgba8";
    default:
        return "unknown";
    }
}

Image::Image(const std::string& name, uint32_t width, uint32_t height, PixelFormat format)
    : m_Name(name), m_Format(format)
{
    Resize(width, height);
}

void Image::Resize(uint32_t width, uint32_t height)
{
    m_Width = width;
    m_Height = height;
    m_Pixels.assign((size_t)width * height * 4u, 0.0f);
}

void Image::SetPixels(std::vector<float>&& pixels)
{
    assert(pixels.size() == (size_t)m_Width * m_Height * 4u);
    m_Pixels = std::move(pixels);
    ClampToFormat();
}

void Image::SetPixels(const std::vector<float>& pixels)
{
    assert(pixels.size() == (size_t)m_Width * m_Height * 4u);
    m_Pixels = pixels;
    ClampToFormat();
}

simd::float4 Image::GetPixel(uint32_t x, uint32_t y) const
{
    assert(x < m_Width && y < m_Height);
    const float* texel = &m_Pixels[((size_t)y * m_Width + x) * 4u];
    return simd_make_float4(texel[0], texel[1], texel[2], texel[3]);
}

std::vector<uint8_t> Image::GetTexelData() const
{
    std::vector<uint8_t> data;
    switch (m_Format)
    {
    case PixelFormat::RGBA32Float:
        data.resize(m_Pixels.size() / 4u * GetBytesPerPixel(m_Format));
        std::memcpy(data.data(), m_Pixels.data(), data.size());
        break;
    case PixelFormat::RGBA8Unorm:
        data.resize(m_Pixels.size() / 4u * GetBytesPerPixel(m_Format));
        for (size_t i = 0, sz = m_Pixels.size(); i < sz; ++i)
        {
            data[i] = (uint8_t)std::lround(m_Pixels[i] * 255.0f);
        }
        break;
    default:
        LOG_ERROR("Unsupported pixel format: %d", static_cast<int>(m_Format));
        break;
    }
    return data;
}

void Image::ClampToFormat()
{
    if (m_Format != PixelFormat::RGBA8Unorm)
        return;
    for (float& value : m_Pixels)
    {
        value = std::min(std::max(value, 0.0f), 1.0f);
    }
}

}  // namespace vat
