#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Image.hpp"

namespace vat
{

// Named images of the host document. Baking into an existing name reuses
// the image instead of adding a second one.
class ImageLibrary
{
public:
    ImageLibrary() = default;
    ~ImageLibrary() = default;

    Image* FindImage(const std::string& name);
    const Image* FindImage(const std::string& name) const;

    // Existing images are resized (and cleared) when the size differs.
    Image* AcquireImage(const std::string& name, uint32_t width, uint32_t height, PixelFormat format);

    uint32_t GetImageCount() const { return (uint32_t)m_Images.size(); }
    std::vector<const Image*> GetImages() const;

private:
    std::map<std::string, std::unique_ptr<Image>> m_Images;
};

}  // namespace vat
