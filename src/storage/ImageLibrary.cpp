#include "ImageLibrary.hpp"

#include "Logging.hpp"

namespace vat
{

Image* ImageLibrary::FindImage(const std::string& name)
{
    auto it = m_Images.find(name);
    return it != m_Images.end() ? it->second.get() : nullptr;
}

const Image* ImageLibrary::FindImage(const std::string& name) const
{
    auto it = m_Images.find(name);
    return it != m_Images.end() ? it->second.get() : nullptr;
}

Image* ImageLibrary::AcquireImage(const std::string& name, uint32_t width, uint32_t height, PixelFormat format)
{
    Image* image = FindImage(name);
    if (image != nullptr)
    {
        if (image->GetFormat() != format)
        {
            LOG_WARNING("Image %s is %s, replacing it with a %s image", name.c_str(),
                        GetPixelFormatName(image->GetFormat()), GetPixelFormatName(format));
            m_Images[name] = std::make_unique<Image>(name, width, height, format);
            return m_Images[name].get();
        }
        if (image->GetWidth() != width || image->GetHeight() != height)
            image->Resize(width, height);
        return image;
    }

    auto created = std::make_unique<Image>(name, width, height, format);
    image = created.get();
    m_Images.emplace(name, std::move(created));
    return image;
}

std::vector<const Image*> ImageLibrary::GetImages() const
{
    std::vector<const Image*> images;
    images.reserve(m_Images.size());
    for (const auto& entry : m_Images)
    {
        images.push_back(entry.second.get());
    }
    return images;
}

}  // namespace vat
