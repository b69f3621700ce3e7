#include "io/image_io.h"

#include "io/image_loader.h"
#include "io/image_writer.h"

#include <utility>

namespace pix::image_io
{
bool LoadEditorImage(const std::string& path, EditorImage& out, std::string& err)
{
    RgbaImage pixels;
    if (!image_loader::LoadImageAsRgba32(path, pixels, err))
        return false;

    ImageFormatInfo format;
    if (!ImageFormatFromPath(path, format.format))
        format.format = ImageFormat::Png;

    out = EditorImage::FromRgba(path, std::move(pixels), format);
    return true;
}

bool SaveEditorImage(const EditorImage& image, const std::string& path, const ImageFormatInfo& format, std::string& err)
{
    if (image.IsEmpty())
    {
        err = "Nothing to save: the canvas is empty.";
        return false;
    }
    const RgbaImage flat = image.Flatten();
    return image_writer::WriteImageFromRgba32(path, flat.Width(), flat.Height(), flat.Bytes(),
                                              format.format, format.jpeg_quality, err);
}

bool SaveEditorImage(const EditorImage& image, const std::string& path, std::string& err)
{
    ImageFormatInfo format = image.Format();
    ImageFormat from_path = format.format;
    if (ImageFormatFromPath(path, from_path))
        format.format = from_path;
    return SaveEditorImage(image, path, format, err);
}
} // namespace pix::image_io
