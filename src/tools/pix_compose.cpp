// Headless compositor: stacks image files as layers, optionally resizes, flattens the
// visible layers and writes the result.
#include "core/editor.h"
#include "core/image_format.h"
#include "core/image_op.h"
#include "core/settings.h"
#include "io/image_io.h"
#include "io/image_loader.h"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0
              << " [--settings <file>] [--resize WxH] [--canvas WxH] [--quality N] [--hide N]..."
                 " -o <output> <input> [<input>...]\n"
              << "  Layers are stacked bottom to top in argument order.\n"
              << "  --resize  resamples every layer; --canvas crops/pads (anchored top-left).\n"
              << "  --hide    hides layer N (0-based) before flattening.\n";
}

static bool ParseSize(std::string_view s, int& w, int& h)
{
    const std::size_t x = s.find_first_of("xX");
    if (x == std::string_view::npos)
        return false;
    try
    {
        std::size_t used_w = 0;
        std::size_t used_h = 0;
        const std::string ws(s.substr(0, x));
        const std::string hs(s.substr(x + 1));
        w = std::stoi(ws, &used_w);
        h = std::stoi(hs, &used_h);
        return used_w == ws.size() && used_h == hs.size() && w > 0 && h > 0;
    }
    catch (const std::exception&)
    {
        return false;
    }
}
} // namespace

int main(int argc, char** argv)
{
    std::optional<std::string> settings_path;
    std::optional<std::pair<int, int>> resize;
    std::optional<std::pair<int, int>> canvas;
    std::optional<int> quality;
    std::vector<std::size_t> hidden;
    std::string output;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--settings")
        {
            settings_path = std::string(need("--settings"));
        }
        else if (a == "--resize" || a == "--canvas")
        {
            const std::string opt(a);
            int w = 0, h = 0;
            if (!ParseSize(need(opt.c_str()), w, h))
            {
                std::cerr << "Invalid size for " << opt << " (expected WxH)\n";
                return 2;
            }
            (a == "--resize" ? resize : canvas) = std::make_pair(w, h);
        }
        else if (a == "--quality")
        {
            const std::string v(need("--quality"));
            try
            {
                quality = std::stoi(v);
            }
            catch (const std::exception&)
            {
                std::cerr << "Invalid --quality value: " << v << "\n";
                return 2;
            }
        }
        else if (a == "--hide")
        {
            const std::string v(need("--hide"));
            try
            {
                hidden.push_back((std::size_t)std::stoul(v));
            }
            catch (const std::exception&)
            {
                std::cerr << "Invalid --hide value: " << v << "\n";
                return 2;
            }
        }
        else if (a == "-o" || a == "--output")
        {
            output = std::string(need("-o"));
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else
        {
            inputs.emplace_back(a);
        }
    }

    if (output.empty() || inputs.empty())
    {
        PrintUsage(argv[0]);
        return 2;
    }

    pix::EditorSettings settings;
    std::string err;
    if (settings_path && !pix::LoadSettingsFromFile(*settings_path, settings, err))
    {
        std::cerr << "pix_compose: FAIL: [settings] " << err << "\n";
        return 3;
    }

    pix::EditorImage base;
    if (!pix::image_io::LoadEditorImage(inputs.front(), base, err))
    {
        std::cerr << "pix_compose: FAIL: [io] " << err << "\n";
        return 3;
    }

    pix::Editor editor(std::move(base));
    editor.SetUndoLimit(settings.undo_limit);

    for (std::size_t i = 1; i < inputs.size(); ++i)
    {
        pix::RgbaImage pixels;
        if (!pix::image_loader::LoadImageAsRgba32(inputs[i], pixels, err))
        {
            std::cerr << "pix_compose: FAIL: [io] " << err << "\n";
            return 3;
        }
        if (!editor.AddLayer() ||
            !editor.ApplyImageOp(pix::op::SetImage{0, 0, std::move(pixels), false}))
        {
            std::cerr << "pix_compose: FAIL: could not add layer for " << inputs[i] << "\n";
            return 4;
        }
    }

    for (std::size_t layer : hidden)
    {
        if (!editor.SetLayerVisible(layer, false))
        {
            std::cerr << "pix_compose: FAIL: cannot hide layer " << layer << "\n";
            return 4;
        }
    }

    if (resize && !editor.ResizeImage(resize->first, resize->second))
    {
        std::cerr << "pix_compose: FAIL: resize failed\n";
        return 4;
    }
    if (canvas && !editor.ResizeCanvas(canvas->first, canvas->second))
    {
        std::cerr << "pix_compose: FAIL: canvas resize failed\n";
        return 4;
    }

    pix::ImageFormatInfo format = editor.Image().Format();
    if (!pix::ImageFormatFromPath(output, format.format))
        format.format = pix::ImageFormat::Png;
    format.jpeg_quality = quality.value_or(settings.jpeg_quality);

    if (!pix::image_io::SaveEditorImage(editor.Image(), output, format, err))
    {
        std::cerr << "pix_compose: FAIL: [io] " << err << "\n";
        return 3;
    }

    std::cout << "pix_compose: wrote " << output << " (" << editor.Image().Width() << "x"
              << editor.Image().Height() << ", " << editor.Image().VisibleLayerCount() << " visible layers)\n";
    return 0;
}
