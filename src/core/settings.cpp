#include "core/settings.h"

#include <nlohmann/json.hpp>

#include <exception>
#include <fstream>
#include <utility>

using json = nlohmann::json;

namespace pix
{
namespace
{
static bool ReadInt(const json& j, const char* key, int min_v, int max_v, int& out, std::string& err)
{
    if (!j.contains(key))
        return true;
    const json& v = j[key];
    if (!v.is_number_integer())
    {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    const long long n = v.get<long long>();
    if (n < min_v || n > max_v)
    {
        err = std::string("'") + key + "' out of range [" + std::to_string(min_v) + ", " + std::to_string(max_v) + "]";
        return false;
    }
    out = (int)n;
    return true;
}

static bool ReadBool(const json& j, const char* key, bool& out, std::string& err)
{
    if (!j.contains(key))
        return true;
    if (!j[key].is_boolean())
    {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

static bool ReadColor(const json& j, const char* key, Color& out, std::string& err)
{
    if (!j.contains(key))
        return true;
    if (!j[key].is_string())
    {
        err = std::string("'") + key + "' must be a \"#RRGGBB\" or \"#RRGGBBAA\" string";
        return false;
    }
    const std::string s = j[key].get<std::string>();
    if (!color::ParseHex(s, out))
    {
        err = std::string("'") + key + "': invalid colour '" + s + "'";
        return false;
    }
    return true;
}

static bool SettingsFromJson(const json& j, EditorSettings& out, std::string& err)
{
    if (!j.is_object())
    {
        err = "settings root must be an object";
        return false;
    }
    if (!j.contains("schema_version") || !j["schema_version"].is_number_integer())
    {
        err = "settings missing integer 'schema_version'";
        return false;
    }
    if (j["schema_version"].get<int>() != 1)
    {
        err = "Unsupported settings schema_version (expected 1)";
        return false;
    }

    EditorSettings s = out;

    if (j.contains("undo_limit"))
    {
        if (!j["undo_limit"].is_number_unsigned())
        {
            err = "'undo_limit' must be a non-negative integer";
            return false;
        }
        s.undo_limit = (std::size_t)j["undo_limit"].get<unsigned long long>();
    }

    if (!ReadInt(j, "default_width", 1, 1 << 15, s.default_width, err) ||
        !ReadInt(j, "default_height", 1, 1 << 15, s.default_height, err) ||
        !ReadColor(j, "default_background", s.default_background, err) ||
        !ReadColor(j, "primary_color", s.primary_color, err) ||
        !ReadColor(j, "secondary_color", s.secondary_color, err) ||
        !ReadInt(j, "pencil_half_width", 0, 256, s.pencil_half_width, err) ||
        !ReadBool(j, "anti_aliasing", s.anti_aliasing, err) ||
        !ReadInt(j, "jpeg_quality", 1, 100, s.jpeg_quality, err))
        return false;

    if (j.contains("bucket_tolerance"))
    {
        if (!j["bucket_tolerance"].is_number())
        {
            err = "'bucket_tolerance' must be a number";
            return false;
        }
        const double t = j["bucket_tolerance"].get<double>();
        if (t < 0.0 || t > 1.0)
        {
            err = "'bucket_tolerance' out of range [0, 1]";
            return false;
        }
        s.bucket_tolerance = (float)t;
    }

    out = std::move(s);
    return true;
}
} // namespace

bool LoadSettingsFromJson(const std::string& text, EditorSettings& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err = std::string("JSON parse error: ") + e.what();
        return false;
    }
    return SettingsFromJson(j, out, err);
}

bool LoadSettingsFromFile(const std::string& path, EditorSettings& out, std::string& err)
{
    err.clear();
    std::ifstream f(path);
    if (!f)
    {
        err = std::string("Could not open '") + path + "'";
        return false;
    }

    json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = std::string("JSON parse error: ") + e.what();
        return false;
    }
    return SettingsFromJson(j, out, err);
}

std::string SettingsToJson(const EditorSettings& s)
{
    json j;
    j["schema_version"] = 1;
    j["undo_limit"] = s.undo_limit;
    j["default_width"] = s.default_width;
    j["default_height"] = s.default_height;
    j["default_background"] = color::ToHex(s.default_background);
    j["primary_color"] = color::ToHex(s.primary_color);
    j["secondary_color"] = color::ToHex(s.secondary_color);
    j["pencil_half_width"] = s.pencil_half_width;
    j["anti_aliasing"] = s.anti_aliasing;
    j["bucket_tolerance"] = s.bucket_tolerance;
    j["jpeg_quality"] = s.jpeg_quality;
    return j.dump(2);
}

bool SaveSettingsToFile(const std::string& path, const EditorSettings& s, std::string& err)
{
    err.clear();
    std::ofstream out(path);
    if (!out)
    {
        err = "Failed to open file for writing.";
        return false;
    }

    try
    {
        out << SettingsToJson(s) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write JSON: ") + e.what();
        return false;
    }
    if (!out)
    {
        err = "Failed to write settings file.";
        return false;
    }
    return true;
}
} // namespace pix
