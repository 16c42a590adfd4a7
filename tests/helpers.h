#pragma once

#include <cpl_conv.h>
#include <doctest/doctest.h>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iterator>
#include <ogr_spatialref.h>
#include <random>
#include <stack/external.h>
#include <stdexcept>
#include <utils/geotiff.h>
#include <utils/noCopying.h>

namespace fs = std::filesystem;
using namespace utils;

namespace test_support {
// Scene names of both naming schemes
constexpr char const* SHORT_NAME = "S1A-IW-RTC-30m-20170512_gpn_VV.tif";
constexpr char const* LONG_NAME = "S1B-IW-RTC-30m-S1B_IW_GRDH_1SDV_20180118T031947_20180118T032012_009211_01080E_VV.tif";

// Origin of the synthetic scenes, inside UTM zones 5N and 6N
constexpr f64 EASTING = 500000.0;
constexpr f64 NORTHING = 7000000.0;
constexpr f64 PIXEL = 30.0;
constexpr int SIZE = 100;

class TempDir {
    MAKE_NONCOPYABLE(TempDir);

public:
    TempDir()
    {
        static std::mt19937_64 rng { std::random_device {}() };
        path = fs::temp_directory_path() / fmt::format("rtc_stack_test_{:x}", rng());
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path operator/(fs::path const& name) const { return path / name; }

    fs::path path;
};

inline std::string projection_wkt(int epsg)
{
    OGRSpatialReference srs;
    if (srs.importFromEPSG(epsg) != OGRERR_NONE) {
        throw std::runtime_error(fmt::format("Unknown EPSG code {}", epsg));
    }
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    std::string result(wkt);
    CPLFree(wkt);
    return result;
}

inline fs::path write_scene(fs::path const& path, RasterX<f32> const& values, f64 west = EASTING, f64 north = NORTHING, int epsg = 32605, f64 pixel = PIXEL)
{
    GeoTransform transform { west, pixel, 0.0, north, 0.0, -pixel };
    GeoTIFF<f32>(values, transform, projection_wkt(epsg)).write(path);
    return path;
}

inline fs::path write_constant_scene(fs::path const& path, f32 value, f64 west = EASTING, f64 north = NORTHING, int epsg = 32605)
{
    return write_scene(path, RasterX<f32>::Constant(SIZE, SIZE, value), west, north, epsg);
}

inline void touch(fs::path const& path)
{
    std::ofstream out(path);
    out << "x";
}

inline std::string read_text(fs::path const& path)
{
    std::ifstream in(path);
    return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
}

// Records its invocations. Without a behaviour it succeeds and creates every
// expected output.
class FakeTool : public stack::ExternalTool {
public:
    using Behaviour = std::function<int(std::vector<std::string> const&)>;

    explicit FakeTool(std::string name, Behaviour behaviour = {})
        : m_name(std::move(name))
        , m_behaviour(std::move(behaviour))
    {
    }

    stack::ToolResult invoke(std::vector<std::string> const& args, std::vector<fs::path> const& expected_outputs) override
    {
        calls.push_back(args);
        stack::ToolResult result;
        if (m_behaviour) {
            result.exit_status = m_behaviour(args);
        } else {
            for (auto const& output : expected_outputs) {
                touch(output);
            }
        }
        for (auto const& output : expected_outputs) {
            if (fs::exists(output)) {
                result.outputs.push_back(output);
            }
        }
        return result;
    }

    [[nodiscard]] std::string const& name() const override { return m_name; }

    std::vector<std::vector<std::string>> calls;

private:
    std::string m_name;
    Behaviour m_behaviour;
};

// swap_bytes <in> <out> 4
inline int swap_words(std::vector<std::string> const& args)
{
    std::ifstream in(args.at(0), std::ios::binary);
    std::string bytes { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    for (std::size_t i = 0; i + 3 < bytes.size(); i += 4) {
        std::swap(bytes[i], bytes[i + 3]);
        std::swap(bytes[i + 1], bytes[i + 2]);
    }
    std::ofstream out(args.at(1), std::ios::binary);
    out << bytes;
    return 0;
}

// A filter that leaves the samples untouched
inline int copy_samples(std::vector<std::string> const& args)
{
    fs::copy_file(args.at(0), args.at(1), fs::copy_options::overwrite_existing);
    return 0;
}

template<typename E>
std::string failure_message(std::function<void()> const& fn)
{
    try {
        fn();
    } catch (E const& e) {
        return e.what();
    }
    return {};
}
}
