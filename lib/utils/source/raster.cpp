#include "utils/raster.h"
#include "utils/error.h"
#include "utils/geotiff.h"
#include "utils/log.h"

#include <cpl_string.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <gdal_utils.h>

namespace utils {
static auto logger = utils::create_logger("utils::raster");

namespace {
void add_number(CPLStringList& args, f64 value)
{
    args.AddString(fmt::format("{}", value).c_str());
}
}

std::optional<fs::path> translate(fs::path const& source, fs::path const& destination, TranslateOptions const& options)
{
    CPLStringList args;
    args.AddString("-of");
    args.AddString(options.format.c_str());
    if (options.output_type.has_value()) {
        args.AddString("-ot");
        args.AddString(GDALGetDataTypeName(*options.output_type));
    }
    if (options.scale.has_value()) {
        args.AddString("-scale");
        add_number(args, options.scale->first);
        add_number(args, options.scale->second);
    }
    if (options.resolution.has_value()) {
        args.AddString("-tr");
        add_number(args, *options.resolution);
        add_number(args, *options.resolution);
    }
    if (options.resample_alg.has_value()) {
        args.AddString("-r");
        args.AddString(options.resample_alg->c_str());
    }
    if (options.projection_window.has_value()) {
        // ulx uly lrx lry
        args.AddString("-projwin");
        add_number(args, options.projection_window->west);
        add_number(args, options.projection_window->north);
        add_number(args, options.projection_window->east);
        add_number(args, options.projection_window->south);
    }

    std::unique_ptr<GDALTranslateOptions, decltype(&GDALTranslateOptionsFree)> translate_options {
        GDALTranslateOptionsNew(args.List(), nullptr),
        GDALTranslateOptionsFree
    };
    if (translate_options == nullptr) {
        logger->error("Cannot create gdal_translate options for {}", source);
        return {};
    }

    GDALDatasetWrapper src { source };
    int usage_error = FALSE;
    GDALDatasetH result = GDALTranslate(destination.c_str(), GDALDataset::ToHandle(src.get()), translate_options.get(), &usage_error);
    if (result == nullptr) {
        logger->warn("gdal_translate of {} failed: {}", source, CPLGetLastErrorMsg());
        return {};
    }
    GDALClose(result);
    logger->debug("Translated {} -> {}", source, destination);
    return destination;
}

std::optional<fs::path> warp(fs::path const& source, fs::path const& destination, WarpOptions const& options)
{
    CPLStringList args;
    args.AddString("-of");
    args.AddString(options.format.c_str());
    if (options.dst_srs.has_value()) {
        args.AddString("-t_srs");
        args.AddString(options.dst_srs->c_str());
    }
    if (options.resolution.has_value()) {
        args.AddString("-tr");
        add_number(args, *options.resolution);
        add_number(args, *options.resolution);
    }
    if (options.cutline.has_value()) {
        args.AddString("-cutline");
        args.AddString(options.cutline->c_str());
        if (options.crop_to_cutline) {
            args.AddString("-crop_to_cutline");
        }
    }

    std::unique_ptr<GDALWarpAppOptions, decltype(&GDALWarpAppOptionsFree)> warp_options {
        GDALWarpAppOptionsNew(args.List(), nullptr),
        GDALWarpAppOptionsFree
    };
    if (warp_options == nullptr) {
        logger->error("Cannot create gdalwarp options for {}", source);
        return {};
    }

    GDALDatasetWrapper src { source };
    GDALDatasetH src_handle = GDALDataset::ToHandle(src.get());
    int usage_error = FALSE;
    GDALDatasetH result = GDALWarp(destination.c_str(), nullptr, 1, &src_handle, warp_options.get(), &usage_error);
    if (result == nullptr) {
        logger->warn("gdalwarp of {} failed: {}", source, CPLGetLastErrorMsg());
        return {};
    }
    GDALClose(result);
    logger->debug("Warped {} -> {}", source, destination);
    return destination;
}

RasterX<u8> rasterize(fs::path const& vector_file, RasterInfo const& grid)
{
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (driver == nullptr) {
        throw GenericError("MEM driver is not registered", *logger);
    }
    DatasetPtr mask { driver->Create("", grid.width, grid.height, 1, GDT_Byte, nullptr), GDALClose };
    if (mask == nullptr) {
        throw IOError(fmt::format("Unable to create {}x{} mask", grid.width, grid.height), vector_file, *logger);
    }
    GeoTransform transform = grid.geoTransform;
    mask->SetGeoTransform(transform.data());
    mask->SetProjection(grid.projection.c_str());

    DatasetPtr vectors { GDALDataset::Open(vector_file.c_str(), GDAL_OF_VECTOR), GDALClose };
    if (vectors == nullptr) {
        throw IOError("Unable to open vector file", vector_file, *logger);
    }

    CPLStringList args;
    args.AddString("-burn");
    args.AddString("1");
    std::unique_ptr<GDALRasterizeOptions, decltype(&GDALRasterizeOptionsFree)> rasterize_options {
        GDALRasterizeOptionsNew(args.List(), nullptr),
        GDALRasterizeOptionsFree
    };
    if (rasterize_options == nullptr) {
        throw GenericError("Cannot create gdal_rasterize options", *logger);
    }

    int usage_error = FALSE;
    GDALDatasetH result = GDALRasterize(nullptr, GDALDataset::ToHandle(mask.get()), GDALDataset::ToHandle(vectors.get()), rasterize_options.get(), &usage_error);
    if (result == nullptr) {
        throw IOError(fmt::format("gdal_rasterize failed: {}", CPLGetLastErrorMsg()), vector_file, *logger);
    }

    RasterX<u8> values(grid.height, grid.width);
    auto err = mask->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, grid.width, grid.height, values.data(), grid.width, grid.height, GDT_Byte, 0, 0, nullptr);
    if (err != CE_None) {
        throw IOError(fmt::format("Unable to read mask: {}", CPLGetLastErrorMsg()), vector_file, *logger);
    }
    return values;
}

fs::path derived_path(fs::path const& path, std::string const& suffix)
{
    return path.parent_path() / (path.stem().string() + suffix);
}
}
