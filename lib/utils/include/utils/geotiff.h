#pragma once

#include "utils/error.h"
#include "utils/log.h"
#include "utils/noCopying.h"
#include "utils/types.h"

#include <filesystem>
#include <gdal_priv.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>

namespace fs = std::filesystem;

namespace utils {
class GDALDatasetWrapper {
    MAKE_NONCOPYABLE(GDALDatasetWrapper);

public:
    explicit GDALDatasetWrapper(fs::path const& path);
    ~GDALDatasetWrapper();

    GDALDataset* get() { return dataset; }
    GDALDataset* operator->() { return get(); }

private:
    GDALDataset* dataset;
};

using DatasetPtr = std::unique_ptr<GDALDataset, decltype(&GDALClose)>;

template<typename>
inline constexpr bool unsupported_pixel_type = false;

// GDAL pixel type of the scalars we keep in memory
template<typename ScalarT>
constexpr GDALDataType gdal_type()
{
    if constexpr (std::is_same_v<ScalarT, u8>) {
        return GDT_Byte;
    } else if constexpr (std::is_same_v<ScalarT, u16>) {
        return GDT_UInt16;
    } else if constexpr (std::is_same_v<ScalarT, i16>) {
        return GDT_Int16;
    } else if constexpr (std::is_same_v<ScalarT, i32>) {
        return GDT_Int32;
    } else if constexpr (std::is_same_v<ScalarT, f32>) {
        return GDT_Float32;
    } else if constexpr (std::is_same_v<ScalarT, f64>) {
        return GDT_Float64;
    } else {
        static_assert(unsupported_pixel_type<ScalarT>, "Rasters hold u8, u16, i16, i32, f32 or f64 pixels");
    }
}

// A single band of a geocoded raster, held in memory together with its
// georeferencing. Derived rasters are always written to a new path.
// Geotransform layout: https://gdal.org/tutorials/geotransforms_tut.html
template<typename ScalarT>
class GeoTIFF {
public:
    explicit GeoTIFF(fs::path const& path, int bandIndex = 1)
    {
        GDALDatasetWrapper dataset { path };
        width = dataset->GetRasterXSize();
        height = dataset->GetRasterYSize();
        projection = dataset->GetProjectionRef();
        if (dataset->GetGeoTransform(geoTransform.data()) != CE_None) {
            throw IOError("Raster carries no geotransform", path, *logger);
        }

        GDALRasterBand* band = dataset->GetRasterBand(bandIndex);
        if (band == nullptr) {
            throw IOError(fmt::format("Raster has no band {}", bandIndex), path, *logger);
        }
        values.resize(height, width);
        transfer(band, GF_Read, values.data(), path);
    }

    GeoTIFF(RasterX<ScalarT> pixels, GeoTransform const& transform, std::string wkt)
        : width(static_cast<int>(pixels.cols()))
        , height(static_cast<int>(pixels.rows()))
        , values(std::move(pixels))
        , geoTransform(transform)
        , projection(std::move(wkt))
    {
    }

    GeoTIFF() = default;

    // Creates a new single band GeoTIFF carrying our georeferencing
    void write(fs::path const& destination) const
    {
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        if (driver == nullptr) {
            throw GenericError("GTiff driver is not registered", *logger);
        }

        DatasetPtr output { driver->Create(destination.c_str(), width, height, 1, gdal_type<ScalarT>(), nullptr), GDALClose };
        if (output == nullptr) {
            throw IOError(fmt::format("Unable to create raster: {}", CPLGetLastErrorMsg()), destination, *logger);
        }
        GeoTransform transform = geoTransform;
        output->SetGeoTransform(transform.data());
        output->SetProjection(projection.c_str());

        // RasterIO takes a mutable buffer for reads and writes alike
        transfer(output->GetRasterBand(1), GF_Write, const_cast<ScalarT*>(values.data()), destination);
        output->FlushCache();
        logger->debug("Wrote {}x{} raster to {}", width, height, destination.string());
    }

    f64 eastWestStep() const { return geoTransform[1]; }
    f64 northSouthStep() const { return geoTransform[5]; }

    // North-up rasters only
    f64 west() const { return geoTransform[0]; }
    f64 north() const { return geoTransform[3]; }
    f64 east() const { return west() + width * eastWestStep(); }
    f64 south() const { return north() + height * northSouthStep(); }

    Extent extent() const { return Extent { west(), north(), east(), south() }; }

    int width = 0;
    int height = 0;

    RasterX<ScalarT> values;
    GeoTransform geoTransform {};
    std::string projection;

private:
    void transfer(GDALRasterBand* band, GDALRWFlag direction, ScalarT* buffer, fs::path const& path) const
    {
        auto err = band->RasterIO(direction, 0, 0, width, height, buffer, width, height, gdal_type<ScalarT>(), 0, 0, nullptr);
        if (err != CE_None) {
            throw IOError(fmt::format("Raster {} failed: {}", direction == GF_Read ? "read" : "write", CPLGetLastErrorMsg()), path, *logger);
        }
    }

    static inline std::shared_ptr<spdlog::logger> logger { utils::create_logger("utils::geotiff") };
};

// Georeferencing and size of a raster, read without touching its pixels
struct RasterInfo {
    int width = 0;
    int height = 0;
    GeoTransform geoTransform {};
    std::string projection;

    [[nodiscard]] f64 pixel_size() const { return geoTransform[1]; }
    [[nodiscard]] Extent extent() const;
};

RasterInfo read_info(fs::path const& path);
}
