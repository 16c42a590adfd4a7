#include "utils/geotiff.h"

#include <fmt/format.h>

namespace utils {
static auto logger = utils::create_logger("utils::geotiff");

GDALDatasetWrapper::GDALDatasetWrapper(fs::path const& path)
{
    dataset = GDALDataset::FromHandle(GDALOpen(path.c_str(), GA_ReadOnly));
    if (dataset == nullptr) {
        throw IOError(fmt::format("Unable to load dataset: {}", CPLGetLastErrorMsg()), path, *logger);
    }
}

GDALDatasetWrapper::~GDALDatasetWrapper()
{
    GDALClose(dataset);
}

Extent RasterInfo::extent() const
{
    return Extent {
        geoTransform[0],
        geoTransform[3],
        geoTransform[0] + width * geoTransform[1],
        geoTransform[3] + height * geoTransform[5]
    };
}

RasterInfo read_info(fs::path const& path)
{
    GDALDatasetWrapper dataset { path };
    RasterInfo info;
    info.width = dataset->GetRasterXSize();
    info.height = dataset->GetRasterYSize();
    info.projection = dataset->GetProjectionRef();
    if (dataset->GetGeoTransform(info.geoTransform.data()) != CE_None) {
        throw IOError("Unable to load the geo transformation information", path, *logger);
    }
    return info;
}
}
