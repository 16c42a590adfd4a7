#include "helpers.h"

#include <doctest/doctest.h>
#include <stack/radiometry.h>
#include <utils/error.h>
#include <utils/filesystem.h>

using namespace test_support;

TEST_CASE("Amplitude to power and back")
{
    TempDir dir;
    RasterX<f32> amplitude(2, 3);
    amplitude << 0.5f, 1.0f, 2.0f,
        0.0f, 0.25f, 10.0f;
    auto source = write_scene(dir / "scene.tif", amplitude);

    auto power = stack::amplitude_to_power(source);
    CHECK_EQ(power.filename(), "scene_pwr.tif");
    GeoTIFF<f32> power_tiff(power);
    CHECK_EQ(power_tiff.values(0, 2), doctest::Approx(4.0f));
    CHECK_EQ(power_tiff.values(1, 2), doctest::Approx(100.0f));

    auto restored = stack::power_to_amplitude(power);
    CHECK_EQ(restored.filename(), "scene_pwr_amp.tif");
    GeoTIFF<f32> restored_tiff(restored);
    CHECK(restored_tiff.values.isApprox(amplitude, 1e-6f));
    CHECK_EQ(restored_tiff.geoTransform, GeoTIFF<f32>(source).geoTransform);
}

TEST_CASE("Power to decibel")
{
    TempDir dir;
    RasterX<f32> power(1, 4);
    power << 1.0f, 100.0f, 0.01f, 0.0f;
    auto db = stack::power_to_decibel(write_scene(dir / "scene.tif", power));
    CHECK_EQ(db.filename(), "scene_dB.tif");

    GeoTIFF<f32> tiff(db);
    CHECK_EQ(tiff.values(0, 0), doctest::Approx(0.0f));
    CHECK_EQ(tiff.values(0, 1), doctest::Approx(46.0517f).epsilon(1e-4));
    CHECK_EQ(tiff.values(0, 2), doctest::Approx(-46.0517f).epsilon(1e-4));
    CHECK_EQ(tiff.values(0, 3), stack::NO_DATA_DB);
}

TEST_CASE("Byte scaling")
{
    TempDir dir;
    RasterX<f32> db(1, 4);
    db << -40.0f, 0.0f, stack::NO_DATA_DB, 12.0f;
    auto scaled = stack::byte_scale(write_scene(dir / "scene_dB.tif", db), -40.0, 0.0);
    CHECK_EQ(scaled.filename(), "scene_dB-40_0.tif");

    GeoTIFF<u8> tiff(scaled);
    CHECK_EQ(tiff.values(0, 0), 0);
    CHECK_EQ(tiff.values(0, 1), 255);
    CHECK_EQ(tiff.values(0, 2), 0);
    CHECK_EQ(tiff.values(0, 3), 255);
}

TEST_CASE("Resolution change averages pixels")
{
    TempDir dir;
    auto source = write_constant_scene(dir / "scene.tif", 2.0f);
    auto coarse = stack::change_resolution(source, 60.0);
    CHECK_EQ(coarse.filename(), "scene_60m.tif");

    GeoTIFF<f32> tiff(coarse);
    CHECK_EQ(tiff.width, SIZE / 2);
    CHECK_EQ(tiff.height, SIZE / 2);
    CHECK_EQ(tiff.eastWestStep(), doctest::Approx(60.0));
    CHECK_EQ(tiff.values(10, 10), doctest::Approx(2.0f));
}

TEST_CASE("Two sigma stretch window")
{
    auto constant = stack::two_sigma_cutoffs(RasterX<f32>::Constant(4, 5, 3.0f));
    CHECK_EQ(constant.first, doctest::Approx(3.0));
    CHECK_EQ(constant.second, doctest::Approx(3.0));

    // The outlier is above the 98th percentile and clipped away
    RasterX<f32> outlier = RasterX<f32>::Constant(10, 10, 1.0f);
    outlier(9, 9) = 1000.0f;
    auto clipped = stack::two_sigma_cutoffs(outlier);
    CHECK_EQ(clipped.first, doctest::Approx(1.0));
    CHECK_EQ(clipped.second, doctest::Approx(1.0));

    RasterX<f32> spread(1, 4);
    spread << 1.0f, 2.0f, 3.0f, 4.0f;
    // 98th percentile 3.94, mean 2.485
    auto window = stack::two_sigma_cutoffs(spread);
    CHECK_LT(window.first, 2.485);
    CHECK_GT(window.second, 2.485);
    CHECK_EQ(window.first + window.second, doctest::Approx(2 * 2.485));

    CHECK_THROWS_AS(stack::two_sigma_cutoffs(RasterX<f32>(0, 0)), utils::GenericError);
}

TEST_CASE("Sigma byte output")
{
    TempDir dir;
    RasterX<f32> amplitude(1, 4);
    amplitude << 1.0f, 2.0f, 3.0f, 4.0f;
    auto output = stack::sigma_byte(write_scene(dir / "scene_amp.tif", amplitude));
    CHECK_EQ(output.filename(), "scene_amp_sigma.tif");
    GeoTIFF<u8> tiff(output);
    CHECK_LT(tiff.values(0, 0), tiff.values(0, 3));
}

TEST_CASE("Speckle filter through external tools")
{
    TempDir dir;
    RasterX<f32> values(3, 4);
    values << 1, 2, 3, 4,
        5, 6, 7, 8,
        9, 10, 11, 12;
    auto source = write_scene(dir / "scene.tif", values);

    FakeTool swap("swap_bytes", swap_words);
    FakeTool filter("enh_lee", copy_samples);
    auto filtered = stack::speckle_filter(source, swap, filter);
    CHECK_EQ(filtered.filename(), "scene_sf.tif");

    GeoTIFF<f32> tiff(filtered);
    CHECK(tiff.values.isApprox(values));

    CHECK_EQ(swap.calls.size(), 2);
    REQUIRE_EQ(filter.calls.size(), 1);
    auto const& args = filter.calls.front();
    REQUIRE_EQ(args.size(), 7);
    CHECK_EQ(args[2], "4");
    CHECK_EQ(std::vector<std::string>(args.begin() + 3, args.end()), std::vector<std::string> { "1", "4", "7", "7" });

    CHECK(find_matching(dir.path, boost::regex(".*\\.bin")).empty());
}

TEST_CASE("Speckle filter failures")
{
    TempDir dir;
    auto source = write_constant_scene(dir / "scene.tif", 1.0f);

    FakeTool swap("swap_bytes", swap_words);
    FakeTool failing("enh_lee", [](std::vector<std::string> const&) { return 2; });
    CHECK_THROWS_AS(stack::speckle_filter(source, swap, failing), utils::GenericError);

    // Exit status 0 but the output is truncated
    FakeTool truncating("enh_lee", [](std::vector<std::string> const& args) {
        touch(args.at(1));
        return 0;
    });
    CHECK_THROWS_AS(stack::speckle_filter(source, swap, truncating), utils::IOError);
}

TEST_CASE("Stack transforms keep scene metadata")
{
    TempDir dir;
    stack::RunLog log(dir / "run_stats.txt", false);

    stack::Scene scene { write_constant_scene(dir / SHORT_NAME, 2.0f) };
    scene.acquisition_date = stack::AcquisitionDate { "20170512", utils::Date(date_time::date(2017, 5, 12)) };
    scene.flight_direction = stack::FlightDirection::ascending;

    auto power = stack::amplitude_to_power({ scene }, log);
    REQUIRE_EQ(power.size(), 1);
    CHECK_EQ(power.front().name(), "S1A-IW-RTC-30m-20170512_gpn_VV_pwr.tif");
    CHECK_EQ(power.front().acquisition_date->token, "20170512");
    CHECK_EQ(power.front().flight_direction, stack::FlightDirection::ascending);

    auto coarse = stack::change_resolution(power, 90.0, log);
    CHECK_EQ(coarse.front().name(), "S1A-IW-RTC-30m-20170512_gpn_VV_pwr_90m.tif");
}
