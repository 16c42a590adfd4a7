#include "helpers.h"

#include <algorithm>
#include <cmath>
#include <doctest/doctest.h>
#include <stack/pipeline.h>
#include <utils/error.h>

using namespace test_support;

namespace {
struct FakeToolbox {
    std::shared_ptr<FakeTool> swap = std::make_shared<FakeTool>("swap_bytes", swap_words);
    std::shared_ptr<FakeTool> filter = std::make_shared<FakeTool>("enh_lee", copy_samples);
    std::shared_ptr<FakeTool> convert = std::make_shared<FakeTool>("convert");
    std::shared_ptr<FakeTool> unzip = std::make_shared<FakeTool>("unzip");
    std::shared_ptr<FakeTool> download = std::make_shared<FakeTool>("download_products");

    stack::Toolbox tools() const { return stack::Toolbox { swap, filter, convert, unzip, download }; }
};

std::string dated_name(std::string const& date)
{
    return fmt::format("S1A-IW-RTC-30m-{}_gpn_VV.tif", date);
}

// Two scenes covering the box, one covering a tenth of it
std::vector<fs::path> write_inputs(fs::path const& dir)
{
    fs::create_directories(dir);
    return {
        write_constant_scene(dir / dated_name("20170612"), 0.5f),
        write_constant_scene(dir / dated_name("20170512"), 0.25f),
        write_constant_scene(dir / dated_name("20170712"), 0.5f, EASTING + 2700.0),
    };
}

stack::BoundingBox input_box()
{
    return stack::BoundingBox { Extent { EASTING, NORTHING, EASTING + SIZE * PIXEL, NORTHING - SIZE * PIXEL } };
}
}

TEST_CASE("Run on explicit input files with a bounding box")
{
    TempDir dir;
    stack::Options options;
    options.base_dir = dir.path;
    options.input_files = write_inputs(dir / "inputs");
    options.clip = input_box();
    options.output_type = stack::OutputType::dB;
    options.output_name = "lake";

    FakeToolbox fakes;
    auto tools = fakes.tools();
    fs::path product;
    {
        stack::RunLog log(options.log_file(), false);
        product = stack::run(options, tools, log);
        CHECK(log.closed());
    }

    CHECK_EQ(product, dir / "PRODUCT_lake");
    CHECK_FALSE(fs::exists(dir / "TEMP"));
    CHECK_FALSE(fs::exists(dir / "lake_run_stats.txt"));
    for (auto name : { "lake.gif", "lake_run_stats.txt", "scenes.db",
             "S1A-IW-RTC-30m-20170612_gpn_VV_clipped_dB.tif", "S1A-IW-RTC-30m-20170512_gpn_VV_clipped_dB.tif" }) {
        CAPTURE(name);
        CHECK(fs::exists(product / name));
    }
    CHECK_FALSE(fs::exists(product / "S1A-IW-RTC-30m-20170712_gpn_VV_clipped_dB.tif"));

    GeoTIFF<f32> db(product / "S1A-IW-RTC-30m-20170512_gpn_VV_clipped_dB.tif");
    CHECK_EQ(db.values(50, 50), doctest::Approx(10.0 * std::log(0.25)));

    // Explicit inputs are not annotated, the only convert run is the animation
    REQUIRE_EQ(fakes.convert->calls.size(), 1);
    auto const& args = fakes.convert->calls.front();
    REQUIRE_EQ(args.size(), 7);
    CHECK_EQ(fs::path(args[4]).filename(), "S1A-IW-RTC-30m-20170512_gpn_VV_clipped_dB-40_0.png");
    CHECK_EQ(fs::path(args[5]).filename(), "S1A-IW-RTC-30m-20170612_gpn_VV_clipped_dB-40_0.png");

    auto text = read_text(product / "lake_run_stats.txt");
    CHECK(text.find("Creating dB output frames") != std::string::npos);
    CHECK(text.find("S1A-IW-RTC-30m-20170712_gpn_VV.tif : 0.1 : discarded") != std::string::npos);
    CHECK(text.find("Scaling to dB") != std::string::npos);
    CHECK(text.find("Byte scaling from -40 to 0") != std::string::npos);

    stack::DataBase ledger(product / "scenes.db");
    CHECK_EQ(ledger.count(stack::Disposition::kept), 2);
    CHECK_EQ(ledger.count(stack::Disposition::discarded), 1);
}

TEST_CASE("Quick mode cuts before filtering and resampling")
{
    for (auto mode : { stack::Mode::standard, stack::Mode::quick }) {
        TempDir dir;
        stack::Options options;
        options.base_dir = dir.path;
        options.input_files = write_inputs(dir / "inputs");
        options.clip = input_box();
        options.output_type = stack::OutputType::power;
        options.speckle_filter = true;
        options.resolution = 60.0;
        options.mode = mode;
        options.leave_intermediates = true;

        FakeToolbox fakes;
        auto tools = fakes.tools();
        stack::RunLog log(options.log_file(), false);
        auto product = stack::run(options, tools, log);

        CHECK(fs::exists(dir / "TEMP"));
        std::string expected = mode == stack::Mode::quick
            ? "S1A-IW-RTC-30m-20170512_gpn_VV_clipped_sf_60m.tif"
            : "S1A-IW-RTC-30m-20170512_gpn_VV_sf_60m_clipped.tif";
        CAPTURE(expected);
        CHECK(fs::exists(product / expected));
        // Quick mode filters only the two survivors
        CHECK_EQ(fakes.filter->calls.size(), mode == stack::Mode::quick ? 2 : 3);
    }
}

TEST_CASE("Retained rasters per output type")
{
    TempDir dir;
    auto power = write_constant_scene(dir / "scene.tif", 4.0f);
    stack::StageOutputs outputs { { power }, { dir / "scene_dB.tif" }, { dir / "scene_dB-40_0.tif" } };

    CHECK_EQ(stack::retained_rasters(outputs, stack::OutputType::power), outputs.power);
    CHECK_EQ(stack::retained_rasters(outputs, stack::OutputType::dB), outputs.decibel);
    CHECK_EQ(stack::retained_rasters(outputs, stack::OutputType::dB_byte), outputs.byte);

    auto amp = stack::retained_rasters(outputs, stack::OutputType::amp);
    REQUIRE_EQ(amp.size(), 1);
    CHECK_EQ(amp.front().filename(), "scene_amp.tif");
    CHECK_EQ(GeoTIFF<f32>(amp.front()).values(0, 0), doctest::Approx(2.0f));

    auto sigma = stack::retained_rasters(outputs, stack::OutputType::sigma_byte);
    REQUIRE_EQ(sigma.size(), 1);
    CHECK_EQ(sigma.front().filename(), "scene_amp_sigma.tif");
}

TEST_CASE("Run on discovered products")
{
    TempDir dir;
    auto write_discovered = [&](std::string const& product_dir, std::string const& date, std::string const& direction) {
        fs::path product = dir / "products" / product_dir;
        fs::create_directories(product);
        write_constant_scene(product / dated_name(date), 0.5f);
        std::ofstream xml(product / "metadata.iso.xml");
        xml << "<pass>" << direction << "</pass>\n";
    };
    write_discovered("S1A_20170612-m-rtc-gamma", "20170612", "ascending");
    write_discovered("S1A_20170512-m-rtc-gamma", "20170512", "descending");
    write_discovered("S1A_20170712-m-rtc-gamma", "20170712", "ascending");

    stack::Options options;
    options.base_dir = dir.path;
    options.source_dir = dir / "products";
    options.keep = stack::FlightDirection::ascending;

    FakeToolbox fakes;
    auto tools = fakes.tools();
    stack::RunLog log(options.log_file(), false);
    auto product = stack::run(options, tools, log);

    // Two annotations and the animation
    REQUIRE_EQ(fakes.convert->calls.size(), 3);
    auto const& animation = fakes.convert->calls.back();
    REQUIRE_EQ(animation.size(), 7);
    CHECK_EQ(fs::path(animation[4]).filename(), "anno_S1A-IW-RTC-30m-20170612_gpn_VV_dB-40_0.png");
    CHECK_EQ(fs::path(animation[5]).filename(), "anno_S1A-IW-RTC-30m-20170712_gpn_VV_dB-40_0.png");

    CHECK(fs::exists(product / "animation.gif"));
    CHECK(fs::exists(product / "run_stats.txt"));
    CHECK(fs::exists(product / "S1A-IW-RTC-30m-20170612_gpn_VV_dB-40_0.tif"));
    CHECK_FALSE(fs::exists(product / "S1A-IW-RTC-30m-20170512_gpn_VV_dB-40_0.tif"));
    CHECK(read_text(product / "run_stats.txt").find("Keeping only ascending images") != std::string::npos);
}

TEST_CASE("Runs without usable scenes")
{
    TempDir dir;
    fs::create_directories(dir / "empty");
    FakeToolbox fakes;
    auto tools = fakes.tools();

    stack::Options options;
    options.base_dir = dir.path;
    options.source_dir = dir / "empty";
    {
        stack::RunLog log(options.log_file(), false);
        auto message = failure_message<utils::NoUsableScenes>([&] { stack::run(options, tools, log); });
        CHECK_EQ(message, "Found no files to process.");
    }
    CHECK_FALSE(fs::exists(options.product_dir()));

    options.source_dir.reset();
    options.input_files = write_inputs(dir / "inputs");
    options.clip = stack::BoundingBox { Extent { 0.0, 3000.0, 3000.0, 0.0 } };
    {
        stack::RunLog log(options.log_file(), false);
        CHECK_THROWS_AS(stack::run(options, tools, log), utils::NoOverlap);
    }
    CHECK_FALSE(fs::exists(options.product_dir()));
}

TEST_CASE("Subscription download feeds archive discovery")
{
    TempDir dir;
    FakeToolbox fakes;
    fakes.unzip = std::make_shared<FakeTool>("unzip", [](std::vector<std::string> const& args) {
        fs::path product = fs::path(args.at(4)) / "S1A_20170512-m-rtc-gamma";
        fs::create_directories(product);
        write_constant_scene(product / dated_name("20170512"), 0.5f);
        return 0;
    });
    fakes.download = std::make_shared<FakeTool>("download_products", [](std::vector<std::string> const& args) {
        touch(fs::path(args.back()) / "S1A_20170512.zip");
        return 0;
    });
    auto tools = fakes.tools();

    stack::Options options;
    options.base_dir = dir.path;
    options.subscription = "lake-subscription";

    stack::RunLog log(options.log_file(), false);
    auto product = stack::run(options, tools, log);
    REQUIRE_EQ(fakes.download->calls.size(), 1);
    CHECK(std::find(fakes.download->calls.front().begin(), fakes.download->calls.front().end(), "lake-subscription")
        != fakes.download->calls.front().end());
    CHECK_EQ(fakes.unzip->calls.size(), 1);
    CHECK(fs::exists(dir / "hyp3-products" / "S1A_20170512.zip"));
    CHECK(fs::exists(product / "S1A-IW-RTC-30m-20170512_gpn_VV_dB-40_0.tif"));
}
