#include "stack/options.h"

#include <boost/algorithm/string/replace.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/program_options.hpp>
#include <magic_enum.hpp>
#include <sstream>
#include <utils/error.h>
#include <utils/log.h>

namespace po = boost::program_options;

namespace stack {
static auto logger = utils::create_logger("stack::options");

fs::path Options::log_file() const
{
    return base_dir / (output_name.has_value() ? fmt::format("{}_run_stats.txt", *output_name) : std::string("run_stats.txt"));
}

fs::path Options::product_dir() const
{
    return base_dir / (output_name.has_value() ? fmt::format("PRODUCT_{}", *output_name) : std::string("PRODUCT"));
}

std::string Options::animation_name() const
{
    return output_name.has_value() ? fmt::format("{}.gif", *output_name) : std::string("animation.gif");
}

fs::path log_file_from_arguments(int argc, char const* const* argv)
{
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if ((arg == "-o" || arg == "--outfile") && i + 1 < argc) {
            options.output_name = argv[i + 1];
        } else if (arg.starts_with("--outfile=")) {
            options.output_name = std::string(arg.substr(10));
        } else if (arg.starts_with("-o") && arg.size() > 2) {
            options.output_name = std::string(arg.substr(2));
        } else {
            continue;
        }
        break;
    }
    return options.log_file();
}

std::optional<OutputType> output_type_from_str(std::string_view str)
{
    return magic_enum::enum_cast<OutputType>(boost::algorithm::replace_all_copy(std::string(str), "-", "_"));
}

std::string output_type_name(OutputType type)
{
    return boost::algorithm::replace_all_copy(std::string(magic_enum::enum_name(type)), "_", "-");
}

std::optional<FlightDirection> keep_from_str(std::string_view str)
{
    if (str == "a") {
        return FlightDirection::ascending;
    }
    if (str == "d") {
        return FlightDirection::descending;
    }
    return {};
}

namespace {
// "-d -40 0" would otherwise read -40 as an option. Numbers become positional
// tokens, which the preceding multitoken option then takes as its values.
std::vector<po::option> numbers_as_values(std::vector<std::string>& args)
{
    std::vector<po::option> result;
    int position = 0;
    while (!args.empty()) {
        f64 number;
        if (!boost::conversion::try_lexical_convert(args.front(), number)) {
            break;
        }
        po::option opt;
        opt.position_key = position++;
        opt.value.push_back(args.front());
        opt.original_tokens.push_back(args.front());
        result.push_back(opt);
        args.erase(args.begin());
    }
    return result;
}

po::options_description describe_options()
{
    po::options_description desc("rtc-stack - create an RTC time series animation\n\nUsage: rtc-stack [infile ...] [options]\n(options taking several values take every number that follows them)\n\nOptions");
    // clang-format off
    desc.add_options()
        ("help,h", "Print this help")
        ("amp,a", po::bool_switch(), "Input files are amplitude and not power")
        ("black,b", po::value<f64>()->default_value(DEFAULT_COVERAGE_THRESHOLD), "Fraction of black required to remove an image")
        ("dBscale,d", po::value<std::vector<f64>>()->multitoken(), "Lower and upper dB for scaling (default -40 0)")
        ("filter,f", po::bool_switch(), "Apply speckle filtering")
        ("keep,k", po::value<std::string>(), "Keep only ascending (a) or descending (d) images (default is to keep all)")
        ("leave,l", po::bool_switch(), "Leave intermediate files in place")
        ("magnify,m", po::value<int>()->default_value(24), "Annotation font size")
        ("name,n", po::value<std::string>(), "Name of the Hyp3 subscription to download for input files")
        ("outfile,o", po::value<std::string>(), "Output animation name")
        ("path,p", po::value<std::string>(), "Path to the input files")
        ("quick,q", po::bool_switch(), "Run in quick mode - perform clipping first, then filtering and resampling")
        ("res,r", po::value<f64>(), "Desired output resolution")
        ("type,t", po::value<std::string>()->default_value("dB-byte"), "Output type: dB, sigma-byte, dB-byte, amp or power")
        ("zip,z", po::bool_switch(), "Start from hyp3 zip files instead of directories")
        ("clip,c", po::value<std::vector<f64>>()->multitoken(), "Clip output to bounding box (ULE ULN LRE LRN)")
        ("shape,s", po::value<std::string>(), "Clip output to shape file")
        ("overlap,v", po::bool_switch(), "Clip files to common overlap. Assumes files are already pixel aligned")
        ("verbose", po::bool_switch(), "Print module diagnostics to the console")
        ("infile", po::value<std::vector<std::string>>(), "Input tif files; if none are given the hyp3 products are used");
    // clang-format on
    return desc;
}
}

std::string usage()
{
    std::ostringstream out;
    out << describe_options();
    return out.str();
}

std::optional<Options> parse_command_line(int argc, char const* const* argv)
{
    auto desc = describe_options();
    po::positional_options_description positional;
    positional.add("infile", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).extra_style_parser(&numbers_as_values).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (po::error const& e) {
        throw utils::ConfigurationConflict(e.what());
    }

    if (vm.count("help")) {
        return {};
    }

    Options options;
    options.amplitude_input = vm["amp"].as<bool>();
    options.threshold = vm["black"].as<f64>();
    options.speckle_filter = vm["filter"].as<bool>();
    options.leave_intermediates = vm["leave"].as<bool>();
    options.font_size = vm["magnify"].as<int>();
    options.mode = vm["quick"].as<bool>() ? Mode::quick : Mode::standard;
    options.from_archives = vm["zip"].as<bool>();
    options.verbose = vm["verbose"].as<bool>();

    if (options.threshold < 0.0 || options.threshold > 1.0) {
        throw utils::ConfigurationConflict(fmt::format("Clip threshold must be within [0, 1], got {}", options.threshold));
    }
    if (options.font_size <= 0) {
        throw utils::ConfigurationConflict(fmt::format("Font size must be positive, got {}", options.font_size));
    }

    if (vm.count("dBscale")) {
        auto range = vm["dBscale"].as<std::vector<f64>>();
        if (range.size() != 2) {
            throw utils::ConfigurationConflict("--dBscale takes exactly two values (lower upper)");
        }
        options.db_range = { range[0], range[1] };
    }

    if (vm.count("keep")) {
        auto keep = vm["keep"].as<std::string>();
        options.keep = keep_from_str(keep);
        if (!options.keep.has_value()) {
            throw utils::ConfigurationConflict(fmt::format("Unknown keep value {} - must be either 'a' or 'd'", keep));
        }
    }

    auto type = vm["type"].as<std::string>();
    auto output_type = output_type_from_str(type);
    if (!output_type.has_value()) {
        throw utils::ConfigurationConflict(fmt::format("Unknown output type {}", type));
    }
    options.output_type = *output_type;

    if (vm.count("name")) {
        options.subscription = vm["name"].as<std::string>();
    }
    if (vm.count("outfile")) {
        options.output_name = vm["outfile"].as<std::string>();
    }
    if (vm.count("path")) {
        options.source_dir = fs::absolute(vm["path"].as<std::string>());
    }
    if (vm.count("res")) {
        options.resolution = vm["res"].as<f64>();
        if (*options.resolution <= 0.0) {
            throw utils::ConfigurationConflict(fmt::format("Resolution must be positive, got {}", *options.resolution));
        }
    }
    if (vm.count("infile")) {
        for (auto const& file : vm["infile"].as<std::vector<std::string>>()) {
            options.input_files.emplace_back(file);
        }
    }

    int strategies = static_cast<int>(vm.count("clip")) + static_cast<int>(vm.count("shape")) + (vm["overlap"].as<bool>() ? 1 : 0);
    if (strategies > 1) {
        if (vm.count("shape") && vm.count("clip")) {
            throw utils::ConfigurationConflict("Can not use both shapefile and image clipping options");
        }
        if (vm.count("shape")) {
            throw utils::ConfigurationConflict("Can not use both shapefile and clip to overlap options");
        }
        throw utils::ConfigurationConflict("Can not use both clip to overlap and image clipping options");
    }
    if (vm.count("clip")) {
        auto corners = vm["clip"].as<std::vector<f64>>();
        if (corners.size() != 4) {
            throw utils::ConfigurationConflict("--clip takes exactly four values (ULE ULN LRE LRN)");
        }
        options.clip = BoundingBox { utils::Extent { corners[0], corners[1], corners[2], corners[3] } };
    } else if (vm.count("shape")) {
        options.clip = ShapeFile { fs::absolute(vm["shape"].as<std::string>()) };
    } else if (vm["overlap"].as<bool>()) {
        options.clip = Overlap {};
    }

    logger->debug("Parsed options: type {}, clip {}, mode {}", output_type_name(options.output_type), describe(options.clip), magic_enum::enum_name(options.mode));
    return options;
}

void validate(Options const& options)
{
    if (auto const* shape = std::get_if<ShapeFile>(&options.clip)) {
        if (!fs::is_regular_file(shape->path)) {
            throw utils::MissingInput("Shape file does not exist:", shape->path);
        }
    }
    for (auto const& file : options.input_files) {
        if (!fs::is_regular_file(file)) {
            throw utils::MissingInput("Can't find input file", file);
        }
    }
    if (options.discovers_scenes() && !options.subscription.has_value() && options.source_dir.has_value()
        && !fs::is_directory(*options.source_dir)) {
        throw utils::MissingInput("Unable to find directory", *options.source_dir);
    }
}
}
