#include <fmt/std.h>
#include <gdal_priv.h>
#include <iostream>
#include <spdlog/spdlog.h>
#include <utils/error.h>
#include <utils/log.h>

#include <stack/external.h>
#include <stack/options.h>
#include <stack/pipeline.h>
#include <stack/run_log.h>

int main(int argc, char* argv[])
{
    std::optional<stack::Options> options;
    try {
        options = stack::parse_command_line(argc, argv);
    } catch (utils::ConfigurationConflict const& e) {
        spdlog::error("{}", e.what());
        std::cerr << stack::usage() << std::endl;
        stack::RunLog log(stack::log_file_from_arguments(argc, argv), false);
        log.error("{}", e.what());
        log.close();
        return 1;
    }
    if (!options.has_value()) {
        std::cout << stack::usage() << std::endl;
        return 0;
    }

    if (options->verbose) {
        utils::set_console_level(spdlog::level::debug);
    }
    spdlog::debug("Log location: {}", utils::log_location());
    GDALAllRegister();

    stack::RunLog log(options->log_file());
    try {
        stack::Toolbox tools = stack::Toolbox::from_path();
        fs::path product = stack::run(*options, tools, log);
        spdlog::info("Product written to {}", product);
    } catch (utils::StackError const& e) {
        log.error("{}", e.what());
        log.close();
        return 1;
    } catch (std::exception const& e) {
        log.error("Processing failed: {}", e.what());
        log.close();
        return 1;
    }

    std::cout << "Done!!!" << std::endl;
    return 0;
}
