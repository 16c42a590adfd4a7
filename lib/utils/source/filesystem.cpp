#include "utils/filesystem.h"
#include "utils/log.h"

#include <algorithm>
#include <fmt/std.h>

namespace utils {
static auto logger = utils::create_logger("utils::filesystem");

DirectoryContents find_directory_contents(fs::path const& path)
{
    static boost::regex const product_expr { R"(.*m-rtc-.*)" };
    static boost::regex const archive_expr { R"(.*\.zip)" };

    auto name = path.filename().string();
    if (fs::is_directory(path) && boost::regex_match(name, product_expr)) {
        return DirectoryContents::RtcProduct;
    }
    if (fs::is_regular_file(path) && boost::regex_match(name, archive_expr)) {
        return DirectoryContents::Archive;
    }
    return DirectoryContents::NoSceneData;
}

std::vector<fs::path> find_matching(fs::path const& directory, boost::regex const& expr)
{
    std::vector<fs::path> matches;
    if (!fs::is_directory(directory)) {
        return matches;
    }
    for (auto const& entry : fs::directory_iterator(directory)) {
        if (boost::regex_match(entry.path().filename().string(), expr)) {
            matches.push_back(entry.path());
        }
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

void create_clean_dir(fs::path const& path)
{
    if (fs::exists(path)) {
        logger->info("Cleaning up old {} directory", path);
        fs::remove_all(path);
    }
    fs::create_directories(path);
}
}
