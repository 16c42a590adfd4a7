#pragma once

#include <boost/regex.hpp>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace utils {
enum class DirectoryContents {
    NoSceneData,
    RtcProduct,
    Archive
};

// Classifies an entry of a download directory by its name
DirectoryContents find_directory_contents(fs::path const& path);

// Entries of `directory` (not recursive) whose file name matches `expr`, sorted by name
std::vector<fs::path> find_matching(fs::path const& directory, boost::regex const& expr);

// Removes `path` if it exists, then creates it empty
void create_clean_dir(fs::path const& path);
}
