#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace stack {
struct ToolResult {
    int exit_status = 0;
    // The expected outputs that exist after the invocation
    std::vector<fs::path> outputs;

    [[nodiscard]] bool succeeded() const { return exit_status == 0; }
};

// A program outside of this process (speckle filter, image magick, ...).
// Invocations are synchronous.
class ExternalTool {
public:
    virtual ~ExternalTool() = default;

    virtual ToolResult invoke(std::vector<std::string> const& args, std::vector<fs::path> const& expected_outputs) = 0;
    [[nodiscard]] virtual std::string const& name() const = 0;
};

// Runs a named program found on the PATH through the shell
class ProcessTool : public ExternalTool {
public:
    explicit ProcessTool(std::string program);

    ToolResult invoke(std::vector<std::string> const& args, std::vector<fs::path> const& expected_outputs) override;
    [[nodiscard]] std::string const& name() const override { return m_program; }

private:
    std::string m_program;
};

// Every external program the pipeline may call
struct Toolbox {
    std::shared_ptr<ExternalTool> swap_bytes;
    std::shared_ptr<ExternalTool> speckle_filter;
    std::shared_ptr<ExternalTool> convert;
    std::shared_ptr<ExternalTool> unzip;
    std::shared_ptr<ExternalTool> download;

    static Toolbox from_path();
};

/**
 * Invokes a tool and requires a zero exit status and every expected output.
 * Throws utils::GenericError otherwise.
 */
ToolResult run_checked(ExternalTool& tool, std::vector<std::string> const& args, std::vector<fs::path> const& expected_outputs);

std::string shell_quote(std::string const& arg);
}
