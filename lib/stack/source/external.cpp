#include "stack/external.h"

#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sys/wait.h>
#include <utils/error.h>
#include <utils/log.h>

namespace stack {
static auto logger = utils::create_logger("stack::external");

ProcessTool::ProcessTool(std::string program)
    : m_program(std::move(program))
{
}

ToolResult ProcessTool::invoke(std::vector<std::string> const& args, std::vector<fs::path> const& expected_outputs)
{
    std::string cmd = shell_quote(m_program);
    for (auto const& arg : args) {
        cmd += " " + shell_quote(arg);
    }
    logger->info("Running: {}", cmd);

    ToolResult result;
    int status = std::system(cmd.c_str());
    if (status == -1) {
        result.exit_status = -1;
    } else if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else {
        // Killed by a signal
        result.exit_status = 128 + WTERMSIG(status);
    }

    for (auto const& output : expected_outputs) {
        if (fs::exists(output)) {
            result.outputs.push_back(output);
        }
    }
    logger->debug("{} exited with {}", m_program, result.exit_status);
    return result;
}

Toolbox Toolbox::from_path()
{
    Toolbox tools;
    tools.swap_bytes = std::make_shared<ProcessTool>("swap_bytes");
    tools.speckle_filter = std::make_shared<ProcessTool>("enh_lee");
    tools.convert = std::make_shared<ProcessTool>("convert");
    tools.unzip = std::make_shared<ProcessTool>("unzip");
    tools.download = std::make_shared<ProcessTool>("download_products");
    return tools;
}

ToolResult run_checked(ExternalTool& tool, std::vector<std::string> const& args, std::vector<fs::path> const& expected_outputs)
{
    auto result = tool.invoke(args, expected_outputs);
    if (!result.succeeded()) {
        throw utils::GenericError(
            fmt::format("{} {} failed with exit status {}", tool.name(), fmt::join(args, " "), result.exit_status), *logger);
    }
    if (result.outputs.size() != expected_outputs.size()) {
        throw utils::GenericError(
            fmt::format("{} finished but did not produce {} of its {} outputs",
                tool.name(), expected_outputs.size() - result.outputs.size(), expected_outputs.size()),
            *logger);
    }
    return result;
}

std::string shell_quote(std::string const& arg)
{
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
}
