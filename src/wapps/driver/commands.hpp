#pragma once

#include <argparse/argparse.hpp>

#include "wapps/config/host_config.hpp"

namespace wapps::driver {

auto InspectCommand(
    const argparse::ArgumentParser& cmd, const config::HostConfig& config)
    -> int;
auto CheckCommand(
    const argparse::ArgumentParser& cmd, const config::HostConfig& config)
    -> int;
auto PackCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace wapps::driver
