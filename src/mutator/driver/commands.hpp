#pragma once

#include <argparse/argparse.hpp>

namespace mutator::driver {

auto RunCommand(const argparse::ArgumentParser& cmd) -> int;
auto DumpCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace mutator::driver
