#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace agora::common {

/// Stop the node on a failure it cannot recover from without diverging
/// from the rest of the network: storage I/O, codec failure, broken setup.
/// Every sink is flushed before the process goes down.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(fmt::format_string<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Arg>(arg),
                                        std::forward<Args>(args)...)});
}

}  // namespace agora::common
