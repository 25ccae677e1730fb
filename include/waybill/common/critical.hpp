#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace waybill::common {

namespace detail {

[[noreturn]] inline void terminate_process() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace detail

/// Log at critical level, flush every sink and stop the process. Reserved for
/// conditions after which continuing could corrupt or reuse durable state.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  detail::terminate_process();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Arg>(arg),
                   std::forward<Args>(args)...);
  detail::terminate_process();
}

}  // namespace waybill::common
