//                    _
//   ___  _ __   __ _| | __ _
//  / _ \| '_ \ / _` | |/ _` |
// | (_) | |_) | (_| | | (_| |
//  \___/| .__/ \__,_|_|\__, |
//       |_|            |___/
//
// operator algebra made easier in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.


#pragma once

// C++ includes
#include <cstdlib>
#include <memory>

// spdlog includes
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace opalg {
namespace detail {

// Reads OPALG_LOG_LEVEL (trace, debug, info, warn, err, critical, off). Defaults to warn.
inline spdlog::level::level_enum log_level_from_env()
{
    const char* env = std::getenv("OPALG_LOG_LEVEL");
    if(env == nullptr) return spdlog::level::warn;
    return spdlog::level::from_str(env);
}

} // namespace detail

/**
 * @brief Library-wide logger
 *
 * A single named spdlog logger ("opalg") shared by every header. If the host
 * application already registered a logger under that name, it is reused so
 * that its sinks and formatting apply to the library output as well.
 */
inline spdlog::logger& logger()
{
    static const std::shared_ptr<spdlog::logger> instance = []() {
        if(auto existing = spdlog::get("opalg")) return existing;
        auto created = spdlog::stdout_color_mt("opalg");
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(detail::log_level_from_env());
        return created;
    }();
    return *instance;
}

inline void set_log_level(spdlog::level::level_enum level)
{
    logger().set_level(level);
}

} // namespace opalg

#define OPALG_LOG_TRACE(...) ::opalg::logger().trace(__VA_ARGS__)
#define OPALG_LOG_DEBUG(...) ::opalg::logger().debug(__VA_ARGS__)
#define OPALG_LOG_INFO(...) ::opalg::logger().info(__VA_ARGS__)
#define OPALG_LOG_WARN(...) ::opalg::logger().warn(__VA_ARGS__)
#define OPALG_LOG_ERROR(...) ::opalg::logger().error(__VA_ARGS__)
