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


// C++ includes
#include <memory>
#include <sstream>

// Catch includes
#include <catch2/catch_test_macros.hpp>

// spdlog includes
#include <spdlog/sinks/ostream_sink.h>

// opalg includes
#include <opalg/opalg.hpp>

using namespace opalg;

TEST_CASE("logger: composite construction is traced", "[runtime][logging]")
{
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%l %v");

    auto& log = logger();
    const auto previous = log.level();
    log.sinks().push_back(sink);

    set_log_level(spdlog::level::trace);
    CHECK(log.level() == spdlog::level::trace);
    const auto f = L1Norm<double>(3) + SquaredL2Norm<double>(3);
    log.flush();
    CHECK(captured.str().find("Sum node") != std::string::npos);
    CHECK(captured.str().find("primitive L1Norm") != std::string::npos);

    captured.str("");
    set_log_level(spdlog::level::warn);
    const auto g = 2.0 * f;
    log.flush();
    CHECK(captured.str().empty());

    log.sinks().pop_back();
    set_log_level(previous);
}
