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
#include <cmath>
#include <future>
#include <stdexcept>

// Catch includes
#include <catch2/catch_test_macros.hpp>

// opalg includes
#include <opalg/opalg.hpp>
#include <tests/utils/catch.hpp>

using namespace opalg;

TEST_CASE("ConfigScope: installs and restores the configuration", "[runtime][config]")
{
    CHECK(ConfigManager::current().lipschitz_method == LipschitzMethod::Frobenius);

    RuntimeConfig power;
    power.lipschitz_method = LipschitzMethod::PowerIteration;
    power.max_power_iterations = 50;
    {
        ConfigScope scope(power);
        CHECK(ConfigManager::current().lipschitz_method == LipschitzMethod::PowerIteration);
        CHECK(ConfigManager::current().max_power_iterations == 50);

        RuntimeConfig inner = power;
        inner.seed = 7;
        {
            ConfigScope nested(inner);
            CHECK(ConfigManager::current().seed == 7);
        }
        CHECK(ConfigManager::current().seed == 0);
    }
    CHECK(ConfigManager::current().lipschitz_method == LipschitzMethod::Frobenius);
}

TEST_CASE("ConfigScope: restores on exceptions", "[runtime][config]")
{
    RuntimeConfig power;
    power.lipschitz_method = LipschitzMethod::PowerIteration;
    try {
        ConfigScope scope(power);
        throw std::runtime_error("abort");
    } catch(const std::runtime_error&) {
    }
    CHECK(ConfigManager::current().lipschitz_method == LipschitzMethod::Frobenius);
}

TEST_CASE("ConfigManager: configuration is thread-local", "[runtime][config]")
{
    RuntimeConfig power;
    power.lipschitz_method = LipschitzMethod::PowerIteration;
    ConfigScope scope(power);

    auto other = std::async(std::launch::async, [] { return ConfigManager::current().lipschitz_method; });
    CHECK(other.get() == LipschitzMethod::Frobenius);
    CHECK(ConfigManager::current().lipschitz_method == LipschitzMethod::PowerIteration);
}

TEST_CASE("OPALG_WITH_CONFIG: selects the Lipschitz bound procedure", "[runtime][config][lipschitz]")
{
    Eigen::MatrixXd M(2, 2);
    M << 2, 0,
         0, 1;

    const auto frobenius = ExplicitLinOp<double>(M);
    CHECK(frobenius.lipschitz_estimate() == approx(std::sqrt(5.0)));

    RuntimeConfig power;
    power.lipschitz_method = LipschitzMethod::PowerIteration;
    const auto estimated = ExplicitLinOp<double>(M);
    OPALG_WITH_CONFIG(power)
    {
        const double L = estimated.lipschitz_estimate();
        CHECK(L >= 2.0);
        CHECK(L <= 2.0 * (1.0 + 2.0 * power.power_safety_margin));
    }

    // Memoized with the configuration of the first request
    CHECK(estimated.lipschitz_estimate() < frobenius.lipschitz_estimate());
}
