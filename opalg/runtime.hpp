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
#include <cstdint>

// opalg includes
#include <opalg/common.hpp>

namespace opalg {

/// How a linear primitive without a declared bound estimates its Lipschitz constant.
enum class LipschitzMethod : uint8_t
{
    Frobenius,       ///< ||A||_F from one apply per basis vector; a guaranteed upper bound on ||A||_2.
    PowerIteration   ///< sqrt of the largest eigenvalue of A^T A by power iteration; tight but approximate.
};

/**
 * @brief Runtime knobs of the operator algebra
 *
 * The configuration only affects how lazily computed quantities are obtained.
 * It never changes the property set derived for a node.
 */
struct RuntimeConfig
{
    LipschitzMethod lipschitz_method = LipschitzMethod::Frobenius;

    // Power iteration budget and relative stopping tolerance.
    int max_power_iterations = 500;
    double power_tolerance = 1e-10;

    // The power iteration estimate is multiplied by (1 + power_safety_margin)
    // so that a slightly unconverged run still bounds ||A||_2 from above.
    double power_safety_margin = 1e-3;

    // Seed of the power iteration starting vector.
    uint32_t seed = 0;

    // Frobenius estimation applies the operator once per input coordinate.
    // Above this dimension a warning is emitted (the bound is still computed).
    Index frobenius_warn_dim = 4096;
};

/**
 * @brief Thread-local configuration management
 *
 * Each thread sees its own current configuration, so concurrent call chains
 * can run with different settings without synchronization.
 *
 * Usage:
 *   RuntimeConfig cfg;
 *   cfg.lipschitz_method = LipschitzMethod::PowerIteration;
 *   {
 *     ConfigScope scope(cfg);
 *     auto L = op.lipschitz_estimate();   // computed with power iteration
 *   }                                     // previous configuration restored
 */
class ConfigManager
{
  private:
    static inline thread_local RuntimeConfig current_{};

  public:
    static const RuntimeConfig& current()
    {
        return current_;
    }

    static void set_current(const RuntimeConfig& config)
    {
        current_ = config;
    }

    static void reset()
    {
        current_ = RuntimeConfig{};
    }
};

/**
 * @brief RAII configuration override
 *
 * Installs a configuration for the lifetime of the scope and restores the
 * previous one on exit, including exits by exception.
 */
class ConfigScope
{
  private:
    RuntimeConfig previous_;

  public:
    explicit ConfigScope(const RuntimeConfig& config)
        : previous_(ConfigManager::current())
    {
        ConfigManager::set_current(config);
    }

    ~ConfigScope()
    {
        ConfigManager::set_current(previous_);
    }

    // Non-copyable, non-movable
    ConfigScope(const ConfigScope&) = delete;
    ConfigScope& operator=(const ConfigScope&) = delete;
    ConfigScope(ConfigScope&&) = delete;
    ConfigScope& operator=(ConfigScope&&) = delete;
};

// Macro for with-block syntax
#define OPALG_WITH_CONFIG(config) \
    if(auto _opalg_config_scope = ::opalg::ConfigScope(config); true)

} // namespace opalg
