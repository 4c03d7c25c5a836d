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
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

// Eigen includes
#include <Eigen/Core>

namespace opalg {

// Forward declarations
template<typename T>
class OperatorNode;
template<typename T>
class Operator;
template<typename T>
struct PrimitiveDeclaration;

// Sizes follow Eigen's signed index type so that vector sizes compare without casts.
using Index = Eigen::Index;

// Marker for a domain-agnostic axis: the operator accepts (or produces) vectors of any size.
constexpr Index AGNOSTIC_DIM = -1;

template<typename T>
using VectorX = Eigen::Matrix<T, Eigen::Dynamic, 1>;

template<typename T>
using MatrixX = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

template<typename T>
using NodePtr = std::shared_ptr<const OperatorNode<T>>;

///////////////////////////
// error kinds
///////////////////////////

/// Base class of every error raised by the operator algebra.
class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& what)
        : std::runtime_error(what) {}
};

/// Incompatible dimensions, at composition time or at first concrete evaluation.
class ShapeMismatch : public Error
{
  public:
    explicit ShapeMismatch(const std::string& what)
        : Error("ShapeMismatch: " + what) {}
};

/// A capability (adjoint, gradient, prox, ...) was invoked on a node lacking the required property.
class UnsupportedOperation : public Error
{
  public:
    explicit UnsupportedOperation(const std::string& what)
        : Error("UnsupportedOperation: " + what) {}
};

/// Malformed lookup in the property rule table. Reaching it means the rule table is inconsistent.
class InvalidCombination : public Error
{
  public:
    explicit InvalidCombination(const std::string& what)
        : Error("InvalidCombination: " + what) {}
};

/// A primitive declares a kernel without its property, or a property without its kernel.
class PropertyKernelMismatch : public Error
{
  public:
    explicit PropertyKernelMismatch(const std::string& what)
        : Error("PropertyKernelMismatch: " + what) {}
};

} // namespace opalg
