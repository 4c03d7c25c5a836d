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
#include <string>
#include <vector>

// opalg includes
#include <opalg/common.hpp>

namespace opalg {

inline bool is_agnostic(Index n)
{
    return n == AGNOSTIC_DIM;
}

/// An axis is either a positive size or AGNOSTIC_DIM.
inline bool is_valid_axis(Index n)
{
    return n > 0 || is_agnostic(n);
}

inline std::string dim_str(Index n)
{
    return is_agnostic(n) ? std::string("*") : std::to_string(n);
}

/// Shape (codim, dim) of an operator mapping R^dim to R^codim.
struct Shape
{
    Index codim = AGNOSTIC_DIM;
    Index dim = AGNOSTIC_DIM;

    Shape() = default;

    Shape(Index codim_, Index dim_)
        : codim(codim_), dim(dim_) {}

    bool is_functional() const { return codim == 1; }
    bool is_square() const { return !is_agnostic(codim) && codim == dim; }
    bool is_concrete() const { return !is_agnostic(codim) && !is_agnostic(dim); }
    bool is_valid() const { return is_valid_axis(codim) && is_valid_axis(dim); }

    bool operator==(const Shape& other) const { return codim == other.codim && dim == other.dim; }
    bool operator!=(const Shape& other) const { return !(*this == other); }

    std::string str() const { return "(" + dim_str(codim) + ", " + dim_str(dim) + ")"; }
};

enum class StackAxis
{
    Vertical,    ///< stack codomains, shared domain
    Horizontal   ///< stack domains, shared codomain
};

/**
 * @brief Shape rules of the composition graph
 *
 * Every rule treats AGNOSTIC_DIM as compatible with anything. Mismatches that
 * remain hidden behind agnostic axes surface at evaluation time through
 * check_input() and check_output().
 */
class ShapeModel
{
  public:
    static void validate(const Shape& shape, const std::string& name)
    {
        if(!shape.is_valid())
            throw ShapeMismatch(name + " has shape (" + std::to_string(shape.codim) + ", " + std::to_string(shape.dim) +
                                "); every axis must be positive or agnostic");
    }

    // Two axes agree if either is agnostic or they are equal.
    static bool compatible(Index a, Index b)
    {
        return is_agnostic(a) || is_agnostic(b) || a == b;
    }

    // The more specific of two compatible axes.
    static Index merge(Index a, Index b)
    {
        return is_agnostic(a) ? b : a;
    }

    /// Shape of `a * b` (a applied after b).
    static Shape compose(const Shape& a, const Shape& b)
    {
        if(!compatible(a.dim, b.codim))
            throw ShapeMismatch("cannot compose " + a.str() + " after " + b.str() + ": domain " + dim_str(a.dim) +
                                " does not match codomain " + dim_str(b.codim));
        return Shape(a.codim, b.dim);
    }

    static Shape sum(const Shape& a, const Shape& b)
    {
        if(!compatible(a.codim, b.codim) || !compatible(a.dim, b.dim))
            throw ShapeMismatch("cannot add operators of shapes " + a.str() + " and " + b.str());
        return Shape(merge(a.codim, b.codim), merge(a.dim, b.dim));
    }

    static Shape stack(const std::vector<Shape>& shapes, StackAxis axis)
    {
        if(shapes.empty())
            throw ShapeMismatch("cannot stack an empty list of operators");

        const bool vertical = axis == StackAxis::Vertical;
        Index shared = vertical ? shapes[0].dim : shapes[0].codim;
        Index stacked = 0;
        for(const auto& s : shapes) {
            const Index other = vertical ? s.dim : s.codim;
            const Index along = vertical ? s.codim : s.dim;
            if(!compatible(shared, other))
                throw ShapeMismatch(std::string(vertical ? "vstack" : "hstack") + " of " + s.str() +
                                    " with operands of " + (vertical ? "dim " : "codim ") + dim_str(shared));
            shared = merge(shared, other);
            if(is_agnostic(along) || is_agnostic(stacked))
                stacked = AGNOSTIC_DIM;
            else
                stacked += along;
        }
        return vertical ? Shape(stacked, shared) : Shape(shared, stacked);
    }

    /**
     * @brief Resolve the block sizes a stack splits a vector of `total` entries into
     *
     * At most one block may be agnostic; it receives the remainder.
     */
    static std::vector<Index> split_sizes(const std::vector<Index>& blocks, Index total, const std::string& name)
    {
        Index known = 0;
        int agnostic = -1;
        for(std::size_t i = 0; i < blocks.size(); ++i) {
            if(is_agnostic(blocks[i])) {
                if(agnostic >= 0)
                    throw ShapeMismatch(name + ": more than one block of agnostic size, cannot split a vector of size " +
                                        std::to_string(total));
                agnostic = static_cast<int>(i);
            } else {
                known += blocks[i];
            }
        }

        std::vector<Index> sizes = blocks;
        if(agnostic >= 0) {
            if(known > total)
                throw ShapeMismatch(name + ": blocks need at least " + std::to_string(known) +
                                    " entries, got " + std::to_string(total));
            sizes[agnostic] = total - known;
        } else if(known != total) {
            throw ShapeMismatch(name + ": expected a vector of size " + std::to_string(known) + ", got " +
                                std::to_string(total));
        }
        return sizes;
    }

    static void check_input(const Shape& shape, Index size, const std::string& name)
    {
        if(!is_agnostic(shape.dim) && shape.dim != size)
            throw ShapeMismatch(name + " " + shape.str() + " expects an input of size " + std::to_string(shape.dim) +
                                ", got " + std::to_string(size));
    }

    static void check_output(const Shape& shape, Index size, const std::string& name)
    {
        if(!is_agnostic(shape.codim) && shape.codim != size)
            throw ShapeMismatch(name + " " + shape.str() + " expects an output of size " +
                                std::to_string(shape.codim) + ", got " + std::to_string(size));
    }
};

} // namespace opalg
