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

// Catch includes
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

// opalg includes
#include <opalg/shape.hpp>

using namespace opalg;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ShapeModel: composition", "[shape][compose]")
{
    CHECK(ShapeModel::compose(Shape(3, 5), Shape(5, 4)) == Shape(3, 4));
    CHECK_THROWS_AS(ShapeModel::compose(Shape(3, 5), Shape(4, 2)), ShapeMismatch);

    // A domain-agnostic operator after a concrete one takes the concrete input size
    CHECK(ShapeModel::compose(Shape(AGNOSTIC_DIM, 5), Shape(5, 2)) == Shape(AGNOSTIC_DIM, 2));
    CHECK(ShapeModel::compose(Shape(3, AGNOSTIC_DIM), Shape(7, 2)) == Shape(3, 2));
    CHECK(ShapeModel::compose(Shape(1, 4), Shape(AGNOSTIC_DIM, AGNOSTIC_DIM)) == Shape(1, AGNOSTIC_DIM));
}

TEST_CASE("ShapeModel: sum", "[shape][sum]")
{
    CHECK(ShapeModel::sum(Shape(3, AGNOSTIC_DIM), Shape(3, 4)) == Shape(3, 4));
    CHECK(ShapeModel::sum(Shape(1, 6), Shape(1, 6)) == Shape(1, 6));
    CHECK_THROWS_AS(ShapeModel::sum(Shape(3, 4), Shape(2, 4)), ShapeMismatch);
    CHECK_THROWS_AS(ShapeModel::sum(Shape(3, 4), Shape(3, 5)), ShapeMismatch);
}

TEST_CASE("ShapeModel: stacking", "[shape][stack]")
{
    CHECK(ShapeModel::stack({Shape(2, 4), Shape(3, 4)}, StackAxis::Vertical) == Shape(5, 4));
    CHECK(ShapeModel::stack({Shape(AGNOSTIC_DIM, 4), Shape(3, 4)}, StackAxis::Vertical) == Shape(AGNOSTIC_DIM, 4));
    CHECK(ShapeModel::stack({Shape(2, AGNOSTIC_DIM), Shape(3, 4)}, StackAxis::Vertical) == Shape(5, 4));
    CHECK_THROWS_AS(ShapeModel::stack({Shape(2, 4), Shape(3, 5)}, StackAxis::Vertical), ShapeMismatch);

    CHECK(ShapeModel::stack({Shape(1, 2), Shape(1, 3)}, StackAxis::Horizontal) == Shape(1, 5));
    CHECK_THROWS_AS(ShapeModel::stack({Shape(1, 2), Shape(2, 3)}, StackAxis::Horizontal), ShapeMismatch);
    CHECK_THROWS_AS(ShapeModel::stack({}, StackAxis::Horizontal), ShapeMismatch);
}

TEST_CASE("ShapeModel: block sizes with one agnostic block", "[shape][split]")
{
    CHECK(ShapeModel::split_sizes({2, AGNOSTIC_DIM, 3}, 10, "op") == std::vector<Index>{2, 5, 3});
    CHECK(ShapeModel::split_sizes({2, 3}, 5, "op") == std::vector<Index>{2, 3});
    CHECK_THROWS_AS(ShapeModel::split_sizes({2, AGNOSTIC_DIM, AGNOSTIC_DIM}, 10, "op"), ShapeMismatch);
    CHECK_THROWS_AS(ShapeModel::split_sizes({2, 3}, 6, "op"), ShapeMismatch);
    CHECK_THROWS_AS(ShapeModel::split_sizes({4, AGNOSTIC_DIM}, 3, "op"), ShapeMismatch);
}

TEST_CASE("ShapeModel: evaluation-time checks name the node", "[shape][check]")
{
    CHECK_NOTHROW(ShapeModel::check_input(Shape(3, 4), 4, "A"));
    CHECK_NOTHROW(ShapeModel::check_input(Shape(3, AGNOSTIC_DIM), 17, "A"));
    CHECK_THROWS_WITH(ShapeModel::check_input(Shape(3, 4), 5, "ForwardModel"), ContainsSubstring("ForwardModel"));
    CHECK_THROWS_AS(ShapeModel::check_output(Shape(3, 4), 2, "A"), ShapeMismatch);
}

TEST_CASE("Shape: printing and predicates", "[shape]")
{
    CHECK(Shape(1, 5).str() == "(1, 5)");
    CHECK(Shape(AGNOSTIC_DIM, 5).str() == "(*, 5)");
    CHECK(Shape(1, 5).is_functional());
    CHECK(Shape(4, 4).is_square());
    CHECK_FALSE(Shape(AGNOSTIC_DIM, AGNOSTIC_DIM).is_square());
    CHECK_FALSE(Shape(AGNOSTIC_DIM, 2).is_concrete());
}
