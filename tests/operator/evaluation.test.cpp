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
#include <stdexcept>

// Catch includes
#include <catch2/catch_test_macros.hpp>

// opalg includes
#include <opalg/opalg.hpp>
#include <tests/utils/catch.hpp>

using namespace opalg;
using P = Property;

namespace {

Eigen::MatrixXd sample_matrix()
{
    Eigen::MatrixXd A(3, 2);
    A << 1, 2,
         0, 1,
        -1, 3;
    return A;
}

} // namespace

TEST_CASE("Evaluation: sum, scale and composition", "[operator][evaluation]")
{
    const auto A = ExplicitLinOp<double>(sample_matrix());
    const auto D = DiagonalOp<double>(vec({1, 2, 3}));
    const Eigen::VectorXd x = vec({1, -1});

    CHECK_VECTOR_APPROX((D * A)(x), vec({-1, -2, -12}));
    CHECK_VECTOR_APPROX((D + D)(vec({1, 1, 1})), vec({2, 4, 6}));
    CHECK_VECTOR_APPROX((D - 2.0 * D)(vec({1, 1, 1})), vec({-1, -2, -3}));
    CHECK_VECTOR_APPROX((-D)(vec({1, 1, 1})), vec({-1, -2, -3}));
    CHECK_VECTOR_APPROX((D * A).adjoint(vec({1, 1, 1})), sample_matrix().transpose() * vec({1, 2, 3}));
}

TEST_CASE("Evaluation: a vanishing scalar gives the zero map", "[operator][evaluation][scale]")
{
    const Eigen::VectorXd x = vec({1, 1, 1});

    const auto z = scale(L2Norm<double>(3), 1e-13);
    REQUIRE(z.has(P::Linear));
    CHECK_VECTOR_APPROX(z(x), vec({0}));
    CHECK(z(x)[0] == 0.0);
    CHECK_VECTOR_APPROX(z.adjoint(vec({1})), vec({0, 0, 0}));
    CHECK_VECTOR_APPROX(z.gradient(x), vec({0, 0, 0}));
    CHECK_VECTOR_APPROX(z.jacobian(x)(vec({1, 2, 3})), vec({0}));
    CHECK_VECTOR_APPROX(z.prox(vec({1, -2, 3}), 0.5), vec({1, -2, 3}));

    // Square operands of agnostic size take the size of the input
    const auto square = 0.0 * IdentityOp<double>();
    CHECK_VECTOR_APPROX(square(vec({1, 2, 3, 4})), vec({0, 0, 0, 0}));
}

TEST_CASE("Evaluation: stacks split and concatenate", "[operator][evaluation][stack]")
{
    const auto A = ExplicitLinOp<double>(sample_matrix());
    const auto B = DiagonalOp<double>(vec({2, 3}));

    const auto V = vstack<double>({A, B});
    CHECK(V.shape() == Shape(5, 2));
    CHECK_VECTOR_APPROX(V(vec({1, 1})), vec({3, 1, 2, 2, 3}));

    const auto H = hstack<double>({transpose(A), B});
    CHECK(H.shape() == Shape(2, 5));
    const Eigen::VectorXd y = vec({1, 0, 1, 1, 1});
    CHECK_VECTOR_APPROX(H(y), vec({0 + 2, 5 + 3}));

    // <V x, y> == <x, V^T y>
    const Eigen::VectorXd x = vec({0.5, -2});
    CHECK(V(x).dot(y) == Catch::Approx(x.dot(V.adjoint(y))));
    CHECK(H(y).dot(x) == Catch::Approx(y.dot(H.adjoint(x))));

    // A stack block of agnostic size takes the remainder of the input
    const auto G = hstack<double>({L1Norm<double>(2), L2Norm<double>()});
    CHECK(G(vec({1, -1, 3, 4}))[0] == approx(7.0));
}

TEST_CASE("Evaluation: transpose and argument shift", "[operator][evaluation]")
{
    const auto A = ExplicitLinOp<double>(sample_matrix());
    const auto At = transpose(A);
    CHECK(At.shape() == Shape(2, 3));
    CHECK(At.has(P::Linear));
    CHECK_VECTOR_APPROX(At(vec({1, 1, 1})), A.adjoint(vec({1, 1, 1})));
    CHECK_VECTOR_APPROX(At.adjoint(vec({1, 1})), A(vec({1, 1})));

    const auto f = argshift(L1Norm<double>(2), vec({1, -1}));
    CHECK_FALSE(f.has(P::Linear));
    CHECK(f(vec({0, 0}))[0] == approx(2.0));
    CHECK_THROWS_AS(argshift(L1Norm<double>(2), vec({1, 2, 3})), ShapeMismatch);
}

TEST_CASE("Evaluation: power of a square operator", "[operator][evaluation]")
{
    const auto D = DiagonalOp<double>(vec({1, 2, 3}));
    CHECK_VECTOR_APPROX(power(D, 3)(vec({1, 1, 1})), vec({1, 8, 27}));
    CHECK_VECTOR_APPROX(power(D, 0)(vec({4, 5, 6})), vec({4, 5, 6}));
    CHECK_THROWS_AS(power(D, -1), std::invalid_argument);
    CHECK_THROWS_AS(power(ExplicitLinOp<double>(sample_matrix()), 2), ShapeMismatch);
}

TEST_CASE("Evaluation: gradients follow the chain rule", "[operator][evaluation][gradient]")
{
    const auto A = ExplicitLinOp<double>(sample_matrix());
    const auto f = SquaredL2Norm<double>(3) * A;
    const Eigen::VectorXd x = vec({0.3, -0.7});

    // grad ||A x||^2 = 2 A^T A x
    const Eigen::VectorXd expected = 2.0 * sample_matrix().transpose() * sample_matrix() * x;
    CHECK_VECTOR_APPROX(f.gradient(x), expected);

    // Central finite differences
    const double h = 1e-6;
    for(Index i = 0; i < x.size(); ++i) {
        Eigen::VectorXd e = Eigen::VectorXd::Zero(x.size());
        e[i] = h;
        const double fd = (f(x + e)[0] - f(x - e)[0]) / (2 * h);
        CHECK(f.gradient(x)[i] == Catch::Approx(fd).epsilon(1e-6));
    }

    const auto g = f + LinFunc<double>(vec({1, 1}));
    CHECK_VECTOR_APPROX(g.gradient(x), expected + vec({1, 1}));

    const auto h2 = 3.0 * argshift(SquaredL2Norm<double>(2), vec({1, 0}));
    CHECK_VECTOR_APPROX(h2.gradient(vec({0, 1})), vec({6, 6}));

    const auto s = hstack<double>({SquaredL2Norm<double>(1), LinFunc<double>(vec({2, 2}))});
    CHECK_VECTOR_APPROX(s.gradient(vec({3, 0, 0})), vec({6, 2, 2}));
}

TEST_CASE("Evaluation: Jacobians", "[operator][evaluation][jacobian]")
{
    const auto A = ExplicitLinOp<double>(sample_matrix());
    const Eigen::VectorXd x = vec({1, 2});

    // Linear operators are their own Jacobian
    CHECK(A.jacobian(x).same_node(A));

    // J of ||A .||^2 at x is v -> 2 <A x, A v>
    const auto f = SquaredL2Norm<double>(3) * A;
    const auto J = f.jacobian(x);
    const Eigen::VectorXd v = vec({1, -1});
    CHECK(J(v)[0] == Catch::Approx(2.0 * (sample_matrix() * x).dot(sample_matrix() * v)));

    const auto V = vstack<double>({SquaredL2Norm<double>(2), L2Norm<double>(2) * IdentityOp<double>(2)});
    CHECK_THROWS_AS(V.jacobian(x), UnsupportedOperation);
}

TEST_CASE("Evaluation: capability checks are deferred to the call", "[operator][evaluation][errors]")
{
    const auto l1 = L1Norm<double>(3);
    const auto l2 = L2Norm<double>(3);

    Operator<double> h;
    CHECK_NOTHROW(h = l1 + l2);
    CHECK_THROWS_AS(h.adjoint(vec({1})), UnsupportedOperation);
    CHECK_THROWS_AS(h.gradient(vec({1, 2, 3})), UnsupportedOperation);
    CHECK_THROWS_AS(h.prox(vec({1, 2, 3}), 1.0), UnsupportedOperation);
    CHECK_THROWS_AS(h.jacobian(vec({1, 2, 3})), UnsupportedOperation);
    CHECK(h(vec({1, -2, 2}))[0] == approx(8.0));

    CHECK_THROWS_AS(IdentityOp<double>(3).gradient(vec({1, 2, 3})), UnsupportedOperation);
    CHECK_THROWS_AS(l1.prox(vec({1, 2, 3}), 0.0), std::invalid_argument);
    CHECK_THROWS_AS(l1.prox(vec({1, 2, 3}), -1.0), std::invalid_argument);
    CHECK_THROWS_AS(Operator<double>().apply(vec({1})), Error);
}

TEST_CASE("Evaluation: shape errors", "[operator][evaluation][errors]")
{
    CHECK_THROWS_AS(IdentityOp<double>(3) * IdentityOp<double>(4), ShapeMismatch);
    CHECK_THROWS_AS(L1Norm<double>(3) + L1Norm<double>(4), ShapeMismatch);
    CHECK_THROWS_AS(IdentityOp<double>(3)(vec({1, 2})), ShapeMismatch);

    // Agnostic operands hide the mismatch until the first concrete evaluation
    const auto f = L1Norm<double>() * IdentityOp<double>();
    CHECK(f(vec({1, -2, 3, -4, 5}))[0] == approx(15.0));

    const auto g = L1Norm<double>() + LinFunc<double>(vec({1, 1, 1}));
    CHECK(g.shape() == Shape(1, 3));
    CHECK_THROWS_AS(g(vec({1, 2, 3, 4})), ShapeMismatch);
}
