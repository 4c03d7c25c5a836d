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

// Catch includes
#include <catch2/catch_test_macros.hpp>

// opalg includes
#include <opalg/opalg.hpp>
#include <tests/utils/catch.hpp>

using namespace opalg;
using P = Property;

TEST_CASE("Primitives: identity and homothety", "[operator][primitives][linear]")
{
    const auto I = IdentityOp<double>(3);
    CHECK(I.has(P::LinearUnitary));
    CHECK(I.has(P::LinearPositiveDefinite));
    CHECK(I.has(P::LinearIdempotent));
    CHECK_FALSE(I.has(P::Functional));
    CHECK_VECTOR_APPROX(I(vec({1, 2, 3})), vec({1, 2, 3}));
    CHECK(I.lipschitz_estimate() == approx(1.0));
    CHECK(I.diff_lipschitz_estimate() == approx(0.0));

    const auto H = HomothetyOp<double>(2.0, 3);
    CHECK_VECTOR_APPROX(H(vec({1, 2, 3})), vec({2, 4, 6}));
    CHECK_VECTOR_APPROX(H.adjoint(vec({1, 0, 1})), vec({2, 0, 2}));
    CHECK(H.lipschitz_estimate() == approx(2.0));
    CHECK_FALSE(H.has(P::LinearUnitary));
    REQUIRE(H.traits().homothety.has_value());
    CHECK(*H.traits().homothety == approx(2.0));

    const auto flip = HomothetyOp<double>(-1.0, 3);
    CHECK(flip.has(P::LinearUnitary));
    CHECK_FALSE(flip.has(P::LinearPositiveDefinite));

    // Domain-agnostic identity accepts any size
    const auto any = IdentityOp<double>();
    CHECK(any(vec({1, 2, 3, 4, 5})).size() == 5);
}

TEST_CASE("Primitives: null operator and null functional", "[operator][primitives][linear]")
{
    const auto Z = NullOp<double>(2, 3);
    CHECK_VECTOR_APPROX(Z(vec({1, 2, 3})), vec({0, 0}));
    CHECK_VECTOR_APPROX(Z.adjoint(vec({1, 1})), vec({0, 0, 0}));
    CHECK(Z.lipschitz_estimate() == approx(0.0));

    const auto f = NullFunc<double>(3);
    CHECK(f.has(P::Functional));
    CHECK(f.has(P::Proximable));
    CHECK_VECTOR_APPROX(f.gradient(vec({4, 5, 6})), vec({0, 0, 0}));
    CHECK_VECTOR_APPROX(f.prox(vec({4, 5, 6}), 2.0), vec({4, 5, 6}));
}

TEST_CASE("Primitives: diagonal and explicit matrix", "[operator][primitives][linear]")
{
    const auto D = DiagonalOp<double>(vec({1, -2, 3}));
    CHECK(D.has(P::LinearSelfAdjoint));
    CHECK_FALSE(D.has(P::LinearPositiveDefinite));
    CHECK_VECTOR_APPROX(D(vec({1, 1, 1})), vec({1, -2, 3}));
    CHECK_VECTOR_APPROX(D.adjoint(vec({1, 1, 1})), vec({1, -2, 3}));
    CHECK(D.lipschitz_estimate() == approx(3.0));

    const auto signs = DiagonalOp<double>(vec({1, -1, 1}));
    CHECK(signs.has(P::LinearUnitary));
    CHECK_FALSE(signs.traits().homothety.has_value());

    const auto mask = DiagonalOp<double>(vec({1, 0, 1}));
    CHECK(mask.has(P::LinearIdempotent));

    Eigen::MatrixXd A(2, 3);
    A << 1, 2, 0,
         0, 1, 1;
    const auto M = ExplicitLinOp<double>(A);
    CHECK(M.shape() == Shape(2, 3));
    CHECK(M.has(P::Linear));
    CHECK(M.has(P::Lipschitz));
    CHECK_FALSE(M.has(P::LinearSquare));
    CHECK_VECTOR_APPROX(M(vec({1, 1, 1})), vec({3, 2}));
    CHECK_VECTOR_APPROX(M.adjoint(vec({1, 1})), vec({1, 3, 1}));
    // Frobenius norm by default
    CHECK(M.lipschitz_estimate() == approx(std::sqrt(7.0)));
}

TEST_CASE("Primitives: linear functional", "[operator][primitives][functional]")
{
    const auto f = LinFunc<double>(vec({1, 2, 3}));
    CHECK(f.shape() == Shape(1, 3));
    CHECK(f.properties().contains({P::Linear, P::Functional, P::Convex, P::Proximable, P::DifferentiableFunction}));
    CHECK(f(vec({1, 1, 1}))[0] == approx(6.0));
    CHECK_VECTOR_APPROX(f.gradient(vec({7, 8, 9})), vec({1, 2, 3}));
    CHECK_VECTOR_APPROX(f.prox(vec({0, 0, 0}), 0.5), vec({-0.5, -1.0, -1.5}));
    CHECK(f.lipschitz_estimate() == approx(std::sqrt(14.0)));
}

TEST_CASE("Primitives: L1 and L2 norms", "[operator][primitives][norms]")
{
    const auto l1 = L1Norm<double>(3);
    CHECK(l1(vec({3, -0.5, 1}))[0] == approx(4.5));
    CHECK_VECTOR_APPROX(l1.prox(vec({3, -0.5, 1}), 1.0), vec({2, 0, 0}));
    CHECK_VECTOR_APPROX(l1.prox(vec({-3, 0.5, 1}), 0.25), vec({-2.75, 0.25, 0.75}));
    CHECK(l1.lipschitz_estimate() == approx(std::sqrt(3.0)));
    CHECK_FALSE(l1.has(P::Differentiable));

    const auto agnostic = L1Norm<double>();
    CHECK_FALSE(agnostic.has(P::Lipschitz));
    CHECK(std::isinf(agnostic.lipschitz_estimate()));
    CHECK(agnostic(vec({1, -1, 1, -1}))[0] == approx(4.0));

    const auto l2 = L2Norm<double>(2);
    CHECK(l2(vec({3, 4}))[0] == approx(5.0));
    CHECK_VECTOR_APPROX(l2.prox(vec({3, 4}), 1.0), vec({2.4, 3.2}));
    CHECK_VECTOR_APPROX(l2.prox(vec({3, 4}), 10.0), vec({0, 0}));
    CHECK(l2.lipschitz_estimate() == approx(1.0));
}

TEST_CASE("Primitives: squared L2 norm is an isotropic quadratic", "[operator][primitives][norms]")
{
    const auto q = SquaredL2Norm<double>(2);
    CHECK(q.has(P::Quadratic));
    CHECK(q.has(P::DiffLipschitz));
    CHECK_FALSE(q.has(P::Lipschitz));
    CHECK(q(vec({1, 2}))[0] == approx(5.0));
    CHECK_VECTOR_APPROX(q.gradient(vec({1, 2})), vec({2, 4}));
    CHECK_VECTOR_APPROX(q.prox(vec({3, 6}), 1.0), vec({1, 2}));
    CHECK(q.diff_lipschitz_estimate() == approx(2.0));
    CHECK(std::isinf(q.lipschitz_estimate()));

    // Jacobian derived from the gradient: v -> <2x, v>
    const auto J = q.jacobian(vec({1, 2}));
    CHECK(J.has(P::Linear));
    CHECK(J(vec({1, 1}))[0] == approx(6.0));
}

TEST_CASE("Primitives: squared L1 and L-infinity norms", "[operator][primitives][norms]")
{
    const auto sq = SquaredL1Norm<double>(2);
    CHECK(sq(vec({3, -1}))[0] == approx(16.0));
    // Soft thresholding at 2 tau ||u||_1 = 1.5
    CHECK_VECTOR_APPROX(sq.prox(vec({3, 1}), 0.5), vec({1.5, 0}));
    CHECK_VECTOR_APPROX(sq.prox(vec({0, 0}), 0.5), vec({0, 0}));

    const auto linf = LInfinityNorm<double>(3);
    CHECK(linf(vec({3, 1, -2}))[0] == approx(3.0));
    // Clipping at the level t where sum_i max(|x_i| - t, 0) = tau
    CHECK_VECTOR_APPROX(linf.prox(vec({3, 1, -2}), 1.0), vec({2, 1, -2}));
    CHECK_VECTOR_APPROX(linf.prox(vec({3, 1, -2}), 10.0), vec({0, 0, 0}));
    CHECK(linf.lipschitz_estimate() == approx(1.0));
}

TEST_CASE("Primitives: mixed L21 norm shrinks whole groups", "[operator][primitives][norms]")
{
    const auto l21 = L21Norm<double>(2, 3);
    CHECK(l21.shape() == Shape(1, 6));
    CHECK(l21.has(P::Convex));
    CHECK(l21(vec({3, 4, 0, 1, 6, 8}))[0] == approx(16.0));
    CHECK_VECTOR_APPROX(l21.prox(vec({3, 4, 0, 1, 6, 8}), 2.0), vec({1.8, 2.4, 0, 0, 4.8, 6.4}));
    CHECK(l21.lipschitz_estimate() == approx(std::sqrt(3.0)));

    const auto agnostic = L21Norm<double>(2);
    CHECK_FALSE(agnostic.has(P::Lipschitz));
    CHECK(agnostic(vec({3, 4}))[0] == approx(5.0));
    CHECK_THROWS_AS(agnostic(vec({1, 2, 3})), ShapeMismatch);
    CHECK_THROWS_AS(L21Norm<double>(0), ShapeMismatch);
}
