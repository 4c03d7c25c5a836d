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
#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <vector>

// opalg includes
#include <opalg/common.hpp>
#include <opalg/declaration.hpp>
#include <opalg/operator.hpp>

namespace opalg {
namespace detail {

template<typename T>
VectorX<T> soft_threshold(const VectorX<T>& x, T lambda)
{
    return x.unaryExpr([lambda](T v) { return std::copysign(std::max(std::abs(v) - lambda, T(0)), v); });
}

// Magnitudes of x sorted in decreasing order.
template<typename T>
std::vector<T> sorted_magnitudes(const VectorX<T>& x)
{
    std::vector<T> z(x.size());
    for(Index i = 0; i < x.size(); ++i) z[i] = std::abs(x[i]);
    std::sort(z.begin(), z.end(), std::greater<T>());
    return z;
}

// Euclidean projection onto the l1 ball of the given radius (sort-based).
template<typename T>
VectorX<T> project_l1_ball(const VectorX<T>& v, T radius)
{
    if(v.template lpNorm<1>() <= radius) return v;
    const auto z = sorted_magnitudes(v);
    T partial = T(0);
    T theta = T(0);
    for(std::size_t k = 0; k < z.size(); ++k) {
        partial += z[k];
        const T candidate = (partial - radius) / static_cast<T>(k + 1);
        if(z[k] - candidate > T(0)) theta = candidate;
    }
    return soft_threshold(v, theta);
}

// Concrete size of an output whose declared size may be agnostic.
inline Index resolve_size(Index declared, Index fallback, const std::string& name)
{
    if(!is_agnostic(declared)) return declared;
    if(is_agnostic(fallback))
        throw ShapeMismatch(name + ": cannot infer the size of the result");
    return fallback;
}

} // namespace detail

//=====================================================================================================================
// LINEAR OPERATORS
//=====================================================================================================================

/// The homothety x -> a x.
template<typename T>
Operator<T> HomothetyOp(double a, Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "HomothetyOp";
    decl.shape = Shape(dim, dim);
    decl.properties = {P::LinearSelfAdjoint, P::Lipschitz};
    if(a > 0) decl.properties.insert(P::LinearPositiveDefinite);
    if(is_close(std::abs(a), 1.0)) decl.properties.insert(P::LinearUnitary);
    if(is_close(a, 1.0) || is_close(a, 0.0)) decl.properties.insert(P::LinearIdempotent);
    decl.homothety = a;
    const T s = static_cast<T>(a);
    decl.apply = [s](const VectorX<T>& x) -> VectorX<T> { return s * x; };
    decl.adjoint = [s](const VectorX<T>& y) -> VectorX<T> { return s * y; };
    return make_primitive(std::move(decl));
}

template<typename T>
Operator<T> IdentityOp(Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "IdentityOp";
    decl.shape = Shape(dim, dim);
    decl.properties = {P::LinearUnitary, P::LinearPositiveDefinite, P::LinearIdempotent};
    decl.homothety = 1.0;
    decl.apply = [](const VectorX<T>& x) { return x; };
    decl.adjoint = [](const VectorX<T>& y) { return y; };
    return make_primitive(std::move(decl));
}

/// The zero map from R^dim to R^codim.
template<typename T>
Operator<T> NullOp(Index codim, Index dim)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = codim == 1 ? "NullFunc" : "NullOp";
    decl.shape = Shape(codim, dim);
    decl.properties = {P::Linear, P::Lipschitz};
    if(codim == dim) {
        decl.properties.insert(P::LinearSelfAdjoint).insert(P::LinearIdempotent);
        decl.homothety = 0.0;
    }
    decl.lipschitz = 0.0;
    const std::string name = decl.name;
    decl.apply = [codim, dim, name](const VectorX<T>& x) -> VectorX<T> {
        return VectorX<T>::Zero(detail::resolve_size(codim, codim == dim ? x.size() : AGNOSTIC_DIM, name));
    };
    decl.adjoint = [codim, dim, name](const VectorX<T>& y) -> VectorX<T> {
        return VectorX<T>::Zero(detail::resolve_size(dim, codim == dim ? y.size() : AGNOSTIC_DIM, name));
    };
    return make_primitive(std::move(decl));
}

template<typename T>
Operator<T> NullFunc(Index dim)
{
    return NullOp<T>(1, dim);
}

/// x -> diag(d) x
template<typename T>
Operator<T> DiagonalOp(const VectorX<T>& d)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "DiagonalOp";
    decl.shape = Shape(d.size(), d.size());
    decl.properties = {P::LinearSelfAdjoint};

    const bool positive = d.size() > 0 && (d.array() > T(0)).all();
    const bool unit = d.size() > 0 && ((d.array().abs() - T(1)).abs() <= T(SCALAR_TOLERANCE)).all();
    const bool binary = ((d.array() == T(0)) || (d.array() == T(1))).all();
    if(positive) decl.properties.insert(P::LinearPositiveDefinite);
    if(unit) decl.properties.insert(P::LinearUnitary);
    if(binary) decl.properties.insert(P::LinearIdempotent);
    if(d.size() > 0 && (d.array() == d[0]).all()) decl.homothety = static_cast<double>(d[0]);

    decl.lipschitz = d.size() > 0 ? static_cast<double>(d.cwiseAbs().maxCoeff()) : 0.0;
    decl.apply = [d](const VectorX<T>& x) -> VectorX<T> { return d.cwiseProduct(x); };
    decl.adjoint = [d](const VectorX<T>& y) -> VectorX<T> { return d.cwiseProduct(y); };
    return make_primitive(std::move(decl));
}

/// A dense matrix. The Lipschitz bound is estimated on first request with the configured method.
template<typename T>
Operator<T> ExplicitLinOp(const MatrixX<T>& A)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "ExplicitLinOp";
    decl.shape = Shape(A.rows(), A.cols());
    decl.properties = {P::Linear};
    if(A.rows() == A.cols()) {
        decl.properties.insert(P::LinearSquare);
        if(A.isApprox(A.transpose())) decl.properties.insert(P::LinearSelfAdjoint);
    }
    decl.apply = [A](const VectorX<T>& x) -> VectorX<T> { return A * x; };
    decl.adjoint = [A](const VectorX<T>& y) -> VectorX<T> { return A.transpose() * y; };
    return make_primitive(std::move(decl));
}

/// x -> <c, x>
template<typename T>
Operator<T> LinFunc(const VectorX<T>& c)
{
    return detail::linear_functional<T>(c, "LinFunc");
}

//=====================================================================================================================
// NORMS
//=====================================================================================================================

/// ||x||_1. Lipschitz with constant sqrt(dim) when the dimension is known.
template<typename T>
Operator<T> L1Norm(Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "L1Norm";
    decl.shape = Shape(1, dim);
    decl.properties = {P::Convex, P::Proximable};
    if(!is_agnostic(dim)) {
        decl.properties.insert(P::Lipschitz);
        decl.lipschitz = std::sqrt(static_cast<double>(dim));
    }
    decl.apply = [](const VectorX<T>& x) {
        VectorX<T> y(1);
        y[0] = x.template lpNorm<1>();
        return y;
    };
    decl.prox = [](const VectorX<T>& x, T tau) { return detail::soft_threshold(x, tau); };
    return make_primitive(std::move(decl));
}

/// ||x||_2
template<typename T>
Operator<T> L2Norm(Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "L2Norm";
    decl.shape = Shape(1, dim);
    decl.properties = {P::Convex, P::Proximable, P::Lipschitz};
    decl.lipschitz = 1.0;
    decl.apply = [](const VectorX<T>& x) {
        VectorX<T> y(1);
        y[0] = x.norm();
        return y;
    };
    decl.prox = [](const VectorX<T>& x, T tau) -> VectorX<T> {
        const T n = x.norm();
        if(n <= tau) return VectorX<T>::Zero(x.size());
        return (T(1) - tau / n) * x;
    };
    return make_primitive(std::move(decl));
}

/**
 * @brief Mixed norm sum_g ||x_g||_2 over contiguous groups of `group_size` entries
 *
 * The number of groups may be left agnostic; the input size must then be a
 * multiple of `group_size`. The prox shrinks every group as L2Norm does.
 */
template<typename T>
Operator<T> L21Norm(Index group_size, Index groups = AGNOSTIC_DIM)
{
    using P = Property;
    if(group_size <= 0 || !is_valid_axis(groups))
        throw ShapeMismatch("L21Norm needs a positive group size and group count, got " + std::to_string(group_size) +
                            " and " + dim_str(groups));
    PrimitiveDeclaration<T> decl;
    decl.name = "L21Norm";
    decl.shape = Shape(1, is_agnostic(groups) ? AGNOSTIC_DIM : groups * group_size);
    decl.properties = {P::Convex, P::Proximable};
    if(!is_agnostic(groups)) {
        decl.properties.insert(P::Lipschitz);
        decl.lipschitz = std::sqrt(static_cast<double>(groups));
    }
    const auto grouped = [group_size](const VectorX<T>& x) {
        if(x.size() % group_size != 0)
            throw ShapeMismatch("L21Norm: input of size " + std::to_string(x.size()) + " is not a multiple of the group size " +
                                std::to_string(group_size));
        return x.size() / group_size;
    };
    decl.apply = [group_size, grouped](const VectorX<T>& x) {
        VectorX<T> y = VectorX<T>::Zero(1);
        const Index count = grouped(x);
        for(Index g = 0; g < count; ++g) y[0] += x.segment(g * group_size, group_size).norm();
        return y;
    };
    decl.prox = [group_size, grouped](const VectorX<T>& x, T tau) {
        VectorX<T> u = x;
        const Index count = grouped(x);
        for(Index g = 0; g < count; ++g) {
            auto block = u.segment(g * group_size, group_size);
            const T n = block.norm();
            block *= T(1) - tau / std::max(n, tau);
        }
        return u;
    };
    return make_primitive(std::move(decl));
}

/// ||x||_2^2: quadratic with Hessian 2 I.
template<typename T>
Operator<T> SquaredL2Norm(Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "SquaredL2Norm";
    decl.shape = Shape(1, dim);
    decl.properties = {P::Quadratic, P::Proximable};
    decl.curvature = 2.0;
    decl.apply = [](const VectorX<T>& x) {
        VectorX<T> y(1);
        y[0] = x.squaredNorm();
        return y;
    };
    decl.gradient = [](const VectorX<T>& x) -> VectorX<T> { return T(2) * x; };
    decl.prox = [](const VectorX<T>& x, T tau) -> VectorX<T> { return x / (T(2) * tau + T(1)); };
    return make_primitive(std::move(decl));
}

/// ||x||_1^2
template<typename T>
Operator<T> SquaredL1Norm(Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "SquaredL1Norm";
    decl.shape = Shape(1, dim);
    decl.properties = {P::Convex, P::Proximable};
    decl.apply = [](const VectorX<T>& x) {
        VectorX<T> y(1);
        const T n = x.template lpNorm<1>();
        y[0] = n * n;
        return y;
    };
    // Soft thresholding at lambda = 2 tau ||u||_1. With z the sorted magnitudes,
    // lambda = 2 tau S_k / (1 + 2 tau k) for the largest k such that z_k > lambda.
    decl.prox = [](const VectorX<T>& x, T tau) {
        const auto z = detail::sorted_magnitudes(x);
        T partial = T(0);
        T lambda = T(0);
        for(std::size_t k = 0; k < z.size(); ++k) {
            partial += z[k];
            const T candidate = T(2) * tau * partial / (T(1) + T(2) * tau * static_cast<T>(k + 1));
            if(z[k] > candidate) lambda = candidate;
        }
        return detail::soft_threshold(x, lambda);
    };
    return make_primitive(std::move(decl));
}

/// ||x||_inf. The prox follows from the Moreau decomposition with the l1 ball.
template<typename T>
Operator<T> LInfinityNorm(Index dim = AGNOSTIC_DIM)
{
    using P = Property;
    PrimitiveDeclaration<T> decl;
    decl.name = "LInfinityNorm";
    decl.shape = Shape(1, dim);
    decl.properties = {P::Convex, P::Proximable, P::Lipschitz};
    decl.lipschitz = 1.0;
    decl.apply = [](const VectorX<T>& x) {
        VectorX<T> y(1);
        y[0] = x.size() > 0 ? x.cwiseAbs().maxCoeff() : T(0);
        return y;
    };
    decl.prox = [](const VectorX<T>& x, T tau) -> VectorX<T> { return x - detail::project_l1_ball(x, tau); };
    return make_primitive(std::move(decl));
}

} // namespace opalg
