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
#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>

// opalg includes
#include <opalg/common.hpp>
#include <opalg/logging.hpp>
#include <opalg/operator.hpp>
#include <opalg/property.hpp>
#include <opalg/runtime.hpp>
#include <opalg/shape.hpp>

namespace opalg {

/**
 * @brief Everything a kernel author declares for a new primitive operator
 *
 * Only `apply` is mandatory. Each optional kernel must be accompanied by its
 * property and each capability property by its kernel, unless the kernel can
 * be derived:
 * - LINEAR operators are their own Jacobian;
 * - the gradient of a functional follows from its Jacobian and vice versa;
 * - linear functionals and isotropic quadratics have a closed-form prox;
 * - LIPSCHITZ is bounded automatically for linear operators of concrete shape,
 *   unitary operators and homotheties.
 */
template<typename T>
struct PrimitiveDeclaration
{
    using Vector = VectorX<T>;

    std::string name = "Primitive";
    Shape shape;
    PropertySet properties;

    std::function<Vector(const Vector&)> apply;
    std::function<Vector(const Vector&)> adjoint;
    std::function<Operator<T>(const Vector&)> jacobian;
    std::function<Vector(const Vector&)> gradient;
    std::function<Vector(const Vector&, T)> prox;

    // A known constant, or a procedure evaluated lazily on first request.
    std::optional<double> lipschitz;
    std::function<double()> lipschitz_bound;
    std::optional<double> diff_lipschitz;
    std::function<double()> diff_lipschitz_bound;

    std::optional<double> homothety;
    std::optional<double> curvature;
};

template<typename T>
Operator<T> make_primitive(PrimitiveDeclaration<T> decl);

namespace detail {

/// ||A||_F computed column by column. Always bounds ||A||_2 from above.
template<typename T>
double frobenius_bound(const std::function<VectorX<T>(const VectorX<T>&)>& apply, Index dim, const std::string& name)
{
    const auto& config = ConfigManager::current();
    if(dim > config.frobenius_warn_dim)
        OPALG_LOG_WARN("Frobenius bound of {} applies the operator {} times", name, dim);
    double sq = 0.0;
    VectorX<T> e = VectorX<T>::Zero(dim);
    for(Index j = 0; j < dim; ++j) {
        e[j] = T(1);
        sq += static_cast<double>(apply(e).squaredNorm());
        e[j] = T(0);
    }
    return std::sqrt(sq);
}

/// sqrt(lambda_max(A^T A)) by power iteration, inflated by the configured safety margin.
template<typename T>
double power_iteration_bound(const std::function<VectorX<T>(const VectorX<T>&)>& apply,
                             const std::function<VectorX<T>(const VectorX<T>&)>& adjoint, Index dim,
                             const std::string& name)
{
    const auto& config = ConfigManager::current();
    std::mt19937 gen(config.seed);
    std::normal_distribution<double> dist(0.0, 1.0);

    VectorX<T> v(dim);
    for(Index i = 0; i < dim; ++i) v[i] = static_cast<T>(dist(gen));
    v.normalize();

    double lambda = 0.0;
    int it = 0;
    for(; it < config.max_power_iterations; ++it) {
        const VectorX<T> w = adjoint(apply(v));
        const double next = static_cast<double>(w.norm());
        if(next == 0.0) return 0.0;
        v = w / static_cast<T>(next);
        const bool converged = std::abs(next - lambda) <= config.power_tolerance * next;
        lambda = next;
        if(converged) break;
    }
    if(it == config.max_power_iterations)
        OPALG_LOG_WARN("power iteration for {} did not converge in {} iterations", name, it);
    return std::sqrt(lambda) * (1.0 + config.power_safety_margin);
}

/// The linear functional x -> <c, x>.
template<typename T>
Operator<T> linear_functional(const VectorX<T>& c, std::string name)
{
    PrimitiveDeclaration<T> decl;
    decl.name = std::move(name);
    decl.shape = Shape(1, c.size());
    decl.properties = {Property::Linear, Property::Lipschitz};
    decl.apply = [c](const VectorX<T>& x) {
        VectorX<T> y(1);
        y[0] = c.dot(x);
        return y;
    };
    decl.adjoint = [c](const VectorX<T>& y) -> VectorX<T> { return y[0] * c; };
    decl.lipschitz = static_cast<double>(c.norm());
    return make_primitive(std::move(decl));
}

inline void expect_kernel(bool has_property, bool has_kernel, bool derivable, Property p, const char* kernel,
                          const std::string& name)
{
    if(has_kernel && !has_property)
        throw PropertyKernelMismatch(name + " declares a " + kernel + " kernel without " + to_string(p));
    if(has_property && !has_kernel && !derivable)
        throw PropertyKernelMismatch(name + " declares " + to_string(p) + " without a " + kernel + " kernel");
}

} // namespace detail

/**
 * @brief Validate a declaration and turn it into an operator
 *
 * The declared property set is closed first; FUNCTIONAL is added for a
 * concrete codomain of size 1 and LIPSCHITZ for linear operators of concrete
 * shape. Every axis must be positive or agnostic. Violations raise
 * ShapeMismatch or PropertyKernelMismatch.
 */
template<typename T>
Operator<T> make_primitive(PrimitiveDeclaration<T> decl)
{
    using P = Property;
    using Vector = VectorX<T>;
    const auto& lattice = PropertyLattice::instance();
    const std::string& name = decl.name;
    const Shape shape = decl.shape;

    ShapeModel::validate(shape, name);
    if(!decl.apply)
        throw PropertyKernelMismatch(name + " has no apply kernel");

    PropertySet props = decl.properties;
    if(shape.codim == 1) props.insert(P::Functional);
    props = lattice.closure(props);
    if(props.has(P::Linear) && shape.is_concrete()) props.insert(P::Lipschitz);

    if(props.has(P::Functional) && shape.codim != 1)
        throw ShapeMismatch(name + " is FUNCTIONAL but has shape " + shape.str());
    if(props.has(P::LinearSquare) && shape.codim != shape.dim)
        throw ShapeMismatch(name + " is LINEAR_SQUARE but has shape " + shape.str());
    if(decl.homothety && !props.has(P::LinearSquare))
        throw PropertyKernelMismatch(name + " declares a homothety factor without LINEAR_SQUARE");
    if(decl.curvature && !props.has(P::Quadratic))
        throw PropertyKernelMismatch(name + " declares a curvature without QUADRATIC");

    const bool linear = props.has(P::Linear);
    const bool linear_functional = linear && props.has(P::Functional);
    const bool isotropic_quadratic = props.has(P::Quadratic) && decl.curvature.has_value();
    // An isotropic curvature carries its own proximal closed form.
    if(isotropic_quadratic) props.insert(P::Proximable);
    const bool has_lipschitz = decl.lipschitz.has_value() || static_cast<bool>(decl.lipschitz_bound);
    const bool has_diff_lipschitz = decl.diff_lipschitz.has_value() || static_cast<bool>(decl.diff_lipschitz_bound);

    detail::expect_kernel(linear, static_cast<bool>(decl.adjoint), false, P::Linear, "adjoint", name);
    detail::expect_kernel(props.has(P::Differentiable), static_cast<bool>(decl.jacobian),
                          linear || static_cast<bool>(decl.gradient), P::Differentiable, "jacobian", name);
    detail::expect_kernel(props.has(P::DifferentiableFunction), static_cast<bool>(decl.gradient),
                          linear || static_cast<bool>(decl.jacobian), P::DifferentiableFunction, "gradient", name);
    detail::expect_kernel(props.has(P::Proximable), static_cast<bool>(decl.prox),
                          linear_functional || isotropic_quadratic, P::Proximable, "prox", name);
    detail::expect_kernel(props.has(P::Lipschitz), has_lipschitz,
                          (linear && shape.is_concrete()) || props.has(P::LinearUnitary) || decl.homothety.has_value(),
                          P::Lipschitz, "Lipschitz bound", name);
    detail::expect_kernel(props.has(P::DiffLipschitz), has_diff_lipschitz, linear || isotropic_quadratic,
                          P::DiffLipschitz, "Jacobian Lipschitz bound", name);

    auto kernels = std::make_shared<PrimitiveKernels<T>>();
    kernels->apply = decl.apply;
    kernels->adjoint = decl.adjoint;
    kernels->prox = decl.prox;

    kernels->jacobian = decl.jacobian;
    if(!kernels->jacobian && !linear && decl.gradient) {
        auto gradient = decl.gradient;
        kernels->jacobian = [gradient, name](const Vector& x) {
            return detail::linear_functional<T>(gradient(x), "d" + name);
        };
    }

    kernels->gradient = decl.gradient;
    if(!kernels->gradient && props.has(P::DifferentiableFunction)) {
        if(linear) {
            auto adjoint = decl.adjoint;
            kernels->gradient = [adjoint](const Vector&) { return adjoint(Vector::Ones(1)); };
        } else {
            auto jacobian = decl.jacobian;
            kernels->gradient = [jacobian](const Vector& x) { return jacobian(x).adjoint(Vector::Ones(1)); };
        }
    }

    if(decl.lipschitz) {
        const double L = *decl.lipschitz;
        kernels->lipschitz = [L] { return L; };
    } else if(decl.lipschitz_bound) {
        kernels->lipschitz = decl.lipschitz_bound;
    } else if(props.has(P::LinearUnitary)) {
        kernels->lipschitz = [] { return 1.0; };
    } else if(decl.homothety) {
        const double a = std::abs(*decl.homothety);
        kernels->lipschitz = [a] { return a; };
    } else if(linear && shape.is_concrete()) {
        auto apply = decl.apply;
        auto adjoint = decl.adjoint;
        const Index dim = shape.dim;
        kernels->lipschitz = [apply, adjoint, dim, name] {
            if(ConfigManager::current().lipschitz_method == LipschitzMethod::PowerIteration)
                return detail::power_iteration_bound<T>(apply, adjoint, dim, name);
            return detail::frobenius_bound<T>(apply, dim, name);
        };
    }

    if(decl.diff_lipschitz) {
        const double dL = *decl.diff_lipschitz;
        kernels->diff_lipschitz = [dL] { return dL; };
    } else if(decl.diff_lipschitz_bound) {
        kernels->diff_lipschitz = decl.diff_lipschitz_bound;
    } else if(linear) {
        kernels->diff_lipschitz = [] { return 0.0; };
    } else if(isotropic_quadratic) {
        const double mu = *decl.curvature;
        kernels->diff_lipschitz = [mu] { return mu; };
    }

    AlgebraicTraits traits;
    traits.properties = props;
    traits.homothety = decl.homothety;
    traits.curvature = decl.curvature;
    if(decl.prox)
        traits.prox_rule = ProxRule::Kernel;
    else if(linear_functional)
        traits.prox_rule = ProxRule::LinearFunctional;
    else if(isotropic_quadratic)
        traits.prox_rule = ProxRule::IsotropicQuadratic;

    OPALG_LOG_TRACE("primitive {} {} -> {}", name, shape.str(), props.str());

    return Operator<T>(std::make_shared<const OperatorNode<T>>(decl.name, shape, std::move(traits),
                                                               std::shared_ptr<const PrimitiveKernels<T>>(kernels)));
}

} // namespace opalg
