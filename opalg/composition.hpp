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
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// spdlog includes
#include <spdlog/fmt/fmt.h>

// opalg includes
#include <opalg/logging.hpp>
#include <opalg/operator.hpp>
#include <opalg/primitives.hpp>
#include <opalg/property.hpp>
#include <opalg/shape.hpp>

namespace opalg {
namespace detail {

// Every composite goes through here: shapes are already validated by the
// caller, traits are derived by the lattice, the node references its operands.
template<typename T>
Operator<T> make_composite(OperationKind kind, std::string name, const Shape& shape,
                           const std::vector<Operator<T>>& operands, double scalar = 1.0,
                           VectorX<T> shift = VectorX<T>(), bool scalar_codomain = false)
{
    ShapeModel::validate(shape, name);
    const auto& lattice = PropertyLattice::instance();

    std::vector<AlgebraicTraits> traits;
    std::vector<NodePtr<T>> children;
    traits.reserve(operands.size());
    children.reserve(operands.size());
    for(const auto& op : operands) {
        traits.push_back(op.traits());
        children.push_back(op.node());
    }

    AlgebraicTraits derived = lattice.combine(kind, traits, scalar);
    if(scalar_codomain) derived = lattice.finalize(derived, true);

    OPALG_LOG_TRACE("{} node {} {} -> {} prox={}", to_string(kind), name, shape.str(), derived.properties.str(),
                    to_string(derived.prox_rule));

    return Operator<T>(std::make_shared<const OperatorNode<T>>(kind, std::move(name), shape, std::move(derived),
                                                               std::move(children), scalar, std::move(shift)));
}

template<typename T>
std::string join_names(const std::vector<Operator<T>>& ops)
{
    std::string out;
    for(std::size_t i = 0; i < ops.size(); ++i) {
        if(i > 0) out += ", ";
        out += ops[i].name();
    }
    return out;
}

} // namespace detail

//=====================================================================================================================
// CONSTRUCTION OPERATIONS
//=====================================================================================================================

/// a + b
template<typename T>
Operator<T> sum(const Operator<T>& a, const Operator<T>& b)
{
    const Shape shape = ShapeModel::sum(a.shape(), b.shape());
    return detail::make_composite<T>(OperationKind::Sum, "(" + a.name() + " + " + b.name() + ")", shape, {a, b});
}

/// c * a
template<typename T>
Operator<T> scale(const Operator<T>& a, double c)
{
    return detail::make_composite<T>(OperationKind::ScalarMul, fmt::format("{} * {}", c, a.name()), a.shape(), {a}, c);
}

/// a applied after b
template<typename T>
Operator<T> compose(const Operator<T>& a, const Operator<T>& b)
{
    const Shape shape = ShapeModel::compose(a.shape(), b.shape());
    return detail::make_composite<T>(OperationKind::Compose, a.name() + "(" + b.name() + ")", shape, {a, b});
}

/// x -> [A_1 x; ...; A_n x]
template<typename T>
Operator<T> vstack(const std::vector<Operator<T>>& ops)
{
    std::vector<Shape> shapes;
    for(const auto& op : ops) shapes.push_back(op.shape());
    const Shape shape = ShapeModel::stack(shapes, StackAxis::Vertical);
    return detail::make_composite<T>(OperationKind::VStack, "vstack(" + detail::join_names(ops) + ")", shape, ops);
}

/// [x_1; ...; x_n] -> A_1 x_1 + ... + A_n x_n
template<typename T>
Operator<T> hstack(const std::vector<Operator<T>>& ops)
{
    std::vector<Shape> shapes;
    for(const auto& op : ops) shapes.push_back(op.shape());
    const Shape shape = ShapeModel::stack(shapes, StackAxis::Horizontal);
    return detail::make_composite<T>(OperationKind::HStack, "hstack(" + detail::join_names(ops) + ")", shape, ops);
}

/// Adjoint of a linear operator as an operator. Evaluating the transpose of a non-linear operator fails.
template<typename T>
Operator<T> transpose(const Operator<T>& a)
{
    const Shape shape(a.dim(), a.codim());
    return detail::make_composite<T>(OperationKind::Transpose, a.name() + ".T", shape, {a}, 1.0, VectorX<T>(),
                                     shape.is_functional());
}

/// x -> a(x + s)
template<typename T>
Operator<T> argshift(const Operator<T>& a, const VectorX<T>& s)
{
    if(!is_agnostic(a.dim()) && s.size() != a.dim())
        throw ShapeMismatch("shift of size " + std::to_string(s.size()) + " for " + a.name() + " " + a.shape().str());
    const Shape shape(a.codim(), is_agnostic(a.dim()) ? s.size() : a.dim());
    return detail::make_composite<T>(OperationKind::ArgShift, a.name() + "(. + s)", shape, {a}, 1.0, s);
}

/// x -> a(c x)
template<typename T>
Operator<T> argscale(const Operator<T>& a, double c)
{
    return compose(a, HomothetyOp<T>(c, a.dim()));
}

template<typename T>
Operator<T> negate(const Operator<T>& a)
{
    return scale(a, -1.0);
}

template<typename T>
Operator<T> difference(const Operator<T>& a, const Operator<T>& b)
{
    return sum(a, negate(b));
}

/// a o a o ... o a (k times). The zeroth power is the identity on the domain of a.
template<typename T>
Operator<T> power(const Operator<T>& a, int k)
{
    if(k < 0)
        throw std::invalid_argument("power of " + a.name() + " requires a non-negative exponent");
    if(k == 0) return IdentityOp<T>(a.dim());
    Operator<T> result = a;
    for(int i = 1; i < k; ++i) result = compose(a, result);
    return result;
}

//=====================================================================================================================
// OPERATOR OVERLOADS
//=====================================================================================================================

template<typename T>
Operator<T> operator+(const Operator<T>& a, const Operator<T>& b) { return sum(a, b); }

template<typename T>
Operator<T> operator-(const Operator<T>& a, const Operator<T>& b) { return difference(a, b); }

template<typename T>
Operator<T> operator-(const Operator<T>& a) { return negate(a); }

template<typename T>
Operator<T> operator*(double c, const Operator<T>& a) { return scale(a, c); }

template<typename T>
Operator<T> operator*(const Operator<T>& a, double c) { return scale(a, c); }

template<typename T>
Operator<T> operator*(const Operator<T>& a, const Operator<T>& b) { return compose(a, b); }

//=====================================================================================================================
// JACOBIAN
//=====================================================================================================================

template<typename T>
Operator<T> OperatorNode<T>::jacobian(const Vector& x) const
{
    require(Property::Differentiable, "jacobian");
    ShapeModel::check_input(shape_, x.size(), name_);
    if(has(Property::Linear)) return Operator<T>(this->shared_from_this());

    switch(kind_) {
    case OperationKind::Primitive:
        return kernels_->jacobian(x);
    case OperationKind::Sum:
        return sum(children_[0]->jacobian(x), children_[1]->jacobian(x));
    case OperationKind::ScalarMul:
        return scale(children_[0]->jacobian(x), scalar_);
    case OperationKind::Compose:
        return compose(children_[0]->jacobian(children_[1]->apply(x)), children_[1]->jacobian(x));
    case OperationKind::VStack: {
        std::vector<Operator<T>> parts;
        for(const auto& child : children_) parts.push_back(child->jacobian(x));
        return vstack(parts);
    }
    case OperationKind::HStack: {
        const auto blocks = split(x, domain_blocks());
        std::vector<Operator<T>> parts;
        for(std::size_t i = 0; i < children_.size(); ++i) parts.push_back(children_[i]->jacobian(blocks[i]));
        return hstack(parts);
    }
    case OperationKind::ArgShift:
        return children_[0]->jacobian(shifted(x));
    case OperationKind::Transpose:
        break;
    }
    throw UnsupportedOperation("jacobian of " + name_);
}

} // namespace opalg
