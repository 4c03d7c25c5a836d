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
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// opalg includes
#include <opalg/common.hpp>
#include <opalg/logging.hpp>
#include <opalg/property.hpp>
#include <opalg/shape.hpp>

namespace opalg {

/**
 * @brief Kernels of a primitive operator
 *
 * Only `apply` is mandatory. The others are present exactly when the matching
 * property is declared (see make_primitive()).
 */
template<typename T>
struct PrimitiveKernels
{
    using Vector = VectorX<T>;

    std::function<Vector(const Vector&)> apply;
    std::function<Vector(const Vector&)> adjoint;
    std::function<Operator<T>(const Vector&)> jacobian;
    std::function<Vector(const Vector&)> gradient;
    std::function<Vector(const Vector&, T)> prox;
    std::function<double()> lipschitz;
    std::function<double()> diff_lipschitz;
};

namespace detail {

// One lazily computed scalar. Readers take the lock only to look at the slot;
// the value itself is computed outside the lock and the first writer wins.
struct MemoSlot
{
    std::mutex mutex;
    std::optional<double> value;

    template<typename Compute>
    double get(Compute&& compute)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if(value) return *value;
        }
        const double computed = compute();
        std::lock_guard<std::mutex> lock(mutex);
        if(!value) value = computed;
        return *value;
    }

    bool ready()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return value.has_value();
    }
};

} // namespace detail

/**
 * @brief Node of the composition graph
 *
 * A single node type covers primitives and every composite. The kind tag
 * selects the evaluation strategy; the derived traits gate the capabilities.
 * Nodes are immutable after construction except for the two memo slots
 * holding the Lipschitz estimates.
 *
 * Children are owned through shared pointers, so a subgraph may be shared by
 * several parents and stays alive as long as its longest-lived parent.
 */
template<typename T>
class OperatorNode : public std::enable_shared_from_this<OperatorNode<T>>
{
  public:
    using Vector = VectorX<T>;
    using Kernels = PrimitiveKernels<T>;

  private:
    OperationKind kind_;
    Shape shape_;
    AlgebraicTraits traits_;
    std::string name_;
    std::vector<NodePtr<T>> children_;
    double scalar_ = 1.0;
    Vector shift_;
    std::shared_ptr<const Kernels> kernels_;

    mutable detail::MemoSlot lipschitz_memo_;
    mutable detail::MemoSlot diff_lipschitz_memo_;

  public:
    /// Primitive node. Use make_primitive() to obtain validated kernels and traits.
    OperatorNode(std::string name, Shape shape, AlgebraicTraits traits, std::shared_ptr<const Kernels> kernels)
        : kind_(OperationKind::Primitive), shape_(shape), traits_(std::move(traits)), name_(std::move(name)),
          kernels_(std::move(kernels))
    {}

    /// Composite node. Use the composition functions (sum, compose, ...) to build these.
    OperatorNode(OperationKind kind, std::string name, Shape shape, AlgebraicTraits traits,
                 std::vector<NodePtr<T>> children, double scalar = 1.0, Vector shift = Vector())
        : kind_(kind), shape_(shape), traits_(std::move(traits)), name_(std::move(name)),
          children_(std::move(children)), scalar_(scalar), shift_(std::move(shift))
    {}

    // Non-copyable: nodes are shared, never duplicated
    OperatorNode(const OperatorNode&) = delete;
    OperatorNode& operator=(const OperatorNode&) = delete;

    OperationKind kind() const { return kind_; }
    const Shape& shape() const { return shape_; }
    const AlgebraicTraits& traits() const { return traits_; }
    const PropertySet& properties() const { return traits_.properties; }
    const std::string& name() const { return name_; }
    const std::vector<NodePtr<T>>& children() const { return children_; }
    double scalar() const { return scalar_; }
    const Vector& shift() const { return shift_; }

    bool has(Property p) const { return traits_.properties.has(p); }

    //=====================================================================================================================
    // EVALUATION
    //=====================================================================================================================

    Vector apply(const Vector& x) const
    {
        ShapeModel::check_input(shape_, x.size(), name_);
        Vector y;
        switch(kind_) {
        case OperationKind::Primitive:
            y = kernels_->apply(x);
            break;
        case OperationKind::Sum:
            y = add_checked(children_[0]->apply(x), children_[1]->apply(x));
            break;
        case OperationKind::ScalarMul:
            y = is_close(scalar_, 0.0) ? zero_output(x) : Vector(static_cast<T>(scalar_) * children_[0]->apply(x));
            break;
        case OperationKind::Compose:
            y = children_[0]->apply(children_[1]->apply(x));
            break;
        case OperationKind::VStack: {
            std::vector<Vector> parts;
            parts.reserve(children_.size());
            for(const auto& child : children_) parts.push_back(child->apply(x));
            y = concatenate(parts);
            break;
        }
        case OperationKind::HStack: {
            const auto blocks = split(x, domain_blocks());
            y = children_[0]->apply(blocks[0]);
            for(std::size_t i = 1; i < children_.size(); ++i) y = add_checked(y, children_[i]->apply(blocks[i]));
            break;
        }
        case OperationKind::Transpose:
            y = children_[0]->adjoint(x);
            break;
        case OperationKind::ArgShift:
            y = children_[0]->apply(shifted(x));
            break;
        }
        ShapeModel::check_output(shape_, y.size(), name_);
        return y;
    }

    Vector adjoint(const Vector& y) const
    {
        require(Property::Linear, "adjoint");
        ShapeModel::check_output(shape_, y.size(), name_);
        Vector x;
        switch(kind_) {
        case OperationKind::Primitive:
            x = kernels_->adjoint(y);
            break;
        case OperationKind::Sum:
            x = add_checked(children_[0]->adjoint(y), children_[1]->adjoint(y));
            break;
        case OperationKind::ScalarMul:
            x = is_close(scalar_, 0.0) ? zero_input() : Vector(static_cast<T>(scalar_) * children_[0]->adjoint(y));
            break;
        case OperationKind::Compose:
            x = children_[1]->adjoint(children_[0]->adjoint(y));
            break;
        case OperationKind::VStack: {
            const auto blocks = split(y, codomain_blocks());
            x = children_[0]->adjoint(blocks[0]);
            for(std::size_t i = 1; i < children_.size(); ++i) x = add_checked(x, children_[i]->adjoint(blocks[i]));
            break;
        }
        case OperationKind::HStack: {
            std::vector<Vector> parts;
            parts.reserve(children_.size());
            for(const auto& child : children_) parts.push_back(child->adjoint(y));
            x = concatenate(parts);
            break;
        }
        case OperationKind::Transpose:
            x = children_[0]->apply(y);
            break;
        case OperationKind::ArgShift:
            throw UnsupportedOperation("adjoint of argument-shifted operator " + name_);
        }
        ShapeModel::check_input(shape_, x.size(), name_);
        return x;
    }

    /// Jacobian at `x` as an operator. Linear operators are their own Jacobian.
    /// Defined in composition.hpp, since composite Jacobians are built as composites.
    Operator<T> jacobian(const Vector& x) const;

    /// Gradient at `x` of a differentiable functional.
    Vector gradient(const Vector& x) const
    {
        require(Property::DifferentiableFunction, "gradient");
        ShapeModel::check_input(shape_, x.size(), name_);
        Vector g;
        if(has(Property::Linear) && kind_ != OperationKind::Primitive) {
            g = adjoint(Vector::Ones(1));
            ShapeModel::check_input(shape_, g.size(), name_);
            return g;
        }
        switch(kind_) {
        case OperationKind::Primitive:
            g = kernels_->gradient(x);
            break;
        case OperationKind::Sum:
            g = add_checked(children_[0]->gradient(x), children_[1]->gradient(x));
            break;
        case OperationKind::ScalarMul:
            g = static_cast<T>(scalar_) * children_[0]->gradient(x);
            break;
        case OperationKind::Compose:
            // Chain rule: grad (f o g)(x) = J_g(x)^T grad f(g(x))
            g = children_[1]->jacobian(x).adjoint(children_[0]->gradient(children_[1]->apply(x)));
            break;
        case OperationKind::VStack:
            g = children_[0]->gradient(x);
            break;
        case OperationKind::HStack: {
            const auto blocks = split(x, domain_blocks());
            std::vector<Vector> parts;
            parts.reserve(children_.size());
            for(std::size_t i = 0; i < children_.size(); ++i) parts.push_back(children_[i]->gradient(blocks[i]));
            g = concatenate(parts);
            break;
        }
        case OperationKind::Transpose:
            g = adjoint(Vector::Ones(1));
            break;
        case OperationKind::ArgShift:
            g = children_[0]->gradient(shifted(x));
            break;
        }
        ShapeModel::check_input(shape_, g.size(), name_);
        return g;
    }

    /**
     * @brief Proximal operator prox_{tau f}(x) = argmin_u f(u) + |u - x|^2 / (2 tau)
     *
     * Composites evaluate the closed form selected when they were built.
     */
    Vector prox(const Vector& x, T tau) const
    {
        if(!(tau > T(0)))
            throw std::invalid_argument("prox of " + name_ + " requires tau > 0");
        require(Property::Proximable, "prox");
        ShapeModel::check_input(shape_, x.size(), name_);

        const std::size_t k = traits_.prox_operand;
        Vector u;
        switch(traits_.prox_rule) {
        case ProxRule::Kernel:
            u = kernels_->prox(x, tau);
            break;
        case ProxRule::LinearFunctional:
            u = x - tau * checked_input(adjoint(Vector::Ones(1)), x.size());
            break;
        case ProxRule::IsotropicQuadratic: {
            const T mu = static_cast<T>(*traits_.curvature);
            const Vector b = gradient(x) - mu * x;
            u = (x - tau * b) / (T(1) + tau * mu);
            break;
        }
        case ProxRule::AffineSum: {
            const Vector c = checked_input(children_[1 - k]->adjoint(Vector::Ones(1)), x.size());
            u = children_[k]->prox(x - tau * c, tau);
            break;
        }
        case ProxRule::IsotropicQuadraticSum: {
            const auto& q = children_[1 - k];
            const T mu = static_cast<T>(*q->traits().curvature);
            const Vector b = q->gradient(x) - mu * x;
            const T s = T(1) + tau * mu;
            u = children_[k]->prox((x - tau * b) / s, tau / s);
            break;
        }
        case ProxRule::PositiveScale:
            u = children_[0]->prox(x, static_cast<T>(scalar_) * tau);
            break;
        case ProxRule::ArgScale: {
            const T a = static_cast<T>(*children_[1]->traits().homothety);
            u = children_[0]->prox(a * x, a * a * tau) / a;
            break;
        }
        case ProxRule::Unitary: {
            const auto& U = children_[1];
            u = U->adjoint(children_[0]->prox(U->apply(x), tau));
            break;
        }
        case ProxRule::PostHomothety: {
            const T a = static_cast<T>(*children_[0]->traits().homothety);
            u = children_[1]->prox(x, a * tau);
            break;
        }
        case ProxRule::Separable: {
            const auto blocks = split(x, domain_blocks());
            std::vector<Vector> parts;
            parts.reserve(children_.size());
            for(std::size_t i = 0; i < children_.size(); ++i) parts.push_back(children_[i]->prox(blocks[i], tau));
            u = concatenate(parts);
            break;
        }
        case ProxRule::Delegate:
            u = children_[0]->prox(x, tau);
            break;
        case ProxRule::ArgShift:
            u = children_[0]->prox(shifted(x), tau) - shift_;
            break;
        case ProxRule::None:
            throw UnsupportedOperation("no proximal closed form for " + name_);
        }
        return u;
    }

    //=====================================================================================================================
    // LIPSCHITZ ESTIMATES
    //=====================================================================================================================

    /**
     * @brief Upper bound on the Lipschitz constant, +inf when LIPSCHITZ is absent
     *
     * Computed on first request and memoized. Composite bounds combine the
     * children's bounds and are not claimed to be tight.
     */
    double lipschitz_estimate() const
    {
        if(!has(Property::Lipschitz)) return std::numeric_limits<double>::infinity();
        return lipschitz_memo_.get([this] {
            double L = std::numeric_limits<double>::infinity();
            if(kind_ == OperationKind::Primitive) {
                if(kernels_->lipschitz) L = kernels_->lipschitz();
            } else {
                std::vector<double> bounds;
                bounds.reserve(children_.size());
                for(const auto& child : children_) bounds.push_back(child->lipschitz_estimate());
                L = PropertyLattice::instance().combine_lipschitz(kind_, bounds, scalar_);
            }
            OPALG_LOG_DEBUG("lipschitz_estimate({}) = {}", name_, L);
            return L;
        });
    }

    /// Upper bound on the Lipschitz constant of the Jacobian. Zero for linear operators.
    double diff_lipschitz_estimate() const
    {
        if(has(Property::Linear)) return 0.0;
        if(!has(Property::DiffLipschitz)) return std::numeric_limits<double>::infinity();
        return diff_lipschitz_memo_.get([this] {
            double dL = std::numeric_limits<double>::infinity();
            if(kind_ == OperationKind::Primitive) {
                if(kernels_->diff_lipschitz) dL = kernels_->diff_lipschitz();
            } else {
                std::vector<double> bounds, diff_bounds;
                std::vector<PropertySet> sets;
                for(const auto& child : children_) {
                    bounds.push_back(child->lipschitz_estimate());
                    diff_bounds.push_back(child->diff_lipschitz_estimate());
                    sets.push_back(child->properties());
                }
                dL = PropertyLattice::instance().combine_diff_lipschitz(kind_, bounds, diff_bounds, sets, scalar_);
            }
            OPALG_LOG_DEBUG("diff_lipschitz_estimate({}) = {}", name_, dL);
            return dL;
        });
    }

    /// True once lipschitz_estimate() has been computed for this node.
    bool lipschitz_ready() const { return lipschitz_memo_.ready(); }

  private:
    void require(Property p, const char* what) const
    {
        if(!has(p))
            throw UnsupportedOperation(std::string(what) + " of " + name_ + " requires " + to_string(p) +
                                       ", available " + traits_.properties.str());
    }

    Vector add_checked(const Vector& a, const Vector& b) const
    {
        if(a.size() != b.size())
            throw ShapeMismatch(name_ + ": operand results of size " + std::to_string(a.size()) + " and " +
                                std::to_string(b.size()) + " cannot be added");
        return a + b;
    }

    Vector checked_input(const Vector& v, Index size) const
    {
        if(v.size() != size)
            throw ShapeMismatch(name_ + ": expected a vector of size " + std::to_string(size) + ", got " +
                                std::to_string(v.size()));
        return v;
    }

    Vector shifted(const Vector& x) const
    {
        return x + checked_input(shift_, x.size());
    }

    Vector zero_input() const
    {
        if(is_agnostic(shape_.dim))
            throw ShapeMismatch(name_ + ": adjoint of the zero map needs a concrete domain");
        return Vector::Zero(shape_.dim);
    }

    // Output of the zero map; the operand is evaluated only when neither the shape nor squareness fixes the size.
    Vector zero_output(const Vector& x) const
    {
        if(!is_agnostic(shape_.codim)) return Vector::Zero(shape_.codim);
        if(has(Property::LinearSquare)) return Vector::Zero(x.size());
        return Vector::Zero(children_[0]->apply(x).size());
    }

    std::vector<Index> domain_blocks() const
    {
        std::vector<Index> blocks;
        for(const auto& child : children_) blocks.push_back(child->shape().dim);
        return blocks;
    }

    std::vector<Index> codomain_blocks() const
    {
        std::vector<Index> blocks;
        for(const auto& child : children_) blocks.push_back(child->shape().codim);
        return blocks;
    }

    std::vector<Vector> split(const Vector& v, const std::vector<Index>& blocks) const
    {
        const auto sizes = ShapeModel::split_sizes(blocks, v.size(), name_);
        std::vector<Vector> parts;
        parts.reserve(sizes.size());
        Index offset = 0;
        for(Index n : sizes) {
            parts.push_back(v.segment(offset, n));
            offset += n;
        }
        return parts;
    }

    static Vector concatenate(const std::vector<Vector>& parts)
    {
        Index n = 0;
        for(const auto& p : parts) n += p.size();
        Vector out(n);
        Index offset = 0;
        for(const auto& p : parts) {
            out.segment(offset, p.size()) = p;
            offset += p.size();
        }
        return out;
    }

    friend class Operator<T>;
};

/**
 * @brief Value-like handle on a node of the composition graph
 *
 * Copying a handle shares the node. All composition functions take and
 * return handles; evaluation calls forward to the node.
 */
template<typename T>
class Operator
{
  public:
    using Vector = VectorX<T>;

  private:
    NodePtr<T> node_;

  public:
    Operator() = default;

    explicit Operator(NodePtr<T> node)
        : node_(std::move(node)) {}

    const NodePtr<T>& node() const { return node_; }

    explicit operator bool() const { return static_cast<bool>(node_); }

    const OperatorNode<T>& get() const
    {
        if(!node_) throw Error("empty operator handle");
        return *node_;
    }

    const Shape& shape() const { return get().shape(); }
    Index codim() const { return get().shape().codim; }
    Index dim() const { return get().shape().dim; }
    const PropertySet& properties() const { return get().properties(); }
    const AlgebraicTraits& traits() const { return get().traits(); }
    OperationKind kind() const { return get().kind(); }
    const std::string& name() const { return get().name(); }
    bool has(Property p) const { return get().has(p); }

    Vector apply(const Vector& x) const { return get().apply(x); }
    Vector operator()(const Vector& x) const { return get().apply(x); }
    Vector adjoint(const Vector& y) const { return get().adjoint(y); }
    Operator jacobian(const Vector& x) const { return get().jacobian(x); }
    Vector gradient(const Vector& x) const { return get().gradient(x); }
    Vector prox(const Vector& x, T tau) const { return get().prox(x, tau); }
    double lipschitz_estimate() const { return get().lipschitz_estimate(); }
    double diff_lipschitz_estimate() const { return get().diff_lipschitz_estimate(); }

    /// Same node, not merely an equal one.
    bool same_node(const Operator& other) const { return node_ == other.node_; }
};

} // namespace opalg
