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
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// opalg includes
#include <opalg/common.hpp>

namespace opalg {

///////////////////////////
// properties
///////////////////////////

/**
 * @brief Mathematical properties an operator may declare
 *
 * Every property gates a capability or a guarantee:
 * - Functional: scalar codomain (codim == 1)
 * - Linear: adjoint() is available
 * - Differentiable: jacobian() is available
 * - DifferentiableFunction: gradient() is available
 * - Proximable: prox() is available
 * - Quadratic: f(x) = 1/2 <Qx, x> + <c, x> + t with Q positive semi-definite
 * - Convex: convex functional
 * - Lipschitz / DiffLipschitz: a finite bound on the operator / its Jacobian is known
 * - Linear*: refinements of linear square operators
 */
enum class Property : uint8_t
{
    Functional,
    Linear,
    Differentiable,
    DifferentiableFunction,
    Proximable,
    Quadratic,
    Convex,
    Lipschitz,
    DiffLipschitz,
    LinearSquare,
    LinearNormal,
    LinearUnitary,
    LinearSelfAdjoint,
    LinearPositiveDefinite,
    LinearIdempotent
};

constexpr std::size_t PROPERTY_COUNT = 15;

inline const char* to_string(Property p)
{
    switch(p) {
    case Property::Functional: return "FUNCTIONAL";
    case Property::Linear: return "LINEAR";
    case Property::Differentiable: return "DIFFERENTIABLE";
    case Property::DifferentiableFunction: return "DIFFERENTIABLE_FUNCTION";
    case Property::Proximable: return "PROXIMABLE";
    case Property::Quadratic: return "QUADRATIC";
    case Property::Convex: return "CONVEX";
    case Property::Lipschitz: return "LIPSCHITZ";
    case Property::DiffLipschitz: return "DIFF_LIPSCHITZ";
    case Property::LinearSquare: return "LINEAR_SQUARE";
    case Property::LinearNormal: return "LINEAR_NORMAL";
    case Property::LinearUnitary: return "LINEAR_UNITARY";
    case Property::LinearSelfAdjoint: return "LINEAR_SELF_ADJOINT";
    case Property::LinearPositiveDefinite: return "LINEAR_POSITIVE_DEFINITE";
    case Property::LinearIdempotent: return "LINEAR_IDEMPOTENT";
    }
    return "UNKNOWN";
}

/**
 * @brief Set of properties held by one operator
 *
 * A plain 32-bit mask. Sets attached to operator nodes are always closed
 * under the implications of PropertyLattice; a freshly built set is not.
 */
class PropertySet
{
  private:
    uint32_t bits_ = 0;

    static constexpr uint32_t bit(Property p)
    {
        return uint32_t{1} << static_cast<uint32_t>(p);
    }

  public:
    constexpr PropertySet() = default;

    PropertySet(std::initializer_list<Property> properties)
    {
        for(auto p : properties) bits_ |= bit(p);
    }

    static PropertySet from_bits(uint32_t bits)
    {
        PropertySet s;
        s.bits_ = bits & ((uint32_t{1} << PROPERTY_COUNT) - 1);
        return s;
    }

    uint32_t bits() const { return bits_; }

    bool has(Property p) const { return (bits_ & bit(p)) != 0; }

    // True if every property of `other` is also in this set.
    bool contains(const PropertySet& other) const { return (bits_ & other.bits_) == other.bits_; }

    bool empty() const { return bits_ == 0; }

    std::size_t size() const
    {
        std::size_t n = 0;
        for(uint32_t b = bits_; b != 0; b &= b - 1) ++n;
        return n;
    }

    PropertySet& insert(Property p)
    {
        bits_ |= bit(p);
        return *this;
    }

    PropertySet& erase(Property p)
    {
        bits_ &= ~bit(p);
        return *this;
    }

    PropertySet& operator|=(const PropertySet& other)
    {
        bits_ |= other.bits_;
        return *this;
    }

    PropertySet& operator&=(const PropertySet& other)
    {
        bits_ &= other.bits_;
        return *this;
    }

    PropertySet operator|(const PropertySet& other) const { return from_bits(bits_ | other.bits_); }
    PropertySet operator&(const PropertySet& other) const { return from_bits(bits_ & other.bits_); }
    PropertySet operator-(const PropertySet& other) const { return from_bits(bits_ & ~other.bits_); }
    bool operator==(const PropertySet& other) const { return bits_ == other.bits_; }
    bool operator!=(const PropertySet& other) const { return bits_ != other.bits_; }

    std::vector<Property> to_vector() const
    {
        std::vector<Property> out;
        for(std::size_t i = 0; i < PROPERTY_COUNT; ++i)
            if(bits_ & (uint32_t{1} << i)) out.push_back(static_cast<Property>(i));
        return out;
    }

    std::string str() const
    {
        std::string out = "{";
        bool first = true;
        for(auto p : to_vector()) {
            if(!first) out += ", ";
            out += to_string(p);
            first = false;
        }
        return out + "}";
    }
};

///////////////////////////
// combination rules
///////////////////////////

/// Node kinds of the composition graph.
enum class OperationKind : uint8_t
{
    Primitive,
    Sum,
    ScalarMul,
    Compose,
    VStack,
    HStack,
    Transpose,
    ArgShift
};

inline const char* to_string(OperationKind kind)
{
    switch(kind) {
    case OperationKind::Primitive: return "Primitive";
    case OperationKind::Sum: return "Sum";
    case OperationKind::ScalarMul: return "ScalarMul";
    case OperationKind::Compose: return "Compose";
    case OperationKind::VStack: return "VStack";
    case OperationKind::HStack: return "HStack";
    case OperationKind::Transpose: return "Transpose";
    case OperationKind::ArgShift: return "ArgShift";
    }
    return "Unknown";
}

/**
 * @brief Enumerated closed forms of the proximal operator
 *
 * A node is PROXIMABLE only if exactly one of these rules was selected when
 * the node was built. There is no generic composite proximal operator.
 */
enum class ProxRule : uint8_t
{
    None,
    Kernel,                 ///< primitive closed form
    LinearFunctional,       ///< prox(x, t) = x - t c,  c = adjoint([1])
    IsotropicQuadratic,     ///< q(x) = mu/2 |x|^2 + <b, x> + t:  prox(x, t) = (x - t b) / (1 + t mu)
    AffineSum,              ///< f + <c, .>:  prox_f(x - t c, t)
    IsotropicQuadraticSum,  ///< f + q, q isotropic:  prox_f((x - t b) / (1 + t mu), t / (1 + t mu))
    PositiveScale,          ///< a f, a > 0:  prox_f(x, a t)
    ArgScale,               ///< f(a .), a != 0:  prox_f(a x, a^2 t) / a
    Unitary,                ///< f(U .):  U^T prox_f(U x, t)
    PostHomothety,          ///< [a] o f, a > 0 (1x1 homothety after a functional):  prox_f(x, a t)
    Separable,              ///< [f_1, ..., f_n] on disjoint blocks:  blockwise prox
    Delegate,               ///< single-operand stack:  prox of the operand
    ArgShift                ///< f(. + s):  prox_f(x + s, t) - s
};

inline const char* to_string(ProxRule rule)
{
    switch(rule) {
    case ProxRule::None: return "None";
    case ProxRule::Kernel: return "Kernel";
    case ProxRule::LinearFunctional: return "LinearFunctional";
    case ProxRule::IsotropicQuadratic: return "IsotropicQuadratic";
    case ProxRule::AffineSum: return "AffineSum";
    case ProxRule::IsotropicQuadraticSum: return "IsotropicQuadraticSum";
    case ProxRule::PositiveScale: return "PositiveScale";
    case ProxRule::ArgScale: return "ArgScale";
    case ProxRule::Unitary: return "Unitary";
    case ProxRule::PostHomothety: return "PostHomothety";
    case ProxRule::Separable: return "Separable";
    case ProxRule::Delegate: return "Delegate";
    case ProxRule::ArgShift: return "ArgShift";
    }
    return "Unknown";
}

/**
 * @brief Everything the rule table derives for one node
 *
 * Besides the property set, two scalars are tracked because the enumerated
 * proximal closed forms depend on them:
 * - homothety: the node is the linear square map `homothety * I`
 * - curvature: the node is a quadratic functional with Hessian `curvature * I`
 */
struct AlgebraicTraits
{
    PropertySet properties;
    ProxRule prox_rule = ProxRule::None;
    std::size_t prox_operand = 0;
    std::optional<double> homothety;
    std::optional<double> curvature;
};

/// Relative tolerance used for the scalar decisions of the rule table (c == 0, c == 1, |c| == 1).
constexpr double SCALAR_TOLERANCE = 1e-12;

inline bool is_close(double a, double b)
{
    const double scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= SCALAR_TOLERANCE * scale;
}

/**
 * @brief Process-wide property lattice and combination rule table
 *
 * The implication closure of every property is computed once, on first use,
 * and is read-only afterwards. All composite constructions route through
 * combine(); no other code derives properties.
 *
 * Lipschitz bounds produced by combine_lipschitz() and combine_diff_lipschitz()
 * are upper bounds obtained from the triangle inequality, the chain rule and
 * block norms. They are never claimed to be tight.
 */
class PropertyLattice
{
  public:
    static const PropertyLattice& instance()
    {
        static const PropertyLattice lattice;
        return lattice;
    }

    /// All properties guaranteed by holding `p` (reflexive, transitively closed).
    PropertySet implications(Property p) const
    {
        return closure_[static_cast<std::size_t>(p)];
    }

    /// Smallest closed superset of `s`.
    PropertySet closure(PropertySet s) const
    {
        while(true) {
            PropertySet next = s;
            for(auto p : s.to_vector()) next |= closure_[static_cast<std::size_t>(p)];
            for(const auto& rule : joint_)
                if(next.contains(rule.premises)) next |= rule.conclusions;
            if(next == s) return s;
            s = next;
        }
    }

    bool is_closed(const PropertySet& s) const
    {
        return closure(s) == s;
    }

    /**
     * @brief Traits of the result of `kind` applied to operands with the given traits
     *
     * Property sets alone do not determine the result: the argument-scaling,
     * post-homothety and quadratic-sum closed forms depend on the operands'
     * homothety factor and isotropic curvature. The operands' traits are
     * therefore the only input. A node's traits are what this returns for its
     * children, finalized with the scalar codomain of its shape where that
     * applies (transpose of a column).
     */
    AlgebraicTraits combine(OperationKind kind, const std::vector<AlgebraicTraits>& operands, double scalar = 1.0) const
    {
        switch(kind) {
        case OperationKind::Sum:
            expect_operands(kind, operands.size(), 2);
            return finalize(combine_sum(operands[0], operands[1]), false);
        case OperationKind::ScalarMul:
            expect_operands(kind, operands.size(), 1);
            return finalize(combine_scale(operands[0], scalar), false);
        case OperationKind::Compose:
            expect_operands(kind, operands.size(), 2);
            return finalize(combine_compose(operands[0], operands[1]), false);
        case OperationKind::VStack:
        case OperationKind::HStack:
            if(operands.empty())
                throw InvalidCombination(std::string(to_string(kind)) + " requires at least one operand");
            return finalize(combine_stack(kind, operands), false);
        case OperationKind::Transpose:
            expect_operands(kind, operands.size(), 1);
            return finalize(combine_transpose(operands[0]), false);
        case OperationKind::ArgShift:
            expect_operands(kind, operands.size(), 1);
            return finalize(combine_argshift(operands[0]), false);
        case OperationKind::Primitive:
            break;
        }
        throw InvalidCombination(std::string("no combination rule for kind ") + to_string(kind));
    }

    /**
     * @brief Close a derived property set and settle its proximal closed form
     *
     * `scalar_codomain` adds FUNCTIONAL for results whose codomain is known to
     * be one-dimensional from their shape alone (e.g. the transpose of a
     * column). Idempotent.
     */
    AlgebraicTraits finalize(AlgebraicTraits t, bool scalar_codomain) const
    {
        if(scalar_codomain) t.properties.insert(Property::Functional);
        t.properties = closure(t.properties);
        const PropertySet& p = t.properties;

        if(!p.has(Property::LinearSquare)) t.homothety.reset();
        if(!p.has(Property::Quadratic)) t.curvature.reset();

        // Self-contained closed forms take precedence over operand-based ones.
        if(p.has(Property::Linear) && p.has(Property::Functional)) {
            t.prox_rule = ProxRule::LinearFunctional;
            t.prox_operand = 0;
        } else if(p.has(Property::Quadratic) && t.curvature) {
            t.prox_rule = ProxRule::IsotropicQuadratic;
            t.prox_operand = 0;
            t.properties.insert(Property::Proximable);
        }

        if(t.prox_rule != ProxRule::None) t.properties.insert(Property::Proximable);
        if(t.properties.has(Property::Proximable) && t.prox_rule == ProxRule::None)
            throw InvalidCombination("PROXIMABLE derived for " + t.properties.str() + " without an enumerated closed form");
        return t;
    }

    /// Upper bound on the Lipschitz constant of the result from the operands' bounds.
    double combine_lipschitz(OperationKind kind, const std::vector<double>& bounds, double scalar = 1.0) const
    {
        switch(kind) {
        case OperationKind::Sum:
            expect_operands(kind, bounds.size(), 2);
            return bounds[0] + bounds[1];
        case OperationKind::ScalarMul:
            expect_operands(kind, bounds.size(), 1);
            return bound_product(std::abs(scalar), bounds[0]);
        case OperationKind::Compose:
            expect_operands(kind, bounds.size(), 2);
            return bound_product(bounds[0], bounds[1]);
        case OperationKind::VStack:
        case OperationKind::HStack:
            return block_norm(kind, bounds);
        case OperationKind::Transpose:
        case OperationKind::ArgShift:
            expect_operands(kind, bounds.size(), 1);
            return bounds[0];
        case OperationKind::Primitive:
            break;
        }
        throw InvalidCombination(std::string("no Lipschitz rule for kind ") + to_string(kind));
    }

    /**
     * @brief Upper bound on the Lipschitz constant of the result's Jacobian
     *
     * For a composition A o B: dL_A L_B^2 if B is linear, L_A dL_B if A is
     * linear, dL_A L_B^2 + L_A dL_B otherwise.
     */
    double combine_diff_lipschitz(OperationKind kind, const std::vector<double>& bounds,
                                  const std::vector<double>& diff_bounds,
                                  const std::vector<PropertySet>& operands, double scalar = 1.0) const
    {
        switch(kind) {
        case OperationKind::Sum:
            expect_operands(kind, diff_bounds.size(), 2);
            return diff_bounds[0] + diff_bounds[1];
        case OperationKind::ScalarMul:
            expect_operands(kind, diff_bounds.size(), 1);
            return bound_product(std::abs(scalar), diff_bounds[0]);
        case OperationKind::Compose: {
            expect_operands(kind, diff_bounds.size(), 2);
            expect_operands(kind, bounds.size(), 2);
            expect_operands(kind, operands.size(), 2);
            const double outer = bound_product(diff_bounds[0], bound_product(bounds[1], bounds[1]));
            if(operands[1].has(Property::Linear)) return outer;
            const double inner = bound_product(bounds[0], diff_bounds[1]);
            if(operands[0].has(Property::Linear)) return inner;
            return outer + inner;
        }
        case OperationKind::VStack:
        case OperationKind::HStack:
            return block_norm(kind, diff_bounds);
        case OperationKind::Transpose:
            return 0.0;
        case OperationKind::ArgShift:
            expect_operands(kind, diff_bounds.size(), 1);
            return diff_bounds[0];
        case OperationKind::Primitive:
            break;
        }
        throw InvalidCombination(std::string("no Lipschitz rule for kind ") + to_string(kind));
    }

    // Non-copyable, non-movable
    PropertyLattice(const PropertyLattice&) = delete;
    PropertyLattice& operator=(const PropertyLattice&) = delete;

  private:
    struct JointRule
    {
        PropertySet premises;
        PropertySet conclusions;
    };

    std::array<PropertySet, PROPERTY_COUNT> direct_;
    std::array<PropertySet, PROPERTY_COUNT> closure_;
    std::vector<JointRule> joint_;

    PropertyLattice()
    {
        using P = Property;
        auto set = [this](P p, std::initializer_list<P> implied) {
            direct_[static_cast<std::size_t>(p)] = PropertySet(implied);
        };
        set(P::Linear, {P::Differentiable, P::DiffLipschitz});
        set(P::DifferentiableFunction, {P::Differentiable, P::Functional});
        set(P::Proximable, {P::Functional});
        set(P::Convex, {P::Functional});
        set(P::Quadratic, {P::DifferentiableFunction, P::Convex, P::DiffLipschitz});
        set(P::DiffLipschitz, {P::Differentiable});
        set(P::LinearSquare, {P::Linear});
        set(P::LinearNormal, {P::LinearSquare});
        set(P::LinearUnitary, {P::LinearNormal, P::Lipschitz});
        set(P::LinearSelfAdjoint, {P::LinearNormal});
        set(P::LinearPositiveDefinite, {P::LinearSelfAdjoint});
        set(P::LinearIdempotent, {P::LinearSquare});

        joint_.push_back({{P::Differentiable, P::Functional}, {P::DifferentiableFunction}});
        joint_.push_back({{P::Linear, P::Functional}, {P::Convex, P::Proximable}});

        // Reflexive-transitive closure of the direct table, then joint rules until a fixed point.
        for(std::size_t i = 0; i < PROPERTY_COUNT; ++i) {
            PropertySet s = PropertySet{static_cast<P>(i)};
            while(true) {
                PropertySet next = s;
                for(auto p : s.to_vector()) next |= direct_[static_cast<std::size_t>(p)];
                for(const auto& rule : joint_)
                    if(next.contains(rule.premises)) next |= rule.conclusions;
                if(next == s) break;
                s = next;
            }
            closure_[i] = s;
        }
    }

    static void expect_operands(OperationKind kind, std::size_t got, std::size_t expected)
    {
        if(got != expected)
            throw InvalidCombination(std::string(to_string(kind)) + " expects " + std::to_string(expected) +
                                     " operand(s), got " + std::to_string(got));
    }

    // Product of two bounds where a zero factor wins over an infinite one.
    static double bound_product(double a, double b)
    {
        if(a == 0.0 || b == 0.0) return 0.0;
        return a * b;
    }

    static double block_norm(OperationKind kind, const std::vector<double>& bounds)
    {
        if(bounds.empty())
            throw InvalidCombination(std::string(to_string(kind)) + " requires at least one operand");
        if(bounds.size() == 1) return bounds[0];
        double sq = 0.0;
        for(double b : bounds) {
            if(std::isinf(b)) return std::numeric_limits<double>::infinity();
            sq += b * b;
        }
        return std::sqrt(sq);
    }

    static bool is_linear_functional(const PropertySet& p)
    {
        return p.has(Property::Linear) && p.has(Property::Functional);
    }

    static bool is_isotropic_quadratic(const AlgebraicTraits& t)
    {
        return t.properties.has(Property::Quadratic) && t.curvature.has_value();
    }

    // Curvature of a functional contributing to a quadratic sum: linear functionals are flat.
    static std::optional<double> curvature_of(const AlgebraicTraits& t)
    {
        if(is_linear_functional(t.properties)) return 0.0;
        if(t.properties.has(Property::Quadratic)) return t.curvature;
        return std::nullopt;
    }

    AlgebraicTraits combine_sum(const AlgebraicTraits& a, const AlgebraicTraits& b) const
    {
        using P = Property;
        const PropertySet& pa = a.properties;
        const PropertySet& pb = b.properties;

        AlgebraicTraits r;
        r.properties = pa & pb &
                       PropertySet{P::Functional, P::Linear, P::Differentiable, P::Convex, P::Lipschitz,
                                   P::DiffLipschitz, P::LinearSquare, P::LinearSelfAdjoint,
                                   P::LinearPositiveDefinite};

        const bool qa = pa.has(P::Quadratic), qb = pb.has(P::Quadratic);
        if((qa && qb) || (qa && is_linear_functional(pb)) || (is_linear_functional(pa) && qb)) {
            r.properties.insert(P::Quadratic);
            const auto ca = curvature_of(a), cb = curvature_of(b);
            if(ca && cb) r.curvature = *ca + *cb;
        }

        if(a.homothety && b.homothety) r.homothety = *a.homothety + *b.homothety;

        const bool xa = pa.has(P::Proximable), xb = pb.has(P::Proximable);
        if(xa && is_linear_functional(pb)) {
            r.prox_rule = ProxRule::AffineSum;
            r.prox_operand = 0;
        } else if(xb && is_linear_functional(pa)) {
            r.prox_rule = ProxRule::AffineSum;
            r.prox_operand = 1;
        } else if(xa && is_isotropic_quadratic(b)) {
            r.prox_rule = ProxRule::IsotropicQuadraticSum;
            r.prox_operand = 0;
        } else if(xb && is_isotropic_quadratic(a)) {
            r.prox_rule = ProxRule::IsotropicQuadraticSum;
            r.prox_operand = 1;
        }
        return r;
    }

    AlgebraicTraits combine_scale(const AlgebraicTraits& a, double c) const
    {
        using P = Property;
        const PropertySet& pa = a.properties;

        if(is_close(c, 1.0)) {
            AlgebraicTraits r = a;
            if(pa.has(P::Proximable)) {
                r.prox_rule = ProxRule::PositiveScale;
                r.prox_operand = 0;
            }
            return r;
        }

        AlgebraicTraits r;
        if(is_close(c, 0.0)) {
            // The zero map: linear whatever the operand was.
            r.properties = PropertySet{P::Linear, P::Lipschitz} | (pa & PropertySet{P::Functional, P::LinearSquare});
            if(r.properties.has(P::LinearSquare)) {
                r.properties.insert(P::LinearSelfAdjoint).insert(P::LinearIdempotent);
                r.homothety = 0.0;
            }
            return r;
        }

        r.properties = pa & PropertySet{P::Functional, P::Linear, P::Differentiable, P::Lipschitz, P::DiffLipschitz,
                                        P::LinearSquare, P::LinearNormal, P::LinearSelfAdjoint};
        if(c > 0) {
            r.properties |= pa & PropertySet{P::Convex, P::Quadratic, P::LinearPositiveDefinite};
            if(a.curvature) r.curvature = c * *a.curvature;
            if(pa.has(P::Proximable)) {
                r.prox_rule = ProxRule::PositiveScale;
                r.prox_operand = 0;
            }
        }
        if(is_close(std::abs(c), 1.0)) r.properties |= pa & PropertySet{P::LinearUnitary};
        if(a.homothety) r.homothety = c * *a.homothety;
        return r;
    }

    AlgebraicTraits combine_compose(const AlgebraicTraits& a, const AlgebraicTraits& b) const
    {
        using P = Property;
        const PropertySet& pa = a.properties;
        const PropertySet& pb = b.properties;

        AlgebraicTraits r;
        r.properties = pa & pb & PropertySet{P::Linear, P::Differentiable, P::Lipschitz, P::LinearSquare, P::LinearUnitary};
        if(pa.has(P::Functional)) r.properties.insert(P::Functional);
        if(pb.has(P::Linear)) r.properties |= pa & PropertySet{P::Convex, P::Quadratic};

        const bool diff_lip =
            (pa.has(P::DiffLipschitz) && pb.has(P::DiffLipschitz) && pa.has(P::Lipschitz) && pb.has(P::Lipschitz)) ||
            (pa.has(P::DiffLipschitz) && pb.has(P::Linear) && pb.has(P::Lipschitz)) ||
            (pa.has(P::Linear) && pa.has(P::Lipschitz) && pb.has(P::DiffLipschitz));
        if(diff_lip) r.properties.insert(P::DiffLipschitz);

        if(a.homothety && b.homothety) r.homothety = *a.homothety * *b.homothety;

        if(r.properties.has(P::Quadratic) && a.curvature) {
            if(b.homothety)
                r.curvature = *a.curvature * *b.homothety * *b.homothety;
            else if(pb.has(P::LinearUnitary))
                r.curvature = a.curvature;
        }

        if(pa.has(P::Proximable) && b.homothety && !is_close(*b.homothety, 0.0)) {
            r.prox_rule = ProxRule::ArgScale;
            r.prox_operand = 0;
        } else if(pa.has(P::Proximable) && pb.has(P::LinearUnitary)) {
            r.prox_rule = ProxRule::Unitary;
            r.prox_operand = 0;
        } else if(pa.has(P::Functional) && a.homothety && *a.homothety > 0 && !is_close(*a.homothety, 0.0) &&
                  pb.has(P::Proximable)) {
            r.prox_rule = ProxRule::PostHomothety;
            r.prox_operand = 1;
            r.properties |= pb & PropertySet{P::Convex, P::Quadratic};
            if(b.curvature) r.curvature = *a.homothety * *b.curvature;
        }
        return r;
    }

    AlgebraicTraits combine_stack(OperationKind kind, const std::vector<AlgebraicTraits>& ops) const
    {
        using P = Property;
        if(ops.size() == 1) {
            AlgebraicTraits r = ops[0];
            if(r.properties.has(P::Proximable)) {
                r.prox_rule = ProxRule::Delegate;
                r.prox_operand = 0;
            }
            return r;
        }

        PropertySet common = ops[0].properties;
        for(const auto& t : ops) common &= t.properties;

        AlgebraicTraits r;
        if(kind == OperationKind::VStack) {
            r.properties = common & PropertySet{P::Linear, P::Differentiable, P::Lipschitz, P::DiffLipschitz};
            return r;
        }

        r.properties = common & PropertySet{P::Linear, P::Differentiable, P::Lipschitz, P::DiffLipschitz,
                                            P::Functional, P::Convex, P::Quadratic};
        if(r.properties.has(P::Quadratic)) {
            std::optional<double> mu = ops[0].curvature;
            for(const auto& t : ops)
                if(!mu || !t.curvature || !is_close(*t.curvature, *mu)) mu.reset();
            r.curvature = mu;
        }
        if(common.has(P::Functional) && common.has(P::Proximable)) {
            r.prox_rule = ProxRule::Separable;
            r.prox_operand = 0;
        }
        return r;
    }

    AlgebraicTraits combine_transpose(const AlgebraicTraits& a) const
    {
        using P = Property;
        AlgebraicTraits r;
        r.properties = a.properties & PropertySet{P::Linear, P::Lipschitz, P::LinearSquare, P::LinearNormal,
                                                  P::LinearUnitary, P::LinearSelfAdjoint,
                                                  P::LinearPositiveDefinite, P::LinearIdempotent};
        r.homothety = a.homothety;
        return r;
    }

    AlgebraicTraits combine_argshift(const AlgebraicTraits& a) const
    {
        using P = Property;
        AlgebraicTraits r;
        r.properties = a.properties - PropertySet{P::Linear, P::LinearSquare, P::LinearNormal, P::LinearUnitary,
                                                  P::LinearSelfAdjoint, P::LinearPositiveDefinite,
                                                  P::LinearIdempotent};
        r.curvature = a.curvature;
        if(a.properties.has(P::Proximable)) {
            r.prox_rule = ProxRule::ArgShift;
            r.prox_operand = 0;
        }
        return r;
    }
};

} // namespace opalg
