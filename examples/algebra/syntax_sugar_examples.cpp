/**
 * @file syntax_sugar_examples.cpp
 * @brief Demonstrates the operator overloads and scoped configuration of the operator algebra
 *
 * Every expression below builds an immutable operator graph. The property set of
 * each node is inferred when the node is built, so capabilities such as prox or
 * gradient are available exactly when the algebra can guarantee them.
 */

#include <opalg/opalg.hpp>
#include <iostream>
#include <vector>

using namespace opalg;

void demonstrate_overloads() {
    std::cout << "\n=== 1. Arithmetic overloads ===\n";

    auto f = SquaredL2Norm<double>(3);
    auto A = DiagonalOp<double>((Eigen::VectorXd(3) << 1.0, 2.0, 3.0).finished());

    auto g = f * A;           // composition f(A x)
    auto h = 2.0 * f + g;     // positive scaling and sum
    auto k = -A;              // negation is scaling by -1
    auto A3 = power(A, 3);    // repeated composition

    Eigen::VectorXd x(3);
    x << 1.0, -1.0, 0.5;

    std::cout << "g = " << g.name() << ", g(x) = " << g(x)[0] << std::endl;
    std::cout << "h = " << h.name() << ", h(x) = " << h(x)[0] << std::endl;
    std::cout << "k(x) = " << k(x).transpose() << std::endl;
    std::cout << "A^3 x = " << A3(x).transpose() << std::endl;
    std::cout << "grad h(x) = " << h.gradient(x).transpose() << std::endl;
}

void demonstrate_properties() {
    std::cout << "\n=== 2. Inferred properties ===\n";

    auto u = IdentityOp<double>(4);
    auto d = HomothetyOp<double>(-2.0, 4);
    auto l1 = L1Norm<double>(4);

    std::vector<std::pair<std::string, Operator<double>>> ops = {
        {"identity", u},
        {"homothety(-2)", d},
        {"homothety(-2) o identity", d * u},
        {"l1", l1},
        {"0.5 * l1", 0.5 * l1},
        {"l1 o homothety(-2)", l1 * d},
        {"transpose(homothety(-2))", transpose(d)},
    };

    for(const auto& [label, op] : ops)
        std::cout << label << ": " << op.properties().str() << "  prox rule: " << to_string(op.traits().prox_rule) << std::endl;

    // Capabilities that cannot be guaranteed are refused at call time
    try {
        (l1 + L2Norm<double>(4)).prox(Eigen::VectorXd::Ones(4), 1.0);
    }
    catch(const UnsupportedOperation& e) {
        std::cout << "l1 + l2 has no closed-form prox: " << e.what() << std::endl;
    }
}

void demonstrate_stacking() {
    std::cout << "\n=== 3. Stacking ===\n";

    auto a = LinFunc<double>((Eigen::VectorXd(2) << 1.0, 1.0).finished());
    auto b = LinFunc<double>((Eigen::VectorXd(2) << 1.0, -1.0).finished());
    auto V = vstack<double>({a, b});
    auto H = hstack<double>({SquaredL2Norm<double>(2), L1Norm<double>(1)});

    Eigen::VectorXd x(2);
    x << 3.0, 1.0;
    Eigen::VectorXd y(3);
    y << 1.0, 2.0, -4.0;

    std::cout << "V shape = " << V.shape().str() << ", V x = " << V(x).transpose() << std::endl;
    std::cout << "V^T V " << (transpose(V) * V).shape().str() << " is linear: " << (transpose(V) * V).has(Property::Linear) << std::endl;
    std::cout << "H shape = " << H.shape().str() << ", H(y) = " << H(y)[0] << std::endl;
    std::cout << "prox_H(y, 0.5) = " << H.prox(y, 0.5).transpose() << std::endl;
}

void demonstrate_config_scope() {
    std::cout << "\n=== 4. Scoped runtime configuration ===\n";

    Eigen::MatrixXd M(2, 2);
    M << 2.0, 1.0,
         1.0, 2.0;

    // Memoized bounds are computed once per node, so each scope builds its own operator
    std::cout << "default (Frobenius) bound = " << ExplicitLinOp<double>(M).lipschitz_estimate() << std::endl;

    RuntimeConfig config;
    config.lipschitz_method = LipschitzMethod::PowerIteration;
    OPALG_WITH_CONFIG(config)
    {
        std::cout << "power iteration bound    = " << ExplicitLinOp<double>(M).lipschitz_estimate() << std::endl;
    }
}

void demonstrate_graph_listing() {
    std::cout << "\n=== 5. Graph listing ===\n";

    Eigen::VectorXd b(3);
    b << 1.0, 2.0, 3.0;
    auto f = 0.5 * argshift(SquaredL2Norm<double>(3), b) + 0.1 * L1Norm<double>(3);

    std::cout << describe(f);
    std::cout << "nodes = " << node_count(f) << ", leaves = " << leaves(f).size() << std::endl;
}

int main() {
    std::cout << "Operator algebra syntax sugar examples\n";
    std::cout << "======================================\n";

    demonstrate_overloads();
    demonstrate_properties();
    demonstrate_stacking();
    demonstrate_config_scope();
    demonstrate_graph_listing();

    std::cout << "\nDone.\n";
    return 0;
}
