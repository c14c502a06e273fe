#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include "graft/graph.h"
#include "graft/value.h"
#include <gtest/gtest.h>

using namespace graft;

// ============================================================================
// Random DAG programs
// ============================================================================
// A program is a list of instructions over a growing list of slots. Slots
// [0, numInputs) are the leaves; instruction i writes slot numInputs + i and
// may read any earlier slot, so operands are reused freely and fan-in/fan-out
// both occur. The program is generated once against the base input values and
// then replayed on perturbed inputs for central differences.

namespace {

enum class Kind { Add, Mul, Sub, Div, Pow, Exp, Tanh, Relu, Neg, AddConst, MulConst };

struct Instruction {
    Kind kind;
    std::size_t a;
    std::size_t b;
    double k;
};

struct Program {
    std::vector<double> inputs;
    std::vector<Instruction> instructions;
};

Value apply(const Instruction& ins, const std::vector<Value>& slots) {
    const Value& a = slots[ins.a];
    const Value& b = slots[ins.b];
    switch (ins.kind) {
        case Kind::Add:
            return a + b;
        case Kind::Mul:
            return a * b;
        case Kind::Sub:
            return a - b;
        case Kind::Div:
            return a / b;
        case Kind::Pow:
            return a.pow(ins.k);
        case Kind::Exp:
            return a.exp();
        case Kind::Tanh:
            return a.tanh();
        case Kind::Relu:
            return a.relu();
        case Kind::Neg:
            return -a;
        case Kind::AddConst:
            return a + ins.k;
        case Kind::MulConst:
            return ins.k * a;
    }
    return a;
}

// Runs the program in graph and returns the terminal: the sum of the last three slots
Value evaluate(Graph& graph, const Program& program, const std::vector<double>& inputs,
               std::vector<Value>* leaves = nullptr) {
    std::vector<Value> slots;
    for (const double x : inputs) {
        slots.push_back(graph.leaf(x));
    }
    if (leaves) {
        *leaves = slots;
    }
    for (const auto& ins : program.instructions) {
        slots.push_back((apply)(ins, slots));
    }

    const std::size_t n = slots.size();
    return slots[n - 1] + slots[n - 2] + slots[n - 3];
}

// Picks operations whose local derivative is smooth and moderate at the base point,
// falling back to tanh otherwise
Program generate(std::mt19937& rng, std::size_t numInputs, std::size_t numInstructions) {
    std::uniform_real_distribution<double> value_dist(-1.5, 1.5);
    std::uniform_int_distribution<int> kind_dist(0, 10);

    Program program;
    for (std::size_t i = 0; i < numInputs; ++i) {
        program.inputs.push_back(value_dist(rng));
    }

    Graph graph;
    std::vector<Value> slots;
    for (const double x : program.inputs) {
        slots.push_back(graph.leaf(x));
    }

    for (std::size_t i = 0; i < numInstructions; ++i) {
        std::uniform_int_distribution<std::size_t> slot_dist(0, slots.size() - 1);
        Instruction ins{static_cast<Kind>(kind_dist(rng)), slot_dist(rng), slot_dist(rng), 0.0};
        const double a = slots[ins.a].data();
        const double b = slots[ins.b].data();

        switch (ins.kind) {
            case Kind::Div:
                if (std::abs(b) < 0.5) {
                    ins.kind = Kind::Tanh;
                }
                break;
            case Kind::Pow:
                ins.k = std::uniform_int_distribution<int>(2, 3)(rng);
                if (std::abs(a) > 3.0) {
                    ins.kind = Kind::Tanh;
                }
                break;
            case Kind::Exp:
                if (std::abs(a) > 3.0) {
                    ins.kind = Kind::Tanh;
                }
                break;
            case Kind::Relu:
                if (std::abs(a) < 1e-2) {
                    ins.kind = Kind::Tanh;
                }
                break;
            case Kind::Mul:
                if (std::abs(a * b) > 10.0) {
                    ins.kind = Kind::Add;
                }
                break;
            case Kind::AddConst:
            case Kind::MulConst:
                ins.k = value_dist(rng);
                break;
            default:
                break;
        }

        slots.push_back((apply)(ins, slots));
        program.instructions.push_back(ins);
    }
    return program;
}

}  // namespace

// ============================================================================
// Finite-difference agreement
// ============================================================================

class GradCheckTest : public ::testing::TestWithParam<unsigned> {};

TEST_P(GradCheckTest, BackwardMatchesCentralDifferences) {
    std::mt19937 rng(GetParam());
    const Program program = generate(rng, 4, 12);

    Graph graph;
    std::vector<Value> leaves;
    Value out = evaluate(graph, program, program.inputs, &leaves);
    ASSERT_TRUE(std::isfinite(out.data()));
    out.backward();

    const double h = 1e-6;
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        std::vector<double> plus = program.inputs;
        std::vector<double> minus = program.inputs;
        plus[i] += h;
        minus[i] -= h;

        Graph graph_plus;
        Graph graph_minus;
        const double f_plus = evaluate(graph_plus, program, plus).data();
        const double f_minus = evaluate(graph_minus, program, minus).data();
        const double numeric = (f_plus - f_minus) / (2.0 * h);

        EXPECT_NEAR(leaves[i].grad(), numeric, 1e-4 * std::max(1.0, std::abs(numeric)))
            << "seed " << GetParam() << ", input " << i;
    }
}

INSTANTIATE_TEST_SUITE_P(RandomGraphs, GradCheckTest, ::testing::Range(1u, 21u));

TEST(GradCheckAnalyticTest, SharedSubexpressionMatchesAnalyticDerivative) {
    // f(x) = (x^2 + x) * tanh(x^2 + x), with u = x^2 + x reused
    const double x0 = 0.4;
    Graph graph;
    Value x = graph.leaf(x0);
    Value u = x * x + x;
    Value f = u * u.tanh();
    f.backward();

    const double u0 = x0 * x0 + x0;
    const double t = std::tanh(u0);
    const double expected = (t + u0 * (1.0 - t * t)) * (2.0 * x0 + 1.0);
    EXPECT_NEAR(x.grad(), expected, 1e-12);
}
