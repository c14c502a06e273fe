/**
 * Autodiff Performance Benchmarks
 *
 * - Recording: cost of building expressions into a Graph
 * - Backward: topological sort plus the reverse sweep
 * - MLP: one full forward/backward training step of a small network
 */

#include <cstdint>
#include <vector>

#include "graft/graph.h"
#include "graft/nn/loss.h"
#include "graft/nn/mlp.h"
#include "graft/optim/sgd.h"
#include "graft/value.h"
#include <benchmark/benchmark.h>

using namespace graft;

namespace {

// x * 0.5 + 0.1, tanh'd every few links so the values stay bounded
Value buildChain(Graph& graph, std::int64_t length) {
    Value x = graph.leaf(0.3);
    for (std::int64_t i = 0; i < length; ++i) {
        x = x * 0.5 + 0.1;
        if (i % 4 == 0) {
            x = x.tanh();
        }
    }
    return x;
}

}  // namespace

// ============================================================================
// Recording
// ============================================================================

static void BM_Record_Chain(benchmark::State& state) {
    for (auto _ : state) {
        Graph graph;
        Value out = buildChain(graph, state.range(0));
        benchmark::DoNotOptimize(out.data());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Record_Chain)->RangeMultiplier(4)->Range(16, 4096)->Complexity();

// ============================================================================
// Backward
// ============================================================================

static void BM_Backward_Chain(benchmark::State& state) {
    Graph graph;
    Value out = buildChain(graph, state.range(0));

    for (auto _ : state) {
        graph.zeroGrad();
        out.backward();
        benchmark::DoNotOptimize(graph.node(0).grad);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Backward_Chain)->RangeMultiplier(4)->Range(16, 4096)->Complexity();

// Wide fan-in: every leaf feeds the sum and the running product
static void BM_Backward_SharedLeaves(benchmark::State& state) {
    Graph graph;
    std::vector<Value> leaves;
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        leaves.push_back(graph.leaf(0.01 * static_cast<double>(i)));
    }
    Value sum = leaves.front();
    Value prod = leaves.front();
    for (const Value& leaf : leaves) {
        sum = sum + leaf;
        prod = (prod * leaf).tanh();
    }
    Value out = sum + prod;

    for (auto _ : state) {
        graph.zeroGrad();
        out.backward();
        benchmark::DoNotOptimize(leaves.back().grad());
    }
}
BENCHMARK(BM_Backward_SharedLeaves)->Arg(64)->Arg(512);

// ============================================================================
// MLP training step
// ============================================================================

static void BM_MLP_TrainStep(benchmark::State& state) {
    nn::Parameter::manualSeed(1337);
    nn::MLP model(3, {4, 4, 1});
    optim::SGD optimizer(model.parameters(), 0.01);

    const std::vector<std::vector<double>> xs = {
        {2.0, 3.0, -1.0}, {3.0, -1.0, 0.5}, {0.5, 1.0, 1.0}, {1.0, 1.0, -1.0}};
    const std::vector<double> ys = {1.0, -1.0, -1.0, 1.0};

    for (auto _ : state) {
        Graph graph;
        std::vector<Value> predictions;
        for (const auto& x : xs) {
            predictions.push_back(model(graph, x).front());
        }
        Value loss = nn::mseLoss(predictions, ys);
        optimizer.zeroGrad();
        loss.backward();
        optimizer.step();
        benchmark::DoNotOptimize(loss.data());
    }
}
BENCHMARK(BM_MLP_TrainStep);
