#include <vector>

#include "graft/graph.h"
#include "graft/logger.h"
#include "graft/nn/loss.h"
#include "graft/nn/mlp.h"
#include "graft/optim/sgd.h"

using namespace graft;

int main() {
    // Configure logging
    Logger::setMinLogLevel(LogLevel::INFO);
    Logger::setLogOutput(LogOutput::CONSOLE);
    auto& logger = Logger::getInstance("Train");

    logger.info("=== graft MLP regression example ===");

    // ========================================================================
    // Data: four samples, targets in {-1, 1}
    // ========================================================================
    const std::vector<std::vector<double>> xs = {
        {2.0, 3.0, -1.0},
        {3.0, -1.0, 0.5},
        {0.5, 1.0, 1.0},
        {1.0, 1.0, -1.0},
    };
    const std::vector<double> ys = {1.0, -1.0, -1.0, 1.0};

    // ========================================================================
    // Model and optimizer
    // ========================================================================
    nn::Parameter::manualSeed(1337);
    nn::MLP model(3, {4, 4, 1});

    auto params = model.parameters();
    logger.info("Model: MLP(3 -> 4 -> 4 -> 1), {} parameters", params.size());

    optim::SGD optimizer(params, 0.05);

    // ========================================================================
    // Training loop: one graph per step
    // ========================================================================
    const int steps = 50;
    for (int k = 0; k < steps; ++k) {
        Graph graph({.checkFinite = true, .name = "step"});

        std::vector<Value> predictions;
        predictions.reserve(xs.size());
        for (const auto& x : xs) {
            predictions.push_back(model(graph, x).front());
        }
        Value loss = nn::mseLoss(predictions, ys);

        optimizer.zeroGrad();
        loss.backward();
        optimizer.step();

        if (k % 5 == 0 || k == steps - 1) {
            logger.info("step {:>3}  loss {:.6f}  ({} nodes)", k, loss.data(), graph.size());
        }
    }

    // ========================================================================
    // Final predictions
    // ========================================================================
    {
        Graph graph({.checkFinite = true, .name = "eval"});
        for (std::size_t i = 0; i < xs.size(); ++i) {
            logger.info("x{} -> {:+.4f} (target {:+.1f})", i,
                        model(graph, xs[i]).front().data(), ys[i]);
        }
        // No backward on this graph, drop the bindings before it goes away
        model.release();
    }

    Logger::shutdown();
    return 0;
}
