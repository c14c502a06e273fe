#pragma once

#include "graft/optim/optimizer.h"

namespace graft {
namespace optim {

/**
 * @brief Stochastic Gradient Descent (SGD) optimizer.
 *
 * Implements vanilla SGD parameter updates:
 *   p_new = p_old - lr * dL/dp
 *
 * Example usage:
 *   nn::MLP model(3, {4, 4, 1});
 *   optim::SGD optimizer(model.parameters(), 0.05);
 *
 *   for (int k = 0; k < steps; ++k) {
 *       Graph graph;
 *       Value loss = nn::mseLoss(predict(graph), targets);
 *       optimizer.zeroGrad();
 *       loss.backward();
 *       optimizer.step();
 *   }
 */
class SGD : public Optimizer {
  public:
    SGD(const std::vector<std::shared_ptr<nn::Parameter>>& parameters, double lr = 0.01);

    /// Pulls every parameter's gradient, then p -= lr * grad(p)
    void step() override;
};

}  // namespace optim
}  // namespace graft
