#pragma once

#include <memory>
#include <vector>

#include "graft/nn/parameter.h"

namespace graft {
namespace optim {

/**
 * @brief Abstract base class for all optimizers.
 *
 * The typical training loop pattern is:
 *
 *   Graph graph;                         // fresh graph per step
 *   Value loss = ...;                    // forward pass
 *   optimizer.zeroGrad();                // clear previous gradients
 *   loss.backward();                     // compute gradients
 *   optimizer.step();                    // update parameters
 *
 * step() collects each parameter's gradient from the graph it was last lifted
 * into, so the graph must still be alive when step() runs.
 */
class Optimizer {
  protected:
    std::vector<std::shared_ptr<nn::Parameter>> mParameters;
    double mLearningRate;

  public:
    Optimizer(const std::vector<std::shared_ptr<nn::Parameter>>& parameters, double lr);

    virtual ~Optimizer() = default;

    /// Perform a single optimization step (parameter update)
    virtual void step() = 0;

    /// Zero out all parameter gradients
    void zeroGrad();

    double learningRate() const { return mLearningRate; }

    /// Set a new learning rate (for learning rate scheduling)
    void setLearningRate(double lr) { mLearningRate = lr; }

    size_t numParameters() const { return mParameters.size(); }
};

}  // namespace optim
}  // namespace graft
