#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "graft/nn/module.h"
#include "graft/nn/parameter.h"

namespace graft {
namespace nn {

/**
 * @brief Single neuron: act = sum_i(w_i * x_i) + b, then tanh if nonlinear.
 *
 * Weights start uniform in [-1, 1], the bias at 0.
 */
class Neuron : public Module {
  public:
    explicit Neuron(std::size_t nin, bool nonlin = true);

    /**
     * @brief Forward pass for one sample.
     * @return A single value
     * @throws std::runtime_error if inputs.size() != nin
     */
    std::vector<Value> forward(Graph& graph, const std::vector<Value>& inputs) override;

    std::size_t nin() const { return mWeights.size(); }
    bool nonlin() const { return mNonlin; }

    const std::vector<std::shared_ptr<Parameter>>& weights() const { return mWeights; }
    std::shared_ptr<Parameter> bias() const { return mBias; }

  private:
    std::vector<std::shared_ptr<Parameter>> mWeights;
    std::shared_ptr<Parameter> mBias;
    bool mNonlin;
};

/**
 * @brief nout independent neurons over the same nin inputs.
 */
class Layer : public Module {
  public:
    Layer(std::size_t nin, std::size_t nout, bool nonlin = true);

    std::vector<Value> forward(Graph& graph, const std::vector<Value>& inputs) override;

    std::size_t nin() const { return mNin; }
    std::size_t nout() const { return mNeurons.size(); }

  private:
    std::size_t mNin;
    std::vector<std::shared_ptr<Neuron>> mNeurons;
};

/**
 * @brief Multi-layer perceptron.
 *
 * MLP(3, {4, 4, 1}) builds 3 -> 4 -> 4 -> 1. Hidden layers use tanh, the output
 * layer is linear.
 *
 * Example usage:
 *   MLP model(3, {4, 4, 1});
 *   Graph graph;
 *   Value y = model(graph, std::vector<double>{2.0, 3.0, -1.0})[0];
 */
class MLP : public Module {
  public:
    MLP(std::size_t nin, const std::vector<std::size_t>& nouts);

    std::vector<Value> forward(Graph& graph, const std::vector<Value>& inputs) override;

    std::size_t numLayers() const { return mLayers.size(); }
    const Layer& layer(std::size_t index) const { return *mLayers.at(index); }

  private:
    std::vector<std::shared_ptr<Layer>> mLayers;
};

}  // namespace nn
}  // namespace graft
