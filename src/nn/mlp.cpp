#include "graft/nn/mlp.h"

#include <stdexcept>

#include "graft/logger.h"

namespace graft {
namespace nn {

// ============================================================================
// Neuron
// ============================================================================

Neuron::Neuron(std::size_t nin, bool nonlin) : mNonlin(nonlin) {
    mWeights.reserve(nin);
    for (std::size_t i = 0; i < nin; ++i) {
        const std::string name = "w" + std::to_string(i);
        mWeights.push_back(registerParameter(name, Parameter::uniform(-1.0, 1.0)));
    }
    mBias = registerParameter("b", Parameter::zeros());
}

std::vector<Value> Neuron::forward(Graph& graph, const std::vector<Value>& inputs) {
    if (inputs.size() != mWeights.size()) {
        throw std::runtime_error("Neuron expects " + std::to_string(mWeights.size()) +
                                 " inputs, got " + std::to_string(inputs.size()));
    }

    Value act = mBias->bind(graph);
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        act = act + mWeights[i]->bind(graph) * inputs[i];
    }

    return {mNonlin ? act.tanh() : act};
}

// ============================================================================
// Layer
// ============================================================================

Layer::Layer(std::size_t nin, std::size_t nout, bool nonlin) : mNin(nin) {
    mNeurons.reserve(nout);
    for (std::size_t i = 0; i < nout; ++i) {
        auto neuron = std::make_shared<Neuron>(nin, nonlin);
        registerModule("neuron" + std::to_string(i), neuron);
        mNeurons.push_back(neuron);
    }
}

std::vector<Value> Layer::forward(Graph& graph, const std::vector<Value>& inputs) {
    std::vector<Value> outputs;
    outputs.reserve(mNeurons.size());
    for (auto& neuron : mNeurons) {
        outputs.push_back(neuron->forward(graph, inputs).front());
    }
    return outputs;
}

// ============================================================================
// MLP
// ============================================================================

MLP::MLP(std::size_t nin, const std::vector<std::size_t>& nouts) {
    if (nouts.empty()) {
        throw std::runtime_error("MLP needs at least one layer");
    }

    std::size_t fan_in = nin;
    for (std::size_t i = 0; i < nouts.size(); ++i) {
        const bool hidden = i + 1 < nouts.size();
        auto layer = std::make_shared<Layer>(fan_in, nouts[i], hidden);
        registerModule("layer" + std::to_string(i), layer);
        mLayers.push_back(layer);
        fan_in = nouts[i];
    }

    Logger::getInstance("NN").debug("MLP({}) with {} layers, {} parameters", nin, mLayers.size(),
                                    parameters().size());
}

std::vector<Value> MLP::forward(Graph& graph, const std::vector<Value>& inputs) {
    std::vector<Value> activations = inputs;
    for (auto& layer : mLayers) {
        activations = layer->forward(graph, activations);
    }
    return activations;
}

}  // namespace nn
}  // namespace graft
