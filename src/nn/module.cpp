#include "graft/nn/module.h"

#include <stdexcept>

namespace graft {
namespace nn {

std::vector<Value> Module::operator()(Graph& graph, const std::vector<double>& inputs) {
    std::vector<Value> leaves;
    leaves.reserve(inputs.size());
    for (const double x : inputs) {
        leaves.push_back(graph.leaf(x));
    }
    return forward(graph, leaves);
}

// ============================================================================
// Registration
// ============================================================================

std::shared_ptr<Parameter> Module::registerParameter(const std::string& name,
                                                     const Parameter& param) {
    if (mParameters.find(name) != mParameters.end()) {
        throw std::runtime_error("Parameter '" + name + "' already registered");
    }

    auto param_ptr = std::make_shared<Parameter>(param);
    if (param_ptr->name().empty()) {
        param_ptr->setName(name);
    }
    mParameters[name] = param_ptr;

    return param_ptr;
}

std::shared_ptr<Module> Module::registerModule(const std::string& name,
                                               std::shared_ptr<Module> module) {
    if (mSubmodules.find(name) != mSubmodules.end()) {
        throw std::runtime_error("Submodule '" + name + "' already registered");
    }

    mSubmodules[name] = module;
    return module;
}

// ============================================================================
// Parameter Access
// ============================================================================

std::vector<std::shared_ptr<Parameter>> Module::parameters() const {
    std::vector<std::shared_ptr<Parameter>> result;
    for (const auto& [name, param] : mParameters) {
        result.push_back(param);
    }
    for (const auto& [name, submodule] : mSubmodules) {
        auto subparams = submodule->parameters();
        result.insert(result.end(), subparams.begin(), subparams.end());
    }
    return result;
}

std::vector<std::pair<std::string, std::shared_ptr<Parameter>>> Module::namedParameters() const {
    std::vector<std::pair<std::string, std::shared_ptr<Parameter>>> result;
    namedParametersImpl(result, "");
    return result;
}

void Module::namedParametersImpl(
    std::vector<std::pair<std::string, std::shared_ptr<Parameter>>>& result,
    const std::string& prefix) const {
    for (const auto& [name, param] : mParameters) {
        result.emplace_back(prefix.empty() ? name : prefix + "." + name, param);
    }

    for (const auto& [name, submodule] : mSubmodules) {
        submodule->namedParametersImpl(result, prefix.empty() ? name : prefix + "." + name);
    }
}

// ============================================================================
// Gradients
// ============================================================================

void Module::zeroGrad() {
    for (auto& param : parameters()) {
        param->zeroGrad();
    }
}

void Module::bind(Graph& graph) {
    for (auto& param : parameters()) {
        param->bind(graph);
    }
}

void Module::pullGrad() {
    for (auto& param : parameters()) {
        param->pullGrad();
    }
}

void Module::release() {
    for (auto& param : parameters()) {
        param->release();
    }
}

}  // namespace nn
}  // namespace graft
