#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "graft/graph.h"
#include "graft/nn/parameter.h"
#include "graft/value.h"

namespace graft {
namespace nn {

/**
 * @brief Base class for all neural network modules.
 *
 * Module provides:
 * - Parameter registration and management
 * - Hierarchical composition (modules can contain submodules)
 * - Recursive parameter collection
 * - Gradient zeroing and collection from a finished backward pass
 *
 * Design pattern:
 * - Subclasses register Parameters in constructor via registerParameter()
 * - Subclasses register sub-Modules via registerModule()
 * - Subclasses implement forward(), which records into the caller's Graph
 */
class Module {
  public:
    Module() = default;
    virtual ~Module() = default;

    // Pure virtual: record the forward computation into graph
    virtual std::vector<Value> forward(Graph& graph, const std::vector<Value>& inputs) = 0;

    std::vector<Value> operator()(Graph& graph, const std::vector<Value>& inputs) {
        return forward(graph, inputs);
    }

    /// Lift plain inputs to leaves, then forward
    std::vector<Value> operator()(Graph& graph, const std::vector<double>& inputs);

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Register a parameter with a name.
     * @throws std::runtime_error if name already registered
     */
    std::shared_ptr<Parameter> registerParameter(const std::string& name, const Parameter& param);

    /**
     * @brief Register a submodule with a name.
     * @throws std::runtime_error if name already registered
     */
    std::shared_ptr<Module> registerModule(const std::string& name,
                                           std::shared_ptr<Module> module);

    // ========================================================================
    // Parameter Access
    // ========================================================================

    /**
     * @brief Get all parameters recursively.
     *
     * Own parameters first, then submodule parameters (DFS order).
     */
    std::vector<std::shared_ptr<Parameter>> parameters() const;

    /**
     * @brief Get all parameters with hierarchical names ("layer0.neuron1.w2").
     */
    std::vector<std::pair<std::string, std::shared_ptr<Parameter>>> namedParameters() const;

    // ========================================================================
    // Gradients
    // ========================================================================

    void zeroGrad();

    /// Lift every parameter into graph ahead of forward()
    void bind(Graph& graph);

    /// Collect the gradients of every bound parameter after a backward pass
    void pullGrad();

    /// Drop every parameter's binding, e.g. before an evaluation graph goes away
    void release();

  protected:
    std::map<std::string, std::shared_ptr<Parameter>> mParameters;
    std::map<std::string, std::shared_ptr<Module>> mSubmodules;

  private:
    void namedParametersImpl(std::vector<std::pair<std::string, std::shared_ptr<Parameter>>>& result,
                             const std::string& prefix) const;
};

}  // namespace nn
}  // namespace graft
