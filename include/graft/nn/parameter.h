#pragma once

#include <cstdint>
#include <string>

#include "graft/graph.h"
#include "graft/value.h"

namespace graft {
namespace nn {

/**
 * @brief Learnable scalar that outlives the graphs it takes part in.
 *
 * Graph nodes are immutable and die with their Graph, so a model's weights are
 * kept here instead. Each training step lifts the weight into the step's Graph
 * as a labelled leaf (bind), backpropagates, then copies the leaf's gradient
 * back (pullGrad) before the optimizer updates data().
 *
 * Typical step:
 *   Graph graph;
 *   Value loss = mseLoss(model(graph, xs), ys);
 *   optimizer.zeroGrad();
 *   loss.backward();
 *   optimizer.step();  // pulls gradients, then p -= lr * grad
 */
class Parameter {
  public:
    /**
     * @brief Construct a Parameter.
     * @param data Initial value
     * @param name Label given to the leaf in every graph it is lifted into
     */
    explicit Parameter(double data = 0.0, std::string name = {});

    double& data() { return mData; }
    double data() const { return mData; }

    /// Gradient collected by pullGrad() since the last zeroGrad()
    double grad() const { return mGrad; }

    void zeroGrad() { mGrad = 0.0; }

    const std::string& name() const { return mName; }
    void setName(std::string name) { mName = std::move(name); }

    /**
     * @brief Leaf holding this parameter in graph.
     *
     * The first call for a given graph generation records the leaf; later calls
     * return the same handle so every use of the weight shares one node.
     */
    Value bind(Graph& graph);

    /// True if a leaf was recorded in this exact graph generation
    bool isBoundTo(const Graph& graph) const;

    /**
     * @brief Add the bound leaf's gradient to grad().
     *
     * Reads each binding at most once, so calling it again before the next
     * bind() on a new graph is a no-op. The bound graph must still be alive.
     */
    void pullGrad();

    /// Forget the current binding, so a graph about to be destroyed is never read
    void release();

    // ========================================================================
    // Factory methods
    // ========================================================================

    static Parameter zeros(std::string name = {});

    /// Uniform in [low, high) from the shared generator
    static Parameter uniform(double low = -1.0, double high = 1.0, std::string name = {});

    /// Seed the generator used by uniform()
    static void manualSeed(std::uint64_t seed);

  private:
    double mData;
    double mGrad = 0.0;
    std::string mName;

    Value mBound;
    std::uint64_t mBoundSerial = 0;
    bool mPulled = true;
};

}  // namespace nn
}  // namespace graft
