#include "graft/nn/parameter.h"

#include <random>
#include <utility>

namespace graft {
namespace nn {

namespace {

std::mt19937_64& generator() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

}  // namespace

Parameter::Parameter(double data, std::string name) : mData(data), mName(std::move(name)) {}

Value Parameter::bind(Graph& graph) {
    if (!isBoundTo(graph)) {
        mBound = graph.leaf(mData, mName);
        mBoundSerial = graph.serial();
        mPulled = false;
    }
    return mBound;
}

bool Parameter::isBoundTo(const Graph& graph) const {
    return mBound.valid() && mBoundSerial == graph.serial();
}

void Parameter::pullGrad() {
    if (mPulled || !mBound.valid()) {
        return;
    }
    mGrad += mBound.grad();
    mPulled = true;
}

void Parameter::release() {
    mBound = Value();
    mBoundSerial = 0;
    mPulled = true;
}

// ============================================================================
// Factory methods
// ============================================================================

Parameter Parameter::zeros(std::string name) {
    return Parameter(0.0, std::move(name));
}

Parameter Parameter::uniform(double low, double high, std::string name) {
    std::uniform_real_distribution<double> dist(low, high);
    return Parameter(dist(generator()), std::move(name));
}

void Parameter::manualSeed(std::uint64_t seed) {
    generator().seed(seed);
}

}  // namespace nn
}  // namespace graft
