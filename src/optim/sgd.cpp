#include "graft/optim/sgd.h"

#include "graft/logger.h"

namespace graft {
namespace optim {

SGD::SGD(const std::vector<std::shared_ptr<nn::Parameter>>& parameters, double lr)
    : Optimizer(parameters, lr) {
    Logger::getInstance("Optim").debug("SGD over {} parameters, lr={}", mParameters.size(), lr);
}

void SGD::step() {
    for (auto& parameter : mParameters) {
        parameter->pullGrad();
        parameter->data() -= mLearningRate * parameter->grad();
    }
}

}  // namespace optim
}  // namespace graft
