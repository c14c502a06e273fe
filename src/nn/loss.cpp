#include "graft/nn/loss.h"

#include <stdexcept>
#include <string>

namespace graft {
namespace nn {

Value mseLoss(const std::vector<Value>& predictions, const std::vector<double>& targets) {
    if (predictions.empty()) {
        throw std::runtime_error("mseLoss needs at least one prediction");
    }
    if (predictions.size() != targets.size()) {
        throw std::runtime_error("mseLoss got " + std::to_string(predictions.size()) +
                                 " predictions for " + std::to_string(targets.size()) +
                                 " targets");
    }

    Value loss = (predictions[0] - targets[0]).pow(2.0);
    for (std::size_t i = 1; i < predictions.size(); ++i) {
        loss = loss + (predictions[i] - targets[i]).pow(2.0);
    }
    return loss;
}

}  // namespace nn
}  // namespace graft
