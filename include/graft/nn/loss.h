#pragma once

#include <vector>

#include "graft/value.h"

namespace graft {
namespace nn {

/**
 * @brief Sum of squared errors: sum_i (predictions[i] - targets[i]) ** 2
 *
 * @throws std::runtime_error if the sizes differ or predictions is empty
 */
Value mseLoss(const std::vector<Value>& predictions, const std::vector<double>& targets);

}  // namespace nn
}  // namespace graft
