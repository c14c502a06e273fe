#pragma once

#include "graft/autograd/engine.h"
#include "graft/autograd/node.h"
#include "graft/autograd/ops.h"
#include "graft/errors.h"
#include "graft/graph.h"
#include "graft/logger.h"
#include "graft/value.h"
#include "graft/viz/trace.h"
