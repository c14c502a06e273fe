#include <iostream>

#include "graft/graft.h"

using graft::Graph;
using graft::Logger;
using graft::LogLevel;
using graft::Value;

int main() {
    Logger::setMinLogLevel(LogLevel::DEBUG);

    auto& logger = Logger::getInstance("Demo");
    logger.info("Two-input tanh neuron");

    Graph graph({.checkFinite = false, .name = "neuron"});

    // inputs x1, x2
    Value x1 = graph.leaf(2.0, "x1");
    Value x2 = graph.leaf(0.0, "x2");
    // weights w1, w2
    Value w1 = graph.leaf(-3.0, "w1");
    Value w2 = graph.leaf(1.0, "w2");
    // bias, chosen so that o comes out at 1/sqrt(2)
    Value b = graph.leaf(6.8813735870195432, "b");

    Value x1w1 = (x1 * w1).setLabel("x1*w1");
    Value x2w2 = (x2 * w2).setLabel("x2*w2");
    Value n = (x1w1 + x2w2 + b).setLabel("n");
    Value o = n.tanh().setLabel("o");

    o.backward();

    logger.info("o = {:.6f} over {} nodes", o.data(), graph.size());
    for (const Value& v : {x1, w1, x2, w2, b, n}) {
        logger.info("d{}/d{} = {:.6f}", o.label(), v.label(), v.grad());
    }

    // Same neuron with tanh spelled out through exp, gradients must agree
    Graph expanded({.checkFinite = false, .name = "neuron-exp"});
    Value ex1 = expanded.leaf(2.0, "x1");
    Value ex2 = expanded.leaf(0.0, "x2");
    Value ew1 = expanded.leaf(-3.0, "w1");
    Value ew2 = expanded.leaf(1.0, "w2");
    Value eb = expanded.leaf(6.8813735870195432, "b");
    Value en = ex1 * ew1 + ex2 * ew2 + eb;
    Value e = (2.0 * en).exp();
    Value eo = (e - 1.0) / (e + 1.0);
    eo.backward();
    logger.info("exp form: o = {:.6f}, dx1 = {:.6f}, dw1 = {:.6f}", eo.data(), ex1.grad(),
                ew1.grad());

    Logger::flush();
    std::cout << graft::viz::toDot(o);

    Logger::shutdown();
    return 0;
}
