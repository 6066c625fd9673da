#pragma once

/* Reduce the final forward and backward encoder states to a single
 * decoder initial state: relu(W [fw; bw] + b), separately for the memory
 * and hidden components of an LSTM state. */

#include <vector>

#include <dynet/model.h>
#include <dynet/expr.h>

#include "builders/registry.h"

namespace dy = dynet;

struct StateReducer
{
    StateReducer(dy::ParameterCollection& pc,
                 unsigned hidden_dim,
                 bool lstm,
                 float init_mag);

    void new_graph(dy::ComputationGraph& cg);

    /* fw, bw: {c, h} for an LSTM, {h} otherwise */
    std::vector<dy::Expression> apply(const std::vector<dy::Expression>& fw,
                                      const std::vector<dy::Expression>& bw);

    dy::ParameterCollection local_pc;
    ParamRegistry registry;
    unsigned hidden_dim;
    bool lstm;

    dy::Parameter p_W_c, p_b_c, p_W_h, p_b_h;
    dy::Expression W_c, b_c, W_h, b_h;
};
