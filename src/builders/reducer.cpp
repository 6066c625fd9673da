#include <iostream>
#include <stdexcept>

#include <dynet/param-init.h>

#include "builders/reducer.h"

StateReducer::StateReducer(dy::ParameterCollection& pc,
                           unsigned hidden_dim,
                           bool lstm,
                           float init_mag)
  : local_pc(pc.add_subcollection("reduce-final-st"))
  , hidden_dim(hidden_dim)
  , lstm(lstm)
{
    auto init = dy::ParameterInitUniform(-init_mag, init_mag);
    if (lstm) {
        p_W_c = registry.add(
          local_pc.add_parameters({ hidden_dim, 2 * hidden_dim }, init, "W-reduce-c"));
        p_b_c = registry.add(
          local_pc.add_parameters({ hidden_dim }, init, "b-reduce-c"));
    }
    p_W_h = registry.add(
      local_pc.add_parameters({ hidden_dim, 2 * hidden_dim }, init, "W-reduce-h"));
    p_b_h = registry.add(
      local_pc.add_parameters({ hidden_dim }, init, "b-reduce-h"));
}

void
StateReducer::new_graph(dy::ComputationGraph& cg)
{
    if (lstm) {
        W_c = dy::parameter(cg, p_W_c);
        b_c = dy::parameter(cg, p_b_c);
    }
    W_h = dy::parameter(cg, p_W_h);
    b_h = dy::parameter(cg, p_b_h);
}

std::vector<dy::Expression>
StateReducer::apply(const std::vector<dy::Expression>& fw,
                    const std::vector<dy::Expression>& bw)
{
    const size_t expected = lstm ? 2 : 1;
    if (fw.size() != expected || bw.size() != expected)
        throw std::invalid_argument("Reducer got a state of the wrong arity");

    auto h = dy::rectify(dy::affine_transform(
      { b_h, W_h, dy::concatenate({ fw.back(), bw.back() }) }));

    if (!lstm)
        return { h };

    auto c = dy::rectify(dy::affine_transform(
      { b_c, W_c, dy::concatenate({ fw.front(), bw.front() }) }));
    return { c, h };
}
