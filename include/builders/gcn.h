#pragma once

/* Label-aware graph convolution over dependency arcs
 * (Marcheggiani & Titov, 2017), with an optional gated self loop,
 * degree normalization and a learned residual connection. */

#include <iostream>
#include <vector>

#include <dynet/model.h>
#include <dynet/expr.h>

#include "builders/adjmatrix.h"
#include "builders/registry.h"

namespace dy = dynet;

struct GCNSettings
{
    unsigned dim;
    unsigned layers;
    unsigned labels;
    bool gating;
    bool skip;
    bool normalize;
    float keep_prob;
};

struct GCNParams {

    GCNParams(dy::ParameterCollection& pc,
              unsigned dim_in,
              unsigned dim_out,
              const GCNSettings& settings,
              ParamRegistry& registry);

    std::vector<dy::Parameter> W_in;
    std::vector<dy::Parameter> W_out;
    dy::Parameter W_loop;
    dy::Parameter b_out;
    dy::Parameter b_layer;

    dy::Parameter w_gloop;
    dy::Parameter b_gloop;
    dy::Parameter W_adjust;

    bool gating;
    bool adjust;
};

struct GCNExprs {

    GCNExprs() = default;
    GCNExprs(dy::ComputationGraph& cg, const GCNParams& params);

    std::vector<dy::Expression> W_in;
    std::vector<dy::Expression> W_out;
    dy::Expression W_loop;
    dy::Expression b_out;
    dy::Expression b_layer;

    dy::Expression w_gloop;
    dy::Expression b_gloop;
    dy::Expression W_adjust;
};


struct GCNBuilder
{
    GCNBuilder(dy::ParameterCollection& pc,
               const GCNSettings& settings,
               unsigned dim_in,
               const std::string& name = "gcn");

    void new_graph(dy::ComputationGraph& cg, bool training);

    /* input: dim_in x n node features; returns dim x n */
    dy::Expression apply(const dy::Expression& input, const GraphExprs& graph);

    unsigned output_rows() const { return settings.dim; }

    const GCNSettings settings;
    dy::ParameterCollection local_pc;
    ParamRegistry registry;
    std::vector<GCNParams> params;
    std::vector<GCNExprs> exprs;
    bool _training = true;
};
