#include <stdexcept>
#include <string>

#include <dynet/param-init.h>

#include "builders/gcn.h"
#include "utils.h"

namespace dy = dynet;

GCNParams::GCNParams(dy::ParameterCollection& pc,
                     unsigned dim_in,
                     unsigned dim_out,
                     const GCNSettings& settings,
                     ParamRegistry& registry)
  : W_loop{ registry.add(pc.add_parameters({ dim_out, dim_in }, 0, "W-loop")) }
  , b_out{ registry.add(pc.add_parameters(
      { dim_out }, dy::ParameterInitConst(0.f), "b-out")) }
  , b_layer{ registry.add(pc.add_parameters(
      { 1 }, dy::ParameterInitConst(0.f), "b-layer")) }
  , gating{ settings.gating }
  , adjust{ settings.skip && dim_in != dim_out }
{
    for (unsigned l = 0; l < settings.labels; ++l) {
        auto suffix = std::to_string(l);
        W_in.push_back(registry.add(
          pc.add_parameters({ dim_out, dim_in }, 0, "W-in-" + suffix)));
        W_out.push_back(registry.add(
          pc.add_parameters({ dim_out, dim_in }, 0, "W-out-" + suffix)));
    }

    if (gating) {
        w_gloop = registry.add(pc.add_parameters({ 1, dim_in }, 0, "w-gloop"));
        b_gloop = registry.add(pc.add_parameters(
          { 1 }, dy::ParameterInitConst(0.f), "b-gloop"));
    }

    if (adjust)
        W_adjust = registry.add(
          pc.add_parameters({ dim_out, dim_in }, 0, "W-adjust"));
}

GCNExprs::GCNExprs(dy::ComputationGraph& cg, const GCNParams& params)
{
    for (auto&& W : params.W_in)
        W_in.push_back(dy::parameter(cg, W));
    for (auto&& W : params.W_out)
        W_out.push_back(dy::parameter(cg, W));
    W_loop = dy::parameter(cg, params.W_loop);
    b_out = dy::parameter(cg, params.b_out);
    b_layer = dy::parameter(cg, params.b_layer);

    if (params.gating) {
        w_gloop = dy::parameter(cg, params.w_gloop);
        b_gloop = dy::parameter(cg, params.b_gloop);
    }
    if (params.adjust)
        W_adjust = dy::parameter(cg, params.W_adjust);
}

GCNBuilder::GCNBuilder(dy::ParameterCollection& pc,
                       const GCNSettings& settings,
                       unsigned dim_in,
                       const std::string& name)
  : settings(settings)
  , local_pc(pc.add_subcollection(name))
  , exprs{ settings.layers }
{
    if (settings.labels == 0)
        throw std::invalid_argument("GCN needs at least one label");
    if (settings.keep_prob <= 0.f || settings.keep_prob > 1.f)
        throw std::invalid_argument("GCN keep probability must be in (0, 1]");

    params.reserve(settings.layers);
    unsigned dim = dim_in;
    for (unsigned i = 0; i < settings.layers; ++i) {
        params.push_back(GCNParams(local_pc, dim, settings.dim, settings, registry));
        dim = settings.dim;
    }

    std::cerr << "Graph Convolutional Network (" << name << ")\n"
              << " input dim: " << dim_in << "\n"
              << "   gcn dim: " << settings.dim << "\n"
              << "    layers: " << settings.layers << "\n"
              << "    labels: " << settings.labels << "\n"
              << "    gating: " << settings.gating << "\n"
              << "      skip: " << settings.skip << "\n"
              << " normalize: " << settings.normalize << "\n"
              << "      keep: " << settings.keep_prob << "\n"
              << std::endl;
}

void
GCNBuilder::new_graph(dy::ComputationGraph& cg, bool training)
{
    _training = training;
    for (unsigned i = 0; i < settings.layers; ++i)
        exprs.at(i) = GCNExprs(cg, params.at(i));
}

dy::Expression
GCNBuilder::apply(const dy::Expression& input, const GraphExprs& graph)
{
    if (settings.layers == 0)
        return input;

    if (graph.n_labels() != settings.labels)
        throw std::invalid_argument("Graph label count does not match GCN");

    const unsigned n = graph.n_nodes;
    const bool drop = _training && settings.keep_prob < 1.f;
    const float rate = 1.f - settings.keep_prob;

    auto h = input;
    for (auto i = 0u; i < settings.layers; ++i) {
        auto&& ex = exprs.at(i);

        // self loop, the only gated contribution
        auto act = ex.W_loop * h;
        if (drop)
            act = dy::dropout(act, rate);
        if (params.at(i).gating) {
            auto gate = dy::logistic(
              dy::affine_transform({ ex.b_gloop, ex.w_gloop, h }));
            act = scale_cols(act, gate);
        }

        for (unsigned l = 0; l < settings.labels; ++l) {
            auto in_t = (ex.W_in[l] * h) * graph.in_t[l];
            auto out_t = (ex.W_out[l] * h) * graph.out_t[l];
            if (drop) {
                in_t = dy::dropout(in_t, rate);
                out_t = dy::dropout(out_t, rate);
            }
            act = act + in_t + out_t;
        }

        act = dy::colwise_add(act, ex.b_out);

        if (settings.normalize)
            act = dy::cdiv(act, broadcast(graph.degree, { settings.dim, n }));

        auto h_next = dy::rectify(act);

        if (settings.skip) {
            auto h_in = params.at(i).adjust ? ex.W_adjust * h : h;
            h_next = convex(ex.b_layer, h_in, h_next);
        }

        h = h_next;
    }

    return h;
}
