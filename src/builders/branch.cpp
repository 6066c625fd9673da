#include <stdexcept>

#include <dynet/param-init.h>

#include "builders/branch.h"
#include "utils.h"

namespace dy = dynet;

namespace {

void
require(bool cond, const BranchSettings& s, const std::string& msg)
{
    if (!cond)
        throw std::invalid_argument("Encoder branch '" + s.name + "': " + msg);
}

std::unique_ptr<BiRNNBuilder>
make_birnn(dy::ParameterCollection& pc, const BranchSettings& s, unsigned input_dim)
{
    BiRNNSettings rnn_settings{ s.stacked ? 2u : 1u, s.hidden_dim, s.lstm };
    return std::make_unique<BiRNNBuilder>(pc, rnn_settings, input_dim, "birnn");
}

/* BiRNN over the first `length` columns, zero-padded back to T columns */
BranchOutput
run_birnn(BiRNNBuilder& birnn,
          const std::vector<dy::Expression>& cols,
          unsigned length)
{
    const unsigned T = cols.size();
    std::vector<dy::Expression> tokens(cols.begin(), cols.begin() + length);
    auto outputs = birnn(tokens);

    BranchOutput out;
    out.states = dy::concatenate_cols(outputs);
    if (length < T) {
        auto& cg = *out.states.pg;
        out.states = dy::concatenate_cols(
          { out.states, dy::zeros(cg, { birnn.output_rows(), T - length }) });
    }
    out.fw_final = birnn.fw_final;
    out.bw_final = birnn.bw_final;
    return out;
}

std::vector<dy::Expression>
columns(const dy::Expression& X, unsigned n)
{
    std::vector<dy::Expression> cols(n);
    for (unsigned t = 0; t < n; ++t)
        cols[t] = dy::pick(X, t, 1);
    return cols;
}

const GraphExprs&
require_graph(const GraphExprs* graph, const BranchSettings& s)
{
    require(graph != nullptr, s, "GCN needs a dependency graph");
    return *graph;
}

}

BranchSettings
make_branch_settings(const HParams& hps, bool query)
{
    BranchSettings s;
    s.name = query ? "query" : "article";
    s.emb_dim = hps.emb_dim;
    s.hidden_dim = hps.hidden_dim;
    s.rnn = query ? !hps.no_lstm_query_encoder : !hps.no_lstm_encoder;
    s.lstm = hps.use_lstm;
    s.stacked = !query && hps.stacked_lstm;

    s.gcn.dim = query ? hps.query_gcn_dim : hps.word_gcn_dim;
    s.gcn.layers = query ? hps.query_gcn_layers : hps.word_gcn_layers;
    s.gcn.labels = hps.use_label_information ? hps.num_word_dependency_labels : 1;
    s.gcn.gating = query ? hps.query_gcn_gating : hps.word_gcn_gating;
    s.gcn.skip = query ? hps.query_gcn_skip : hps.word_gcn_skip;
    s.gcn.normalize = hps.gcn_normalization;
    s.gcn.keep_prob = query ? hps.query_gcn_dropout : hps.word_gcn_dropout;

    s.concat_with_word_embedding = hps.concat_with_word_embedding;
    s.project_word_concat = !query;
    s.concat_gcn_lstm = hps.concat_gcn_lstm;
    s.simple_concat = hps.simple_concat;
    s.init_std = hps.trunc_norm_init_std;
    return s;
}

/*
 * RNN only
 */

RNNBranch::RNNBranch(dy::ParameterCollection& pc, const BranchSettings& settings)
  : EncoderBranch{ settings }
  , local_pc{ pc.add_subcollection(settings.name) }
{
    if (settings.rnn) {
        birnn = make_birnn(local_pc, settings, settings.emb_dim);
        registry.extend(birnn->registry);
    }
}

void
RNNBranch::new_graph(dy::ComputationGraph& cg, bool training)
{
    if (birnn)
        birnn->new_graph(cg, training, /*update=*/true);
}

BranchOutput
RNNBranch::encode(const std::vector<dy::Expression>& embeds,
                  unsigned length,
                  const GraphExprs*)
{
    if (birnn)
        return run_birnn(*birnn, embeds, length);

    BranchOutput out;
    out.states = dy::concatenate_cols(embeds);
    return out;
}

unsigned
RNNBranch::output_rows() const
{
    return birnn ? birnn->output_rows() : settings.emb_dim;
}

/*
 * GCN after RNN
 */

GCNAfterRNNBranch::GCNAfterRNNBranch(dy::ParameterCollection& pc,
                                     const BranchSettings& settings)
  : EncoderBranch{ settings }
  , local_pc{ pc.add_subcollection(settings.name) }
{
    const unsigned enc_dim = 2 * settings.hidden_dim;
    auto zero = dy::ParameterInitConst(0.f);

    unsigned in_dim = settings.emb_dim;
    if (settings.rnn) {
        birnn = make_birnn(local_pc, settings, settings.emb_dim);
        registry.extend(birnn->registry);
        in_dim = birnn->output_rows();
    }

    if (settings.concat_with_word_embedding) {
        require(settings.rnn, settings,
                "blending embeddings into the GCN input needs the recurrent encoder");
        p_b_highway = local_pc.add_parameters({ 1 }, zero, "b-highway");
        adjust_emb = settings.emb_dim != enc_dim;
        if (adjust_emb)
            p_W_adjust = registry.add(
              local_pc.add_parameters({ enc_dim, settings.emb_dim }, 0, "W-adjust"));
    }

    gcn = std::make_unique<GCNBuilder>(local_pc, settings.gcn, in_dim, "gcn");
    registry.extend(gcn->registry);

    if (settings.concat_gcn_lstm) {
        require(settings.rnn, settings,
                "fusing GCN and recurrent states needs the recurrent encoder");
        p_b_upper = local_pc.add_parameters({ 1 }, zero, "b-upper-concat");
        adjust_gcn = settings.gcn.dim != enc_dim;
        if (adjust_gcn)
            p_W_adjust_upper = registry.add(local_pc.add_parameters(
              { enc_dim, settings.gcn.dim }, 0, "W-adjust-upper-concat"));
    }
}

void
GCNAfterRNNBranch::new_graph(dy::ComputationGraph& cg, bool training)
{
    if (birnn)
        birnn->new_graph(cg, training, /*update=*/true);
    gcn->new_graph(cg, training);

    if (settings.concat_with_word_embedding) {
        b_highway = dy::parameter(cg, p_b_highway);
        if (adjust_emb)
            W_adjust = dy::parameter(cg, p_W_adjust);
    }
    if (settings.concat_gcn_lstm) {
        b_upper = dy::parameter(cg, p_b_upper);
        if (adjust_gcn)
            W_adjust_upper = dy::parameter(cg, p_W_adjust_upper);
    }
}

BranchOutput
GCNAfterRNNBranch::encode(const std::vector<dy::Expression>& embeds,
                          unsigned length,
                          const GraphExprs* graph)
{
    auto&& g = require_graph(graph, settings);
    auto X = dy::concatenate_cols(embeds);

    BranchOutput out;
    if (birnn)
        out = run_birnn(*birnn, embeds, length);
    else
        out.states = X;
    auto H = out.states;

    auto gcn_in = H;
    if (settings.concat_with_word_embedding) {
        auto E = adjust_emb ? W_adjust * X : X;
        gcn_in = convex(b_highway, E, H);
    }

    auto G = gcn->apply(gcn_in, g);

    if (settings.concat_gcn_lstm) {
        if (adjust_gcn)
            G = W_adjust_upper * G;
        out.states = convex(b_upper, H, G);
    } else {
        out.states = G;
    }
    return out;
}

unsigned
GCNAfterRNNBranch::output_rows() const
{
    if (settings.concat_gcn_lstm)
        return 2 * settings.hidden_dim;
    return gcn->output_rows();
}

/*
 * GCN in parallel with RNN
 */

GCNParallelBranch::GCNParallelBranch(dy::ParameterCollection& pc,
                                     const BranchSettings& settings)
  : EncoderBranch{ settings }
  , local_pc{ pc.add_subcollection(settings.name) }
{
    const unsigned enc_dim = 2 * settings.hidden_dim;

    if (settings.rnn) {
        birnn = make_birnn(local_pc, settings, settings.emb_dim);
        registry.extend(birnn->registry);
    }

    gcn = std::make_unique<GCNBuilder>(local_pc, settings.gcn, settings.emb_dim, "gcn");
    registry.extend(gcn->registry);

    if (settings.concat_gcn_lstm) {
        require(settings.rnn, settings,
                "fusing GCN and recurrent states needs the recurrent encoder");
        if (!settings.simple_concat) {
            p_b_upper = local_pc.add_parameters(
              { 1 }, dy::ParameterInitConst(0.f), "b-upper-concat");
            adjust_gcn = settings.gcn.dim != enc_dim;
            if (adjust_gcn)
                p_W_adjust_upper = registry.add(local_pc.add_parameters(
                  { enc_dim, settings.gcn.dim }, 0, "W-adjust-upper-concat"));
        }
    }
}

void
GCNParallelBranch::new_graph(dy::ComputationGraph& cg, bool training)
{
    if (birnn)
        birnn->new_graph(cg, training, /*update=*/true);
    gcn->new_graph(cg, training);

    if (settings.concat_gcn_lstm && !settings.simple_concat) {
        b_upper = dy::parameter(cg, p_b_upper);
        if (adjust_gcn)
            W_adjust_upper = dy::parameter(cg, p_W_adjust_upper);
    }
}

BranchOutput
GCNParallelBranch::encode(const std::vector<dy::Expression>& embeds,
                          unsigned length,
                          const GraphExprs* graph)
{
    auto&& g = require_graph(graph, settings);
    auto X = dy::concatenate_cols(embeds);

    BranchOutput out;
    if (birnn)
        out = run_birnn(*birnn, embeds, length);

    auto G = gcn->apply(X, g);

    if (!settings.concat_gcn_lstm) {
        out.states = G;
    } else if (settings.simple_concat) {
        out.states = dy::concatenate({ out.states, G });
    } else {
        if (adjust_gcn)
            G = W_adjust_upper * G;
        out.states = convex(b_upper, out.states, G);
    }
    return out;
}

unsigned
GCNParallelBranch::output_rows() const
{
    if (!settings.concat_gcn_lstm)
        return gcn->output_rows();
    if (settings.simple_concat)
        return 2 * settings.hidden_dim + gcn->output_rows();
    return 2 * settings.hidden_dim;
}

/*
 * GCN before RNN
 */

GCNBeforeRNNBranch::GCNBeforeRNNBranch(dy::ParameterCollection& pc,
                                       const BranchSettings& settings)
  : EncoderBranch{ settings }
  , local_pc{ pc.add_subcollection(settings.name) }
{
    require(settings.rnn, settings, "a GCN before the encoder needs the encoder");

    const unsigned enc_dim = 2 * settings.hidden_dim;
    const unsigned gcn_dim = settings.gcn.dim;
    const float init_std = settings.init_std;
    auto zero = dy::ParameterInitConst(0.f);

    gcn = std::make_unique<GCNBuilder>(local_pc, settings.gcn, settings.emb_dim, "gcn");
    registry.extend(gcn->registry);

    rnn_in_dim = gcn_dim;
    if (settings.concat_with_word_embedding) {
        if (settings.project_word_concat) {
            p_W_word = registry.add(local_pc.add_parameters(
              { gcn_dim, settings.emb_dim + gcn_dim },
          truncated_normal_init({ gcn_dim, settings.emb_dim + gcn_dim }, init_std),
          "W-word"));
            p_b_word = registry.add(local_pc.add_parameters({ gcn_dim }, zero, "b-word"));
        } else {
            rnn_in_dim = settings.emb_dim + gcn_dim;
        }
    }

    birnn = make_birnn(local_pc, settings, rnn_in_dim);
    registry.extend(birnn->registry);

    if (settings.concat_gcn_lstm && !settings.simple_concat) {
        p_W_gcn_lstm = registry.add(local_pc.add_parameters(
          { enc_dim, enc_dim + rnn_in_dim },
          truncated_normal_init({ enc_dim, enc_dim + rnn_in_dim }, init_std),
          "W-gcn-lstm"));
        p_b_gcn_lstm = registry.add(
          local_pc.add_parameters({ enc_dim }, zero, "b-gcn-lstm"));
    }
}

void
GCNBeforeRNNBranch::new_graph(dy::ComputationGraph& cg, bool training)
{
    gcn->new_graph(cg, training);
    birnn->new_graph(cg, training, /*update=*/true);

    if (settings.concat_with_word_embedding && settings.project_word_concat) {
        W_word = dy::parameter(cg, p_W_word);
        b_word = dy::parameter(cg, p_b_word);
    }
    if (settings.concat_gcn_lstm && !settings.simple_concat) {
        W_gcn_lstm = dy::parameter(cg, p_W_gcn_lstm);
        b_gcn_lstm = dy::parameter(cg, p_b_gcn_lstm);
    }
}

BranchOutput
GCNBeforeRNNBranch::encode(const std::vector<dy::Expression>& embeds,
                           unsigned length,
                           const GraphExprs* graph)
{
    auto&& g = require_graph(graph, settings);
    const unsigned T = embeds.size();
    auto X = dy::concatenate_cols(embeds);

    auto G = gcn->apply(X, g);
    if (settings.concat_with_word_embedding) {
        G = dy::concatenate({ X, G });
        if (settings.project_word_concat)
            G = dy::rectify(dy::affine_transform({ b_word, W_word, G }));
    }

    auto out = run_birnn(*birnn, columns(G, T), length);

    if (settings.concat_gcn_lstm) {
        auto HG = dy::concatenate({ out.states, G });
        if (settings.simple_concat)
            out.states = HG;
        else
            out.states = dy::rectify(
              dy::affine_transform({ b_gcn_lstm, W_gcn_lstm, HG }));
    }
    return out;
}

unsigned
GCNBeforeRNNBranch::output_rows() const
{
    if (settings.concat_gcn_lstm && settings.simple_concat)
        return 2 * settings.hidden_dim + rnn_in_dim;
    return 2 * settings.hidden_dim;
}

std::unique_ptr<EncoderBranch>
make_branch(dy::ParameterCollection& pc,
            Topology topology,
            const BranchSettings& settings)
{
    switch (topology) {
        case Topology::RNN_ONLY:
            return std::make_unique<RNNBranch>(pc, settings);
        case Topology::GCN_AFTER_RNN:
            return std::make_unique<GCNAfterRNNBranch>(pc, settings);
        case Topology::GCN_PARALLEL:
            return std::make_unique<GCNParallelBranch>(pc, settings);
        case Topology::GCN_BEFORE_RNN:
            return std::make_unique<GCNBeforeRNNBranch>(pc, settings);
    }
    throw std::invalid_argument("Unknown topology");
}
