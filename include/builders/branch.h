#pragma once

/* Encoder branches: how recurrent and graph-convolutional encoders are
 * stacked over one input sequence (the article or the query). */

#include <memory>
#include <string>
#include <vector>

#include <dynet/model.h>
#include <dynet/expr.h>

#include "hparams.h"
#include "builders/adjmatrix.h"
#include "builders/bilstm.h"
#include "builders/gcn.h"
#include "builders/registry.h"

namespace dy = dynet;

struct BranchSettings
{
    std::string name;
    unsigned emb_dim;
    unsigned hidden_dim;
    bool rnn;
    bool lstm;
    bool stacked;
    GCNSettings gcn;
    bool concat_with_word_embedding;
    bool project_word_concat;  // GCN before RNN: W-word over [emb; gcn]
    bool concat_gcn_lstm;
    bool simple_concat;
    float init_std;
};

BranchSettings make_branch_settings(const HParams& hps, bool query);

struct BranchOutput
{
    dy::Expression states;  // output_rows() x T
    std::vector<dy::Expression> fw_final;  // empty without a recurrent encoder
    std::vector<dy::Expression> bw_final;

    bool has_final() const { return !fw_final.empty(); }
};

struct EncoderBranch
{
    explicit EncoderBranch(const BranchSettings& settings) : settings(settings) {}
    virtual ~EncoderBranch() = default;

    virtual void new_graph(dy::ComputationGraph& cg, bool training) = 0;

    /* embeds: T padded columns, of which the first `length` are tokens.
     * graph may be null for branches without a GCN. */
    virtual BranchOutput encode(const std::vector<dy::Expression>& embeds,
                                unsigned length,
                                const GraphExprs* graph) = 0;

    virtual unsigned output_rows() const = 0;
    virtual Topology topology() const = 0;
    virtual bool has_rnn() const { return settings.rnn; }

    const BranchSettings settings;
    ParamRegistry registry;
};

/* BiRNN over the embeddings, or the embeddings themselves. */
struct RNNBranch : EncoderBranch
{
    RNNBranch(dy::ParameterCollection& pc, const BranchSettings& settings);

    void new_graph(dy::ComputationGraph& cg, bool training) override;
    BranchOutput encode(const std::vector<dy::Expression>& embeds,
                        unsigned length,
                        const GraphExprs* graph) override;
    unsigned output_rows() const override;
    Topology topology() const override { return Topology::RNN_ONLY; }

    dy::ParameterCollection local_pc;
    std::unique_ptr<BiRNNBuilder> birnn;
};

/* GCN over the BiRNN states, optionally blended with the embeddings on
 * the way in and with the BiRNN states on the way out. */
struct GCNAfterRNNBranch : EncoderBranch
{
    GCNAfterRNNBranch(dy::ParameterCollection& pc, const BranchSettings& settings);

    void new_graph(dy::ComputationGraph& cg, bool training) override;
    BranchOutput encode(const std::vector<dy::Expression>& embeds,
                        unsigned length,
                        const GraphExprs* graph) override;
    unsigned output_rows() const override;
    Topology topology() const override { return Topology::GCN_AFTER_RNN; }

    dy::ParameterCollection local_pc;
    std::unique_ptr<BiRNNBuilder> birnn;
    std::unique_ptr<GCNBuilder> gcn;

    bool adjust_emb = false;
    bool adjust_gcn = false;
    dy::Parameter p_b_highway, p_W_adjust, p_b_upper, p_W_adjust_upper;
    dy::Expression b_highway, W_adjust, b_upper, W_adjust_upper;
};

/* GCN and BiRNN side by side over the embeddings. */
struct GCNParallelBranch : EncoderBranch
{
    GCNParallelBranch(dy::ParameterCollection& pc, const BranchSettings& settings);

    void new_graph(dy::ComputationGraph& cg, bool training) override;
    BranchOutput encode(const std::vector<dy::Expression>& embeds,
                        unsigned length,
                        const GraphExprs* graph) override;
    unsigned output_rows() const override;
    Topology topology() const override { return Topology::GCN_PARALLEL; }

    dy::ParameterCollection local_pc;
    std::unique_ptr<BiRNNBuilder> birnn;
    std::unique_ptr<GCNBuilder> gcn;

    bool adjust_gcn = false;
    dy::Parameter p_b_upper, p_W_adjust_upper;
    dy::Expression b_upper, W_adjust_upper;
};

/* GCN over the embeddings feeding the BiRNN. */
struct GCNBeforeRNNBranch : EncoderBranch
{
    GCNBeforeRNNBranch(dy::ParameterCollection& pc, const BranchSettings& settings);

    void new_graph(dy::ComputationGraph& cg, bool training) override;
    BranchOutput encode(const std::vector<dy::Expression>& embeds,
                        unsigned length,
                        const GraphExprs* graph) override;
    unsigned output_rows() const override;
    Topology topology() const override { return Topology::GCN_BEFORE_RNN; }

    dy::ParameterCollection local_pc;
    std::unique_ptr<GCNBuilder> gcn;
    std::unique_ptr<BiRNNBuilder> birnn;
    unsigned rnn_in_dim;

    dy::Parameter p_W_word, p_b_word, p_W_gcn_lstm, p_b_gcn_lstm;
    dy::Expression W_word, b_word, W_gcn_lstm, b_gcn_lstm;
};

std::unique_ptr<EncoderBranch> make_branch(dy::ParameterCollection& pc,
                                           Topology topology,
                                           const BranchSettings& settings);
