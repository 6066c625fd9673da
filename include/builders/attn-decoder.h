#pragma once

/* Attention decoder in the style of See et al. (2017): Bahdanau attention
 * over encoder states with an optional coverage feature, an optional
 * second (coverage-free) attention over query states, and a
 * generation probability for the copy mechanism. */

#include <memory>
#include <vector>

#include <dynet/model.h>
#include <dynet/expr.h>
#include <dynet/rnn.h>

#include "builders/registry.h"

namespace dy = dynet;

struct AttnDecoderSettings
{
    unsigned emb_dim;
    unsigned hidden_dim;
    unsigned enc_dim;
    unsigned query_dim;  // 0 when there is no query memory
    bool lstm;
    bool pointer_gen;
    bool coverage;
};

/* One attention memory: states are columns. */
struct AttnMemory
{
    dy::Expression states;    // dim x T
    dy::Expression features;  // attn dim x T
    dy::Expression mask;      // {T}
    unsigned length = 0;
};

struct DecoderOutput
{
    std::vector<dy::Expression> outputs;
    std::vector<dy::Expression> state;
    std::vector<dy::Expression> attn_dists;
    std::vector<dy::Expression> query_attn_dists;
    std::vector<dy::Expression> p_gens;
    dy::Expression coverage;
    bool has_coverage = false;
};

struct AttnDecoderBuilder
{
    AttnDecoderBuilder(dy::ParameterCollection& pc,
                       const AttnDecoderSettings& settings);

    void new_graph(dy::ComputationGraph& cg, bool training);

    AttnMemory memory(const dy::Expression& states, const std::vector<float>& mask);
    AttnMemory query_memory(const dy::Expression& states,
                            const std::vector<float>& mask);

    /* Run the decoder over `inputs`. With initial_state_attention (single
     * step decoding) the first context comes from the initial state, and
     * only that attention updates the coverage. prev_coverage may be null. */
    DecoderOutput run(const std::vector<dy::Expression>& inputs,
                      const std::vector<dy::Expression>& init_state,
                      const AttnMemory& enc,
                      const AttnMemory* query,
                      const dy::Expression* prev_coverage,
                      bool initial_state_attention);

    /* number of state vectors: {c, h} or {h} */
    unsigned state_size() const { return settings.lstm ? 2 : 1; }

    const AttnDecoderSettings settings;
    dy::ParameterCollection local_pc;
    ParamRegistry registry;
    std::unique_ptr<dy::RNNBuilder> cell;

    private:

    std::pair<dy::Expression, dy::Expression>
    attend(const AttnMemory& mem,
           const dy::Expression& state,
           const dy::Expression* coverage,
           bool query);

    dy::ComputationGraph* cg_ = nullptr;

    dy::Parameter p_W_h, p_W_s, p_b_s, p_v, p_w_c;
    dy::Parameter p_Wq_h, p_Wq_s, p_bq_s, p_vq;
    dy::Parameter p_W_x, p_b_x;
    dy::Parameter p_w_gen, p_b_gen;
    dy::Parameter p_W_o, p_b_o;

    dy::Expression W_h, W_s, b_s, v, w_c;
    dy::Expression Wq_h, Wq_s, bq_s, vq;
    dy::Expression W_x, b_x;
    dy::Expression w_gen, b_gen;
    dy::Expression W_o, b_o;
};
