#pragma once

/* Vocabulary projection and the pointer-generator mixture. */

#include <vector>

#include <dynet/model.h>
#include <dynet/expr.h>

#include "builders/registry.h"

namespace dy = dynet;

/* scores = W h + v, one weight holder shared by every decoder step */
struct VocabProjection
{
    VocabProjection(dy::ParameterCollection& pc,
                    unsigned hidden_dim,
                    unsigned vocab_size,
                    float init_std);

    void new_graph(dy::ComputationGraph& cg);
    dy::Expression scores(const dy::Expression& output) const;

    dy::ParameterCollection local_pc;
    ParamRegistry registry;
    dy::Parameter p_W, p_v;
    dy::Expression W, v;
};

/*
 * Mixes p_gen * P_vocab with (1 - p_gen) * attention scattered onto the
 * extended vocabulary of one example. Attention on encoder positions that
 * share an id accumulates. Built once per example, reused at every step.
 */
struct CopyDistribution
{
    CopyDistribution(dy::ComputationGraph& cg,
                     const std::vector<unsigned>& enc_ext_ids,
                     unsigned vocab_size,
                     unsigned max_oovs);

    unsigned extended_size() const { return vocab_size + max_oovs; }

    /* attention mass per distinct id, in the order of `ids` */
    dy::Expression copy_mass(const dy::Expression& attn) const;

    /* full distribution over the extended vocabulary */
    dy::Expression final_dist(const dy::Expression& vocab_dist,
                              const dy::Expression& attn,
                              const dy::Expression& p_gen) const;

    /* the entry of final_dist at `target`, without building the rest */
    dy::Expression gold_prob(const dy::Expression& vocab_dist,
                             const dy::Expression& attn,
                             const dy::Expression& p_gen,
                             unsigned target) const;

    dy::ComputationGraph* cg;
    unsigned vocab_size;
    unsigned max_oovs;
    std::vector<unsigned> ids;  // distinct extended ids, ascending
    dy::Expression scatter;     // ids.size() x T, one 1 per column
};
