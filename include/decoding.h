#pragma once

/* Beam search over single-step decoder calls. */

#include <string>
#include <vector>

#include "data.h"
#include "vocab.h"
#include "models/summarizer.h"

struct Hypothesis
{
    std::vector<unsigned> tokens;
    std::vector<float> log_probs;
    std::vector<std::vector<float>> state;
    std::vector<std::vector<float>> attn_dists;
    std::vector<float> p_gens;
    std::vector<float> coverage;

    Hypothesis extend(unsigned token,
                      float log_prob,
                      const std::vector<std::vector<float>>& state,
                      const std::vector<float>& attn_dist,
                      float p_gen,
                      const std::vector<float>& coverage) const;

    unsigned latest_token() const { return tokens.back(); }
    float log_prob() const;
    float avg_log_prob() const;
};

/* most probable first, by average log probability */
std::vector<Hypothesis> sort_hyps(std::vector<Hypothesis> hyps);

/* batch: one example repeated once per beam slot */
Hypothesis run_beam_search(Summarizer& model,
                           const Vocab& vocab,
                           const Batch& batch);

/* the decoded words, without START and anything from STOP on */
std::vector<std::string> hypothesis_words(const Hypothesis& hyp,
                                          const Vocab& vocab,
                                          const std::vector<std::string>& art_oovs);
