#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "decoding.h"

Hypothesis
Hypothesis::extend(unsigned token,
                   float log_prob,
                   const std::vector<std::vector<float>>& new_state,
                   const std::vector<float>& attn_dist,
                   float p_gen,
                   const std::vector<float>& new_coverage)
const
{
    Hypothesis h = *this;
    h.tokens.push_back(token);
    h.log_probs.push_back(log_prob);
    h.state = new_state;
    h.attn_dists.push_back(attn_dist);
    h.p_gens.push_back(p_gen);
    h.coverage = new_coverage;
    return h;
}

float
Hypothesis::log_prob()
const
{
    return std::accumulate(log_probs.begin(), log_probs.end(), 0.f);
}

float
Hypothesis::avg_log_prob()
const
{
    return log_prob() / tokens.size();
}

std::vector<Hypothesis>
sort_hyps(std::vector<Hypothesis> hyps)
{
    std::stable_sort(hyps.begin(), hyps.end(),
                     [](const Hypothesis& a, const Hypothesis& b) {
                         return a.avg_log_prob() > b.avg_log_prob();
                     });
    return hyps;
}

Hypothesis
run_beam_search(Summarizer& model,
                const Vocab& vocab,
                const Batch& batch)
{
    const auto& hps = model.hps;
    const unsigned beam_size = batch.size;
    if (beam_size == 0)
        throw std::invalid_argument("Beam search on an empty batch");

    model.set_test_time();
    auto encoded = model.run_encoder(batch);

    Hypothesis start;
    start.tokens = { Vocab::START_ID };
    start.log_probs = { 0.f };
    start.state = encoded.dec_in_state;
    start.coverage = std::vector<float>(encoded.enc_cols, 0.f);

    std::vector<Hypothesis> hyps(beam_size, start);
    std::vector<Hypothesis> results;

    unsigned steps = 0;
    while (steps < hps.max_dec_steps && results.size() < beam_size)
    {
        std::vector<unsigned> latest_tokens;
        std::vector<std::vector<std::vector<float>>> states;
        std::vector<std::vector<float>> prev_coverage;
        for (auto&& h : hyps) {
            auto t = h.latest_token();
            // copied words are fed back as UNK
            latest_tokens.push_back(t < vocab.size() ? t : (unsigned) Vocab::UNK_ID);
            states.push_back(h.state);
            prev_coverage.push_back(h.coverage);
        }

        auto step = model.decode_onestep(batch, encoded, latest_tokens,
                                         states, prev_coverage);

        // at the first step all hypotheses are identical
        const unsigned n_orig = steps == 0 ? 1 : hyps.size();
        std::vector<Hypothesis> all_hyps;
        for (auto i = 0u; i < n_orig; ++i)
            for (auto j = 0u; j < step.topk_ids[i].size(); ++j)
                all_hyps.push_back(hyps[i].extend(step.topk_ids[i][j],
                                                  step.topk_log_probs[i][j],
                                                  step.new_states[i],
                                                  step.attn_dists[i],
                                                  step.p_gens[i],
                                                  step.new_coverage[i]));

        hyps.clear();
        for (auto&& h : sort_hyps(std::move(all_hyps)))
        {
            if (h.latest_token() == Vocab::STOP_ID) {
                if (steps >= hps.min_dec_steps)
                    results.push_back(h);
            }
            else
                hyps.push_back(h);

            if (hyps.size() == beam_size || results.size() == beam_size)
                break;
        }
        steps += 1;
    }

    if (results.empty())
        results = hyps;
    if (results.empty())
        throw std::runtime_error("Beam search produced no hypothesis");

    return sort_hyps(std::move(results)).front();
}

std::vector<std::string>
hypothesis_words(const Hypothesis& hyp,
                 const Vocab& vocab,
                 const std::vector<std::string>& art_oovs)
{
    std::vector<unsigned> ids(hyp.tokens.begin() + 1, hyp.tokens.end());
    auto stop = std::find(ids.begin(), ids.end(), (unsigned) Vocab::STOP_ID);
    ids.erase(stop, ids.end());
    return outputids2words(ids, vocab, art_oovs);
}
