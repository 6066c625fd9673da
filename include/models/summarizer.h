#pragma once

#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <dynet/param-init.h>

#include "data.h"
#include "hparams.h"
#include "loss.h"

#include "builders/adjmatrix.h"
#include "builders/attn-decoder.h"
#include "builders/branch.h"
#include "builders/copy.h"
#include "builders/reducer.h"
#include "builders/registry.h"
#include "models/basemodel.h"

namespace dy = dynet;

using dy::Expression;
using dy::Parameter;
using dy::ComputationGraph;
using dy::ParameterCollection;
using dy::parameter;

using std::vector;
using std::unique_ptr;

struct SummLoss
{
    Expression loss;
    Expression coverage_loss;
    Expression total;
    bool has_coverage = false;
};

/* Encoder results copied to the host, fed back as inputs at every
 * single-step decoder call. */
struct EncoderResult
{
    vector<float> enc_states;
    unsigned enc_rows = 0;
    unsigned enc_cols = 0;

    vector<float> query_states;
    unsigned query_rows = 0;
    unsigned query_cols = 0;

    vector<vector<float>> dec_in_state;
};

/* One decoder step for every live hypothesis. Rows index hypotheses. */
struct DecodeStep
{
    vector<vector<unsigned>> topk_ids;
    vector<vector<float>> topk_log_probs;
    vector<vector<vector<float>>> new_states;
    vector<vector<float>> attn_dists;
    vector<float> p_gens;
    vector<vector<float>> new_coverage;
};

struct Summarizer : public BaseEmbedModel
{
    explicit
    Summarizer(
        ParameterCollection& params,
        const HParams& hps,
        unsigned vocab_size)
        : BaseEmbedModel{
            params,
            vocab_size,
            hps.emb_dim,
            hps.emb_trainable,
            hps.trunc_norm_init_std,
            "summarizer"}
        , hps{ hps }
    {
        hps.validate();
        if (hps.mode == Mode::DECODE && vocab_size < 2 * hps.batch_size)
            throw std::invalid_argument(
              "Decoding needs a vocabulary of at least twice the beam size");

        if (hps.emb_trainable)
            registry.add(p_emb);

        auto article_settings = make_branch_settings(hps, /*query=*/false);
        article = make_branch(p, select_topology(hps, hps.word_gcn),
                              article_settings);
        registry.extend(article->registry);

        if (hps.query_encoder) {
            auto query_settings = make_branch_settings(hps, /*query=*/true);
            query = make_branch(p, select_topology(hps, hps.query_gcn),
                                query_settings);
            registry.extend(query->registry);
        }

        if (article->has_rnn()) {
            reducer = std::make_unique<StateReducer>(
              p, hps.hidden_dim, hps.use_lstm, hps.rand_unif_init_mag);
            registry.extend(reducer->registry);
        } else {
            // no final encoder state to reduce: learn one
            p_init_h = p.add_parameters({ hps.hidden_dim }, dy::ParameterInitConst(0.f), "init-h");
            if (hps.use_lstm)
                p_init_c = p.add_parameters({ hps.hidden_dim }, dy::ParameterInitConst(0.f), "init-c");
        }

        AttnDecoderSettings dec_settings;
        dec_settings.emb_dim = hps.emb_dim;
        dec_settings.hidden_dim = hps.hidden_dim;
        dec_settings.enc_dim = article->output_rows();
        dec_settings.query_dim = query ? query->output_rows() : 0;
        dec_settings.lstm = hps.use_lstm;
        dec_settings.pointer_gen = hps.pointer_gen;
        dec_settings.coverage = hps.coverage;
        decoder = std::make_unique<AttnDecoderBuilder>(p, dec_settings);
        registry.extend(decoder->registry);

        projection = std::make_unique<VocabProjection>(
          p, hps.hidden_dim, vocab_size, hps.trunc_norm_init_std);
        registry.extend(projection->registry);

        std::cerr << "Summarizer: article " << to_string(article->topology())
                  << " (" << article->output_rows() << ")";
        if (query)
            std::cerr << ", query " << to_string(query->topology())
                      << " (" << query->output_rows() << ")";
        std::cerr << ", " << registry.size() << " weights\n";
    }

    void
    new_graph(ComputationGraph& cg)
    {
        article->new_graph(cg, training_);
        if (query)
            query->new_graph(cg, training_);
        if (reducer)
            reducer->new_graph(cg);
        decoder->new_graph(cg, training_);
        projection->new_graph(cg);
    }

    SummLoss
    batch_loss(
        ComputationGraph& cg,
        const Batch& batch)
    {
        new_graph(cg);

        vector<vector<Expression>> step_losses(batch.size);
        vector<vector<Expression>> step_scores(batch.size);
        vector<vector<Expression>> attn_dists(batch.size);

        for (auto b = 0u; b < batch.size; ++b)
        {
            auto enc = encode_example(cg, batch, b);

            auto dec_len = batch.dec_lens.at(b);
            auto inputs = embed_sent(cg, batch.dec_ids.at(b), dec_len);
            auto out = decoder->run(inputs, enc.dec_init, enc.memory,
                                    enc.has_query ? &enc.query : nullptr,
                                    nullptr, false);

            unique_ptr<CopyDistribution> copy;
            if (hps.pointer_gen)
                copy = std::make_unique<CopyDistribution>(
                  cg, batch.enc_ext_ids.at(b), vocab_size_, batch.max_art_oovs);

            for (auto t = 0u; t < out.outputs.size(); ++t)
            {
                auto scores = projection->scores(out.outputs[t]);
                if (copy) {
                    auto gold = copy->gold_prob(dy::softmax(scores),
                                                out.attn_dists[t],
                                                out.p_gens[t],
                                                batch.target_ids[b][t]);
                    step_losses[b].push_back(-dy::log(gold));
                }
                else
                    step_scores[b].push_back(scores);
            }
            attn_dists[b] = out.attn_dists;
        }

        SummLoss res;
        if (hps.pointer_gen)
            res.loss = mask_and_avg(step_losses, batch.dec_mask);
        else
            res.loss = sequence_loss(step_scores, batch.target_ids, batch.dec_mask);

        if (hps.use_regularizer)
            res.loss = res.loss + hps.beta_l2 * registry.l2_penalty(cg);

        res.total = res.loss;
        if (hps.coverage) {
            res.has_coverage = true;
            res.coverage_loss = coverage_loss(attn_dists, batch.dec_mask);
            res.total = res.loss + hps.cov_loss_wt * res.coverage_loss;
        }
        return res;
    }

    /* Encode the first example of a decode batch. */
    EncoderResult
    run_encoder(const Batch& batch)
    {
        ComputationGraph cg;
        new_graph(cg);
        auto enc = encode_example(cg, batch, 0);

        EncoderResult res;
        res.enc_states = dy::as_vector(cg.incremental_forward(enc.memory.states));
        res.enc_rows = enc.memory.states.dim()[0];
        res.enc_cols = enc.memory.length;

        if (enc.has_query) {
            res.query_states = dy::as_vector(enc.query.states.value());
            res.query_rows = enc.query.states.dim()[0];
            res.query_cols = enc.query.length;
        }

        for (auto&& s : enc.dec_init)
            res.dec_in_state.push_back(dy::as_vector(s.value()));
        return res;
    }

    /* Advance every hypothesis by one token and keep the 2 * size best
     * extensions of each. Latest tokens must already be in-vocabulary. */
    DecodeStep
    decode_onestep(
        const Batch& batch,
        const EncoderResult& encoded,
        const vector<unsigned>& latest_tokens,
        const vector<vector<vector<float>>>& states,
        const vector<vector<float>>& prev_coverage)
    {
        if (hps.mode != Mode::DECODE)
            throw std::invalid_argument("decode_onestep needs decode mode");
        if (latest_tokens.size() != states.size())
            throw std::invalid_argument("decode_onestep: one state per token");

        ComputationGraph cg;
        new_graph(cg);

        auto enc_states = dy::input(cg, { encoded.enc_rows, encoded.enc_cols },
                                    encoded.enc_states);
        auto memory = decoder->memory(enc_states, batch.enc_mask.at(0));

        AttnMemory query_memory;
        if (query) {
            auto q_states = dy::input(cg,
                                      { encoded.query_rows, encoded.query_cols },
                                      encoded.query_states);
            query_memory = decoder->query_memory(q_states, batch.query_mask.at(0));
        }

        unique_ptr<CopyDistribution> copy;
        if (hps.pointer_gen)
            copy = std::make_unique<CopyDistribution>(
              cg, batch.enc_ext_ids.at(0), vocab_size_, batch.max_art_oovs);

        const unsigned k = 2 * batch.size;
        DecodeStep res;

        for (auto i = 0u; i < latest_tokens.size(); ++i)
        {
            vector<Expression> init;
            for (auto&& s : states[i])
                init.push_back(dy::input(cg, { hps.hidden_dim }, s));

            Expression cov;
            if (hps.coverage)
                cov = dy::input(cg, { encoded.enc_cols }, prev_coverage.at(i));

            vector<Expression> inputs{ embed_word(cg, latest_tokens[i]) };
            auto out = decoder->run(inputs, init, memory,
                                    query ? &query_memory : nullptr,
                                    hps.coverage ? &cov : nullptr,
                                    /*initial_state_attention=*/true);
            if (out.outputs.size() != 1)
                throw std::logic_error("decode_onestep: expected a single step");

            auto dist = dy::softmax(projection->scores(out.outputs[0]));
            if (copy)
                dist = copy->final_dist(dist, out.attn_dists[0], out.p_gens[0]);

            auto probs = dy::as_vector(cg.incremental_forward(dist));

            vector<unsigned> ixs(probs.size());
            std::iota(ixs.begin(), ixs.end(), 0u);
            std::partial_sort(ixs.begin(), ixs.begin() + k, ixs.end(),
                              [&probs](unsigned a, unsigned b) {
                                  return probs[a] > probs[b];
                              });
            ixs.resize(k);

            vector<float> log_probs;
            for (auto ix : ixs)
                log_probs.push_back(std::log(probs[ix]));

            res.topk_ids.push_back(ixs);
            res.topk_log_probs.push_back(log_probs);

            vector<vector<float>> new_state;
            for (auto&& s : out.state)
                new_state.push_back(dy::as_vector(s.value()));
            res.new_states.push_back(new_state);

            res.attn_dists.push_back(dy::as_vector(out.attn_dists[0].value()));
            res.p_gens.push_back(hps.pointer_gen
                                 ? dy::as_scalar(out.p_gens[0].value())
                                 : 1.f);
            if (out.has_coverage)
                res.new_coverage.push_back(dy::as_vector(out.coverage.value()));
            else
                res.new_coverage.push_back(vector<float>());
        }
        return res;
    }

    const HParams hps;
    unique_ptr<EncoderBranch> article;
    unique_ptr<EncoderBranch> query;
    unique_ptr<StateReducer> reducer;
    unique_ptr<AttnDecoderBuilder> decoder;
    unique_ptr<VocabProjection> projection;
    Parameter p_init_c, p_init_h;
    ParamRegistry registry;

    private:

    struct Encoded
    {
        AttnMemory memory;
        AttnMemory query;
        bool has_query = false;
        vector<Expression> dec_init;
    };

    Encoded
    encode_example(
        ComputationGraph& cg,
        const Batch& batch,
        unsigned b)
    {
        Encoded enc;

        auto embeds = embed_sent(cg, batch.enc_ids.at(b), batch.enc_steps);
        GraphExprs graph;
        if (article->topology() != Topology::RNN_ONLY)
            graph = make_graph(cg, batch.enc_graphs.at(b),
                               article->settings.gcn.labels);
        auto out = article->encode(embeds, batch.enc_lens.at(b),
                                   article->topology() != Topology::RNN_ONLY
                                   ? &graph : nullptr);
        enc.memory = decoder->memory(out.states, batch.enc_mask.at(b));

        if (out.has_final()) {
            enc.dec_init = reducer->apply(out.fw_final, out.bw_final);
        } else {
            if (hps.use_lstm)
                enc.dec_init.push_back(parameter(cg, p_init_c));
            enc.dec_init.push_back(parameter(cg, p_init_h));
        }

        if (query)
        {
            auto q_embeds = embed_sent(cg, batch.query_ids.at(b), batch.query_steps);
            GraphExprs q_graph;
            if (query->topology() != Topology::RNN_ONLY)
                q_graph = make_graph(cg, batch.query_graphs.at(b),
                                     query->settings.gcn.labels);
            auto q_out = query->encode(q_embeds, batch.query_lens.at(b),
                                       query->topology() != Topology::RNN_ONLY
                                       ? &q_graph : nullptr);
            enc.query = decoder->query_memory(q_out.states, batch.query_mask.at(b));
            enc.has_query = true;
        }
        return enc;
    }
};
