#include <dynet/dynet.h>
#include <dynet/expr.h>
#include <dynet/training.h>

#include <cmath>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "data.h"
#include "decoding.h"
#include "hparams.h"
#include "training.h"
#include "vocab.h"
#include "utils.h"
#include "models/summarizer.h"
#include "expect.h"

namespace dy = dynet;

/* 46 words plus the 4 reserved ones */
Vocab
toy_vocab()
{
    std::vector<std::string> words;
    for (unsigned i = 0; i < 46; ++i)
        words.push_back("w" + std::to_string(i));
    return Vocab(words);
}

HParams
toy_hparams()
{
    HParams hps;
    hps.batch_size = 2;
    hps.hidden_dim = 8;
    hps.emb_dim = 6;
    hps.vocab_size = 50;
    hps.max_enc_steps = 4;
    hps.max_dec_steps = 3;
    hps.max_query_steps = 3;
    hps.min_dec_steps = 1;
    hps.pointer_gen = true;
    hps.word_gcn_dim = 10;
    hps.query_gcn_dim = 6;
    hps.trunc_norm_init_std = .1f;
    hps.rand_unif_init_mag = .1f;
    return hps;
}

std::vector<Example>
toy_examples()
{
    Example a;
    a.article = { "w1", "w2", "zebra", "w3" };
    a.abstract = { "zebra", "w2" };
    a.article_deps = { { 2, 0 }, { 0, 0 }, { 2, 1 }, { 3, 0 } };
    a.query = { "w5", "w6" };
    a.query_deps = { { 0, 0 }, { 1, 0 } };

    Example b;
    b.article = { "w7", "w8", "w9" };
    b.abstract = { "w8", "w9", "w7", "w1" };
    b.article_deps = { { 0, 0 }, { 1, 1 }, { 1, 0 } };
    b.query = { "w10" };
    b.query_deps = { { 0, 0 } };

    return { a, b };
}

float
loss_value(Summarizer& model, const Batch& batch)
{
    model.set_train_time();
    dy::ComputationGraph cg;
    auto loss = model.batch_loss(cg, batch);
    return dy::as_scalar(cg.forward(loss.total));
}

void test_end_to_end()
{
    auto vocab = toy_vocab();
    auto hps = toy_hparams();
    auto batch = make_batch(toy_examples(), vocab, hps);

    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());

    model.set_train_time();
    dy::ComputationGraph cg;
    auto loss = model.batch_loss(cg, batch);
    auto value = dy::as_scalar(cg.forward(loss.total));
    expect(std::isfinite(value) && value > 0.f, "loss is finite and positive");
    cg.backward(loss.total);

    auto& grads = model.p_emb.get_storage().grads;
    auto norm = [&grads](unsigned id) {
        float s = 0.f;
        for (auto g : dy::as_vector(grads.at(id)))
            s += g * g;
        return s;
    };
    expect(norm(vocab.word2id("w2")) > 0.f, "article word embedding gets a gradient");
    expect(norm(Vocab::START_ID) > 0.f, "decoder input embedding gets a gradient");
    expect(norm(vocab.word2id("w40")) == 0.f, "unused word embedding untouched");
}

void test_training_step()
{
    auto vocab = toy_vocab();
    auto hps = toy_hparams();
    hps.coverage = true;
    hps.use_regularizer = true;
    auto batch = make_batch(toy_examples(), vocab, hps);

    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());
    auto trainer = make_trainer(model.p, hps);
    expect(trainer->clipping_enabled, "gradient clipping enabled");

    auto first = train_step(model, *trainer, batch);
    expect(first.grad_norm > 0.f, "gradient norm is recorded");
    expect(first.coverage_loss >= 0.f, "coverage loss is reported");
    expect(close_to(first.total_loss, first.loss + hps.cov_loss_wt * first.coverage_loss),
           "total loss adds weighted coverage loss");

    for (unsigned i = 0; i < 20; ++i)
        train_step(model, *trainer, batch);
    auto after = eval_step(model, batch);
    expect(after.total_loss < first.total_loss, "training lowers the loss");

    hps.optimizer = Optimizer::ADAM;
    auto adam = make_trainer(model.p, hps);
    expect(adam->learning_rate == hps.adam_lr, "adam uses its own learning rate");
}

std::vector<float>
embedding_values(Summarizer& model)
{
    return dy::as_vector(model.p_emb.get_storage().all_values);
}

void test_frozen_embeddings()
{
    auto vocab = toy_vocab();
    auto hps = toy_hparams();
    hps.use_regularizer = true;
    hps.beta_l2 = .1f;
    hps.emb_trainable = false;
    auto batch = make_batch(toy_examples(), vocab, hps);

    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());
    expect(model.registry.lookups.empty(), "frozen embeddings are not regularized");

    auto trainer = make_trainer(model.p, hps);
    auto before = embedding_values(model);
    for (unsigned i = 0; i < 3; ++i)
        train_step(model, *trainer, batch);
    expect(embedding_values(model) == before,
           "frozen embeddings unchanged by training with L2");

    hps.emb_trainable = true;
    dy::ParameterCollection tr_params;
    Summarizer tr_model(tr_params, hps, vocab.size());
    auto tr_trainer = make_trainer(tr_model.p, hps);
    auto tr_before = embedding_values(tr_model);
    train_step(tr_model, *tr_trainer, batch);
    expect(embedding_values(tr_model) != tr_before, "trainable embeddings move");
}

void test_initialization()
{
    auto vocab = toy_vocab();
    auto hps = toy_hparams();
    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());

    bool bounded = true;
    for (auto x : embedding_values(model))
        bounded = bounded && std::fabs(x) <= 2.f * hps.trunc_norm_init_std;
    for (auto x : dy::as_vector(*model.projection->p_W.values()))
        bounded = bounded && std::fabs(x) <= 2.f * hps.trunc_norm_init_std;
    expect(bounded, "normal initialization truncated at two deviations");

    auto xs = truncated_normal(1000, 1.f);
    float mean = 0.f;
    for (auto x : xs)
        mean += x / xs.size();
    expect(std::fabs(mean) < .2f, "truncated samples centred on zero");
}

struct Variant
{
    std::string name;
    std::function<void(HParams&)> set;
};

void test_topologies()
{
    auto vocab = toy_vocab();

    std::vector<Variant> variants{
        { "rnn only", [](HParams&) {} },
        { "plain rnn cells", [](HParams& h) { h.use_lstm = false; } },
        { "stacked", [](HParams& h) { h.stacked_lstm = true; } },
        { "no pointer", [](HParams& h) { h.pointer_gen = false; } },
        { "gcn after rnn", [](HParams& h) { h.word_gcn = true; } },
        { "gcn after rnn, labels", [](HParams& h) {
              h.word_gcn = true;
              h.use_label_information = true;
              h.num_word_dependency_labels = 2; } },
        { "gcn after rnn, blended", [](HParams& h) {
              h.word_gcn = true;
              h.concat_with_word_embedding = true;
              h.concat_gcn_lstm = true; } },
        { "gcn without rnn", [](HParams& h) {
              h.word_gcn = true;
              h.no_lstm_encoder = true; } },
        { "gcn parallel, gated", [](HParams& h) {
              h.word_gcn = true;
              h.use_gcn_lstm_parallel = true;
              h.concat_gcn_lstm = true; } },
        { "gcn parallel, concat", [](HParams& h) {
              h.word_gcn = true;
              h.use_gcn_lstm_parallel = true;
              h.concat_gcn_lstm = true;
              h.simple_concat = true; } },
        { "gcn before rnn", [](HParams& h) {
              h.word_gcn = true;
              h.use_gcn_before_lstm = true; } },
        { "gcn before rnn, fused", [](HParams& h) {
              h.word_gcn = true;
              h.use_gcn_before_lstm = true;
              h.concat_with_word_embedding = true;
              h.concat_gcn_lstm = true; } },
        { "query encoder", [](HParams& h) { h.query_encoder = true; } },
        { "query gcn", [](HParams& h) {
              h.query_encoder = true;
              h.query_gcn = true; } },
        { "query gcn, no query rnn", [](HParams& h) {
              h.query_encoder = true;
              h.query_gcn = true;
              h.no_lstm_query_encoder = true; } },
        { "query gcn before rnn, blended", [](HParams& h) {
              h.query_encoder = true;
              h.query_gcn = true;
              h.use_gcn_before_lstm = true;
              h.concat_with_word_embedding = true;
              h.concat_gcn_lstm = true; } },
        { "stacked with query", [](HParams& h) {
              h.stacked_lstm = true;
              h.query_encoder = true; } },
        { "coverage", [](HParams& h) { h.coverage = true; } },
    };

    for (auto&& v : variants) {
        auto hps = toy_hparams();
        v.set(hps);
        auto batch = make_batch(toy_examples(), vocab, hps);
        dy::ParameterCollection params;
        Summarizer model(params, hps, vocab.size());
        auto value = loss_value(model, batch);
        expect(std::isfinite(value) && value > 0.f, v.name + ": finite loss");
    }
}

void test_query_branch()
{
    auto hps = toy_hparams();
    hps.query_encoder = true;
    hps.query_gcn = true;
    hps.use_gcn_before_lstm = true;
    hps.concat_with_word_embedding = true;
    hps.concat_gcn_lstm = true;
    hps.simple_concat = true;
    hps.stacked_lstm = true;

    auto vocab = toy_vocab();
    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());

    expect(model.article->settings.stacked, "article encoder is stacked");
    expect(!model.query->settings.stacked, "query encoder is a single layer");
    expect(model.query->topology() == Topology::GCN_BEFORE_RNN, "query gcn before rnn");
    // [rnn; emb; gcn]: the query feeds [emb; gcn] to its rnn unprojected
    expect(model.query->output_rows() == 2 * hps.hidden_dim + hps.emb_dim + hps.query_gcn_dim,
           "query rnn input is the embedding and gcn concatenation");

    auto batch = make_batch(toy_examples(), vocab, hps);
    auto value = loss_value(model, batch);
    expect(std::isfinite(value), "concatenated query states are usable as memory");
}

void test_invalid_configs()
{
    auto vocab = toy_vocab();

    std::vector<Variant> invalid{
        { "before and parallel", [](HParams& h) {
              h.word_gcn = true;
              h.use_gcn_before_lstm = true;
              h.use_gcn_lstm_parallel = true; } },
        { "before without rnn", [](HParams& h) {
              h.word_gcn = true;
              h.use_gcn_before_lstm = true;
              h.no_lstm_encoder = true; } },
        { "query gcn without query", [](HParams& h) { h.query_gcn = true; } },
        { "zero keep probability", [](HParams& h) {
              h.word_gcn = true;
              h.word_gcn_dropout = 0.f; } },
        { "fusion without rnn", [](HParams& h) {
              h.word_gcn = true;
              h.no_lstm_encoder = true;
              h.concat_gcn_lstm = true; } },
        { "beam wider than half the vocabulary", [](HParams& h) {
              h.mode = Mode::DECODE;
              h.batch_size = 30; } },
        { "vocabulary smaller than configured", [](HParams& h) {
              h.mode = Mode::DECODE;
              h.vocab_size = 100;
              h.batch_size = 30; } },
    };

    for (auto&& v : invalid) {
        auto hps = toy_hparams();
        v.set(hps);
        dy::ParameterCollection params;
        expect_throw([&] { Summarizer model(params, hps, vocab.size()); },
                     v.name + " is rejected");
    }
}

void test_decode()
{
    auto vocab = toy_vocab();
    auto hps = toy_hparams();
    hps.mode = Mode::DECODE;
    hps.batch_size = 3;
    hps.coverage = true;
    auto examples = toy_examples();
    auto batch = make_decode_batch(examples[0], vocab, hps);

    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());
    model.set_test_time();

    auto encoded = model.run_encoder(batch);
    expect(encoded.enc_cols == 4, "encoder states over the article");
    expect(encoded.dec_in_state.size() == 2, "lstm initial state");

    std::vector<unsigned> tokens(3, Vocab::START_ID);
    std::vector<std::vector<std::vector<float>>> states(3, encoded.dec_in_state);
    std::vector<std::vector<float>> cov(3, std::vector<float>(4, 0.f));
    auto step = model.decode_onestep(batch, encoded, tokens, states, cov);

    expect(step.topk_ids.size() == 3 && step.topk_ids[0].size() == 6,
           "2 * beam candidates per hypothesis");
    bool sorted = true;
    for (unsigned j = 1; j < 6; ++j)
        sorted = sorted && step.topk_log_probs[0][j] <= step.topk_log_probs[0][j - 1];
    expect(sorted, "candidates sorted by probability");
    expect(step.new_coverage[0].size() == 4, "coverage over the article");

    auto best = run_beam_search(model, vocab, batch);
    expect(best.tokens.front() == Vocab::START_ID, "hypothesis starts with START");
    expect(best.tokens.size() <= hps.max_dec_steps + 1, "at most max_dec_steps tokens");
    auto words = hypothesis_words(best, vocab, batch.art_oovs[0]);
    expect(words.size() < best.tokens.size(), "START is not a decoded word");

    auto train_hps = toy_hparams();
    dy::ParameterCollection train_params;
    Summarizer train_model(train_params, train_hps, vocab.size());
    expect_throw([&] { train_model.decode_onestep(batch, encoded, tokens, states, cov); },
                 "single-step decoding outside decode mode throws");
}

void test_hypotheses()
{
    Hypothesis h;
    h.tokens = { Vocab::START_ID };
    h.log_probs = { 0.f };
    auto a = h.extend(7, -1.f, {}, {}, .5f, {});
    auto b = h.extend(8, -.5f, {}, {}, .5f, {});
    auto sorted = sort_hyps({ a, b });
    expect(sorted[0].latest_token() == 8, "best average log probability first");
    expect(close_to(a.avg_log_prob(), -.5f), "average over all tokens");
}

int main(int argc, char** argv)
{
    dy::initialize(argc, argv);

    std::cout << "end to end" << std::endl;
    test_end_to_end();
    std::cout << "training step" << std::endl;
    test_training_step();
    std::cout << "frozen embeddings" << std::endl;
    test_frozen_embeddings();
    std::cout << "initialization" << std::endl;
    test_initialization();
    std::cout << "topologies" << std::endl;
    test_topologies();
    std::cout << "query branch" << std::endl;
    test_query_branch();
    std::cout << "invalid configurations" << std::endl;
    test_invalid_configs();
    std::cout << "decode" << std::endl;
    test_decode();
    std::cout << "hypotheses" << std::endl;
    test_hypotheses();

    return test_status();
}
