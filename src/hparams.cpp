#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "hparams.h"

using nlohmann::json;

namespace {

void
require(bool cond, const std::string& msg)
{
    if (!cond)
        throw std::invalid_argument("Invalid configuration: " + msg);
}

template<typename T>
void
read_key(const json& j, const char* key, T& field)
{
    if (j.count(key))
        field = j.at(key).get<T>();
}

}

Mode
parse_mode(const std::string& s)
{
    if (s == "train")
        return Mode::TRAIN;
    else if (s == "eval")
        return Mode::EVAL;
    else if (s == "decode")
        return Mode::DECODE;
    throw std::invalid_argument("Invalid mode: " + s);
}

Optimizer
parse_optimizer(const std::string& s)
{
    if (s == "adagrad")
        return Optimizer::ADAGRAD;
    else if (s == "adam")
        return Optimizer::ADAM;
    throw std::invalid_argument("Invalid optimizer: " + s);
}

std::string
to_string(Mode mode)
{
    switch (mode) {
        case Mode::TRAIN: return "train";
        case Mode::EVAL: return "eval";
        case Mode::DECODE: return "decode";
    }
    return "";
}

std::string
to_string(Topology topology)
{
    switch (topology) {
        case Topology::RNN_ONLY: return "rnn";
        case Topology::GCN_AFTER_RNN: return "gcn-after-rnn";
        case Topology::GCN_BEFORE_RNN: return "gcn-before-rnn";
        case Topology::GCN_PARALLEL: return "gcn-parallel";
    }
    return "";
}

Topology
select_topology(const HParams& hps, bool gcn_enabled)
{
    if (!gcn_enabled)
        return Topology::RNN_ONLY;
    if (hps.use_gcn_before_lstm)
        return Topology::GCN_BEFORE_RNN;
    if (hps.use_gcn_lstm_parallel)
        return Topology::GCN_PARALLEL;
    return Topology::GCN_AFTER_RNN;
}

void
HParams::validate() const
{
    require(batch_size > 0, "batch_size must be positive");
    require(hidden_dim > 0 && emb_dim > 0, "dimensions must be positive");
    require(vocab_size > 4, "vocab_size must hold the special tokens");
    require(max_enc_steps > 0 && max_dec_steps > 0, "empty sequences");

    require(!(use_gcn_before_lstm && use_gcn_lstm_parallel),
            "use_gcn_before_lstm and use_gcn_lstm_parallel are exclusive");
    require(!(use_gcn_before_lstm && no_lstm_encoder),
            "use_gcn_before_lstm needs the recurrent encoder");
    require(!query_gcn || query_encoder, "query_gcn needs query_encoder");

    if (word_gcn || query_gcn)
        require(num_word_dependency_labels >= 1,
                "num_word_dependency_labels must be at least 1");

    if (word_gcn) {
        require(word_gcn_dim > 0 && word_gcn_layers > 0,
                "word GCN needs a positive dim and layer count");
        require(word_gcn_dropout > 0.f && word_gcn_dropout <= 1.f,
                "word_gcn_dropout is a keep probability in (0, 1]");
    }
    if (query_gcn) {
        require(query_gcn_dim > 0 && query_gcn_layers > 0,
                "query GCN needs a positive dim and layer count");
        require(query_gcn_dropout > 0.f && query_gcn_dropout <= 1.f,
                "query_gcn_dropout is a keep probability in (0, 1]");
    }

    require(trunc_norm_init_std > 0.f && rand_unif_init_mag > 0.f,
            "initialization scales must be positive");

    if (mode == Mode::DECODE) {
        require(max_dec_steps >= min_dec_steps,
                "max_dec_steps must not be below min_dec_steps");
        require(vocab_size >= 2 * batch_size,
                "decoding keeps 2 * batch_size candidates per hypothesis, "
                "vocab_size is too small");
    }

    require(!use_glove || !glove_path.empty(), "use_glove needs glove_path");
}

void
HParams::load_json(const std::string& filename)
{
    std::ifstream in(filename);
    if (!in)
        throw std::invalid_argument("Cannot open config file " + filename);

    json j;
    in >> j;

    if (j.count("mode"))
        mode = parse_mode(j.at("mode").get<std::string>());
    if (j.count("optimizer"))
        optimizer = parse_optimizer(j.at("optimizer").get<std::string>());

    read_key(j, "batch_size", batch_size);
    read_key(j, "hidden_dim", hidden_dim);
    read_key(j, "emb_dim", emb_dim);
    read_key(j, "vocab_size", vocab_size);
    read_key(j, "max_enc_steps", max_enc_steps);
    read_key(j, "max_dec_steps", max_dec_steps);
    read_key(j, "max_query_steps", max_query_steps);
    read_key(j, "min_dec_steps", min_dec_steps);

    read_key(j, "use_lstm", use_lstm);
    read_key(j, "no_lstm_encoder", no_lstm_encoder);
    read_key(j, "no_lstm_query_encoder", no_lstm_query_encoder);
    read_key(j, "stacked_lstm", stacked_lstm);
    read_key(j, "query_encoder", query_encoder);

    read_key(j, "pointer_gen", pointer_gen);
    read_key(j, "coverage", coverage);
    read_key(j, "cov_loss_wt", cov_loss_wt);

    read_key(j, "word_gcn", word_gcn);
    read_key(j, "word_gcn_dim", word_gcn_dim);
    read_key(j, "word_gcn_layers", word_gcn_layers);
    read_key(j, "word_gcn_gating", word_gcn_gating);
    read_key(j, "word_gcn_skip", word_gcn_skip);
    read_key(j, "word_gcn_dropout", word_gcn_dropout);

    read_key(j, "query_gcn", query_gcn);
    read_key(j, "query_gcn_dim", query_gcn_dim);
    read_key(j, "query_gcn_layers", query_gcn_layers);
    read_key(j, "query_gcn_gating", query_gcn_gating);
    read_key(j, "query_gcn_skip", query_gcn_skip);
    read_key(j, "query_gcn_dropout", query_gcn_dropout);

    read_key(j, "gcn_normalization", gcn_normalization);
    read_key(j, "use_label_information", use_label_information);
    read_key(j, "num_word_dependency_labels", num_word_dependency_labels);

    read_key(j, "use_gcn_before_lstm", use_gcn_before_lstm);
    read_key(j, "use_gcn_lstm_parallel", use_gcn_lstm_parallel);
    read_key(j, "concat_with_word_embedding", concat_with_word_embedding);
    read_key(j, "concat_gcn_lstm", concat_gcn_lstm);
    read_key(j, "simple_concat", simple_concat);

    read_key(j, "use_regularizer", use_regularizer);
    read_key(j, "beta_l2", beta_l2);
    read_key(j, "lr", lr);
    read_key(j, "adam_lr", adam_lr);
    read_key(j, "adagrad_init_acc", adagrad_init_acc);
    read_key(j, "max_grad_norm", max_grad_norm);
    read_key(j, "rand_unif_init_mag", rand_unif_init_mag);
    read_key(j, "trunc_norm_init_std", trunc_norm_init_std);

    read_key(j, "emb_trainable", emb_trainable);
    read_key(j, "use_glove", use_glove);
    read_key(j, "glove_path", glove_path);
}
