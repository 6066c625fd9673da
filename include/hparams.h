#pragma once

/* Model hyperparameters, shared read-only by every component. */

#include <string>

enum class Mode
{
    TRAIN,
    EVAL,
    DECODE
};

enum class Optimizer
{
    ADAGRAD,
    ADAM
};

/* Shape of one encoder branch (article or query). */
enum class Topology
{
    RNN_ONLY,
    GCN_AFTER_RNN,
    GCN_BEFORE_RNN,
    GCN_PARALLEL
};

struct HParams
{
    Mode mode = Mode::TRAIN;
    unsigned batch_size = 16;

    unsigned hidden_dim = 256;
    unsigned emb_dim = 128;
    unsigned vocab_size = 50000;

    unsigned max_enc_steps = 400;
    unsigned max_dec_steps = 100;
    unsigned max_query_steps = 65;
    unsigned min_dec_steps = 35;

    // encoders
    bool use_lstm = true;
    bool no_lstm_encoder = false;
    bool no_lstm_query_encoder = false;
    bool stacked_lstm = false;
    bool query_encoder = false;

    // decoder
    bool pointer_gen = true;
    bool coverage = false;
    float cov_loss_wt = 1.0f;

    // graph convolutions
    bool word_gcn = false;
    unsigned word_gcn_dim = 512;
    unsigned word_gcn_layers = 1;
    bool word_gcn_gating = true;
    bool word_gcn_skip = true;
    float word_gcn_dropout = 1.0f; // keep probability

    bool query_gcn = false;
    unsigned query_gcn_dim = 512;
    unsigned query_gcn_layers = 1;
    bool query_gcn_gating = true;
    bool query_gcn_skip = true;
    float query_gcn_dropout = 1.0f;

    bool gcn_normalization = true;
    bool use_label_information = false;
    unsigned num_word_dependency_labels = 1;

    // fusion points
    bool use_gcn_before_lstm = false;
    bool use_gcn_lstm_parallel = false;
    bool concat_with_word_embedding = false;
    bool concat_gcn_lstm = false;
    bool simple_concat = false;

    // optimisation
    bool use_regularizer = false;
    float beta_l2 = 1e-5f;
    Optimizer optimizer = Optimizer::ADAGRAD;
    float lr = 0.15f;
    float adam_lr = 0.0004f;
    float adagrad_init_acc = 0.1f;
    float max_grad_norm = 2.0f;
    float rand_unif_init_mag = 0.02f;
    float trunc_norm_init_std = 1e-4f;

    // embeddings
    bool emb_trainable = true;
    bool use_glove = false;
    std::string glove_path;

    /* throws std::invalid_argument on an incompatible combination */
    void validate() const;

    /* overwrite the fields present in a JSON object file */
    void load_json(const std::string& filename);

    bool training() const { return mode == Mode::TRAIN; }
    unsigned encoder_dim() const { return 2 * hidden_dim; }
};

Topology select_topology(const HParams& hps, bool gcn_enabled);

Mode parse_mode(const std::string& s);
Optimizer parse_optimizer(const std::string& s);
std::string to_string(Mode mode);
std::string to_string(Topology topology);
