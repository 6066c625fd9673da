#pragma once

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "hparams.h"

struct BaseOpts
{
    virtual std::ostream& print(std::ostream& o) const = 0;
    virtual std::string get_filename() const = 0;
};

/* value following argv[i], converted; throws if absent or malformed */
template <typename T>
void
read_arg(int argc, char** argv, int i, T& out)
{
    if (i + 1 >= argc)
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    std::istringstream vals(argv[i + 1]);
    vals >> out;
    if (!vals)
        throw std::invalid_argument(std::string("Bad value for ") + argv[i]
                                    + ": " + argv[i + 1]);
}

inline void
read_arg(int argc, char** argv, int i, std::string& out)
{
    if (i + 1 >= argc)
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    out = argv[i + 1];
}

struct TrainOpts : BaseOpts
{
    unsigned max_iter = 20;
    unsigned patience = 5;
    float decay = 0.9;
    unsigned log_every = 100;

    std::string saved_model;
    std::string save_prefix = "./";
    bool override_dy = true;

    int mlflow_exp = -1;
    std::string mlflow_name = "";
    std::string mlflow_host = "localhost";

    virtual void parse(int argc, char** argv)
    {
        int i = 1;
        while (i < argc) {
            std::string arg = argv[i];
            if (arg == "--no-override-dy") {
                override_dy = false;
                i += 1;
            } else if (arg == "--decay") {
                read_arg(argc, argv, i, decay);
                i += 2;
            } else if (arg == "--patience") {
                read_arg(argc, argv, i, patience);
                i += 2;
            } else if (arg == "--log-every") {
                read_arg(argc, argv, i, log_every);
                i += 2;
            } else if (arg == "--save-prefix") {
                read_arg(argc, argv, i, save_prefix);
                i += 2;
            } else if (arg == "--max-iter") {
                read_arg(argc, argv, i, max_iter);
                i += 2;
            } else if (arg == "--saved-model") {
                read_arg(argc, argv, i, saved_model);
                i += 2;
            } else if (arg == "--mlflow-experiment") {
                read_arg(argc, argv, i, mlflow_exp);
                i += 2;
            } else if (arg == "--mlflow-name") {
                read_arg(argc, argv, i, mlflow_name);
                i += 2;
            } else if (arg == "--mlflow-host") {
                read_arg(argc, argv, i, mlflow_host);
                i += 2;
            } else {
                i += 1;
            }
        }
    }

    virtual std::ostream& print(std::ostream& o) const override
    {
        o << "Arguments:\n"
          << " Save prefix: " << save_prefix << '\n'
          << "   Max. iter: " << max_iter << '\n'
          << "    Patience: " << patience << '\n'
          << "       Decay: " << decay << '\n'
          << " MLFlow host: " << mlflow_host << '\n'
          << "  MLFlow exp: " << mlflow_exp << '\n'
          << "  MLFlow run: " << mlflow_name << '\n'
          << "  Model file: " << saved_model << std::endl;

        return o;
    }

    virtual std::string get_filename() const override
    {
        std::ostringstream fn;
        fn << "decay_" << decay << "_";
        return fn.str();
    }
};

/* Data locations and model hyperparameters. A --config JSON file is read
 * first; flags given on the command line override it. */
struct SummOpts : BaseOpts
{
    std::string train_file;
    std::string valid_file;
    std::string test_file;
    std::string vocab_file;
    std::string config_file;
    std::string decode_file = "decoded.txt";

    HParams hps;

    virtual void parse(int argc, char** argv)
    {
        for (int i = 1; i < argc; ++i)
            if (std::string(argv[i]) == "--config") {
                read_arg(argc, argv, i, config_file);
                hps.load_json(config_file);
            }

        int i = 1;
        while (i < argc) {
            std::string arg = argv[i];
            if (arg == "--config") {
                i += 2;
            } else if (arg == "--train") {
                read_arg(argc, argv, i, train_file);
                i += 2;
            } else if (arg == "--valid") {
                read_arg(argc, argv, i, valid_file);
                i += 2;
            } else if (arg == "--test") {
                read_arg(argc, argv, i, test_file);
                i += 2;
            } else if (arg == "--vocab") {
                read_arg(argc, argv, i, vocab_file);
                i += 2;
            } else if (arg == "--decode-file") {
                read_arg(argc, argv, i, decode_file);
                i += 2;
            } else if (arg == "--mode") {
                std::string val;
                read_arg(argc, argv, i, val);
                hps.mode = parse_mode(val);
                i += 2;
            } else if (arg == "--optimizer") {
                std::string val;
                read_arg(argc, argv, i, val);
                hps.optimizer = parse_optimizer(val);
                i += 2;
            } else if (arg == "--batch-size") {
                read_arg(argc, argv, i, hps.batch_size);
                i += 2;
            } else if (arg == "--hidden-dim") {
                read_arg(argc, argv, i, hps.hidden_dim);
                i += 2;
            } else if (arg == "--emb-dim") {
                read_arg(argc, argv, i, hps.emb_dim);
                i += 2;
            } else if (arg == "--vocab-size") {
                read_arg(argc, argv, i, hps.vocab_size);
                i += 2;
            } else if (arg == "--max-enc-steps") {
                read_arg(argc, argv, i, hps.max_enc_steps);
                i += 2;
            } else if (arg == "--max-dec-steps") {
                read_arg(argc, argv, i, hps.max_dec_steps);
                i += 2;
            } else if (arg == "--max-query-steps") {
                read_arg(argc, argv, i, hps.max_query_steps);
                i += 2;
            } else if (arg == "--min-dec-steps") {
                read_arg(argc, argv, i, hps.min_dec_steps);
                i += 2;
            } else if (arg == "--rnn") {
                hps.use_lstm = false;
                i += 1;
            } else if (arg == "--no-lstm-encoder") {
                hps.no_lstm_encoder = true;
                i += 1;
            } else if (arg == "--no-lstm-query-encoder") {
                hps.no_lstm_query_encoder = true;
                i += 1;
            } else if (arg == "--stacked-lstm") {
                hps.stacked_lstm = true;
                i += 1;
            } else if (arg == "--query-encoder") {
                hps.query_encoder = true;
                i += 1;
            } else if (arg == "--no-pointer-gen") {
                hps.pointer_gen = false;
                i += 1;
            } else if (arg == "--coverage") {
                hps.coverage = true;
                i += 1;
            } else if (arg == "--cov-loss-wt") {
                read_arg(argc, argv, i, hps.cov_loss_wt);
                i += 2;
            } else if (arg == "--word-gcn") {
                hps.word_gcn = true;
                i += 1;
            } else if (arg == "--word-gcn-dim") {
                read_arg(argc, argv, i, hps.word_gcn_dim);
                i += 2;
            } else if (arg == "--word-gcn-layers") {
                read_arg(argc, argv, i, hps.word_gcn_layers);
                i += 2;
            } else if (arg == "--no-word-gcn-gating") {
                hps.word_gcn_gating = false;
                i += 1;
            } else if (arg == "--no-word-gcn-skip") {
                hps.word_gcn_skip = false;
                i += 1;
            } else if (arg == "--word-gcn-dropout") {
                read_arg(argc, argv, i, hps.word_gcn_dropout);
                i += 2;
            } else if (arg == "--query-gcn") {
                hps.query_gcn = true;
                i += 1;
            } else if (arg == "--query-gcn-dim") {
                read_arg(argc, argv, i, hps.query_gcn_dim);
                i += 2;
            } else if (arg == "--query-gcn-layers") {
                read_arg(argc, argv, i, hps.query_gcn_layers);
                i += 2;
            } else if (arg == "--no-query-gcn-gating") {
                hps.query_gcn_gating = false;
                i += 1;
            } else if (arg == "--no-query-gcn-skip") {
                hps.query_gcn_skip = false;
                i += 1;
            } else if (arg == "--query-gcn-dropout") {
                read_arg(argc, argv, i, hps.query_gcn_dropout);
                i += 2;
            } else if (arg == "--no-gcn-normalization") {
                hps.gcn_normalization = false;
                i += 1;
            } else if (arg == "--use-label-information") {
                hps.use_label_information = true;
                i += 1;
            } else if (arg == "--num-labels") {
                read_arg(argc, argv, i, hps.num_word_dependency_labels);
                i += 2;
            } else if (arg == "--gcn-before-lstm") {
                hps.use_gcn_before_lstm = true;
                i += 1;
            } else if (arg == "--gcn-lstm-parallel") {
                hps.use_gcn_lstm_parallel = true;
                i += 1;
            } else if (arg == "--concat-with-word-embedding") {
                hps.concat_with_word_embedding = true;
                i += 1;
            } else if (arg == "--concat-gcn-lstm") {
                hps.concat_gcn_lstm = true;
                i += 1;
            } else if (arg == "--simple-concat") {
                hps.simple_concat = true;
                i += 1;
            } else if (arg == "--regularizer") {
                hps.use_regularizer = true;
                i += 1;
            } else if (arg == "--beta-l2") {
                read_arg(argc, argv, i, hps.beta_l2);
                i += 2;
            } else if (arg == "--lr") {
                read_arg(argc, argv, i, hps.lr);
                i += 2;
            } else if (arg == "--adam-lr") {
                read_arg(argc, argv, i, hps.adam_lr);
                i += 2;
            } else if (arg == "--adagrad-init-acc") {
                read_arg(argc, argv, i, hps.adagrad_init_acc);
                i += 2;
            } else if (arg == "--max-grad-norm") {
                read_arg(argc, argv, i, hps.max_grad_norm);
                i += 2;
            } else if (arg == "--rand-unif-init-mag") {
                read_arg(argc, argv, i, hps.rand_unif_init_mag);
                i += 2;
            } else if (arg == "--trunc-norm-init-std") {
                read_arg(argc, argv, i, hps.trunc_norm_init_std);
                i += 2;
            } else if (arg == "--freeze-emb") {
                hps.emb_trainable = false;
                i += 1;
            } else if (arg == "--glove") {
                read_arg(argc, argv, i, hps.glove_path);
                hps.use_glove = true;
                i += 2;
            } else {
                i += 1;
            }
        }
    }

    virtual std::ostream& print(std::ostream& o) const override
    {
        o << "Summarization, " << to_string(hps.mode) << " mode\n"
          << "      Train: " << train_file << '\n'
          << "      Valid: " << valid_file << '\n'
          << "       Test: " << test_file << '\n'
          << "      Vocab: " << vocab_file << " (" << hps.vocab_size << ")\n"
          << "     Config: " << config_file << '\n'
          << " Batch size: " << hps.batch_size << '\n'
          << " Hidden dim: " << hps.hidden_dim << '\n'
          << "  Embed dim: " << hps.emb_dim << '\n'
          << "   Pointer?: " << hps.pointer_gen << '\n'
          << "  Coverage?: " << hps.coverage << '\n'
          << "  Word GCN?: " << hps.word_gcn;
        if (hps.word_gcn)
            o << " (" << hps.word_gcn_layers << " x " << hps.word_gcn_dim << ")";
        o << '\n'
          << "    Query?: " << hps.query_encoder << '\n'
          << " Query GCN?: " << hps.query_gcn << '\n';
        return o;
    }

    virtual std::string get_filename() const override
    {
        std::ostringstream fn;
        fn << "summ_bs_" << hps.batch_size
           << "_hid_" << hps.hidden_dim
           << "_emb_" << hps.emb_dim;
        if (hps.pointer_gen)
            fn << "_ptr";
        if (hps.coverage)
            fn << "_cov";
        if (hps.word_gcn)
            fn << "_wgcn_" << hps.word_gcn_layers << "x" << hps.word_gcn_dim;
        if (hps.query_gcn)
            fn << "_qgcn_" << hps.query_gcn_layers << "x" << hps.query_gcn_dim;
        fn << "_";
        return fn.str();
    }
};

inline std::ostream& operator << (std::ostream &o, const BaseOpts &opts)
{
    return opts.print(o);
}
