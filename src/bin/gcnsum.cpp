#include <dynet/dynet.h>
#include <dynet/expr.h>
#include <dynet/globals.h>
#include <dynet/io.h>
#include <dynet/timing.h>
#include <dynet/training.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <sstream>

#include "utils.h"
#include "data.h"
#include "vocab.h"
#include "args.h"
#include "mlflow.h"
#include "training.h"
#include "decoding.h"

#include "models/summarizer.h"

namespace dy = dynet;

using std::vector;
using std::cout;
using std::endl;


vector<Batch>
load_batches(
    const std::string& filename,
    const Vocab& vocab,
    const HParams& hps)
{
    vector<Batch> batches;
    for (auto&& examples : read_batches<Example>(filename, hps.batch_size))
        batches.push_back(make_batch(examples, vocab, hps));
    return batches;
}


StepStats
validate(
    Summarizer& model,
    const vector<Batch>& data)
{
    StepStats avg;
    unsigned n = 0;
    for (auto&& batch : data)
    {
        auto stats = eval_step(model, batch);
        avg.loss += batch.size * stats.loss;
        avg.coverage_loss += batch.size * stats.coverage_loss;
        avg.total_loss += batch.size * stats.total_loss;
        n += batch.size;
    }
    if (n > 0) {
        avg.loss /= n;
        avg.coverage_loss /= n;
        avg.total_loss /= n;
    }
    return avg;
}


void
train(
    Summarizer& model,
    const TrainOpts& opts,
    const SummOpts& summ_opts,
    const Vocab& vocab,
    const std::string& out_fn,
    MLFlowRun& mlflow)
{
    const auto& hps = model.hps;
    auto train_data = load_batches(summ_opts.train_file, vocab, hps);
    auto valid_data = load_batches(summ_opts.valid_file, vocab, hps);
    auto n_batches = train_data.size();

    // make an identity permutation vector of pointers into the batches
    vector<vector<Batch>::iterator> train_iter(n_batches);
    std::iota(train_iter.begin(), train_iter.end(), train_data.begin());

    auto trainer = make_trainer(model.p, hps);

    float best_valid_loss = std::numeric_limits<float>::infinity();
    float last_valid_loss = std::numeric_limits<float>::infinity();
    unsigned impatience = 0;
    unsigned global_step = 0;

    for (unsigned it = 0; it < opts.max_iter; ++it)
    {
        // shuffle the permutation vector
        std::shuffle(train_iter.begin(), train_iter.end(), *dy::rndeng);

        float total_loss = 0;
        unsigned n_train = 0;

        {
            std::unique_ptr<dy::Timer> timer(new dy::Timer("train took"));
            for (auto&& batch : train_iter)
            {
                auto stats = train_step(model, *trainer, *batch);
                total_loss += batch->size * stats.total_loss;
                n_train += batch->size;
                global_step += 1;

                if (opts.log_every > 0 && global_step % opts.log_every == 0)
                {
                    cout << "step " << global_step
                         << " loss " << stats.loss
                         << " coverage " << stats.coverage_loss
                         << " grad norm " << stats.grad_norm << endl;
                    mlflow.log_train_step(global_step, stats, hps.coverage);
                }
            }
        }

        StepStats valid;
        {
            std::unique_ptr<dy::Timer> timer(new dy::Timer("valid took"));
            valid = validate(model, valid_data);
        }

        auto training_loss = total_loss / std::max(n_train, 1u);

        mlflow.log_epoch(it, training_loss, valid, trainer->learning_rate);

        cout << "training loss " << training_loss
             << " valid loss " << valid.loss
             << " valid coverage loss " << valid.coverage_loss
             << endl;

        if (valid.total_loss < last_valid_loss)
        {
            impatience = 0;
        }
        else
        {
            trainer->learning_rate *= opts.decay;
            cout << "Decaying LR to " << trainer->learning_rate << endl;
            impatience += 1;
        }

        if (valid.total_loss < best_valid_loss)
        {
            best_valid_loss = valid.total_loss;

            std::ostringstream fn;
            fn << out_fn
               << "_loss_"
               << std::fixed << std::setprecision(4)
               << valid.total_loss
               << "_iter_" << std::setw(3) << std::setfill('0') << it
               << ".dy";
            model.save(fn.str());
        }

        if (impatience > opts.patience)
        {
            cout << opts.patience << " epochs without improvement." << endl;
            break;
        }
        last_valid_loss = valid.total_loss;
    }
    mlflow.log_metric("best_valid_loss", best_valid_loss);
}


void
eval(
    Summarizer& model,
    const TrainOpts& opts,
    const SummOpts& summ_opts,
    const Vocab& vocab)
{
    model.load(opts.saved_model);
    auto test_data = load_batches(summ_opts.test_file, vocab, model.hps);
    auto stats = validate(model, test_data);
    cout << "Test loss: " << stats.loss << endl;
    if (model.hps.coverage)
        cout << "Test coverage loss: " << stats.coverage_loss << endl;
}


void
decode(
    Summarizer& model,
    const TrainOpts& opts,
    const SummOpts& summ_opts,
    const Vocab& vocab)
{
    model.load(opts.saved_model);

    std::ifstream in(summ_opts.test_file);
    if (!in)
        throw std::runtime_error("Cannot open " + summ_opts.test_file);
    std::ofstream out(summ_opts.decode_file);
    if (!out)
        throw std::runtime_error("Cannot write " + summ_opts.decode_file);

    unsigned n = 0;
    std::unique_ptr<dy::Timer> timer(new dy::Timer("decoding took"));
    Example example;
    while (in >> example)
    {
        auto batch = make_decode_batch(example, vocab, model.hps);
        auto best = run_beam_search(model, vocab, batch);
        auto words = hypothesis_words(best, vocab, batch.art_oovs.at(0));

        for (auto i = 0u; i < words.size(); ++i)
            out << (i > 0 ? " " : "") << words[i];
        out << '\n';
        n += 1;
    }
    cout << "Decoded " << n << " articles into "
         << summ_opts.decode_file << endl;
}


int main(int argc, char** argv)
{
    auto dyparams = dy::extract_dynet_params(argc, argv);

    TrainOpts opts;
    opts.parse(argc, argv);
    std::cout << opts << std::endl;

    SummOpts summ_opts;
    summ_opts.parse(argc, argv);
    std::cout << summ_opts << std::endl;

    if (opts.override_dy)
    {
        dyparams.random_seed = 42;
        dyparams.autobatch = true;
    }

    dy::initialize(dyparams);

    auto& hps = summ_opts.hps;

    Vocab vocab(summ_opts.vocab_file, hps.vocab_size);
    cout << "vocabulary size: " << vocab.size() << endl;
    hps.vocab_size = vocab.size();

    dy::ParameterCollection params;
    Summarizer model(params, hps, vocab.size());

    if (hps.use_glove)
        model.load_embeddings(hps.glove_path, vocab);

    if (hps.mode == Mode::TRAIN)
    {
        std::ostringstream fn;
        fn << opts.save_prefix
           << summ_opts.get_filename()
           << opts.get_filename();

        vocab.write_metadata(fn.str() + "vocab_metadata.tsv");

        MLFlowRun mlflow(opts.mlflow_exp, opts.mlflow_name, opts.mlflow_host);
        mlflow.log_hparams(hps, opts.decay);

        train(model, opts, summ_opts, vocab, fn.str(), mlflow);
    }
    else if (hps.mode == Mode::EVAL)
        eval(model, opts, summ_opts, vocab);
    else
        decode(model, opts, summ_opts, vocab);

    return 0;
}
