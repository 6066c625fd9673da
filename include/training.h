#pragma once

/* One optimisation or evaluation step over a batch. */

#include <memory>

#include <dynet/training.h>

#include "data.h"
#include "hparams.h"
#include "models/summarizer.h"

namespace dy = dynet;

struct StepStats
{
    float loss = 0.f;
    float coverage_loss = 0.f;
    float total_loss = 0.f;
    float grad_norm = 0.f;
};

/* Adagrad or Adam, clipping gradients to a global norm of max_grad_norm */
std::unique_ptr<dy::Trainer> make_trainer(dy::ParameterCollection& p,
                                          const HParams& hps);

StepStats train_step(Summarizer& model, dy::Trainer& trainer, const Batch& batch);

StepStats eval_step(Summarizer& model, const Batch& batch);
