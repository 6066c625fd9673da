#include <cmath>
#include <stdexcept>

#include "training.h"

namespace {

StepStats
forward_stats(dy::ComputationGraph& cg, const SummLoss& loss)
{
    StepStats stats;
    stats.total_loss = dy::as_scalar(cg.forward(loss.total));
    stats.loss = dy::as_scalar(loss.loss.value());
    if (loss.has_coverage)
        stats.coverage_loss = dy::as_scalar(loss.coverage_loss.value());
    return stats;
}

}

std::unique_ptr<dy::Trainer>
make_trainer(dy::ParameterCollection& p, const HParams& hps)
{
    std::unique_ptr<dy::Trainer> trainer;
    if (hps.optimizer == Optimizer::ADAGRAD)
        // eps acts as the initial accumulator value
        trainer = std::make_unique<dy::AdagradTrainer>(p, hps.lr,
                                                       hps.adagrad_init_acc);
    else
        trainer = std::make_unique<dy::AdamTrainer>(p, hps.adam_lr);

    trainer->clipping_enabled = hps.max_grad_norm > 0.f;
    trainer->clip_threshold = hps.max_grad_norm;
    trainer->sparse_updates_enabled = false;
    return trainer;
}

StepStats
train_step(Summarizer& model, dy::Trainer& trainer, const Batch& batch)
{
    model.set_train_time();
    dy::ComputationGraph cg;
    auto loss = model.batch_loss(cg, batch);
    auto stats = forward_stats(cg, loss);

    if (!std::isfinite(stats.total_loss))
        throw std::runtime_error("Loss is not finite");

    cg.backward(loss.total);
    stats.grad_norm = model.p.gradient_l2_norm();
    trainer.update();
    return stats;
}

StepStats
eval_step(Summarizer& model, const Batch& batch)
{
    model.set_test_time();
    dy::ComputationGraph cg;
    auto loss = model.batch_loss(cg, batch);
    return forward_stats(cg, loss);
}
