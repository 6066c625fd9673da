#include <iostream>

#include "hparams.h"
#include "mlflow.h"
#include "training.h"
#include "expect.h"

void test_untracked_run()
{
    MLFlowRun run(-1, "untracked");
    expect(!run.connected, "no experiment id: run is not tracked");
    expect(run.run_uuid.empty(), "no run id without a server");

    HParams hps;
    hps.word_gcn = true;
    StepStats stats;
    stats.loss = 1.f;

    // every call is a no-op on an untracked run
    run.log_hparams(hps, .9f);
    run.log_train_step(1, stats, true);
    run.log_epoch(0, 1.f, stats, .15f);
    run.log_metric("best_valid_loss", 1.f);
    expect(!run.connected, "logging keeps the run untracked");
}

int main(int, char**)
{
    std::cout << "untracked run" << std::endl;
    test_untracked_run();

    return test_status();
}
