#pragma once

/* Tracking of summarizer training runs on an MLFlow server. Runs that
 * cannot reach the server, or have no experiment id, log nothing. */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include "hparams.h"
#include "training.h"

#ifndef GIT_COMMIT
#define GIT_COMMIT "0"
#endif

using nlohmann::json;

inline long milliseconds_since_epoch()
{
    auto t = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(t).count();
}

struct MLFlowRun
{
    MLFlowRun(
        int exp_id,
        const std::string& run_name,
        const std::string& hostname = "localhost",
        const std::string& port = "5000")
        : hostname(hostname)
        , port(port)
    {
        if (exp_id < 0) {
            std::cerr << "No MLFlow experiment given, not tracking." << std::endl;
            return;
        }

        auto user = std::getenv("USER");
        auto r = request("runs/create", json{
            {"user_id", user ? user : "unknown"},
            {"start_time", milliseconds_since_epoch()},
            {"experiment_id", exp_id},
            {"source_type", "PROJECT"},
            {"source_version", GIT_COMMIT}
        });

        if (r.status_code != 200) {
            std::cerr << "Warning: could not connect to MLFlow server. "
                      << "Status code: " << r.status_code << ", "
                      << "Response: " << r.text << std::endl;
            return;
        }

        run_uuid = json::parse(r.text)["run"]["info"]["run_uuid"];
        connected = true;

        if (!run_name.empty())
            post("runs/set-tag", {{"key", "mlflow.runName"}, {"value", run_name}});
    }

    /* Everything that changes the model or its optimisation. */
    void log_hparams(const HParams& hps, float decay)
    {
        auto param = [this](const std::string& key, const std::string& val) {
            post("runs/log-parameter", {{"key", key}, {"value", val}});
        };
        auto flag = [](bool b) { return std::string(b ? "true" : "false"); };

        param("article_topology", to_string(select_topology(hps, hps.word_gcn)));
        if (hps.query_encoder)
            param("query_topology", to_string(select_topology(hps, hps.query_gcn)));
        param("hidden_dim", std::to_string(hps.hidden_dim));
        param("emb_dim", std::to_string(hps.emb_dim));
        param("vocab_size", std::to_string(hps.vocab_size));
        param("batch_size", std::to_string(hps.batch_size));
        param("pointer_gen", flag(hps.pointer_gen));
        param("coverage", flag(hps.coverage));
        param("stacked_lstm", flag(hps.stacked_lstm));
        if (hps.word_gcn) {
            param("word_gcn_dim", std::to_string(hps.word_gcn_dim));
            param("word_gcn_layers", std::to_string(hps.word_gcn_layers));
            param("word_gcn_dropout", std::to_string(hps.word_gcn_dropout));
        }
        if (hps.query_gcn) {
            param("query_gcn_dim", std::to_string(hps.query_gcn_dim));
            param("query_gcn_layers", std::to_string(hps.query_gcn_layers));
        }
        param("use_label_information", flag(hps.use_label_information));
        param("optimizer", hps.optimizer == Optimizer::ADAM ? "adam" : "adagrad");
        param("lr", std::to_string(hps.optimizer == Optimizer::ADAM ? hps.adam_lr : hps.lr));
        param("max_grad_norm", std::to_string(hps.max_grad_norm));
        if (hps.use_regularizer)
            param("beta_l2", std::to_string(hps.beta_l2));
        param("decay", std::to_string(decay));
    }

    void log_train_step(unsigned step, const StepStats& stats, bool coverage)
    {
        log_metric("loss", stats.loss, step);
        log_metric("global_norm", stats.grad_norm, step);
        if (coverage)
            log_metric("coverage_loss", stats.coverage_loss, step);
    }

    void log_epoch(unsigned epoch, float train_loss, const StepStats& valid, float lr)
    {
        log_metric("train_loss", train_loss, epoch);
        log_metric("valid_loss", valid.total_loss, epoch);
        log_metric("valid_coverage_loss", valid.coverage_loss, epoch);
        log_metric("effective_lr", lr, epoch);
    }

    void log_metric(const std::string& key, double val, unsigned step = 0)
    {
        post("runs/log-metric", {
            {"timestamp", milliseconds_since_epoch()},
            {"key", key},
            {"value", val},
            {"step", step}
        });
    }

    bool connected = false;
    std::string hostname;
    std::string port;
    std::string run_uuid;

    private:

    cpr::Response request(const std::string& path, const json& payload) const
    {
        std::stringstream url;
        url << "http://" << hostname << ":" << port
            << "/api/2.0/preview/mlflow/" << path;
        return cpr::Post(cpr::Url{url.str()},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Body{payload.dump()});
    }

    void post(const std::string& path, json payload) const
    {
        if (!connected)
            return;
        payload["run_uuid"] = run_uuid;
        auto r = request(path, payload);
        if (r.status_code != 200)
            std::cerr << "Warning: MLFlow " << path << " failed with status "
                      << r.status_code << std::endl;
    }
};
