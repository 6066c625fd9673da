#include <cstdio>
#include <fstream>
#include <iostream>

#include "hparams.h"
#include "expect.h"

void test_topology()
{
    HParams hps;
    expect(select_topology(hps, false) == Topology::RNN_ONLY, "no gcn: rnn only");
    expect(select_topology(hps, true) == Topology::GCN_AFTER_RNN, "default gcn runs after rnn");

    hps.use_gcn_lstm_parallel = true;
    expect(select_topology(hps, true) == Topology::GCN_PARALLEL, "parallel gcn");

    hps.use_gcn_lstm_parallel = false;
    hps.use_gcn_before_lstm = true;
    expect(select_topology(hps, true) == Topology::GCN_BEFORE_RNN, "gcn before rnn");
    expect(select_topology(hps, false) == Topology::RNN_ONLY,
           "fusion flags ignored without gcn");
}

void test_validate()
{
    HParams hps;
    hps.validate();
    expect(true, "defaults are valid");

    auto bad = hps;
    bad.use_gcn_before_lstm = true;
    bad.use_gcn_lstm_parallel = true;
    expect_throw([&] { bad.validate(); }, "exclusive fusion points");

    bad = hps;
    bad.query_gcn = true;
    expect_throw([&] { bad.validate(); }, "query gcn needs the query encoder");

    bad = hps;
    bad.word_gcn = true;
    bad.word_gcn_layers = 0;
    expect_throw([&] { bad.validate(); }, "gcn needs layers");

    bad = hps;
    bad.mode = Mode::DECODE;
    bad.min_dec_steps = bad.max_dec_steps + 1;
    expect_throw([&] { bad.validate(); }, "min_dec_steps above max_dec_steps");

    bad = hps;
    bad.use_glove = true;
    expect_throw([&] { bad.validate(); }, "glove needs a path");

    bad = hps;
    bad.mode = Mode::DECODE;
    bad.batch_size = 4;
    bad.vocab_size = 7;
    expect_throw([&] { bad.validate(); }, "decode vocabulary below twice the beam size");
    bad.vocab_size = 8;
    bad.validate();
    expect(true, "decode vocabulary of exactly twice the beam size");

    bad = hps;
    bad.trunc_norm_init_std = 0.f;
    expect_throw([&] { bad.validate(); }, "zero init scale");
}

void test_parse()
{
    expect(parse_mode("decode") == Mode::DECODE, "parse decode mode");
    expect(parse_optimizer("adam") == Optimizer::ADAM, "parse adam");
    expect(to_string(Mode::EVAL) == "eval", "mode name");
    expect_throw([] { parse_mode("infer"); }, "unknown mode throws");
    expect_throw([] { parse_optimizer("sgd"); }, "unknown optimizer throws");
}

void test_json()
{
    const char* fn = "test-hparams.json";
    {
        std::ofstream out(fn);
        out << "{ \"hidden_dim\": 32, \"word_gcn\": true, \"mode\": \"eval\","
               " \"word_gcn_dropout\": 0.8, \"glove_path\": \"g.txt\" }";
    }

    HParams hps;
    hps.load_json(fn);
    expect(hps.hidden_dim == 32, "integer key read");
    expect(hps.word_gcn, "boolean key read");
    expect(hps.mode == Mode::EVAL, "mode read by name");
    expect(close_to(hps.word_gcn_dropout, .8f), "float key read");
    expect(hps.glove_path == "g.txt", "string key read");
    expect(hps.emb_dim == 128, "absent keys keep their default");
    std::remove(fn);

    expect_throw([&] { hps.load_json("no-such-config.json"); }, "missing file throws");
}

int main(int, char**)
{
    std::cout << "topology" << std::endl;
    test_topology();
    std::cout << "validate" << std::endl;
    test_validate();
    std::cout << "parse" << std::endl;
    test_parse();
    std::cout << "json" << std::endl;
    test_json();

    return test_status();
}
