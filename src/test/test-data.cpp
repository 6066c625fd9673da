#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "data.h"
#include "hparams.h"
#include "vocab.h"
#include "expect.h"

Vocab
small_vocab()
{
    return Vocab({ "the", "cat", "sat", "on", "mat", "." });
}

void test_vocab()
{
    auto vocab = small_vocab();
    expect(vocab.size() == 10, "special tokens come first");
    expect(vocab.word2id("cat") == 5, "words follow the special tokens");
    expect(vocab.word2id("dog") == Vocab::UNK_ID, "unknown word maps to UNK");
    expect(vocab.id2word(Vocab::STOP_ID) == Vocab::STOP, "STOP id round trip");
    expect_throw([&] { vocab.id2word(42); }, "unknown id throws");
}

void test_oov_ids()
{
    auto vocab = small_vocab();
    std::vector<std::string> oovs;
    auto ids = article2ids({ "the", "dog", "bit", "the", "dog" }, vocab, oovs);

    expect(oovs == std::vector<std::string>({ "dog", "bit" }),
           "article OOVs in order of first appearance");
    expect(ids[1] == 10 && ids[4] == 10, "repeated OOV shares one id");
    expect(ids[2] == 11, "second OOV gets the next id");

    auto abs = abstract2ids({ "dog", "ran", "the" }, vocab, oovs);
    expect(abs[0] == 10, "abstract OOV from the article is copied");
    expect(abs[1] == Vocab::UNK_ID, "abstract OOV absent from article is UNK");
    expect(abs[2] == vocab.word2id("the"), "in-vocabulary word unchanged");

    auto words = outputids2words({ 5, 11 }, vocab, oovs);
    expect(words == std::vector<std::string>({ "cat", "bit" }),
           "extended ids map back to article words");
    expect_throw([&] { outputids2words({ 12 }, vocab, oovs); },
                 "id beyond article OOVs throws");
}

void test_parse()
{
    std::istringstream in(
      "the cat sat\tcat sat\t2:0 0:0 2:1\n"
      "\n"
      "on the mat\tthe mat\t0:0 3:0 1:0\twhere\t0:0\n");

    Example ex;
    in >> ex;
    expect(ex.article.size() == 3 && ex.abstract.size() == 2, "first line tokens");
    expect(ex.article_deps.size() == 3 && ex.article_deps[2].label == 1,
           "dependencies parsed as head:label");
    expect(ex.query.empty(), "missing query column is empty");

    in >> ex;
    expect(ex.query.size() == 1 && ex.query_deps.size() == 1,
           "blank line skipped and query read");

    std::istringstream bad("a b\tc\t1:0\n");
    expect_throw([&] { Example e; bad >> e; }, "dependency count mismatch throws");

    std::istringstream bad_head("a b\tc\t3:0 0:0\n");
    expect_throw([&] { Example e; bad_head >> e; }, "head out of range throws");
}

void test_batch()
{
    auto vocab = small_vocab();
    HParams hps;
    hps.batch_size = 2;
    hps.max_enc_steps = 4;
    hps.max_dec_steps = 3;
    hps.pointer_gen = true;
    hps.word_gcn = true;

    Example a;
    a.article = { "the", "dog", "sat", "on", "the", "mat" };
    a.abstract = { "dog", "sat" };
    a.article_deps = { { 2, 0 }, { 3, 0 }, { 0, 0 }, { 3, 0 }, { 6, 0 }, { 4, 0 } };

    Example b;
    b.article = { "cat", "sat" };
    b.abstract = { "the", "cat", "sat", "on", "mat" };
    b.article_deps = { { 2, 0 }, { 0, 0 } };

    auto batch = make_batch({ a, b }, vocab, hps);
    expect(batch.size == 2, "batch size");
    expect(batch.enc_steps == 4, "encoder steps capped at max_enc_steps");
    expect(batch.enc_lens[0] == 4 && batch.enc_lens[1] == 2, "true lengths");
    expect(batch.enc_ids[1][3] == Vocab::PAD_ID, "short article padded");
    expect(batch.enc_mask[1] == std::vector<float>({ 1, 1, 0, 0 }), "encoder mask");
    expect(batch.enc_ids[0][1] == Vocab::UNK_ID && batch.enc_ext_ids[0][1] == 10,
           "OOV is UNK in ids and temporary in extended ids");
    expect(batch.max_art_oovs == 1, "largest OOV count in the batch");

    expect(batch.dec_ids[0][0] == Vocab::START_ID, "decoder input starts with START");
    expect(batch.target_ids[0][0] == 10, "target copies the article OOV");
    expect(batch.target_ids[0][2] == Vocab::STOP_ID, "target ends with STOP");
    expect(batch.dec_lens[1] == 3 && batch.target_ids[1][2] != Vocab::STOP_ID,
           "truncated target has no STOP");

    // arcs of tokens 5 and 6 lie beyond the truncation
    auto&& g = batch.enc_graphs[0];
    expect(g.n_nodes() == 4, "graph over the padded steps");
    expect(g.adj_in[0].nnz() == 3, "only arcs within the truncation are kept");
    expect(g.neighbour_count[2] == 3.f, "head counts each of its dependents");

    hps.query_encoder = true;
    expect_throw([&] { make_batch({ a }, vocab, hps); },
                 "query encoder without a query throws");
    expect_throw([&] { make_batch({}, vocab, hps); }, "empty batch throws");
}

void test_decode_batch()
{
    auto vocab = small_vocab();
    HParams hps;
    hps.mode = Mode::DECODE;
    hps.batch_size = 3;

    Example ex;
    ex.article = { "the", "cat" };
    ex.abstract = { "cat" };
    auto batch = make_decode_batch(ex, vocab, hps);
    expect(batch.size == 3, "one slot per beam");
    expect(batch.enc_ids[0] == batch.enc_ids[2], "slots hold the same article");
}

int main(int, char**)
{
    std::cout << "vocab" << std::endl;
    test_vocab();
    std::cout << "oov ids" << std::endl;
    test_oov_ids();
    std::cout << "parse" << std::endl;
    test_parse();
    std::cout << "batch" << std::endl;
    test_batch();
    std::cout << "decode batch" << std::endl;
    test_decode_batch();

    return test_status();
}
