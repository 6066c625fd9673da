#include <algorithm>
#include <sstream>

#include "data.h"

namespace {

std::vector<std::string>
split_tokens(const std::string& buf)
{
    std::vector<std::string> toks;
    std::stringstream ss(buf);
    std::string tmp;
    while (ss >> tmp)
        toks.push_back(tmp);
    return toks;
}

std::vector<Dependency>
parse_deps(const std::string& buf, size_t n_tokens, const std::string& what)
{
    std::vector<Dependency> deps;
    for (auto&& tok : split_tokens(buf)) {
        auto colon = tok.find(':');
        if (colon == std::string::npos)
            throw std::runtime_error("Malformed " + what + " dependency '" +
                                     tok + "': expected head:label");
        Dependency dep;
        try {
            dep.head = std::stoul(tok.substr(0, colon));
            dep.label = std::stoul(tok.substr(colon + 1));
        } catch (const std::logic_error&) {
            throw std::runtime_error("Malformed " + what + " dependency '" +
                                     tok + "'");
        }
        if (dep.head > n_tokens)
            throw std::runtime_error("Dependency head out of range in " +
                                     what);
        deps.push_back(dep);
    }

    if (!deps.empty() && deps.size() != n_tokens)
        throw std::runtime_error("Mismatched dependency count for " + what +
                                 ": " + std::to_string(deps.size()) + " vs " +
                                 std::to_string(n_tokens) + " tokens");
    return deps;
}

template<typename T>
std::vector<T>
padded(std::vector<T> v, unsigned length, T pad)
{
    v.resize(length, pad);
    return v;
}

std::vector<float>
make_mask(unsigned len, unsigned length)
{
    std::vector<float> mask(length, 0.f);
    std::fill(mask.begin(), mask.begin() + std::min(len, length), 1.f);
    return mask;
}

}

std::istream&
operator>>(std::istream& in, Example& data)
{
    std::string line;
    do {
        std::getline(in, line);
    } while (in && line.find_first_not_of(" \t\r") == std::string::npos);

    if (!in)  // failed
        return in;

    std::vector<std::string> cols;
    {
        std::stringstream ss(line);
        std::string col;
        while (std::getline(ss, col, '\t'))
            cols.push_back(col);
    }

    if (cols.size() < 2)
        throw std::runtime_error("Malformed example line: expected at least "
                                 "article and abstract columns");

    data.article = split_tokens(cols[0]);
    data.abstract = split_tokens(cols[1]);
    if (data.article.empty())
        throw std::runtime_error("Malformed example line: empty article");

    if (cols.size() > 2)
        data.article_deps = parse_deps(cols[2], data.article.size(), "article");
    if (cols.size() > 3)
        data.query = split_tokens(cols[3]);
    if (cols.size() > 4)
        data.query_deps = parse_deps(cols[4], data.query.size(), "query");

    return in;
}

GraphInput
make_graph_input(const std::vector<Dependency>& deps,
                 unsigned length,
                 unsigned n_nodes,
                 unsigned n_labels)
{
    GraphInput g;
    g.adj_in.resize(n_labels);
    g.adj_out.resize(n_labels);
    for (auto&& a : g.adj_in)
        a.n = n_nodes;
    for (auto&& a : g.adj_out)
        a.n = n_nodes;
    g.neighbour_count.assign(n_nodes, 1.f);

    unsigned n = std::min<unsigned>(length, deps.size());
    for (unsigned m = 0; m < n; ++m) {
        auto&& dep = deps[m];
        if (dep.head == 0)
            continue;
        unsigned h = dep.head - 1;
        // arcs into truncated tokens are dropped
        if (h >= n)
            continue;
        // a single label means a label-free graph
        unsigned label = n_labels == 1 ? 0 : dep.label;
        if (label >= n_labels)
            throw std::runtime_error("Dependency label " +
                                     std::to_string(dep.label) +
                                     " out of range");

        g.adj_in[label].add(m, h);
        g.adj_out[label].add(h, m);
        g.neighbour_count[m] += 1;
        g.neighbour_count[h] += 1;
    }
    return g;
}

Batch
make_batch(const std::vector<Example>& examples,
           const Vocab& vocab,
           const HParams& hps)
{
    if (examples.empty())
        throw std::invalid_argument("Cannot batch zero examples");

    Batch b;
    b.size = examples.size();
    b.dec_steps = hps.max_dec_steps;

    unsigned n_labels =
      hps.use_label_information ? hps.num_word_dependency_labels : 1;

    for (auto&& ex : examples) {
        unsigned len = std::min<unsigned>(ex.article.size(), hps.max_enc_steps);
        b.enc_steps = std::max(b.enc_steps, len);
        unsigned qlen = std::min<unsigned>(ex.query.size(), hps.max_query_steps);
        b.query_steps = std::max(b.query_steps, qlen);
    }

    for (auto&& ex : examples) {
        std::vector<std::string> article(
          ex.article.begin(),
          ex.article.begin() + std::min<size_t>(ex.article.size(),
                                                hps.max_enc_steps));
        unsigned len = article.size();

        std::vector<unsigned> ids;
        for (auto&& w : article)
            ids.push_back(vocab.word2id(w));

        std::vector<std::string> oovs;
        auto ext_ids = article2ids(article, vocab, oovs);

        b.enc_ids.push_back(padded(ids, b.enc_steps, (unsigned)Vocab::PAD_ID));
        b.enc_ext_ids.push_back(
          padded(ext_ids, b.enc_steps, (unsigned)Vocab::PAD_ID));
        b.enc_lens.push_back(len);
        b.enc_mask.push_back(make_mask(len, b.enc_steps));
        b.max_art_oovs = std::max<unsigned>(b.max_art_oovs, oovs.size());

        // decoder input starts with [START], target ends with [STOP]
        std::vector<unsigned> abs_ids;
        for (auto&& w : ex.abstract)
            abs_ids.push_back(vocab.word2id(w));
        auto abs_ext = abstract2ids(ex.abstract, vocab, oovs);

        std::vector<unsigned> dec_in{ Vocab::START_ID };
        dec_in.insert(dec_in.end(), abs_ids.begin(), abs_ids.end());
        std::vector<unsigned> target(hps.pointer_gen ? abs_ext : abs_ids);
        target.push_back(Vocab::STOP_ID);

        if (dec_in.size() > hps.max_dec_steps) {
            // truncated target has no [STOP]
            dec_in.resize(hps.max_dec_steps);
            target.resize(hps.max_dec_steps);
        }
        unsigned dec_len = dec_in.size();

        b.dec_ids.push_back(padded(dec_in, b.dec_steps, (unsigned)Vocab::PAD_ID));
        b.target_ids.push_back(
          padded(target, b.dec_steps, (unsigned)Vocab::PAD_ID));
        b.dec_lens.push_back(dec_len);
        b.dec_mask.push_back(make_mask(dec_len, b.dec_steps));

        if (hps.query_encoder) {
            unsigned qlen = std::min<unsigned>(ex.query.size(),
                                               hps.max_query_steps);
            if (qlen == 0)
                throw std::runtime_error("Query encoder enabled but example "
                                         "has no query");
            std::vector<unsigned> qids;
            for (unsigned i = 0; i < qlen; ++i)
                qids.push_back(vocab.word2id(ex.query[i]));
            b.query_ids.push_back(
              padded(qids, b.query_steps, (unsigned)Vocab::PAD_ID));
            b.query_lens.push_back(qlen);
            b.query_mask.push_back(make_mask(qlen, b.query_steps));

            if (hps.query_gcn)
                b.query_graphs.push_back(make_graph_input(
                  ex.query_deps, qlen, b.query_steps, n_labels));
        }

        if (hps.word_gcn)
            b.enc_graphs.push_back(
              make_graph_input(ex.article_deps, len, b.enc_steps, n_labels));

        b.art_oovs.push_back(oovs);
        b.abstracts.push_back(ex.abstract);
    }

    return b;
}

Batch
make_decode_batch(const Example& example, const Vocab& vocab, const HParams& hps)
{
    std::vector<Example> repeated(hps.batch_size, example);
    return make_batch(repeated, vocab, hps);
}
