#pragma once

#include <dynet/io.h>
#include <dynet/param-init.h>

#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "utils.h"
#include "vocab.h"

namespace dy = dynet;

struct BaseModel
{
    explicit
    BaseModel(dy::ParameterCollection&& p) : p(p) {};

    virtual ~BaseModel() = default;

    virtual void
    set_train_time()
    {
        training_ = true;
    }

    virtual void
    set_test_time()
    {
        training_ = false;
    }


    void save(const std::string filename)
    {
        dy::TextFileSaver s(filename);
        s.save(p);
    }

    void load(const std::string filename)
    {
        dy::TextFileLoader l(filename);
        l.populate(p);
    }

    dy::ParameterCollection p;
    bool training_ = false;
};


struct BaseEmbedModel : BaseModel
{
    unsigned vocab_size_;
    unsigned embed_dim_;
    bool update_embed_;
    dy::LookupParameter p_emb;

    /* Embeddings always live in the model collection so that they are
     * saved; frozen ones are read with const_lookup and skipped by the
     * trainer. */
    explicit
    BaseEmbedModel(
        dy::ParameterCollection& params,
        unsigned vocab_size,
        unsigned embed_dim,
        bool update_embed,
        float init_std,
        std::string model_name="model")
    : BaseModel{params.add_subcollection(model_name)}
    , vocab_size_{vocab_size}
    , embed_dim_{embed_dim}
    , update_embed_{update_embed}
    {
        p_emb = p.add_lookup_parameters(
            vocab_size_,
            {embed_dim_},
            truncated_normal_init({embed_dim_, vocab_size_}, init_std),
            "embedding");
        if (!update_embed_)
            p_emb.set_updated(false);
    }

    /* GloVe text format: a word followed by its vector on each line.
     * Rows for words missing from the file keep their initialization. */
    unsigned
    load_embeddings(
        const std::string filename,
        const Vocab& vocab,
        bool normalize=false)
    {
        std::cerr << "~ ~ loading embeddings... ~ ~ ";
        std::ifstream in(filename);
        if (!in)
            throw std::runtime_error("Cannot open embeddings " + filename);
        std::string line;
        std::vector<float> embed(embed_dim_);
        unsigned found = 0;

        while (getline(in, line))
        {
            std::istringstream lin(line);
            std::string word;
            lin >> word;

            auto ix = vocab.word2id(word);
            if (ix == Vocab::UNK_ID && word != Vocab::UNK)
                continue;

            for (unsigned i = 0; i < embed_dim_; ++i)
                lin >> embed[i];
            if (!lin)
                throw std::runtime_error("Embedding for '" + word +
                                         "' is shorter than emb_dim");

            if (normalize)
                normalize_vector(embed);

            p_emb.initialize(ix, embed);
            found += 1;
        }
        std::cerr << "done, " << found << " of " << vocab.size()
                  << " words found." << std::endl;
        return found;
    }

    dy::Expression
    embed_word(
        dy::ComputationGraph& cg,
        unsigned w)
    {
        return update_embed_ ? dy::lookup(cg, p_emb, w)
                             : dy::const_lookup(cg, p_emb, w);
    }

    std::vector<dy::Expression>
    embed_sent(
        dy::ComputationGraph& cg,
        const std::vector<unsigned>& word_ixs,
        size_t length)
    {
        std::vector<dy::Expression> embeds(length);
        for (size_t i = 0; i < length; ++i)
            embeds[i] = embed_word(cg, word_ixs.at(i));
        return embeds;
    }
};
