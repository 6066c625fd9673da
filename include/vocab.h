#pragma once

#include <string>
#include <unordered_map>
#include <vector>

/* Word <-> id mapping. The first four ids are reserved. */

struct Vocab
{
    enum Special : unsigned
    {
        UNK_ID = 0,
        PAD_ID = 1,
        START_ID = 2,
        STOP_ID = 3
    };

    static const char* const UNK;
    static const char* const PAD;
    static const char* const START;
    static const char* const STOP;

    /* reads `word count` lines, stopping once max_size words are known
     * (max_size = 0 means no limit) */
    Vocab(const std::string& filename, unsigned max_size);

    explicit Vocab(const std::vector<std::string>& words);

    unsigned word2id(const std::string& word) const;
    const std::string& id2word(unsigned id) const;
    unsigned size() const { return id_to_word_.size(); }

    /* one word per line, in id order, for embedding viewers */
    void write_metadata(const std::string& filename) const;

    private:
    void add_word(const std::string& word);

    std::unordered_map<std::string, unsigned> word_to_id_;
    std::vector<std::string> id_to_word_;
};

/* Extended-vocabulary bookkeeping for the copy mechanism. Article words
 * outside the vocabulary get temporary ids size(), size() + 1, ... in
 * order of first appearance. */

std::vector<unsigned> article2ids(const std::vector<std::string>& words,
                                  const Vocab& vocab,
                                  std::vector<std::string>& oovs);

std::vector<unsigned> abstract2ids(const std::vector<std::string>& words,
                                   const Vocab& vocab,
                                   const std::vector<std::string>& article_oovs);

std::vector<std::string> outputids2words(const std::vector<unsigned>& ids,
                                         const Vocab& vocab,
                                         const std::vector<std::string>& article_oovs);
