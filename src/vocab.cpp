#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "vocab.h"

const char* const Vocab::UNK = "[UNK]";
const char* const Vocab::PAD = "[PAD]";
const char* const Vocab::START = "[START]";
const char* const Vocab::STOP = "[STOP]";

namespace {

bool
is_special(const std::string& w)
{
    return w == Vocab::UNK || w == Vocab::PAD || w == Vocab::START ||
           w == Vocab::STOP;
}

}

Vocab::Vocab(const std::string& filename, unsigned max_size)
{
    for (auto w : { UNK, PAD, START, STOP })
        add_word(w);

    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("Cannot open vocabulary " + filename);

    std::string line;
    unsigned lineno = 0;
    while (getline(in, line)) {
        ++lineno;
        std::istringstream lin(line);
        std::string word;
        long count;
        if (!(lin >> word >> count)) {
            std::cerr << "Warning: skipping malformed vocab line " << lineno
                      << std::endl;
            continue;
        }
        if (is_special(word))
            throw std::runtime_error("Reserved token " + word +
                                     " found in vocabulary file");
        if (word_to_id_.count(word))
            throw std::runtime_error("Duplicate vocabulary word " + word);

        add_word(word);
        if (max_size != 0 && size() >= max_size)
            break;
    }

    std::cerr << "Vocabulary: " << size() << " words, last one "
              << id_to_word_.back() << std::endl;
}

Vocab::Vocab(const std::vector<std::string>& words)
{
    for (auto w : { UNK, PAD, START, STOP })
        add_word(w);
    for (auto&& w : words)
        if (!word_to_id_.count(w))
            add_word(w);
}

void
Vocab::add_word(const std::string& word)
{
    word_to_id_[word] = id_to_word_.size();
    id_to_word_.push_back(word);
}

unsigned
Vocab::word2id(const std::string& word) const
{
    auto it = word_to_id_.find(word);
    if (it == word_to_id_.end())
        return UNK_ID;
    return it->second;
}

const std::string&
Vocab::id2word(unsigned id) const
{
    if (id >= id_to_word_.size())
        throw std::out_of_range("Id not found in vocabulary: " +
                                std::to_string(id));
    return id_to_word_[id];
}

void
Vocab::write_metadata(const std::string& filename) const
{
    std::ofstream out(filename);
    if (!out)
        throw std::runtime_error("Cannot write " + filename);
    out << "word\n";
    for (auto&& w : id_to_word_)
        out << w << '\n';
}

std::vector<unsigned>
article2ids(const std::vector<std::string>& words,
            const Vocab& vocab,
            std::vector<std::string>& oovs)
{
    std::vector<unsigned> ids;
    ids.reserve(words.size());
    for (auto&& w : words) {
        auto i = vocab.word2id(w);
        if (i == Vocab::UNK_ID) {
            auto it = std::find(oovs.begin(), oovs.end(), w);
            if (it == oovs.end()) {
                oovs.push_back(w);
                it = oovs.end() - 1;
            }
            i = vocab.size() + (it - oovs.begin());
        }
        ids.push_back(i);
    }
    return ids;
}

std::vector<unsigned>
abstract2ids(const std::vector<std::string>& words,
             const Vocab& vocab,
             const std::vector<std::string>& article_oovs)
{
    std::vector<unsigned> ids;
    ids.reserve(words.size());
    for (auto&& w : words) {
        auto i = vocab.word2id(w);
        if (i == Vocab::UNK_ID) {
            auto it = std::find(article_oovs.begin(), article_oovs.end(), w);
            if (it != article_oovs.end())
                i = vocab.size() + (it - article_oovs.begin());
        }
        ids.push_back(i);
    }
    return ids;
}

std::vector<std::string>
outputids2words(const std::vector<unsigned>& ids,
                const Vocab& vocab,
                const std::vector<std::string>& article_oovs)
{
    std::vector<std::string> words;
    words.reserve(ids.size());
    for (auto i : ids) {
        if (i < vocab.size()) {
            words.push_back(vocab.id2word(i));
        } else {
            auto k = i - vocab.size();
            if (k >= article_oovs.size())
                throw std::out_of_range("Copied id " + std::to_string(i) +
                                        " has no matching article OOV");
            words.push_back(article_oovs[k]);
        }
    }
    return words;
}
