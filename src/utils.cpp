#include <cmath>
#include <random>
#include <stdexcept>

#include <Eigen/Eigen>
#include <dynet/globals.h>
#include "utils.h"


void normalize_vector(std::vector<float>& v)
{
    Eigen::Map<Eigen::RowVectorXf> v_map(v.data(), v.size());
    v_map.normalize();
}


unsigned line_count(const std::string filename)
{
    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("Cannot open " + filename);
    std::string line;

    unsigned lines = 0;
    while (getline(in, line))
        ++lines;

    return lines;
}


std::vector<float>
truncated_normal(unsigned n, float stddev)
{
    std::normal_distribution<float> normal(0.f, stddev);
    std::vector<float> out(n);
    for (auto& x : out) {
        do
            x = normal(*dy::rndeng);
        while (std::fabs(x) > 2.f * stddev);
    }
    return out;
}


dy::ParameterInitFromVector
truncated_normal_init(const dy::Dim& d, float stddev)
{
    return dy::ParameterInitFromVector(truncated_normal(d.size(), stddev));
}


dy::Expression
broadcast(const dy::Expression& x, const dy::Dim& target)
{
    auto& cg = *x.pg;
    auto d = x.dim();
    unsigned rows = target.rows();
    unsigned cols = target.cols();

    dy::Expression out;
    if (d.size() == 1)
        out = dy::ones(cg, { rows, 1 }) * dy::reshape(x, { 1, 1 }) *
              dy::ones(cg, { 1, cols });
    else if (d.rows() == 1)
        out = dy::ones(cg, { rows, 1 }) * dy::reshape(x, { 1, cols });
    else
        out = dy::reshape(x, { rows, 1 }) * dy::ones(cg, { 1, cols });

    return dy::reshape(out, target);
}


dy::Expression
scale_cols(const dy::Expression& X, const dy::Expression& w)
{
    return dy::cmult(X, broadcast(w, X.dim()));
}


dy::Expression
scale(const dy::Expression& x, const dy::Expression& s)
{
    return dy::cmult(x, broadcast(s, x.dim()));
}


dy::Expression
convex(const dy::Expression& g, const dy::Expression& a, const dy::Expression& b)
{
    auto G = broadcast(g, a.dim());
    return dy::cmult(G, a) + dy::cmult(1.f - G, b);
}
