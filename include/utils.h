#pragma once

#include <fstream>
#include <string>
#include <vector>

#include <dynet/expr.h>
#include <dynet/param-init.h>

namespace dy = dynet;

/*
 * Generic utils
 */

void normalize_vector(std::vector<float> & v);
unsigned line_count(const std::string filename);

/* n samples of N(0, stddev^2), redrawing any beyond two deviations.
 * Uses the DyNet random engine, so call after dy::initialize. */
std::vector<float> truncated_normal(unsigned n, float stddev);

dy::ParameterInitFromVector truncated_normal_init(const dy::Dim& d, float stddev);

/* Tile x (a scalar, a row or a column) up to the target shape. */
dy::Expression broadcast(const dy::Expression& x, const dy::Dim& target);

/* Scale every column of X by the matching entry of the row vector w. */
dy::Expression scale_cols(const dy::Expression& X, const dy::Expression& w);

/* x times a {1} scalar expression */
dy::Expression scale(const dy::Expression& x, const dy::Expression& s);

/* Scalar convex combination g * a + (1 - g) * b, with g of dim {1}. */
dy::Expression convex(const dy::Expression& g,
                      const dy::Expression& a,
                      const dy::Expression& b);
