#ifndef _DEMUX_VB_NUMERICS_H
#define _DEMUX_VB_NUMERICS_H
#include <vector>
#include <utility>
#include <math.h>

/**
 * Numerical helpers shared by the genotype posterior update and
 * the cell assignment step, so that both normalize log-scale rows
 * the same way.
 */

// Row-major dense matrix of probabilities, shapes, or log likelihoods
typedef std::vector<std::vector<double> > prob_mtx;

// Allocate an nrow x ncol matrix of val
void init_mtx(prob_mtx& mtx, int nrow, int ncol, double val = 0.0);

// log(sum(exp(x))). Returns -inf if every element is -inf.
double logsumexp(const std::vector<double>& x);

// Convert a row of unnormalized log probabilities into probabilities
// (subtract max, exponentiate, divide by sum). Rows containing no finite
// value become uniform. Returns the log-sum-exp of the input row.
double normalize_log_row(std::vector<double>& row);

// Rescale a row of non-negative weights to sum to 1. An all-zero
// row becomes uniform.
void normalize_row(std::vector<double>& row);

// Clamp every element to [lower, upper] and renormalize rows.
void clamp_prob_rows(prob_mtx& mtx, double lower, double upper);

// Index of the largest element in a row (first one on ties)
int row_argmax(const std::vector<double>& row);

// Sum of x * log(x) over all elements, with 0 * log(0) = 0
double sum_plogp(const prob_mtx& p);

// Sum of p * log(q) over all elements, skipping elements where p == 0
double sum_plogq(const prob_mtx& p, const prob_mtx& q);

// Log beta function
double log_beta_fn(double a, double b);

// Log binomial coefficient
double log_choose(double n, double k);

// Expectation under Beta(shapes) of the log density of Beta(prior), 
// summed over rows of a shape matrix (one (alpha, beta) pair per row). 
// With prior == shapes this is the negative entropy.
double nega_beta_entropy(const prob_mtx& shapes, const prob_mtx& prior);

/**
 * Digamma terms of the expected Beta-Binomial log likelihood for each 
 * row of a shape matrix: E[log p], E[log 1-p] and their common offset.
 */
struct shape_digammas{
    std::vector<double> d_alt;
    std::vector<double> d_ref;
    std::vector<double> d_sum;
    
    shape_digammas(const prob_mtx& shapes);
    
    // Expected log likelihood of a (alt, total) count under row g
    double ll(int g, double alt, double tot) const{
        return alt * d_alt[g] + (tot - alt) * d_ref[g] - tot * d_sum[g];
    }
};

#endif
