#ifndef _DEMUX_VB_GENOTYPE_POST_H
#define _DEMUX_VB_GENOTYPE_POST_H
#include <vector>
#include <random>
#include "vb_numerics.h"
#include "ad_counts.h"

// Bounds applied to a genotype prior taken from an earlier run
#define GT_PRIOR_MIN 1e-8
#define GT_PRIOR_MAX 0.999999

/**
 * Responsibility-weighted read sums per donor per variant. Row index
 * is donor * n_vars + variant (the same layout as genotype tables).
 */
struct gt_stats{
    std::vector<double> s_alt;
    std::vector<double> s_tot;
};

// Convert hard genotypes (variant x donor, values 0/1/2) into a one-hot 
// genotype probability table. Missing genotypes (-1) become uniform rows.
void gt_to_prob(const std::vector<std::vector<int> >& gt, prob_mtx& gt_prob);

// Draw a random one-hot genotype for every row from a prior table
void init_gt_prob(const prob_mtx& gt_prior, std::mt19937& rng, prob_mtx& gt_prob);

// Uniform prior over the three singlet genotypes
void uniform_gt_prior(int n_rows, prob_mtx& gt_prior);

// Sum A and D over cells, weighted by each cell's singlet responsibility
// for each donor.
void compute_gt_stats(const ad_counts& counts, 
    const prob_mtx& id_prob,
    int n_donors,
    gt_stats& stats);

// Expected log likelihood of each donor-variant row under each singlet
// genotype state
void gt_loglik(const gt_stats& stats, 
    const prob_mtx& shapes, 
    prob_mtx& loglik_gt);

// Genotype-weighted alt and ref read sums per genotype state, for
// updating the error model
void gt_state_sums(const gt_stats& stats,
    const prob_mtx& gt_prob,
    std::vector<double>& alt_sum,
    std::vector<double>& ref_sum);

// Posterior genotype probabilities: log likelihood + log prior, normalized
// per row. With binary set, each row collapses onto the state with the 
// highest log likelihood.
void update_gt_post(const prob_mtx& loglik_gt, 
    const prob_mtx& gt_prior,
    bool binary,
    prob_mtx& gt_prob);

// Most likely genotype (0, 1, 2) of each row
void gt_point_estimate(const prob_mtx& gt_prob, std::vector<int>& gt);

#endif
