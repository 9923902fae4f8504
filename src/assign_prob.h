#ifndef _DEMUX_VB_ASSIGN_PROB_H
#define _DEMUX_VB_ASSIGN_PROB_H
#include <vector>
#include "vb_numerics.h"
#include "ad_counts.h"

/**
 * Compute, for every cell, the posterior probability of each identity
 * (donors, then doublet combinations if gt_prob includes them).
 *
 * gt_prob holds n_states blocks of counts.n_vars rows, and one column per 
 * row of shapes. Only the first n_states entries of psi are used, 
 * renormalized to sum to 1.
 *
 * id_prob receives cells x n_states posteriors. If loglik_id is given, it
 * receives the expected log likelihood of each cell under each identity
 * (without the prior).
 *
 * Returns the log likelihood: the sum over cells of the log-sum-exp of
 * their prior-weighted rows.
 */
double get_id_prob(const ad_counts& counts,
    const prob_mtx& gt_prob,
    const prob_mtx& shapes,
    const std::vector<double>& psi,
    prob_mtx& id_prob,
    prob_mtx* loglik_id = NULL);

// Normalized log prior over the first n_states identities
void log_state_prior(const std::vector<double>& psi, int n_states, 
    std::vector<double>& log_prior);

#endif
