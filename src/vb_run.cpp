#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>
#include <utility>
#include <math.h>
#include <float.h>
#include <random>
#include "common.h"
#include "vb_numerics.h"
#include "ad_counts.h"
#include "betabin.h"
#include "genotype_post.h"
#include "doublet_comb.h"
#include "assign_prob.h"
#include "vb_run.h"

using namespace std;

const char* vb_state_name(vb_state s){
    switch(s){
        case VB_INITIALIZING:
            return "initializing";
        case VB_ITERATING:
            return "iterating";
        case VB_CONVERGED:
            return "converged";
        case VB_MAX_ITER:
            return "max_iter";
        case VB_DIVERGED:
            return "diverged";
        case VB_POST_DOUBLET_REFINE:
            return "post_doublet_refine";
        case VB_DONE:
            return "done";
    }
    return "unknown";
}

vb_opts::vb_opts(){
    check_doublet = true;
    check_doublet_iterative = false;
    binary_gt = false;
    learn_theta = true;
    min_iter = 20;
    max_iter = 200;
    epsilon_conv = 1e-2;
    burnin_frac = 2.0/3.0;
    burnin_offset = 5;
    doublet_prior_mode = DBL_PRIOR_UNIFORM;
    doublet_prior = -1;
    auto_doublet_scale = 100000;
    default_theta_prior(theta_prior);
    verbose = false;
}

bool vb_opts::validate() const{
    if (min_iter < 1){
        fprintf(stderr, "ERROR: min_iter must be at least 1\n");
        return false;
    }
    if (max_iter < min_iter){
        fprintf(stderr, "ERROR: max_iter (%d) must be >= min_iter (%d)\n", max_iter, min_iter);
        return false;
    }
    if (epsilon_conv < 0){
        fprintf(stderr, "ERROR: convergence epsilon must be non-negative\n");
        return false;
    }
    if (burnin_frac < 0 || burnin_frac > 1){
        fprintf(stderr, "ERROR: burn-in fraction must be between 0 and 1\n");
        return false;
    }
    if (doublet_prior_mode == DBL_PRIOR_AUTO && auto_doublet_scale <= 0){
        fprintf(stderr, "ERROR: automatic doublet prior scale must be positive\n");
        return false;
    }
    if (theta_prior.size() != N_GT_SINGLET){
        fprintf(stderr, "ERROR: theta prior needs one row per genotype (%d)\n", N_GT_SINGLET);
        return false;
    }
    for (int i = 0; i < theta_prior.size(); ++i){
        if (theta_prior[i].size() != 2 || theta_prior[i][0] <= 0 || theta_prior[i][1] <= 0){
            fprintf(stderr, "ERROR: theta prior shapes must be two positive values per genotype\n");
            return false;
        }
    }
    return true;
}

double vb_opts::burnin() const{
    double b1 = (double)(min_iter - burnin_offset);
    double b2 = (double)min_iter * burnin_frac;
    return (b1 > b2 ? b1 : b2);
}

vb_result::vb_result(){
    loglik = 0.0;
    lbound = -INFINITY;
    n_iter = 0;
    status = VB_INITIALIZING;
    n_donors = 0;
}

double doublet_prior_frac(int n_donors, int n_cells, const vb_opts& opts, bool warn){
    int n_comb = n_doublet_combs(n_donors);
    if (n_comb == 0){
        return 0.0;
    }
    double uniform = (double)n_comb / (double)(n_donors + n_comb);
    if (opts.doublet_prior_mode == DBL_PRIOR_FIXED){
        if (opts.doublet_prior < 0 || opts.doublet_prior >= 1){
            if (warn){
                fprintf(stderr, "WARNING: doublet prior %f outside [0, 1); using uniform prior\n",
                    opts.doublet_prior);
            }
            return uniform;
        }
        return opts.doublet_prior;
    }
    else if (opts.doublet_prior_mode == DBL_PRIOR_AUTO){
        double dp = (double)n_cells / opts.auto_doublet_scale;
        if (dp >= 1){
            if (warn){
                fprintf(stderr, "WARNING: automatic doublet prior %f too high for %d cells; \
using uniform prior\n", dp, n_cells);
            }
            return uniform;
        }
        return dp;
    }
    return uniform;
}

void set_psi(int n_donors, int n_cells, const vb_opts& opts, vector<double>& psi, bool warn){
    int n_comb = n_doublet_combs(n_donors);
    double dp = doublet_prior_frac(n_donors, n_cells, opts, warn);
    psi.clear();
    for (int k = 0; k < n_donors; ++k){
        psi.push_back((1.0 - dp) / (double)n_donors);
    }
    for (int k = 0; k < n_comb; ++k){
        psi.push_back(dp / (double)n_comb);
    }
}

vb_run::vb_run(const ad_counts& c, const vb_opts& o) : theta(o.theta_prior){
    this->counts = &c;
    this->opts = o;
    this->n_donors = 0;
    this->n_comb = 0;
    this->gt_set = false;
    this->update_gt = false;
    this->state = VB_INITIALIZING;
    this->stop_state = VB_INITIALIZING;
    this->n_states = 0;
    this->loglik = 0.0;
}

void vb_run::init_donors(int n){
    this->n_donors = n;
    this->n_comb = n_doublet_combs(n);
    set_psi(n_donors, counts->n_cells, opts, psi);
    this->gt_set = true;
}

bool vb_run::set_genotypes(const vector<vector<int> >& gt){
    if (gt.size() != counts->n_vars){
        fprintf(stderr, "ERROR: genotypes given for %ld variants; count data has %d\n",
            gt.size(), counts->n_vars);
        return false;
    }
    if (gt.size() == 0 || gt[0].size() == 0){
        fprintf(stderr, "ERROR: no donor genotypes given\n");
        return false;
    }
    for (int i = 0; i < gt.size(); ++i){
        if (gt[i].size() != gt[0].size()){
            fprintf(stderr, "ERROR: genotypes at variant %d given for %ld donors; expected %ld\n",
                i, gt[i].size(), gt[0].size());
            return false;
        }
    }
    gt_to_prob(gt, gt_prob);
    gt_prior.clear();
    update_gt = false;
    init_donors(gt[0].size());
    return true;
}

void vb_run::set_random_genotypes(int n, mt19937& rng){
    uniform_gt_prior(n * counts->n_vars, gt_prior);
    init_gt_prob(gt_prior, rng, gt_prob);
    update_gt = true;
    init_donors(n);
}

bool vb_run::set_gt_prior(const prob_mtx& prior, int n){
    if (n < 1 || prior.size() != n * counts->n_vars){
        fprintf(stderr, "ERROR: genotype prior has %ld rows; expected %d donors x %d variants\n",
            prior.size(), n, counts->n_vars);
        return false;
    }
    gt_prob = prior;
    gt_prior = prior;
    clamp_prob_rows(gt_prior, GT_PRIOR_MIN, GT_PRIOR_MAX);
    update_gt = true;
    init_donors(n);
    return true;
}

vb_state vb_run::get_state() const{
    return state;
}

void vb_run::update_theta(){
    vector<double> alt_sum;
    vector<double> ref_sum;
    gt_state_sums(stats, gt_prob, alt_sum, ref_sum);
    theta.update(alt_sum, ref_sum);
}

/**
 * Recompute cell identity posteriors, either over donors only or over
 * donors plus every doublet combination.
 */
double vb_run::assign(bool with_doublets){
    if (with_doublets){
        prob_mtx gt_both;
        prob_mtx shapes_both;
        get_doublet_gt(gt_prob, n_donors, gt_both);
        theta.doublet_shapes(shapes_both);
        n_states = n_donors + n_comb;
        return get_id_prob(*counts, gt_both, shapes_both, psi, id_prob, &loglik_id);
    }
    else{
        n_states = n_donors;
        return get_id_prob(*counts, gt_prob, theta.shapes, psi, id_prob, &loglik_id);
    }
}

void vb_run::update_genotypes(){
    compute_gt_stats(*counts, id_prob, n_donors, stats);
    gt_loglik(stats, theta.shapes, loglik_gt);
    if (update_gt){
        update_gt_post(loglik_gt, gt_prior, opts.binary_gt, gt_prob);
    }
}

/**
 * Evidence lower bound at the current state: expected log likelihood plus
 * expected log priors, minus the entropy terms of the approximate posteriors.
 */
double vb_run::lower_bound(){
    double lb_p = counts->logchoose_sum();
    for (int i = 0; i < loglik_gt.size(); ++i){
        for (int g = 0; g < N_GT_SINGLET; ++g){
            lb_p += loglik_gt[i][g] * gt_prob[i][g];
        }
    }
    // Doublet identities are not covered by the per-donor genotype terms
    for (int c = 0; c < id_prob.size(); ++c){
        for (int s = n_donors; s < n_states; ++s){
            if (id_prob[c][s] > 0){
                lb_p += id_prob[c][s] * loglik_id[c][s];
            }
        }
    }
    
    vector<double> log_prior;
    log_state_prior(psi, n_states, log_prior);
    double lb_p_id = 0.0;
    for (int c = 0; c < id_prob.size(); ++c){
        for (int s = 0; s < n_states; ++s){
            if (id_prob[c][s] > 0){
                lb_p_id += id_prob[c][s] * log_prior[s];
            }
        }
    }
    double lb_q_id = sum_plogp(id_prob);
    
    double lb_p_gt = 0.0;
    double lb_q_gt = 0.0;
    if (update_gt){
        lb_p_gt = sum_plogq(gt_prob, gt_prior);
        lb_q_gt = sum_plogp(gt_prob);
    }
    
    double lb_p_theta = 0.0;
    double lb_q_theta = 0.0;
    if (opts.learn_theta){
        lb_p_theta = theta.lb_p();
        lb_q_theta = theta.lb_q();
    }
    
    return lb_p_id + lb_p_gt + lb_p_theta + lb_p - lb_q_id - lb_q_gt - lb_q_theta;
}

/**
 * One extra assignment over donors and doublets once iterations stop,
 * followed by one more genotype update from those posteriors.
 */
void vb_run::refine_doublets(){
    state = VB_POST_DOUBLET_REFINE;
    loglik = assign(true);
    if (update_gt){
        update_genotypes();
    }
}

bool vb_run::run(vb_result& result){
    if (!gt_set){
        fprintf(stderr, "ERROR: donor genotypes or number of donors must be set before running\n");
        return false;
    }
    if (!opts.validate()){
        return false;
    }
    if (counts->n_vars == 0 || counts->n_cells == 0){
        fprintf(stderr, "ERROR: no variants or cells to work with\n");
        return false;
    }
    
    state = VB_ITERATING;
    stop_state = VB_ITERATING;
    lbound.clear();
    theta.reset();

    bool doublets = opts.check_doublet && n_comb > 0;
    double burnin = opts.burnin();
    bool have_stats = false;

    // Last complete state, kept in case the bound breaks down
    prob_mtx prev_gt;
    prob_mtx prev_id;
    prob_mtx prev_shapes;
    double prev_loglik = 0.0;
    int prev_n_states = 0;

    int it;
    for (it = 1; it <= opts.max_iter; ++it){
        if (it > opts.min_iter){
            prev_gt = gt_prob;
            prev_id = id_prob;
            prev_shapes = theta.shapes;
            prev_loglik = loglik;
            prev_n_states = n_states;
        }
        
        if (opts.learn_theta && have_stats && it > burnin){
            update_theta();
        }
        
        bool with_doublets = doublets && opts.check_doublet_iterative && it > burnin;
        loglik = assign(with_doublets);
        
        update_genotypes();
        have_stats = true;
        
        double lb = lower_bound();
        lbound.push_back(lb);
        
        if (opts.verbose){
            if (it > 1){
                fprintf(stderr, "It: %d LB: %f LB_diff: %f\n", it, lb, lb - lbound[it-2]);
            }
            else{
                fprintf(stderr, "It: %d LB: %f\n", it, lb);
            }
        }
        
        if (it > opts.min_iter){
            if (isnan(lb) || (isinf(lb) && lb < 0)){
                fprintf(stderr, "WARNING: lower bound diverged at iteration %d; \
keeping iteration %d\n", it, it-1);
                gt_prob = prev_gt;
                id_prob = prev_id;
                theta.shapes = prev_shapes;
                loglik = prev_loglik;
                n_states = prev_n_states;
                lbound.pop_back();
                stop_state = VB_DIVERGED;
                --it;
                break;
            }
            double lb_prev = lbound[it-2];
            if (lb < lb_prev){
                fprintf(stderr, "WARNING: lower bound decreases (%f -> %f)\n", lb_prev, lb);
            }
            if (lb - lb_prev < opts.epsilon_conv){
                stop_state = VB_CONVERGED;
                break;
            }
        }
    }
    if (it > opts.max_iter){
        it = opts.max_iter;
    }
    if (stop_state == VB_ITERATING){
        fprintf(stderr, "WARNING: VB did not converge in %d iterations\n", opts.max_iter);
        stop_state = VB_MAX_ITER;
    }
    state = stop_state;
    
    if (doublets && (!opts.check_doublet_iterative || n_states == n_donors)){
        refine_doublets();
    }
    
    if (opts.verbose){
        fprintf(stderr, "Total iterations: %d; LBound: %.2f; logLik: %.2f\n", it,
            (lbound.size() > 0 ? lbound[lbound.size()-1] : -INFINITY), loglik);
    }
    
    fill_result(result, it);
    state = VB_DONE;
    return true;
}

void vb_run::fill_result(vb_result& result, int n_iter){
    result.loglik = loglik;
    result.lbound_all = lbound;
    result.lbound = (lbound.size() > 0 ? lbound[lbound.size()-1] : -INFINITY);
    result.n_iter = n_iter;
    result.status = stop_state;
    result.n_donors = n_donors;
    result.psi = psi;
    result.gt_prob = gt_prob;
    
    bool doublets = n_states > n_donors;
    if (doublets){
        theta.doublet_shapes(result.theta);
        prob_mtx gt_both;
        get_doublet_gt(gt_prob, n_donors, gt_both);
        result.gt_doublet_prob.assign(gt_both.begin() + gt_prob.size(), gt_both.end());
    }
    else{
        result.theta = theta.shapes;
        result.gt_doublet_prob.clear();
    }
    
    result.prob.clear();
    result.prob_doublet.clear();
    for (int c = 0; c < id_prob.size(); ++c){
        vector<double> row_s(id_prob[c].begin(), id_prob[c].begin() + n_donors);
        result.prob.push_back(row_s);
        if (doublets){
            vector<double> row_d(id_prob[c].begin() + n_donors, id_prob[c].end());
            result.prob_doublet.push_back(row_d);
        }
    }
}
