#ifndef _DEMUX_VB_VB_RUN_H
#define _DEMUX_VB_VB_RUN_H
#include <string>
#include <vector>
#include <random>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "betabin.h"
#include "genotype_post.h"

/**
 * Stages of a single variational run. A finished run reports how it
 * stopped (converged, hit the iteration cap, or diverged).
 */
enum vb_state{
    VB_INITIALIZING,
    VB_ITERATING,
    VB_CONVERGED,
    VB_MAX_ITER,
    VB_DIVERGED,
    VB_POST_DOUBLET_REFINE,
    VB_DONE
};

const char* vb_state_name(vb_state s);

// How to set the prior mass on doublet identities
enum dbl_prior_mode{
    // Every singlet and doublet identity equally likely
    DBL_PRIOR_UNIFORM,
    // A given fraction of cells are doublets
    DBL_PRIOR_FIXED,
    // Doublet fraction grows with the number of cells loaded
    DBL_PRIOR_AUTO
};

/**
 * Options controlling a single run.
 */
struct vb_opts{
    bool check_doublet;
    // Include doublet identities in every iteration after burn-in,
    // rather than in one extra pass at the end
    bool check_doublet_iterative;
    // Hard (one-hot) genotype updates
    bool binary_gt;
    bool learn_theta;
    int min_iter;
    int max_iter;
    double epsilon_conv;
    
    // Error model updates (and iterative doublet checking) happen at 
    // iterations above max(min_iter - burnin_offset, min_iter * burnin_frac)
    double burnin_frac;
    int burnin_offset;
    
    dbl_prior_mode doublet_prior_mode;
    double doublet_prior;
    // Cells per unit of doublet rate in DBL_PRIOR_AUTO mode
    double auto_doublet_scale;
    
    prob_mtx theta_prior;
    bool verbose;

    vb_opts();
    
    // Prints an error and returns false for unusable settings
    bool validate() const;
    
    double burnin() const;
};

/**
 * Everything a finished run reports.
 */
struct vb_result{
    // Log likelihood of the final assignment step
    double loglik;
    // Final evidence lower bound, and its value at each iteration
    double lbound;
    std::vector<double> lbound_all;
    int n_iter;
    vb_state status;
    
    int n_donors;
    // Beta shapes per genotype state (0, 1, 2, and 0.5, 1.5 if doublets 
    // were checked)
    prob_mtx theta;
    // Prior over donors followed by doublet combinations
    std::vector<double> psi;
    // Donor-major genotype probabilities (n_donors * n_vars rows)
    prob_mtx gt_prob;
    // Genotype probabilities of each doublet combination (5 states)
    prob_mtx gt_doublet_prob;
    // Cell x donor and cell x doublet combination posteriors
    prob_mtx prob;
    prob_mtx prob_doublet;

    vb_result();
};

// Prior fraction of doublets. With warn set, prints a warning when an
// unusable value is replaced by the uniform prior.
double doublet_prior_frac(int n_donors, int n_cells, const vb_opts& opts, bool warn);

// Prior weights over donors (shared singlet mass) then doublet combinations
void set_psi(int n_donors, int n_cells, const vb_opts& opts, 
    std::vector<double>& psi, bool warn = false);

/**
 * One coordinate ascent run: alternates error model, cell assignment, 
 * and genotype updates until the lower bound stops improving.
 * Holds its own copy of all mutable state; the counts are shared 
 * read-only.
 */
class vb_run{
    private:
        const ad_counts* counts;
        vb_opts opts;
        
        int n_donors;
        int n_comb;
        bool gt_set;
        bool update_gt;
        
        vb_state state;
        vb_state stop_state;
        
        prob_mtx gt_prob;
        prob_mtx gt_prior;
        betabin_model theta;
        std::vector<double> psi;
        
        prob_mtx id_prob;
        prob_mtx loglik_id;
        int n_states;
        double loglik;
        
        gt_stats stats;
        prob_mtx loglik_gt;

        std::vector<double> lbound;
        
        void init_donors(int n);
        void update_theta();
        double assign(bool with_doublets);
        void update_genotypes();
        double lower_bound();
        void refine_doublets();
        void fill_result(vb_result& result, int n_iter);

    public:
        
        vb_run(const ad_counts& counts, const vb_opts& opts);
        
        // Fixed donor genotypes (variant x donor, 0/1/2, -1 = missing).
        // Genotypes are not re-estimated.
        bool set_genotypes(const std::vector<std::vector<int> >& gt);
        
        // Unknown genotypes for n donors, started from one random draw per
        // donor-variant from a uniform prior.
        void set_random_genotypes(int n, std::mt19937& rng);

        // Unknown genotypes started from (and regularized toward) a prior
        // table of n * n_vars rows.
        bool set_gt_prior(const prob_mtx& prior, int n);

        // Returns false if the run could not start
        bool run(vb_result& result);

        vb_state get_state() const;
};

#endif
