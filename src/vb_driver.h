#ifndef _DEMUX_VB_VB_DRIVER_H
#define _DEMUX_VB_VB_DRIVER_H
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "vb_run.h"

/**
 * What is known about the donors going in: either only how many there 
 * are (genotypes inferred), or their genotypes (held fixed).
 */
enum donor_mode{
    DONORS_INFERRED,
    DONORS_FIXED
};

struct donor_input{
    donor_mode mode;
    
    // DONORS_INFERRED: number of donors, and how far to over-provision 
    // the first pass (values below 1 disable it)
    int n_donors;
    double k_extend;
    // Optional genotype prior to start from (n_donors * n_vars rows)
    prob_mtx gt_prior;
    
    // DONORS_FIXED: variant x donor genotypes (0/1/2, -1 = missing)
    std::vector<std::vector<int> > gt;
    
    std::vector<std::string> donor_names;

    donor_input();
};

donor_input inferred_donors(int n_donors, double k_extend = 1.5);
donor_input fixed_genotypes(const std::vector<std::vector<int> >& gt,
    const std::vector<std::string>& donor_names);

/**
 * Options for the set of restarts.
 */
struct driver_opts{
    // Number of independent runs (-1 = 2 with fixed genotypes, 4 otherwise)
    int n_init;
    int n_threads;
    bool seed_set;
    unsigned long seed;

    driver_opts();
};

struct trial_result{
    int idx;
    // False if the trial did not produce a result (it is then ignored)
    bool finished;
    vb_result res;

    trial_result();
};

// Index of the finished trial with the highest final lower bound 
// (the first one on ties), or -1 if none finished.
int select_best_trial(const std::vector<trial_result>& trials);

class vb_driver;

// This class exists solely to run independent trials in 
// multiple threads (it handles thread management).

class trial_pool{
    private:
        
        vb_driver* driver;
        
        bool terminate_threads;
        int nthread;
        std::mutex queue_mutex;
        std::deque<int> jobs;
        
        std::condition_variable has_jobs;
        std::vector<std::thread> threads;
        
        void worker();

    public:
        trial_pool(vb_driver* driver, int nt, int n_trials);
        
        void add_job(int idx);
        std::mutex output_mutex;
        std::vector<trial_result> results;
        
        void launch_threads();

        void close_pool();
};

/**
 * Runs several independent variational runs, keeps the one with the 
 * highest lower bound, and (when inferring donors with an over-provisioned
 * first pass) reruns with the best-supported donors as a genotype prior.
 */
class vb_driver{
    private:
        const ad_counts* counts;
        vb_opts opts;
        driver_opts dopts;
        
        // Settings of the pass being run, read by trials
        const donor_input* input;
        int n_donors_pass;
        unsigned long base_seed;
        
        bool validate(const donor_input& in);
        void run_trials(int n_init);
        bool prune_rerun(const donor_input& in, vb_result& best);

    public:
        
        vb_driver(const ad_counts& counts, const vb_opts& opts, const driver_opts& dopts);
        
        // Returns false on a configuration error or if no trial finished
        bool run(const donor_input& in, vb_result& best);
        
        // Run a single trial of the current pass; result.finished is false
        // if it could not run
        void run_trial(int idx, trial_result& result);

        // Results of every trial in the first pass
        std::vector<trial_result> trials;
        int best_trial;
        
        // Responsibility mass per donor in the over-provisioned pass, and 
        // donors ordered by it
        std::vector<double> donor_mass;
        std::vector<int> donor_rank;
        
        // Names of the donors in the final result
        std::vector<std::string> donor_names;
};

#endif
