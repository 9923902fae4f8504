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
#include <random>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <condition_variable>
#include "common.h"
#include "vb_numerics.h"
#include "ad_counts.h"
#include "vb_run.h"
#include "vb_driver.h"

using namespace std;

donor_input::donor_input(){
    mode = DONORS_INFERRED;
    n_donors = 0;
    k_extend = 1.5;
}

donor_input inferred_donors(int n_donors, double k_extend){
    donor_input in;
    in.mode = DONORS_INFERRED;
    in.n_donors = n_donors;
    in.k_extend = k_extend;
    return in;
}

donor_input fixed_genotypes(const vector<vector<int> >& gt, const vector<string>& donor_names){
    donor_input in;
    in.mode = DONORS_FIXED;
    in.gt = gt;
    in.n_donors = (gt.size() > 0 ? gt[0].size() : 0);
    in.k_extend = -1;
    in.donor_names = donor_names;
    return in;
}

driver_opts::driver_opts(){
    n_init = -1;
    n_threads = 1;
    seed_set = false;
    seed = 0;
}

trial_result::trial_result(){
    idx = -1;
    finished = false;
}

int select_best_trial(const vector<trial_result>& trials){
    int best = -1;
    for (int i = 0; i < trials.size(); ++i){
        if (!trials[i].finished || isnan(trials[i].res.lbound)){
            continue;
        }
        if (best == -1 || trials[i].res.lbound > trials[best].res.lbound){
            best = i;
        }
    }
    return best;
}

// ===== trial_pool =====

trial_pool::trial_pool(vb_driver* d, int nt, int n_trials){
    driver = d;
    nthread = nt;
    terminate_threads = false;
    results.resize(n_trials);
}

void trial_pool::launch_threads(){
    terminate_threads = false;
    for (int i = 0; i < nthread; ++i){
        threads.push_back(thread(&trial_pool::worker, this));
    }
}

void trial_pool::close_pool(){
    {
        unique_lock<mutex> lock(queue_mutex);
        terminate_threads = true;
    }
    has_jobs.notify_all();
    for (int i = 0; i < threads.size(); ++i){
        threads[i].join();
    }
    threads.clear();
}

void trial_pool::add_job(int idx){
    unique_lock<mutex> lock(queue_mutex);
    jobs.push_back(idx);
    has_jobs.notify_one();
}

void trial_pool::worker(){
    while(true){
        int idx = -1;
        {
            unique_lock<mutex> lock(this->queue_mutex);
            this->has_jobs.wait(lock, [this]{ return jobs.size() > 0 || terminate_threads;});
            if (this->jobs.size() == 0 && terminate_threads){
                return;
            }
            idx = jobs[0];
            jobs.pop_front();
        }
        trial_result res;
        driver->run_trial(idx, res);
        unique_lock<mutex> lock(this->output_mutex);
        results[idx] = res;
    }
}

// ===== vb_driver =====

vb_driver::vb_driver(const ad_counts& c, const vb_opts& o, const driver_opts& d){
    this->counts = &c;
    this->opts = o;
    this->dopts = d;
    this->input = NULL;
    this->n_donors_pass = 0;
    this->base_seed = 0;
    this->best_trial = -1;
}

bool vb_driver::validate(const donor_input& in){
    if (!opts.validate()){
        return false;
    }
    if (counts->n_vars == 0 || counts->n_cells == 0){
        fprintf(stderr, "ERROR: no variants or cells to work with\n");
        return false;
    }
    if (dopts.n_init == 0 || dopts.n_init < -1){
        fprintf(stderr, "ERROR: number of initializations must be at least 1\n");
        return false;
    }
    if (in.mode == DONORS_FIXED){
        if (in.gt.size() == 0){
            fprintf(stderr, "ERROR: donor genotypes and number of donors cannot both be missing\n");
            return false;
        }
        if (in.gt.size() != counts->n_vars){
            fprintf(stderr, "ERROR: genotypes given for %ld variants; count data has %d\n",
                in.gt.size(), counts->n_vars);
            return false;
        }
        for (int i = 0; i < in.gt.size(); ++i){
            if (in.gt[i].size() != in.gt[0].size() || in.gt[i].size() == 0){
                fprintf(stderr, "ERROR: genotypes missing for one or more donors at variant %d\n", i);
                return false;
            }
        }
        if (in.donor_names.size() > 0 && in.donor_names.size() != in.gt[0].size()){
            fprintf(stderr, "ERROR: %ld donor names given for %ld donors\n", 
                in.donor_names.size(), in.gt[0].size());
            return false;
        }
    }
    else{
        if (in.n_donors < 1){
            fprintf(stderr, "ERROR: donor genotypes and number of donors cannot both be missing\n");
            return false;
        }
        if (in.gt_prior.size() > 0 && in.gt_prior.size() != in.n_donors * counts->n_vars){
            fprintf(stderr, "ERROR: genotype prior has %ld rows; expected %d\n",
                in.gt_prior.size(), in.n_donors * counts->n_vars);
            return false;
        }
    }
    return true;
}

void vb_driver::run_trial(int idx, trial_result& result){
    result.idx = idx;
    result.finished = false;
    
    vb_run vb(*counts, opts);
    if (input->mode == DONORS_FIXED){
        if (!vb.set_genotypes(input->gt)){
            return;
        }
    }
    else if (input->gt_prior.size() > 0 && n_donors_pass == input->n_donors){
        if (!vb.set_gt_prior(input->gt_prior, n_donors_pass)){
            return;
        }
    }
    else{
        // Each trial gets its own generator, so results do not depend on 
        // which thread runs which trial
        mt19937 rng(base_seed + (unsigned long)idx);
        vb.set_random_genotypes(n_donors_pass, rng);
    }
    result.finished = vb.run(result.res);
}

void vb_driver::run_trials(int n_init){
    trials.clear();
    if (dopts.n_threads > 1){
        int nt = dopts.n_threads;
        if (nt > n_init){
            nt = n_init;
        }
        trial_pool pool(this, nt, n_init);
        pool.launch_threads();
        for (int i = 0; i < n_init; ++i){
            pool.add_job(i);
        }
        pool.close_pool();
        trials = pool.results;
    }
    else{
        for (int i = 0; i < n_init; ++i){
            trial_result res;
            run_trial(i, res);
            trials.push_back(res);
        }
    }
}

/**
 * Keep the n_donors donors with the most assigned cells from the best
 * over-provisioned run, and use their genotypes as a prior for a final 
 * run at the requested number of donors.
 */
bool vb_driver::prune_rerun(const donor_input& in, vb_result& best){
    int n_vars = counts->n_vars;
    int n_run1 = best.n_donors;
    
    donor_mass.assign(n_run1, 0.0);
    for (int c = 0; c < best.prob.size(); ++c){
        for (int k = 0; k < n_run1; ++k){
            donor_mass[k] += best.prob[c][k];
        }
    }
    donor_rank.clear();
    for (int k = 0; k < n_run1; ++k){
        donor_rank.push_back(k);
    }
    stable_sort(donor_rank.begin(), donor_rank.end(), [this](int a, int b){
        return donor_mass[a] > donor_mass[b];
    });
    
    fprintf(stderr, "Donor size in run1:\n");
    for (int k = 0; k < n_run1; ++k){
        fprintf(stderr, "%s%.2f", (k > 0 ? "\t" : ""), donor_mass[donor_rank[k]]);
    }
    fprintf(stderr, "\n");
    
    double mass_k = donor_mass[donor_rank[in.n_donors-1]];
    double mass_k1 = donor_mass[donor_rank[in.n_donors]];
    if (mass_k < 2.0 * mass_k1){
        fprintf(stderr, "WARNING: the difference between the %dth and %dth donors is \
too small.\n", in.n_donors, in.n_donors+1);
        fprintf(stderr, "    Best to run again with more initializations to reach the \
global optimum.\n");
    }
    
    prob_mtx gt_prior;
    for (int k = 0; k < in.n_donors; ++k){
        int d = donor_rank[k];
        for (int v = 0; v < n_vars; ++v){
            gt_prior.push_back(best.gt_prob[d * n_vars + v]);
        }
    }
    
    fprintf(stderr, "Now, run2:\n");
    vb_run vb(*counts, opts);
    if (!vb.set_gt_prior(gt_prior, in.n_donors)){
        return false;
    }
    vb_result res2;
    if (!vb.run(res2)){
        return false;
    }
    best = res2;
    return true;
}

bool vb_driver::run(const donor_input& in, vb_result& best){
    if (!validate(in)){
        return false;
    }
    chrono::steady_clock::time_point start = chrono::steady_clock::now();
    
    int n_init = dopts.n_init;
    if (n_init == -1){
        n_init = (in.mode == DONORS_FIXED ? 2 : 4);
    }
    
    if (dopts.seed_set){
        base_seed = dopts.seed;
    }
    else{
        random_device dev;
        base_seed = dev();
    }
    
    int n_donors = in.n_donors;
    int n_run1 = n_donors;
    if (in.mode == DONORS_INFERRED && in.k_extend >= 1 && in.gt_prior.size() == 0){
        n_run1 = (int)ceil(in.k_extend * (double)n_donors);
    }
    
    // Report the doublet prior once, rather than from every trial
    if (opts.check_doublet){
        double dp = doublet_prior_frac(n_donors, counts->n_cells, opts, true);
        fprintf(stderr, "Doublet prior: %f\n", dp);
    }
    
    input = &in;
    n_donors_pass = n_run1;
    fprintf(stderr, "run1: %d initializations with %d donors...\n", n_init, n_run1);
    run_trials(n_init);
    
    fprintf(stderr, "trial\tn_iter\tLBound\tstatus\n");
    for (int i = 0; i < trials.size(); ++i){
        if (trials[i].finished){
            fprintf(stderr, "%d\t%d\t%.4f\t%s\n", i + 1, trials[i].res.n_iter, 
                trials[i].res.lbound, vb_state_name(trials[i].res.status));
        }
        else{
            fprintf(stderr, "%d\tNA\tNA\tfailed\n", i + 1);
        }
    }
    
    best_trial = select_best_trial(trials);
    input = NULL;
    if (best_trial == -1){
        fprintf(stderr, "ERROR: no initialization finished\n");
        return false;
    }
    best = trials[best_trial].res;
    
    if (in.mode == DONORS_INFERRED && n_run1 > n_donors){
        if (!prune_rerun(in, best)){
            return false;
        }
    }
    
    if (in.mode == DONORS_FIXED && in.donor_names.size() > 0){
        donor_names = in.donor_names;
    }
    else if (in.mode == DONORS_INFERRED && in.donor_names.size() == n_donors){
        donor_names = in.donor_names;
    }
    else{
        default_donor_names(best.n_donors, donor_names);
    }
    
    double elapsed = chrono::duration_cast<chrono::duration<double> >(
        chrono::steady_clock::now() - start).count();
    fprintf(stderr, "Finished in %.2f sec.\n", elapsed);
    return true;
}
