#include <stdio.h>   
#include <stdlib.h> 
#include <string.h>
#include <math.h>
#include <string>
#include <vector>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "vb_run.h"
#include "vb_driver.h"

using namespace std;

int n_errors = 0;

void check(bool ok, const char* what){
    if (ok){
        fprintf(stderr, "\tsuccess: %s\n", what);
    }
    else{
        fprintf(stderr, "ERROR: %s\n", what);
        n_errors++;
    }
}

/**
 * Three donors with distinct genotypes at every variant; cell c comes
 * from donor c % 3, with 8 reads per site.
 */
void three_donor_data(int n_vars, int n_cells, ad_counts& counts, vector<vector<int> >& gt){
    vector<vector<double> > A(n_vars, vector<double>(n_cells, 0.0));
    vector<vector<double> > D(n_vars, vector<double>(n_cells, 0.0));
    gt.clear();
    for (int v = 0; v < n_vars; ++v){
        vector<int> row;
        for (int k = 0; k < 3; ++k){
            row.push_back((v + k) % 3);
        }
        gt.push_back(row);
        for (int c = 0; c < n_cells; ++c){
            D[v][c] = 8;
            A[v][c] = 4 * row[c % 3];
        }
    }
    if (!counts.set_counts(A, D)){
        fprintf(stderr, "ERROR: could not set up test data\n");
        exit(1);
    }
}

int main(int argc, char *argv[]) {   
    
    fprintf(stderr, "===== Testing restart selection: =====\n\n");
    
    vector<trial_result> trials;
    double lbs[] = {-1520.5, -1498.2, -1503.7, -1498.9, -1611.0};
    for (int i = 0; i < 5; ++i){
        trial_result t;
        t.idx = i;
        t.finished = true;
        t.res.lbound = lbs[i];
        trials.push_back(t);
    }
    check(select_best_trial(trials) == 1, "trial with highest lower bound selected");
    trials[1].finished = false;
    check(select_best_trial(trials) == 3, "unfinished trials are skipped");
    trials[3].res.lbound = NAN;
    check(select_best_trial(trials) == 2, "trials without a lower bound are skipped");
    trials[2].res.lbound = -1520.5;
    check(select_best_trial(trials) == 0, "first of tied trials selected");
    vector<trial_result> none;
    check(select_best_trial(none) == -1, "no trials, no selection");
    
    fprintf(stderr, "\n===== Testing configuration errors: =====\n\n");
    
    ad_counts counts;
    vector<vector<int> > gt;
    three_donor_data(45, 30, counts, gt);
    
    vb_opts opts;
    driver_opts dopts;
    dopts.seed_set = true;
    dopts.seed = 1234;
    vb_result best;
    
    vb_driver no_donors(counts, opts, dopts);
    check(!no_donors.run(inferred_donors(0), best), "no donors or genotypes rejected");
    
    vector<vector<int> > gt_short(gt.begin(), gt.begin() + 40);
    vb_driver short_gt(counts, opts, dopts);
    check(!short_gt.run(fixed_genotypes(gt_short, vector<string>()), best), 
        "genotype rows must match variants");
    
    vector<vector<int> > gt_ragged = gt;
    gt_ragged[5].pop_back();
    vb_driver ragged(counts, opts, dopts);
    check(!ragged.run(fixed_genotypes(gt_ragged, vector<string>()), best), 
        "genotypes must cover every donor");
    
    driver_opts zero_init = dopts;
    zero_init.n_init = 0;
    vb_driver no_init(counts, opts, zero_init);
    check(!no_init.run(inferred_donors(3), best), "zero initializations rejected");
    
    vector<string> two_names;
    two_names.push_back("A");
    two_names.push_back("B");
    vb_driver bad_names(counts, opts, dopts);
    check(!bad_names.run(fixed_genotypes(gt, two_names), best), 
        "donor names must match donors");
    
    fprintf(stderr, "\n===== Testing fixed genotypes: =====\n\n");
    
    vector<string> names;
    names.push_back("NA1");
    names.push_back("NA2");
    names.push_back("NA3");
    vb_driver fixed(counts, opts, dopts);
    check(fixed.run(fixed_genotypes(gt, names), best), "driver finished");
    check(fixed.trials.size() == 2, "two initializations by default with genotypes");
    check(fixed.donor_names == names, "donor names kept");
    check(fixed.donor_mass.size() == 0, "no second pass with genotypes");
    bool fixed_ok = true;
    for (int c = 0; c < 30; ++c){
        if (best.prob[c][c % 3] < 0.99){
            fixed_ok = false;
        }
    }
    check(fixed_ok, "every cell goes to its donor");
    
    fprintf(stderr, "\n===== Testing over-provisioned first pass: =====\n\n");
    
    vb_driver inferred(counts, opts, dopts);
    check(inferred.run(inferred_donors(2, 1.5), best), "driver finished");
    check(inferred.trials.size() == 4, "four initializations by default without genotypes");
    check(inferred.trials[inferred.best_trial].res.n_donors == 3, 
        "first pass fits 1.5 times the donors");
    check(inferred.donor_mass.size() == 3 && inferred.donor_rank.size() == 3, 
        "donor mass for every first-pass donor");
    check(inferred.donor_mass[inferred.donor_rank[0]] >= inferred.donor_mass[inferred.donor_rank[1]] &&
        inferred.donor_mass[inferred.donor_rank[1]] >= inferred.donor_mass[inferred.donor_rank[2]],
        "donors ranked by assigned mass");
    double mass_tot = 0.0;
    for (int k = 0; k < 3; ++k){
        mass_tot += inferred.donor_mass[k];
    }
    check(mass_tot <= 30.0 + 1e-6, "donor mass bounded by number of cells");
    check(best.n_donors == 2 && best.prob.size() == 30 && best.prob[0].size() == 2, 
        "final result has the requested donors");
    check(best.gt_prob.size() == 2 * 45, "final genotypes for the requested donors");
    check(inferred.donor_names.size() == 2 && inferred.donor_names[0] == "donor1", 
        "inferred donors get default names");
    
    driver_opts one_pass = dopts;
    one_pass.n_init = 1;
    vb_driver no_extend(counts, opts, one_pass);
    check(no_extend.run(inferred_donors(3, 0.5), best), "driver finished");
    check(no_extend.trials.size() == 1 && best.n_donors == 3 && no_extend.donor_mass.size() == 0, 
        "extension below 1 skips the second pass");

    fprintf(stderr, "\n===== Testing parallel trials: =====\n\n");
    
    driver_opts seq_opts = dopts;
    seq_opts.n_init = 4;
    seq_opts.n_threads = 1;
    driver_opts par_opts = seq_opts;
    par_opts.n_threads = 3;
    
    vb_result best_seq;
    vb_result best_par;
    vb_driver seq(counts, opts, seq_opts);
    vb_driver par(counts, opts, par_opts);
    check(seq.run(inferred_donors(3, -1), best_seq), "sequential driver finished");
    check(par.run(inferred_donors(3, -1), best_par), "parallel driver finished");
    bool same = seq.trials.size() == par.trials.size();
    for (int i = 0; i < seq.trials.size() && same; ++i){
        if (par.trials[i].idx != i || 
            seq.trials[i].res.lbound != par.trials[i].res.lbound ||
            seq.trials[i].res.n_iter != par.trials[i].res.n_iter){
            same = false;
        }
    }
    check(same, "trials give the same results in parallel as in sequence");
    check(seq.best_trial == par.best_trial && best_seq.lbound == best_par.lbound, 
        "same trial selected");
    
    if (n_errors > 0){
        fprintf(stderr, "\n%d checks failed\n", n_errors);
        return 1;
    }
    fprintf(stderr, "\nall checks passed\n");
    return 0;
}
