#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <map>
#include <cstdlib>
#include <utility>
#include <math.h>
#include "vb_numerics.h"
#include "classify.h"

using namespace std;

classify_opts::classify_opts(){
    n_vars_threshold = 10;
    s_threshold = 0.9;
    d_threshold = 0.9;
}

bool classify_opts::validate() const{
    if (s_threshold < 0 || s_threshold > 1){
        fprintf(stderr, "ERROR: assignment threshold must be between 0 and 1\n");
        return false;
    }
    if (d_threshold < 0 || d_threshold > 1){
        fprintf(stderr, "ERROR: doublet threshold must be between 0 and 1\n");
        return false;
    }
    if (n_vars_threshold < 0){
        fprintf(stderr, "ERROR: minimum variants per cell must be non-negative\n");
        return false;
    }
    return true;
}

/**
 * Rules, in order: too few covered variants -> unassigned; enough doublet
 * mass -> doublet; confident donor -> that donor; weak doublet and weak
 * donor evidence -> unassigned; otherwise the most likely donor.
 */
void classify_cells(const prob_mtx& prob,
    const prob_mtx& prob_doublet,
    const vector<int>& n_vars,
    const vector<string>& cell_names,
    const vector<string>& donor_names,
    const classify_opts& opts,
    vector<cell_assignment>& assignments){
    
    bool has_doublet = prob_doublet.size() > 0;
    assignments.clear();
    for (int c = 0; c < prob.size(); ++c){
        cell_assignment a;
        if (c < cell_names.size()){
            a.cell = cell_names[c];
        }
        else{
            char buf[50];
            sprintf(&buf[0], "cell%d", c + 1);
            a.cell = buf;
        }
        a.n_vars = n_vars[c];
        
        int maxidx = row_argmax(prob[c]);
        a.prob_max = (maxidx >= 0 ? prob[c][maxidx] : 0.0);
        double singlet_tot = 0.0;
        for (int k = 0; k < prob[c].size(); ++k){
            singlet_tot += prob[c][k];
        }
        double dbl = 0.0;
        if (has_doublet){
            for (int k = 0; k < prob_doublet[c].size(); ++k){
                dbl += prob_doublet[c][k];
            }
            a.prob_doublet = dbl;
        }
        else{
            a.prob_doublet = NAN;
        }

        if (a.n_vars < opts.n_vars_threshold){
            a.donor_idx = ASSN_UNASSIGNED;
        }
        else if (has_doublet && dbl > 1.0 - opts.s_threshold){
            a.donor_idx = ASSN_DOUBLET;
        }
        else if (a.prob_max >= opts.s_threshold){
            a.donor_idx = maxidx;
        }
        else if (dbl < opts.d_threshold && singlet_tot < opts.s_threshold){
            a.donor_idx = ASSN_UNASSIGNED;
        }
        else{
            a.donor_idx = maxidx;
        }
        
        if (a.donor_idx == ASSN_UNASSIGNED){
            a.donor_id = "unassigned";
        }
        else if (a.donor_idx == ASSN_DOUBLET){
            a.donor_id = "doublet";
        }
        else if (a.donor_idx < donor_names.size()){
            a.donor_id = donor_names[a.donor_idx];
        }
        else{
            char buf[50];
            sprintf(&buf[0], "donor%d", a.donor_idx + 1);
            a.donor_id = buf;
        }
        assignments.push_back(a);
    }
}

void count_labels(const vector<cell_assignment>& assignments, map<string, int>& counts){
    counts.clear();
    for (vector<cell_assignment>::const_iterator a = assignments.begin(); 
        a != assignments.end(); ++a){
        if (counts.count(a->donor_id) == 0){
            counts.insert(make_pair(a->donor_id, 0));
        }
        counts[a->donor_id]++;
    }
}
