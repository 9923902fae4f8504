#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>
#include <utility>
#include <math.h>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "assign_prob.h"

using namespace std;

void log_state_prior(const vector<double>& psi, int n_states, vector<double>& log_prior){
    double tot = 0.0;
    for (int s = 0; s < n_states; ++s){
        tot += psi[s];
    }
    log_prior.resize(n_states);
    for (int s = 0; s < n_states; ++s){
        log_prior[s] = log(psi[s] / tot);
    }
}

double get_id_prob(const ad_counts& counts,
    const prob_mtx& gt_prob,
    const prob_mtx& shapes,
    const vector<double>& psi,
    prob_mtx& id_prob,
    prob_mtx* loglik_id){
    
    int n_vars = counts.n_vars;
    int n_states = (n_vars > 0 ? gt_prob.size() / n_vars : 0);
    int n_gt = shapes.size();
    shape_digammas dg(shapes);
    
    vector<double> log_prior;
    log_state_prior(psi, n_states, log_prior);

    if (loglik_id != NULL){
        init_mtx(*loglik_id, counts.n_cells, n_states);
    }
    id_prob.resize(counts.n_cells);
    
    // Expected log likelihood of one site under each genotype state
    vector<double> ll_gt(n_gt);
    
    double loglik = 0.0;
    for (int c = 0; c < counts.n_cells; ++c){
        vector<double> ll(n_states, 0.0);
        for (vector<site_count>::const_iterator s = counts.cells[c].begin();
            s != counts.cells[c].end(); ++s){
            for (int g = 0; g < n_gt; ++g){
                ll_gt[g] = dg.ll(g, s->alt, s->tot);
            }
            for (int k = 0; k < n_states; ++k){
                const vector<double>& gtrow = gt_prob[k * n_vars + s->var];
                for (int g = 0; g < n_gt; ++g){
                    if (gtrow[g] > 0){
                        ll[k] += gtrow[g] * ll_gt[g];
                    }
                }
            }
        }
        if (loglik_id != NULL){
            (*loglik_id)[c] = ll;
        }
        for (int k = 0; k < n_states; ++k){
            ll[k] += log_prior[k];
        }
        double lse = normalize_log_row(ll);
        if (!isnan(lse)){
            loglik += lse;
        }
        id_prob[c] = ll;
    }
    return loglik;
}
