#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>
#include <utility>
#include <math.h>
#include <random>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "betabin.h"
#include "genotype_post.h"

using namespace std;

/**
 * Rows are stacked donor-major: all variants for donor 0, then all
 * variants for donor 1, and so on.
 */
void gt_to_prob(const vector<vector<int> >& gt, prob_mtx& gt_prob){
    int n_vars = gt.size();
    int n_donors = (n_vars > 0 ? gt[0].size() : 0);
    init_mtx(gt_prob, n_vars * n_donors, N_GT_SINGLET);
    for (int k = 0; k < n_donors; ++k){
        for (int v = 0; v < n_vars; ++v){
            int g = gt[v][k];
            vector<double>& row = gt_prob[k * n_vars + v];
            if (g >= 0 && g < N_GT_SINGLET){
                row[g] = 1.0;
            }
            else{
                for (int x = 0; x < N_GT_SINGLET; ++x){
                    row[x] = 1.0 / (double)N_GT_SINGLET;
                }
            }
        }
    }
}

void uniform_gt_prior(int n_rows, prob_mtx& gt_prior){
    init_mtx(gt_prior, n_rows, N_GT_SINGLET, 1.0 / (double)N_GT_SINGLET);
}

void init_gt_prob(const prob_mtx& gt_prior, mt19937& rng, prob_mtx& gt_prob){
    init_mtx(gt_prob, gt_prior.size(), N_GT_SINGLET);
    for (int i = 0; i < gt_prior.size(); ++i){
        discrete_distribution<int> dist(gt_prior[i].begin(), gt_prior[i].end());
        gt_prob[i][dist(rng)] = 1.0;
    }
}

void compute_gt_stats(const ad_counts& counts, 
    const prob_mtx& id_prob,
    int n_donors,
    gt_stats& stats){
    
    int n_vars = counts.n_vars;
    stats.s_alt.assign(n_vars * n_donors, 0.0);
    stats.s_tot.assign(n_vars * n_donors, 0.0);
    for (int c = 0; c < counts.n_cells; ++c){
        const vector<double>& r = id_prob[c];
        for (vector<site_count>::const_iterator s = counts.cells[c].begin();
            s != counts.cells[c].end(); ++s){
            for (int k = 0; k < n_donors; ++k){
                stats.s_alt[k * n_vars + s->var] += s->alt * r[k];
                stats.s_tot[k * n_vars + s->var] += s->tot * r[k];
            }
        }
    }
}

void gt_loglik(const gt_stats& stats, const prob_mtx& shapes, prob_mtx& loglik_gt){
    shape_digammas dg(shapes);
    init_mtx(loglik_gt, stats.s_alt.size(), N_GT_SINGLET);
    for (int i = 0; i < stats.s_alt.size(); ++i){
        for (int g = 0; g < N_GT_SINGLET; ++g){
            loglik_gt[i][g] = dg.ll(g, stats.s_alt[i], stats.s_tot[i]);
        }
    }
}

void gt_state_sums(const gt_stats& stats,
    const prob_mtx& gt_prob,
    vector<double>& alt_sum,
    vector<double>& ref_sum){
    
    alt_sum.assign(N_GT_SINGLET, 0.0);
    ref_sum.assign(N_GT_SINGLET, 0.0);
    for (int i = 0; i < stats.s_alt.size(); ++i){
        double alt = stats.s_alt[i];
        double ref = stats.s_tot[i] - stats.s_alt[i];
        for (int g = 0; g < N_GT_SINGLET; ++g){
            alt_sum[g] += alt * gt_prob[i][g];
            ref_sum[g] += ref * gt_prob[i][g];
        }
    }
}

void update_gt_post(const prob_mtx& loglik_gt, 
    const prob_mtx& gt_prior,
    bool binary,
    prob_mtx& gt_prob){
    
    gt_prob.resize(loglik_gt.size());
    for (int i = 0; i < loglik_gt.size(); ++i){
        vector<double>& row = gt_prob[i];
        row.resize(N_GT_SINGLET);
        for (int g = 0; g < N_GT_SINGLET; ++g){
            row[g] = loglik_gt[i][g] + log(gt_prior[i][g]);
        }
        normalize_log_row(row);
        if (binary){
            // Hard calls follow the data alone, not the prior
            int maxidx = row_argmax(loglik_gt[i]);
            for (int g = 0; g < N_GT_SINGLET; ++g){
                row[g] = (g == maxidx ? 1.0 : 0.0);
            }
        }
    }
}

void gt_point_estimate(const prob_mtx& gt_prob, vector<int>& gt){
    gt.clear();
    for (int i = 0; i < gt_prob.size(); ++i){
        gt.push_back(row_argmax(gt_prob[i]));
    }
}
