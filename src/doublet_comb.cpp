#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>
#include <utility>
#include <math.h>
#include "common.h"
#include "vb_numerics.h"
#include "betabin.h"
#include "doublet_comb.h"

using namespace std;

void doublet_pairs(int n_donors, vector<pair<int, int> >& pairs){
    pairs.clear();
    int n_comb = n_doublet_combs(n_donors);
    for (int x = n_donors; x < n_donors + n_comb; ++x){
        pair<short, short> comb = idx_to_hap_comb(x, n_donors);
        pairs.push_back(make_pair((int)comb.first, (int)comb.second));
    }
}

void combine_gt_row(const vector<double>& gt1, 
    const vector<double>& gt2,
    vector<double>& combined){
    
    combined.resize(N_GT_DOUBLET);
    combined[GT_COL_0] = gt1[0]*gt2[0];
    combined[GT_COL_1] = gt1[1]*gt2[1] + gt1[0]*gt2[2] + gt1[2]*gt2[0];
    combined[GT_COL_2] = gt1[2]*gt2[2];
    combined[GT_COL_0_5] = gt1[0]*gt2[1] + gt1[1]*gt2[0];
    combined[GT_COL_1_5] = gt1[1]*gt2[2] + gt1[2]*gt2[1];
    normalize_row(combined);
}

void get_doublet_gt(const prob_mtx& gt_prob, int n_donors, prob_mtx& gt_both){
    int n_vars = gt_prob.size() / n_donors;
    vector<pair<int, int> > pairs;
    doublet_pairs(n_donors, pairs);
    
    gt_both.clear();
    gt_both.reserve(gt_prob.size() + pairs.size() * n_vars);
    for (int i = 0; i < gt_prob.size(); ++i){
        vector<double> row(N_GT_DOUBLET, 0.0);
        for (int g = 0; g < N_GT_SINGLET; ++g){
            row[g] = gt_prob[i][g];
        }
        gt_both.push_back(row);
    }
    vector<double> combined;
    for (int p = 0; p < pairs.size(); ++p){
        int off1 = pairs[p].first * n_vars;
        int off2 = pairs[p].second * n_vars;
        for (int v = 0; v < n_vars; ++v){
            combine_gt_row(gt_prob[off1 + v], gt_prob[off2 + v], combined);
            gt_both.push_back(combined);
        }
    }
}

/**
 * Each doublet state sits between two adjacent singlet states: its mean
 * alt fraction is the average of theirs, and its concentration 
 * (alpha + beta) is the geometric mean of theirs.
 */
void get_doublet_theta(const prob_mtx& shapes, prob_mtx& shapes_both){
    shapes_both.clear();
    for (int g = 0; g < N_GT_SINGLET; ++g){
        shapes_both.push_back(shapes[g]);
    }
    for (int g = 0; g < N_GT_SINGLET - 1; ++g){
        double sum1 = shapes[g][0] + shapes[g][1];
        double sum2 = shapes[g+1][0] + shapes[g+1][1];
        double mean = 0.5 * (shapes[g][0] / sum1 + shapes[g+1][0] / sum2);
        double shape_sum = sqrt(sum1 * sum2);
        vector<double> row;
        row.push_back(mean * shape_sum);
        row.push_back((1.0 - mean) * shape_sum);
        shapes_both.push_back(row);
    }
}
