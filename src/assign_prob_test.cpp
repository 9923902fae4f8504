#include <stdio.h>   
#include <stdlib.h> 
#include <string.h>
#include <math.h>
#include <string>
#include <vector>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "betabin.h"
#include "genotype_post.h"
#include "doublet_comb.h"
#include "assign_prob.h"

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

bool rows_sum_one(const prob_mtx& p){
    for (int i = 0; i < p.size(); ++i){
        double tot = 0.0;
        for (int j = 0; j < p[i].size(); ++j){
            if (isnan(p[i][j])){
                return false;
            }
            tot += p[i][j];
        }
        if (fabs(tot - 1.0) > 1e-9){
            return false;
        }
    }
    return true;
}

int main(int argc, char *argv[]) {   
    
    fprintf(stderr, "===== Testing count matrices: =====\n\n");
    
    // 4 variants x 3 cells; the last cell has no coverage
    vector<vector<double> > A(4, vector<double>(3, 0.0));
    vector<vector<double> > D(4, vector<double>(3, 0.0));
    for (int v = 0; v < 4; ++v){
        D[v][0] = 6;
        A[v][0] = 6;
        D[v][1] = 6;
        A[v][1] = 0;
    }
    D[2][1] = NAN;
    A[3][0] = 3;
    
    ad_counts counts;
    check(counts.set_counts(A, D), "dense counts accepted");
    check(counts.n_vars == 4 && counts.n_cells == 3, "dimensions");
    check(counts.n_vars_covered(0) == 4 && counts.n_vars_covered(1) == 3 &&
        counts.n_vars_covered(2) == 0, "missing depth counts as no coverage");
    check(fabs(counts.logchoose_sum() - log_choose(6, 3)) < 1e-9, 
        "log binomial coefficients only where 0 < A < D");
    
    vector<vector<double> > A_bad = A;
    A_bad[0][1] = 7;
    ad_counts bad;
    check(!bad.set_counts(A_bad, D), "A > D rejected");
    vector<vector<double> > D_short(3, vector<double>(3, 1.0));
    check(!bad.set_counts(A, D_short), "mismatched dimensions rejected");

    sparse_mtx sA;
    sparse_mtx sD;
    sA.nrow = 4;
    sA.ncol = 3;
    sD.nrow = 4;
    sD.ncol = 3;
    sD.entries.push_back(mtx_entry(3, 0, 5));
    sD.entries.push_back(mtx_entry(1, 0, 5));
    sA.entries.push_back(mtx_entry(1, 0, 2));
    ad_counts sparse;
    check(sparse.set_counts(sA, sD), "sparse counts accepted");
    check(sparse.cells[0].size() == 2 && sparse.cells[0][0].var == 1 && 
        sparse.cells[0][0].alt == 2, "sparse entries sorted by variant");
    
    vector<string> vars;
    vars.push_back("chr1:100:A:G");
    vars.push_back("chr1:200:C:T");
    vars.push_back("chr1:300:G:A");
    vars.push_back("chr1:400:T:C");
    vector<string> cells;
    cells.push_back("AAAC-1");
    cells.push_back("AAAG-1");
    cells.push_back("AAAT-1");
    sparse.set_names(vars, cells);
    vector<int> keep;
    keep.push_back(3);
    keep.push_back(0);
    sparse.subset_vars(keep);
    check(sparse.n_vars == 2 && sparse.var_names[0] == "chr1:400:T:C", "variant subset");
    check(sparse.n_vars_covered(0) == 1 && sparse.cells[0][0].var == 0 && 
        sparse.cells[0][0].tot == 5, "subset renumbers variants");
    
    fprintf(stderr, "\n===== Testing cell assignment: =====\n\n");
    
    // Donor 0 homozygous alt everywhere, donor 1 homozygous ref
    vector<vector<int> > gt(4, vector<int>(2, 0));
    for (int v = 0; v < 4; ++v){
        gt[v][0] = 2;
    }
    gt[3][1] = -1;
    prob_mtx gt_prob;
    gt_to_prob(gt, gt_prob);
    check(gt_prob.size() == 8 && gt_prob[0][2] == 1.0, "genotypes become one-hot rows");
    check(fabs(gt_prob[7][1] - 1.0/3.0) < 1e-12, "missing genotype becomes uniform");
    
    prob_mtx shapes;
    default_theta_prior(shapes);
    vector<double> psi(2, 0.5);
    prob_mtx id_prob;
    prob_mtx loglik_id;
    double ll = get_id_prob(counts, gt_prob, shapes, psi, id_prob, &loglik_id);
    check(id_prob.size() == 3 && id_prob[0].size() == 2, "one row per cell, one column per donor");
    check(rows_sum_one(id_prob), "posterior rows sum to 1");
    check(!isnan(ll) && !isinf(ll), "log likelihood is finite");
    check(id_prob[0][0] > 0.99, "all-alt cell goes to the alt donor");
    check(id_prob[1][1] > 0.99, "all-ref cell goes to the ref donor");
    check(fabs(id_prob[2][0] - 0.5) < 1e-12, "uncovered cell keeps the prior");
    check(loglik_id[2][0] == 0.0 && loglik_id[2][1] == 0.0, 
        "uncovered cell has no data likelihood");

    vector<double> psi_skew;
    psi_skew.push_back(3.0);
    psi_skew.push_back(1.0);
    get_id_prob(counts, gt_prob, shapes, psi_skew, id_prob);
    check(fabs(id_prob[2][0] - 0.75) < 1e-12, "prior weights are renormalized");
    
    // Same data with doublet states added
    prob_mtx gt_both;
    prob_mtx shapes_both;
    get_doublet_gt(gt_prob, 2, gt_both);
    get_doublet_theta(shapes, shapes_both);
    vector<double> psi3(3, 1.0/3.0);
    get_id_prob(counts, gt_both, shapes_both, psi3, id_prob);
    check(id_prob[0].size() == 3, "doublet column added");
    check(rows_sum_one(id_prob), "singlet and doublet posteriors sum to 1");
    check(id_prob[1][2] < 0.01, "pure cell is not called a doublet");
    
    fprintf(stderr, "\n===== Testing genotype posterior: =====\n\n");
    
    // Cells 0 and 1 fully assigned to donors 0 and 1
    prob_mtx resp;
    init_mtx(resp, 3, 2, 0.0);
    resp[0][0] = 1.0;
    resp[1][1] = 1.0;
    resp[2][0] = 0.5;
    resp[2][1] = 0.5;
    gt_stats stats;
    compute_gt_stats(counts, resp, 2, stats);
    check(stats.s_tot[0] == 6 && stats.s_alt[0] == 6 && stats.s_tot[4] == 6 && 
        stats.s_alt[4] == 0, "read sums follow responsibilities");
    prob_mtx loglik_gt;
    gt_loglik(stats, shapes, loglik_gt);
    prob_mtx prior;
    uniform_gt_prior(8, prior);
    prob_mtx post;
    update_gt_post(loglik_gt, prior, false, post);
    check(rows_sum_one(post), "genotype posterior rows sum to 1");
    check(post[0][2] > 0.98 && post[4][0] > 0.98, "genotypes follow the reads");
    check(fabs(post[6][0] - 1.0/3.0) < 1e-12, "no reads leaves the prior");
    
    prob_mtx post_bin;
    update_gt_post(loglik_gt, prior, true, post_bin);
    vector<int> point;
    gt_point_estimate(post, point);
    bool binary_ok = true;
    for (int i = 0; i < post_bin.size(); ++i){
        if (post_bin[i][point[i]] != 1.0){
            binary_ok = false;
        }
    }
    check(binary_ok, "hard genotypes sit at the most likely state");
    
    vector<double> alt_sum;
    vector<double> ref_sum;
    gt_state_sums(stats, post_bin, alt_sum, ref_sum);
    check(alt_sum[2] >= 18 && ref_sum[0] >= 12, "error model statistics per genotype state");
    
    if (n_errors > 0){
        fprintf(stderr, "\n%d checks failed\n", n_errors);
        return 1;
    }
    fprintf(stderr, "\nall checks passed\n");
    return 0;
}
