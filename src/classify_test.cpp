#include <stdio.h>   
#include <stdlib.h> 
#include <string.h>
#include <math.h>
#include <string>
#include <vector>
#include <map>
#include "vb_numerics.h"
#include "classify.h"

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

void add_cell(prob_mtx& prob, prob_mtx& prob_doublet, vector<int>& n_vars,
    double p1, double p2, double pd, int nv){
    vector<double> row;
    row.push_back(p1);
    row.push_back(p2);
    prob.push_back(row);
    vector<double> drow(1, pd);
    prob_doublet.push_back(drow);
    n_vars.push_back(nv);
}

int main(int argc, char *argv[]) {   
    
    fprintf(stderr, "===== Testing options: =====\n\n");
    
    classify_opts opts;
    check(opts.validate(), "default thresholds are valid");
    classify_opts bad = opts;
    bad.s_threshold = 1.2;
    check(!bad.validate(), "assignment threshold above 1 rejected");
    bad = opts;
    bad.d_threshold = -0.1;
    check(!bad.validate(), "negative doublet threshold rejected");
    
    fprintf(stderr, "\n===== Testing labeling rules: =====\n\n");
    
    prob_mtx prob;
    prob_mtx prob_doublet;
    vector<int> n_vars;
    
    // 0: confident donor at exactly the minimum number of variants
    add_cell(prob, prob_doublet, n_vars, 0.95, 0.03, 0.02, 10);
    // 1: same, one variant short
    add_cell(prob, prob_doublet, n_vars, 0.95, 0.03, 0.02, 9);
    // 2: doublet mass above 1 - assignment threshold
    add_cell(prob, prob_doublet, n_vars, 0.7, 0.1, 0.2, 40);
    // 3: weak evidence everywhere
    add_cell(prob, prob_doublet, n_vars, 0.5, 0.3, 0.05, 40);
    // 4: weak donor evidence but nearly all mass on singlets
    add_cell(prob, prob_doublet, n_vars, 0.6, 0.35, 0.05, 40);
    // 5: second donor
    add_cell(prob, prob_doublet, n_vars, 0.001, 0.998, 0.001, 25);
    
    vector<string> cells;
    cells.push_back("AAAC-1");
    cells.push_back("AAAG-1");
    cells.push_back("AAAT-1");
    cells.push_back("AACA-1");
    cells.push_back("AACC-1");
    cells.push_back("AACG-1");
    vector<string> donors;
    donors.push_back("NA1");
    donors.push_back("NA2");
    
    vector<cell_assignment> assn;
    classify_cells(prob, prob_doublet, n_vars, cells, donors, opts, assn);
    check(assn.size() == 6, "one label per cell");
    check(assn[0].donor_idx == 0 && assn[0].donor_id == "NA1", 
        "minimum variants exactly reached: assigned");
    check(assn[1].donor_idx == ASSN_UNASSIGNED && assn[1].donor_id == "unassigned", 
        "one variant short: unassigned");
    check(assn[2].donor_idx == ASSN_DOUBLET && assn[2].donor_id == "doublet", 
        "doublet mass above 1 - threshold: doublet");
    check(assn[3].donor_idx == ASSN_UNASSIGNED, "weak singlet and doublet evidence: unassigned");
    check(assn[4].donor_idx == 0, "otherwise the most likely donor");
    check(assn[5].donor_idx == 1 && assn[5].donor_id == "NA2", "second donor");
    check(assn[2].cell == "AAAT-1" && assn[2].n_vars == 40, "cell name and coverage recorded");
    check(fabs(assn[2].prob_max - 0.7) < 1e-12 && fabs(assn[2].prob_doublet - 0.2) < 1e-12,
        "posteriors recorded");
    
    fprintf(stderr, "\n===== Testing repeated labeling: =====\n\n");
    
    vector<cell_assignment> assn2;
    classify_cells(prob, prob_doublet, n_vars, cells, donors, opts, assn2);
    bool same = assn.size() == assn2.size();
    for (int i = 0; i < assn.size() && same; ++i){
        if (assn[i].donor_idx != assn2[i].donor_idx || assn[i].donor_id != assn2[i].donor_id){
            same = false;
        }
    }
    check(same, "labels do not change when applied again");
    
    fprintf(stderr, "\n===== Testing without doublet posteriors: =====\n\n");
    
    prob_mtx no_doublet;
    classify_cells(prob, no_doublet, n_vars, cells, donors, opts, assn);
    check(isnan(assn[2].prob_doublet), "doublet posterior missing");
    check(assn[2].donor_idx != ASSN_DOUBLET, "no doublet calls without doublet posteriors");
    check(assn[4].donor_idx == 0, "most likely donor without doublet posteriors");
    check(assn[3].donor_idx == ASSN_UNASSIGNED, "weak singlet evidence still unassigned");
    
    map<string, int> label_counts;
    classify_cells(prob, prob_doublet, n_vars, cells, donors, opts, assn);
    count_labels(assn, label_counts);
    check(label_counts["NA1"] == 2 && label_counts["NA2"] == 1 && 
        label_counts["unassigned"] == 2 && label_counts["doublet"] == 1, "label counts");
    
    if (n_errors > 0){
        fprintf(stderr, "\n%d checks failed\n", n_errors);
        return 1;
    }
    fprintf(stderr, "\nall checks passed\n");
    return 0;
}
