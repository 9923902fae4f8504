#include <stdio.h>   
#include <stdlib.h> 
#include <string.h>
#include <math.h>
#include <string>
#include <vector>
#include <zlib.h>
#include <htswrapper/gzreader.h>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "doublet_comb.h"
#include "demux_vb_io.h"

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

int main(int argc, char *argv[]) {   
    
    fprintf(stderr, "===== Testing Matrix Market input: =====\n\n");
    
    string mtxfile = "demux_vb_io_test.mtx.gz";
    gzFile out = gzopen(mtxfile.c_str(), "w");
    if (!out){
        fprintf(stderr, "ERROR: could not open %s for writing\n", mtxfile.c_str());
        return 1;
    }
    gzprintf(out, "%%%%MatrixMarket matrix coordinate integer general\n");
    gzprintf(out, "%% written by cellSNP-lite\n");
    gzprintf(out, "3 2 2\n");
    gzprintf(out, "1 2 7\n");
    gzprintf(out, "3 1 4\n");
    gzclose(out);
    
    sparse_mtx mtx;
    check(read_mtx(mtxfile, mtx), "matrix read");
    check(mtx.nrow == 3 && mtx.ncol == 2 && mtx.entries.size() == 2, "header and entries");
    check(mtx.entries[0].row == 0 && mtx.entries[0].col == 1 && mtx.entries[0].val == 7, 
        "coordinates made 0-based");
    
    out = gzopen(mtxfile.c_str(), "w");
    if (!out){
        fprintf(stderr, "ERROR: could not open %s for writing\n", mtxfile.c_str());
        return 1;
    }
    gzprintf(out, "3 2 1\n");
    gzprintf(out, "4 1 1\n");
    gzclose(out);
    check(!read_mtx(mtxfile, mtx), "entry outside the matrix rejected");
    remove(mtxfile.c_str());
    
    fprintf(stderr, "\n===== Testing doublet genotype output: =====\n\n");
    
    // Donor k has genotype k at both variants
    int n_donors = 3;
    int n_vars = 2;
    prob_mtx gt_prob;
    init_mtx(gt_prob, n_donors * n_vars, 3, 0.0);
    for (int k = 0; k < n_donors; ++k){
        for (int v = 0; v < n_vars; ++v){
            gt_prob[k * n_vars + v][k] = 1.0;
        }
    }
    prob_mtx gt_both;
    get_doublet_gt(gt_prob, n_donors, gt_both);
    prob_mtx gt_doublet(gt_both.begin() + gt_prob.size(), gt_both.end());
    
    vector<string> vars;
    vars.push_back("chr1:10:A:G");
    vars.push_back("chr1:20:C:T");
    vector<string> donors;
    donors.push_back("NA1");
    donors.push_back("NA2");
    donors.push_back("NA3");
    
    string gtfile = "demux_vb_io_test.gt_doublets.tsv.gz";
    out = gzopen(gtfile.c_str(), "w");
    if (!out){
        fprintf(stderr, "ERROR: could not open %s for writing\n", gtfile.c_str());
        return 1;
    }
    write_gt_doublets(out, gt_doublet, vars, donors);
    gzclose(out);
    
    vector<string> lines;
    gzreader reader(gtfile);
    while(reader.next()){
        lines.push_back(string(reader.line));
    }
    remove(gtfile.c_str());
    
    check(lines.size() == 1 + 3 * n_vars, "one line per variant and donor pair");
    if (lines.size() == 1 + 3 * n_vars){
        check(lines[0] == "var\tdoublet\tp_0\tp_1\tp_2\tp_0.5\tp_1.5", "header");
        check(lines[1] == "chr1:10:A:G\tNA1+NA2\t0\t0\t0\t1\t0", 
            "genotypes 0 and 1 give state 0.5");
        check(lines[2] == "chr1:10:A:G\tNA1+NA3\t0\t1\t0\t0\t0", 
            "genotypes 0 and 2 give state 1");
        check(lines[6] == "chr1:20:C:T\tNA2+NA3\t0\t0\t0\t0\t1", 
            "genotypes 1 and 2 give state 1.5");
    }
    
    if (n_errors > 0){
        fprintf(stderr, "\n%d checks failed\n", n_errors);
        return 1;
    }
    fprintf(stderr, "\nall checks passed\n");
    return 0;
}
