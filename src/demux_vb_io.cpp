#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <map>
#include <set>
#include <cstdlib>
#include <utility>
#include <math.h>
#include <zlib.h>
#include <htslib/vcf.h>
#include <htswrapper/gzreader.h>
#include <htswrapper/robin_hood/robin_hood.h>
#include "common.h"
#include "vb_numerics.h"
#include "ad_counts.h"
#include "betabin.h"
#include "genotype_post.h"
#include "vb_run.h"
#include "vb_driver.h"
#include "classify.h"
#include "demux_vb_io.h"

using std::cout;
using std::endl;
using namespace std;

/**
 * ===== Contains functions for loading input data and writing results =====
 */

string var_key(const string& chrom, long int pos, const string& ref, const string& alt){
    char buf[50];
    sprintf(&buf[0], ":%ld:", pos);
    return chrom + buf + ref + ":" + alt;
}

/**
 * Parse a Matrix Market file (as written by cellSNP-lite: variants as 
 * rows, cells as columns, 1-based coordinates).
 */
bool read_mtx(const string& filename, sparse_mtx& mtx){
    if (!file_exists(filename)){
        fprintf(stderr, "ERROR: file %s not found\n", filename.c_str());
        return false;
    }
    mtx.entries.clear();
    gzreader mtxreader(filename);
    int mexline = 0;
    long int n_entries = 0;
    while(mtxreader.next()){
        string line = mtxreader.line;
        if (line.length() == 0 || line[0] == '%'){
            continue;
        }
        istringstream splitter(line);
        if (mexline == 0){
            // Read header.
            if (!(splitter >> mtx.nrow >> mtx.ncol >> n_entries)){
                fprintf(stderr, "ERROR: could not parse header of %s\n", filename.c_str());
                return false;
            }
            mtx.entries.reserve(n_entries);
        }
        else{
            int row;
            int col;
            double count;
            if (!(splitter >> row >> col >> count)){
                fprintf(stderr, "ERROR: could not parse line %d of %s\n", mexline + 1,
                    filename.c_str());
                return false;
            }
            if (row < 1 || row > mtx.nrow || col < 1 || col > mtx.ncol){
                fprintf(stderr, "ERROR: entry (%d, %d) outside %d x %d matrix in %s\n",
                    row, col, mtx.nrow, mtx.ncol, filename.c_str());
                return false;
            }
            // Make 0-based
            mtx.entries.push_back(mtx_entry(row - 1, col - 1, count));
        }
        ++mexline;
    }
    if (mexline == 0){
        fprintf(stderr, "ERROR: no data in %s\n", filename.c_str());
        return false;
    }
    return true;
}

bool read_lines(const string& filename, vector<string>& lines){
    if (!file_exists(filename)){
        fprintf(stderr, "ERROR: file %s not found\n", filename.c_str());
        return false;
    }
    lines.clear();
    gzreader reader(filename);
    while(reader.next()){
        string line = reader.line;
        if (line.length() == 0){
            continue;
        }
        size_t tabpos = line.find('\t');
        if (tabpos != string::npos){
            line = line.substr(0, tabpos);
        }
        lines.push_back(line);
    }
    return true;
}

bool read_var_ids(const string& vcf_file, vector<string>& var_ids){
    htsFile* bcf_reader = bcf_open(vcf_file.c_str(), "r");
    if (bcf_reader == NULL){
        fprintf(stderr, "ERROR interpreting %s as BCF format.\n", vcf_file.c_str());
        return false;
    }
    bcf_hdr_t* bcf_header = bcf_hdr_read(bcf_reader);
    if (bcf_header == NULL){
        fprintf(stderr, "ERROR reading header of %s\n", vcf_file.c_str());
        hts_close(bcf_reader);
        return false;
    }
    bcf1_t* bcf_record = bcf_init();
    var_ids.clear();
    while(bcf_read(bcf_reader, bcf_header, bcf_record) == 0){
        bcf_unpack(bcf_record, BCF_UN_STR);
        string chrom = bcf_hdr_id2name(bcf_header, bcf_record->rid);
        string ref = (bcf_record->n_allele > 0 ? bcf_record->d.allele[0] : ".");
        string alt = (bcf_record->n_allele > 1 ? bcf_record->d.allele[1] : ".");
        var_ids.push_back(var_key(chrom, bcf_record->pos + 1, ref, alt));
    }
    bcf_destroy(bcf_record);
    bcf_hdr_destroy(bcf_header);
    hts_close(bcf_reader);
    return true;
}

bool read_donor_gt(const string& vcf_file,
    const vector<string>& var_ids,
    vector<vector<int> >& gt,
    vector<string>& donors,
    vector<int>& keep){
    
    robin_hood::unordered_map<string, int> var2idx;
    for (int i = 0; i < var_ids.size(); ++i){
        var2idx.emplace(var_ids[i], i);
    }

    htsFile* bcf_reader = bcf_open(vcf_file.c_str(), "r");
    if (bcf_reader == NULL){
        fprintf(stderr, "ERROR interpreting %s as BCF format.\n", vcf_file.c_str());
        return false;
    }
    bcf_hdr_t* bcf_header = bcf_hdr_read(bcf_reader);
    if (bcf_header == NULL){
        fprintf(stderr, "ERROR reading header of %s\n", vcf_file.c_str());
        hts_close(bcf_reader);
        return false;
    }
    int num_samples = bcf_hdr_nsamples(bcf_header);
    donors.clear();
    for (int i = 0; i < num_samples; ++i){
        donors.push_back(bcf_header->samples[i]);
    }
    if (num_samples == 0){
        fprintf(stderr, "ERROR: no individuals in %s\n", vcf_file.c_str());
        bcf_hdr_destroy(bcf_header);
        hts_close(bcf_reader);
        return false;
    }
    
    vector<vector<int> > gt_all(var_ids.size());
    bcf1_t* bcf_record = bcf_init();
    int32_t* gts = NULL;
    int n_gts = 0;
    int n_dup = 0;
    bool success = true;

    while(bcf_read(bcf_reader, bcf_header, bcf_record) == 0){
        bcf_unpack(bcf_record, BCF_UN_STR);
        if (bcf_record->n_allele != 2){
            continue;
        }
        string chrom = bcf_hdr_id2name(bcf_header, bcf_record->rid);
        string key = var_key(chrom, bcf_record->pos + 1, bcf_record->d.allele[0],
            bcf_record->d.allele[1]);
        robin_hood::unordered_map<string, int>::iterator vi = var2idx.find(key);
        if (vi == var2idx.end()){
            continue;
        }
        if (gt_all[vi->second].size() > 0){
            // Keep the first record at a duplicated site
            n_dup++;
            continue;
        }
        int num_loaded = bcf_get_genotypes(bcf_header, bcf_record, &gts, &n_gts);
        if (num_loaded <= 0){
            fprintf(stderr, "ERROR loading genotypes at %s %ld\n", 
                chrom.c_str(), (long int)bcf_record->pos + 1);
            success = false;
            break;
        }
        int ploidy = num_loaded / num_samples;
        vector<int> row;
        for (int i = 0; i < num_samples; ++i){
            int32_t* gtptr = gts + i*ploidy;
            int n_alt = 0;
            bool missing = false;
            int n_called = 0;
            for (int p = 0; p < ploidy; ++p){
                if (gtptr[p] == bcf_int32_vector_end){
                    break;
                }
                if (bcf_gt_is_missing(gtptr[p])){
                    missing = true;
                    break;
                }
                if (bcf_gt_allele(gtptr[p]) > 0){
                    n_alt++;
                }
                n_called++;
            }
            if (missing || n_called == 0){
                row.push_back(-1);
            }
            else if (n_called == 1){
                // Haploid call: homozygous
                row.push_back(n_alt * 2);
            }
            else{
                row.push_back(n_alt > 2 ? 2 : n_alt);
            }
        }
        gt_all[vi->second] = row;
    }
    free(gts);
    bcf_destroy(bcf_record);
    bcf_hdr_destroy(bcf_header);
    hts_close(bcf_reader);
    if (!success){
        return false;
    }
    
    if (n_dup > 0){
        fprintf(stderr, "WARNING: %d duplicate variant records in %s ignored\n", n_dup,
            vcf_file.c_str());
    }

    gt.clear();
    keep.clear();
    for (int i = 0; i < gt_all.size(); ++i){
        if (gt_all[i].size() > 0){
            keep.push_back(i);
            gt.push_back(gt_all[i]);
        }
    }
    fprintf(stderr, "Loaded genotypes for %ld donors at %ld of %ld variants\n",
        donors.size(), keep.size(), var_ids.size());
    return true;
}

/**
 * Pick a file name in a directory, allowing for an added .gz extension.
 */
static bool find_file(const string& dir, const string& name, string& path){
    path = dir + "/" + name;
    if (file_exists(path)){
        return true;
    }
    if (file_exists(path + ".gz")){
        path += ".gz";
        return true;
    }
    fprintf(stderr, "ERROR: %s not found in %s\n", name.c_str(), dir.c_str());
    return false;
}

bool cellsnp_files(const string& dir, 
    string& ad_file,
    string& dp_file,
    string& samples_file,
    string& vcf_file){
    
    return find_file(dir, "cellSNP.tag.AD.mtx", ad_file) &&
        find_file(dir, "cellSNP.tag.DP.mtx", dp_file) &&
        find_file(dir, "cellSNP.samples.tsv", samples_file) &&
        find_file(dir, "cellSNP.base.vcf", vcf_file);
}

bool load_counts(const string& ad_file,
    const string& dp_file,
    const string& samples_file,
    const string& vcf_file,
    ad_counts& counts){
    
    sparse_mtx A;
    sparse_mtx D;
    fprintf(stderr, "Loading alt allele counts from %s...\n", filename_nopath(ad_file).c_str());
    if (!read_mtx(ad_file, A)){
        return false;
    }
    fprintf(stderr, "Loading depth from %s...\n", filename_nopath(dp_file).c_str());
    if (!read_mtx(dp_file, D)){
        return false;
    }
    if (!counts.set_counts(A, D)){
        return false;
    }
    
    vector<string> cells;
    if (samples_file != ""){
        if (!read_lines(samples_file, cells)){
            return false;
        }
        if (cells.size() != counts.n_cells){
            fprintf(stderr, "ERROR: %ld cell barcodes in %s; count matrices have %d cells\n",
                cells.size(), samples_file.c_str(), counts.n_cells);
            return false;
        }
    }
    vector<string> vars;
    if (vcf_file != ""){
        if (!read_var_ids(vcf_file, vars)){
            return false;
        }
        if (vars.size() != counts.n_vars){
            fprintf(stderr, "ERROR: %ld variants in %s; count matrices have %d variants\n",
                vars.size(), vcf_file.c_str(), counts.n_vars);
            return false;
        }
    }
    counts.set_names(vars, cells);
    fprintf(stderr, "Loaded %d variants and %d cells\n", counts.n_vars, counts.n_cells);
    return true;
}

static void print_prob(FILE* outf, double p){
    if (isnan(p)){
        fprintf(outf, "NA");
    }
    else{
        fprintf(outf, "%g", p);
    }
}

void write_assignments(FILE* outf, const vector<cell_assignment>& assignments){
    fprintf(outf, "cell\tdonor_id\tprob_max\tprob_doublet\tn_vars\n");
    for (vector<cell_assignment>::const_iterator a = assignments.begin(); 
        a != assignments.end(); ++a){
        fprintf(outf, "%s\t%s\t", a->cell.c_str(), a->donor_id.c_str());
        print_prob(outf, a->prob_max);
        fprintf(outf, "\t");
        print_prob(outf, a->prob_doublet);
        fprintf(outf, "\t%d\n", a->n_vars);
    }
}

void write_prob_mtx(gzFile& outf, 
    const prob_mtx& prob, 
    const vector<string>& row_names,
    const vector<string>& col_names){
    
    gzprintf(outf, "cell");
    for (int j = 0; j < col_names.size(); ++j){
        gzprintf(outf, "\t%s", col_names[j].c_str());
    }
    gzprintf(outf, "\n");
    for (int i = 0; i < prob.size(); ++i){
        if (i < row_names.size()){
            gzprintf(outf, "%s", row_names[i].c_str());
        }
        else{
            gzprintf(outf, "cell%d", i + 1);
        }
        for (int j = 0; j < prob[i].size(); ++j){
            gzprintf(outf, "\t%g", prob[i][j]);
        }
        gzprintf(outf, "\n");
    }
}

void write_theta(FILE* outf, const prob_mtx& theta){
    static const char* gt_names[] = {"0", "1", "2", "0.5", "1.5"};
    fprintf(outf, "GT\tbeta_shape1\tbeta_shape2\n");
    for (int g = 0; g < theta.size() && g < N_GT_DOUBLET; ++g){
        fprintf(outf, "%s\t%f\t%f\n", gt_names[g], theta[g][0], theta[g][1]);
    }
}

void write_gt(gzFile& outf,
    const prob_mtx& gt_prob,
    const vector<string>& var_names,
    const vector<string>& donor_names){
    
    int n_donors = donor_names.size();
    if (n_donors == 0){
        return;
    }
    int n_vars = gt_prob.size() / n_donors;
    vector<int> gt;
    gt_point_estimate(gt_prob, gt);
    gzprintf(outf, "var\tdonor\tGT\tp_0\tp_1\tp_2\n");
    for (int v = 0; v < n_vars; ++v){
        for (int k = 0; k < n_donors; ++k){
            const vector<double>& row = gt_prob[k * n_vars + v];
            if (v < var_names.size()){
                gzprintf(outf, "%s", var_names[v].c_str());
            }
            else{
                gzprintf(outf, "var%d", v + 1);
            }
            gzprintf(outf, "\t%s\t%d\t%g\t%g\t%g\n", donor_names[k].c_str(), 
                gt[k * n_vars + v], row[0], row[1], row[2]);
        }
    }
}

void write_gt_doublets(gzFile& outf,
    const prob_mtx& gt_doublet_prob,
    const vector<string>& var_names,
    const vector<string>& donor_names){
    
    int n_donors = donor_names.size();
    int n_comb = n_doublet_combs(n_donors);
    if (n_comb == 0){
        return;
    }
    int n_vars = gt_doublet_prob.size() / n_comb;
    gzprintf(outf, "var\tdoublet\tp_0\tp_1\tp_2\tp_0.5\tp_1.5\n");
    for (int v = 0; v < n_vars; ++v){
        for (int x = 0; x < n_comb; ++x){
            const vector<double>& row = gt_doublet_prob[x * n_vars + v];
            if (v < var_names.size()){
                gzprintf(outf, "%s", var_names[v].c_str());
            }
            else{
                gzprintf(outf, "var%d", v + 1);
            }
            gzprintf(outf, "\t%s", idx2name(n_donors + x, donor_names).c_str());
            for (int g = 0; g < row.size(); ++g){
                gzprintf(outf, "\t%g", row[g]);
            }
            gzprintf(outf, "\n");
        }
    }
}

void write_summary(FILE* outf,
    const vb_result& result,
    const vector<trial_result>& trials,
    int best_trial,
    const vector<cell_assignment>& assignments){
    
    fprintf(outf, "logLik\t%f\n", result.loglik);
    fprintf(outf, "LBound\t%f\n", result.lbound);
    fprintf(outf, "n_iter\t%d\n", result.n_iter);
    fprintf(outf, "status\t%s\n", vb_state_name(result.status));
    fprintf(outf, "n_donors\t%d\n", result.n_donors);
    fprintf(outf, "best_trial\t%d\n", best_trial + 1);
    for (int i = 0; i < trials.size(); ++i){
        if (trials[i].finished){
            fprintf(outf, "trial_%d\t%d\t%f\t%s\n", i + 1, trials[i].res.n_iter, 
                trials[i].res.lbound, vb_state_name(trials[i].res.status));
        }
        else{
            fprintf(outf, "trial_%d\tNA\tNA\tfailed\n", i + 1);
        }
    }
    map<string, int> label_counts;
    count_labels(assignments, label_counts);
    for (map<string, int>::iterator lc = label_counts.begin(); lc != label_counts.end(); ++lc){
        fprintf(outf, "n_cells\t%s\t%d\n", lc->first.c_str(), lc->second);
    }
}
