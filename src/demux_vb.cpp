#include <getopt.h>
#include <argp.h>
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
#include <sys/stat.h>
#include <map>
#include <set>
#include <cstdlib>
#include <utility>
#include <math.h>
#include <zlib.h>
#include "common.h"
#include "vb_numerics.h"
#include "ad_counts.h"
#include "vb_run.h"
#include "vb_driver.h"
#include "doublet_comb.h"
#include "classify.h"
#include "demux_vb_io.h"

using std::cout;
using std::endl;
using namespace std;

/**
 * Print a help message to the terminal and exit.
 */
void help(int code){
    fprintf(stderr, "demux_vb [OPTIONS]\n");
    fprintf(stderr, "Given allele counts at variant sites in single cells (as output by\n");
    fprintf(stderr, "cellSNP-lite), infers which donor each cell came from and which cells\n");
    fprintf(stderr, "are doublets, using variational Bayes. Donor genotypes can be given\n");
    fprintf(stderr, "in a VCF, or inferred given the number of donors.\n");
    fprintf(stderr, "[OPTIONS]:\n");
    fprintf(stderr, "===== REQUIRED =====\n");
    fprintf(stderr, "    --output_prefix -o Prefix for output files\n");
    fprintf(stderr, "    --cellsnp -c Directory of cellSNP-lite output (cellSNP.tag.AD.mtx,\n");
    fprintf(stderr, "       cellSNP.tag.DP.mtx, cellSNP.samples.tsv, cellSNP.base.vcf).\n");
    fprintf(stderr, "       Alternatively, give individual files with the options below.\n");
    fprintf(stderr, "    --donors -g A VCF/BCF of donor genotypes, OR\n");
    fprintf(stderr, "    --n_donor -N Number of donors to infer genotypes for\n");
    fprintf(stderr, "===== INPUT FILES =====\n");
    fprintf(stderr, "    --ad -A Matrix Market file of alt allele counts (variants x cells)\n");
    fprintf(stderr, "    --dp -D Matrix Market file of read depth (variants x cells)\n");
    fprintf(stderr, "    --barcodes -b Cell barcodes, one per line, in matrix column order\n");
    fprintf(stderr, "    --vars -v VCF listing variants in matrix row order (required with\n");
    fprintf(stderr, "       --donors)\n");
    fprintf(stderr, "===== MODEL =====\n");
    fprintf(stderr, "    --k_extend -k When inferring genotypes, first fit this many times the\n");
    fprintf(stderr, "       requested number of donors, then keep the best-supported ones and\n");
    fprintf(stderr, "       refit. Values below 1 disable this. Default = 1.5\n");
    fprintf(stderr, "    --n_init -i Number of independent runs (best lower bound is kept).\n");
    fprintf(stderr, "       Default = 2 with donor genotypes, 4 otherwise\n");
    fprintf(stderr, "    --num_threads -T Number of runs to do in parallel. Default = 1\n");
    fprintf(stderr, "    --seed -s Random seed for initializing genotypes\n");
    fprintf(stderr, "    --epsilon -e Stop when the lower bound improves by less than this.\n");
    fprintf(stderr, "       Default = 0.01\n");
    fprintf(stderr, "    --min_iter -m Minimum number of iterations. Default = 20\n");
    fprintf(stderr, "    --max_iter -M Maximum number of iterations. Default = 200\n");
    fprintf(stderr, "    --no_doublet -x Do not check for doublets\n");
    fprintf(stderr, "    --doublet_iterative -I Consider doublets in every iteration after\n");
    fprintf(stderr, "       burn-in, instead of in one pass at the end\n");
    fprintf(stderr, "    --doublet_prior -p Prior doublet fraction: \"uniform\" (every donor\n");
    fprintf(stderr, "       and donor pair equally likely), \"auto\" (grows with number of cells),\n");
    fprintf(stderr, "       or a number between 0 and 1. Default = uniform\n");
    fprintf(stderr, "    --auto_doublet_scale -a With --doublet_prior auto, the doublet fraction\n");
    fprintf(stderr, "       is number of cells divided by this. Default = 100000\n");
    fprintf(stderr, "    --binary_gt -B Use hard (most likely) genotypes when updating\n");
    fprintf(stderr, "    --no_learn_theta -L Keep allelic error model fixed at its prior\n");
    fprintf(stderr, "===== ASSIGNMENT =====\n");
    fprintf(stderr, "    --n_vars_threshold -n Cells with fewer covered variants than this\n");
    fprintf(stderr, "       are unassigned. Default = 10\n");
    fprintf(stderr, "    --s_threshold -t Minimum posterior probability to assign a cell\n");
    fprintf(stderr, "       to a donor. Default = 0.9\n");
    fprintf(stderr, "    --d_threshold -d Doublet posterior probability threshold. Default = 0.9\n");
    fprintf(stderr, "    --verbose -V Print lower bound at every iteration\n");
    fprintf(stderr, "    --help -h Display this message and exit.\n");
    exit(code);
}

int main(int argc, char *argv[]) {    
    
    static struct option long_options[] = {
       {"output_prefix", required_argument, 0, 'o'},
       {"cellsnp", required_argument, 0, 'c'},
       {"donors", required_argument, 0, 'g'},
       {"n_donor", required_argument, 0, 'N'},
       {"ad", required_argument, 0, 'A'},
       {"dp", required_argument, 0, 'D'},
       {"barcodes", required_argument, 0, 'b'},
       {"vars", required_argument, 0, 'v'},
       {"k_extend", required_argument, 0, 'k'},
       {"n_init", required_argument, 0, 'i'},
       {"num_threads", required_argument, 0, 'T'},
       {"seed", required_argument, 0, 's'},
       {"epsilon", required_argument, 0, 'e'},
       {"min_iter", required_argument, 0, 'm'},
       {"max_iter", required_argument, 0, 'M'},
       {"no_doublet", no_argument, 0, 'x'},
       {"doublet_iterative", no_argument, 0, 'I'},
       {"doublet_prior", required_argument, 0, 'p'},
       {"auto_doublet_scale", required_argument, 0, 'a'},
       {"binary_gt", no_argument, 0, 'B'},
       {"no_learn_theta", no_argument, 0, 'L'},
       {"n_vars_threshold", required_argument, 0, 'n'},
       {"s_threshold", required_argument, 0, 't'},
       {"d_threshold", required_argument, 0, 'd'},
       {"verbose", no_argument, 0, 'V'},
       {"help", no_argument, 0, 'h'},
       {0, 0, 0, 0} 
    };
    
    // Set default values
    string output_prefix = "";
    string cellsnp_dir = "";
    string donor_vcf = "";
    int n_donor = -1;
    string ad_file = "";
    string dp_file = "";
    string barcodes_file = "";
    string vars_file = "";
    double k_extend = 1.5;
    string doublet_prior_str = "uniform";
    
    vb_opts opts;
    driver_opts dopts;
    classify_opts copts;

    int option_index = 0;
    int ch;
    
    if (argc == 1){
        help(0);
    }
    while((ch = getopt_long(argc, argv, "o:c:g:N:A:D:b:v:k:i:T:s:e:m:M:p:a:n:t:d:xIBLVh", 
        long_options, &option_index )) != -1){
        switch(ch){
            case 0:
                // This option set a flag. No need to do anything here.
                break;
            case 'h':
                help(0);
                break;
            case 'o':
                output_prefix = optarg;
                break;
            case 'c':
                cellsnp_dir = optarg;
                break;
            case 'g':
                donor_vcf = optarg;
                break;
            case 'N':
                n_donor = atoi(optarg);
                break;
            case 'A':
                ad_file = optarg;
                break;
            case 'D':
                dp_file = optarg;
                break;
            case 'b':
                barcodes_file = optarg;
                break;
            case 'v':
                vars_file = optarg;
                break;
            case 'k':
                k_extend = atof(optarg);
                break;
            case 'i':
                dopts.n_init = atoi(optarg);
                break;
            case 'T':
                dopts.n_threads = atoi(optarg);
                break;
            case 's':
                dopts.seed = strtoul(optarg, NULL, 10);
                dopts.seed_set = true;
                break;
            case 'e':
                opts.epsilon_conv = atof(optarg);
                break;
            case 'm':
                opts.min_iter = atoi(optarg);
                break;
            case 'M':
                opts.max_iter = atoi(optarg);
                break;
            case 'x':
                opts.check_doublet = false;
                break;
            case 'I':
                opts.check_doublet_iterative = true;
                break;
            case 'p':
                doublet_prior_str = optarg;
                break;
            case 'a':
                opts.auto_doublet_scale = atof(optarg);
                break;
            case 'B':
                opts.binary_gt = true;
                break;
            case 'L':
                opts.learn_theta = false;
                break;
            case 'n':
                copts.n_vars_threshold = atoi(optarg);
                break;
            case 't':
                copts.s_threshold = atof(optarg);
                break;
            case 'd':
                copts.d_threshold = atof(optarg);
                break;
            case 'V':
                opts.verbose = true;
                break;
            default:
                help(0);
                break;
        }    
    }
    
    // Error check arguments.
    if (output_prefix == ""){
        fprintf(stderr, "ERROR: output prefix required\n");
        exit(1);
    }
    if (cellsnp_dir == "" && (ad_file == "" || dp_file == "")){
        fprintf(stderr, "ERROR: --cellsnp, or both --ad and --dp, required\n");
        exit(1);
    }
    if (donor_vcf == "" && n_donor < 1){
        fprintf(stderr, "ERROR: --donors or --n_donor (at least 1) required\n");
        exit(1);
    }
    if (donor_vcf != "" && cellsnp_dir == "" && vars_file == ""){
        fprintf(stderr, "ERROR: --vars required to match cell data to --donors\n");
        exit(1);
    }
    if (dopts.n_init != -1 && dopts.n_init < 1){
        fprintf(stderr, "ERROR: --n_init must be at least 1\n");
        exit(1);
    }
    if (dopts.n_threads < 1){
        dopts.n_threads = 1;
    }
    if (doublet_prior_str == "uniform"){
        opts.doublet_prior_mode = DBL_PRIOR_UNIFORM;
    }
    else if (doublet_prior_str == "auto"){
        opts.doublet_prior_mode = DBL_PRIOR_AUTO;
    }
    else{
        char* endptr = NULL;
        opts.doublet_prior = strtod(doublet_prior_str.c_str(), &endptr);
        if (endptr == doublet_prior_str.c_str() || *endptr != '\0'){
            fprintf(stderr, "ERROR: --doublet_prior must be uniform, auto, or a number\n");
            exit(1);
        }
        opts.doublet_prior_mode = DBL_PRIOR_FIXED;
    }
    if (!copts.validate() || !opts.validate()){
        exit(1);
    }

    // Load cell data
    if (cellsnp_dir != ""){
        string ad_default;
        string dp_default;
        string samples_default;
        string vcf_default;
        if (!cellsnp_files(cellsnp_dir, ad_default, dp_default, samples_default, vcf_default)){
            exit(1);
        }
        if (ad_file == ""){
            ad_file = ad_default;
        }
        if (dp_file == ""){
            dp_file = dp_default;
        }
        if (barcodes_file == ""){
            barcodes_file = samples_default;
        }
        if (vars_file == ""){
            vars_file = vcf_default;
        }
    }
    ad_counts counts;
    if (!load_counts(ad_file, dp_file, barcodes_file, vars_file, counts)){
        exit(1);
    }
    
    donor_input input;
    if (donor_vcf != ""){
        vector<vector<int> > gt;
        vector<string> donors;
        vector<int> keep;
        fprintf(stderr, "Loading donor genotypes...\n");
        if (!read_donor_gt(donor_vcf, counts.var_names, gt, donors, keep)){
            exit(1);
        }
        if (keep.size() == 0){
            fprintf(stderr, "ERROR: no variants in cell data found in %s\n", donor_vcf.c_str());
            exit(1);
        }
        if (keep.size() < counts.n_vars){
            fprintf(stderr, "WARNING: %ld of %d variants not in donor VCF; ignoring them\n",
                counts.n_vars - keep.size(), counts.n_vars);
            counts.subset_vars(keep);
        }
        if (n_donor > 0 && n_donor != donors.size()){
            fprintf(stderr, "WARNING: --n_donor %d ignored; %ld donors in %s\n", n_donor, 
                donors.size(), donor_vcf.c_str());
        }
        input = fixed_genotypes(gt, donors);
    }
    else{
        input = inferred_donors(n_donor, k_extend);
    }
    
    fprintf(stderr, "Donor ID using %d variants and %d cells\n", counts.n_vars, counts.n_cells);

    vb_driver driver(counts, opts, dopts);
    vb_result result;
    if (!driver.run(input, result)){
        exit(1);
    }
    
    vector<cell_assignment> assignments;
    classify_cells(result.prob, result.prob_doublet, counts.n_vars_covered(), 
        counts.cell_names, driver.donor_names, copts, assignments);
    
    // Write output files
    string fn = output_prefix + ".assignments";
    FILE* outf = fopen(fn.c_str(), "w");
    if (outf == NULL){
        fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
        exit(1);
    }
    write_assignments(outf, assignments);
    fclose(outf);

    fn = output_prefix + ".prob_singlet.tsv.gz";
    gzFile outgz = gzopen(fn.c_str(), "w");
    if (!outgz){
        fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
        exit(1);
    }
    write_prob_mtx(outgz, result.prob, counts.cell_names, driver.donor_names);
    gzclose(outgz);
    
    if (result.prob_doublet.size() > 0){
        vector<string> doublet_names;
        int n_comb = n_doublet_combs(driver.donor_names.size());
        for (int x = 0; x < n_comb; ++x){
            doublet_names.push_back(idx2name(driver.donor_names.size() + x, driver.donor_names));
        }
        fn = output_prefix + ".prob_doublet.tsv.gz";
        outgz = gzopen(fn.c_str(), "w");
        if (!outgz){
            fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
            exit(1);
        }
        write_prob_mtx(outgz, result.prob_doublet, counts.cell_names, doublet_names);
        gzclose(outgz);
    }
    
    fn = output_prefix + ".theta.tsv";
    outf = fopen(fn.c_str(), "w");
    if (outf == NULL){
        fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
        exit(1);
    }
    write_theta(outf, result.theta);
    fclose(outf);
    
    fn = output_prefix + ".gt_donors.tsv.gz";
    outgz = gzopen(fn.c_str(), "w");
    if (!outgz){
        fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
        exit(1);
    }
    write_gt(outgz, result.gt_prob, counts.var_names, driver.donor_names);
    gzclose(outgz);

    if (result.gt_doublet_prob.size() > 0){
        fn = output_prefix + ".gt_doublets.tsv.gz";
        outgz = gzopen(fn.c_str(), "w");
        if (!outgz){
            fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
            exit(1);
        }
        write_gt_doublets(outgz, result.gt_doublet_prob, counts.var_names, driver.donor_names);
        gzclose(outgz);
    }

    fn = output_prefix + ".summary";
    outf = fopen(fn.c_str(), "w");
    if (outf == NULL){
        fprintf(stderr, "ERROR: could not open %s for writing\n", fn.c_str());
        exit(1);
    }
    write_summary(outf, result, driver.trials, driver.best_trial, assignments);
    fclose(outf);
    
    map<string, int> label_counts;
    count_labels(assignments, label_counts);
    for (map<string, int>::iterator lc = label_counts.begin(); lc != label_counts.end(); ++lc){
        fprintf(stderr, "%s\t%d\n", lc->first.c_str(), lc->second);
    }
    fprintf(stderr, "Wrote results to %s.*\n", output_prefix.c_str());
    return 0;
}
