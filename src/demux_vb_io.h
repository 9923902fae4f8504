#ifndef _DEMUX_VB_IO_H
#define _DEMUX_VB_IO_H
#include <string>
#include <vector>
#include <map>
#include <stdio.h>
#include <zlib.h>
#include "vb_numerics.h"
#include "ad_counts.h"
#include "vb_run.h"
#include "vb_driver.h"
#include "classify.h"

// Identifier of a variant used to match cell data to donor genotypes
std::string var_key(const std::string& chrom, long int pos, 
    const std::string& ref, const std::string& alt);

// Read a Matrix Market (coordinate) file, gzipped or not
bool read_mtx(const std::string& filename, sparse_mtx& mtx);

// Read the first tab-separated field of every line of a (gzipped) file
bool read_lines(const std::string& filename, std::vector<std::string>& lines);

// Read variant identifiers, in file order, from a VCF/BCF file
bool read_var_ids(const std::string& vcf_file, std::vector<std::string>& var_ids);

// Load genotypes for all individuals in a VCF/BCF at the given variants.
// keep receives the indices (into var_ids) of variants found in the file, 
// and gt the matching variant x donor genotypes (-1 = missing).
bool read_donor_gt(const std::string& vcf_file,
    const std::vector<std::string>& var_ids,
    std::vector<std::vector<int> >& gt,
    std::vector<std::string>& donors,
    std::vector<int>& keep);

// Locate cellSNP-lite output files within a directory
bool cellsnp_files(const std::string& dir, 
    std::string& ad_file,
    std::string& dp_file,
    std::string& samples_file,
    std::string& vcf_file);

// Load A and D matrices plus cell and variant names
bool load_counts(const std::string& ad_file,
    const std::string& dp_file,
    const std::string& samples_file,
    const std::string& vcf_file,
    ad_counts& counts);

void write_assignments(FILE* outf, const std::vector<cell_assignment>& assignments);

void write_prob_mtx(gzFile& outf, 
    const prob_mtx& prob, 
    const std::vector<std::string>& row_names,
    const std::vector<std::string>& col_names);

void write_theta(FILE* outf, const prob_mtx& theta);

void write_gt(gzFile& outf,
    const prob_mtx& gt_prob,
    const std::vector<std::string>& var_names,
    const std::vector<std::string>& donor_names);

// Doublet genotype probabilities (states 0, 1, 2, 0.5, 1.5) for every
// donor pair, in pair order
void write_gt_doublets(gzFile& outf,
    const prob_mtx& gt_doublet_prob,
    const std::vector<std::string>& var_names,
    const std::vector<std::string>& donor_names);

void write_summary(FILE* outf,
    const vb_result& result,
    const std::vector<trial_result>& trials,
    int best_trial,
    const std::vector<cell_assignment>& assignments);

#endif
