#ifndef _DEMUX_VB_DOUBLET_COMB_H
#define _DEMUX_VB_DOUBLET_COMB_H
#include <vector>
#include <utility>
#include "vb_numerics.h"

/**
 * Genotype state columns in combined (singlet + doublet) tables:
 * 0, 1, 2 alt alleles, then the intermediate doublet states.
 */
enum gt_state_col{
    GT_COL_0 = 0,
    GT_COL_1 = 1,
    GT_COL_2 = 2,
    GT_COL_0_5 = 3,
    GT_COL_1_5 = 4
};

// All unordered donor pairs (i < j), in the order doublet states are 
// indexed (i, then j; see idx_to_hap_comb)
void doublet_pairs(int n_donors, std::vector<std::pair<int, int> >& pairs);

// Distribution over doublet genotype states for one variant, given the
// two donors' singlet genotype distributions (equal mixing of alleles).
void combine_gt_row(const std::vector<double>& gt1, 
    const std::vector<double>& gt2,
    std::vector<double>& combined);

// Build the combined genotype table: singlet rows (donor-major, zero-padded
// to 5 columns) followed by one block of n_vars rows per donor pair.
void get_doublet_gt(const prob_mtx& gt_prob, int n_donors, prob_mtx& gt_both);

// Moment-matched shapes for doublet states 0.5 (between 0 and 1) 
// and 1.5 (between 1 and 2), appended to the singlet shapes.
void get_doublet_theta(const prob_mtx& shapes, prob_mtx& shapes_both);

#endif
