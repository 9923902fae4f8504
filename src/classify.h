#ifndef _DEMUX_VB_CLASSIFY_H
#define _DEMUX_VB_CLASSIFY_H
#include <string>
#include <vector>
#include <map>
#include "vb_numerics.h"

// Special donor indices in cell assignments
#define ASSN_UNASSIGNED -1
#define ASSN_DOUBLET -2

struct classify_opts{
    // Cells covering fewer variants than this are unassigned
    int n_vars_threshold;
    // Minimum posterior to assign a cell to a donor
    double s_threshold;
    // Doublet posterior threshold
    double d_threshold;

    classify_opts();
    
    bool validate() const;
};

/**
 * Final call for one cell.
 */
struct cell_assignment{
    std::string cell;
    // Donor index, ASSN_DOUBLET, or ASSN_UNASSIGNED
    int donor_idx;
    std::string donor_id;
    double prob_max;
    // Summed doublet posterior (NaN if doublets were not checked)
    double prob_doublet;
    int n_vars;
};

// Label every cell from its donor posteriors (cells x donors), doublet
// posteriors (cells x combinations, or empty if not checked) and number 
// of covered variants.
void classify_cells(const prob_mtx& prob,
    const prob_mtx& prob_doublet,
    const std::vector<int>& n_vars,
    const std::vector<std::string>& cell_names,
    const std::vector<std::string>& donor_names,
    const classify_opts& opts,
    std::vector<cell_assignment>& assignments);

// Number of cells per label
void count_labels(const std::vector<cell_assignment>& assignments,
    std::map<std::string, int>& counts);

#endif
