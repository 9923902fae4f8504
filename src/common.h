#ifndef _DEMUX_VB_COMMON_H
#define _DEMUX_VB_COMMON_H
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
/**
 * Contains functions used by more than one part of this
 * repository.
 */

// Utility functions for translating identity indices into donor
// pairs and names, using a standard way of representing doublet 
// identities as integers. Doublets (i, j) with i < j follow the 
// singlets, ordered by i then j.
std::pair<short, short> idx_to_hap_comb(short, short);
std::string idx2name(int, const std::vector<std::string>&);

// Number of distinct doublet combinations of n individuals
int n_doublet_combs(int n);

// Default names (donor1, donor2, ...) for inferred individuals
void default_donor_names(int n, std::vector<std::string>& names);

// Trim the path off of a file name
std::string filename_nopath(const std::string& filename);

bool file_exists(std::string name);

#endif
