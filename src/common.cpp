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
#include <sys/stat.h>
#include "common.h"

/**
 * Contains functions used by more than one part of this
 * repository.
 */

using std::cout;
using std::endl;
using namespace std;

/**
 * For doublet identification (in a data structure), convert a 
 * combined donor idx into a <i, j> pair denoting the two indices 
 * that went into creating it. Combinations follow the singlets, 
 * ordered by i and then by j.
 */
pair<short, short> idx_to_hap_comb(short idx, short nhaps){
    if (idx < nhaps){
        return make_pair(-1, -1);
    }
    short combined_idx = nhaps;
    short i = 0;
    short j = 1;
    short k = 1;
    while (combined_idx < idx){
        if (idx > combined_idx && idx < combined_idx + (nhaps - k)){
            // Increment j till we find it.
            j += (idx - combined_idx);
            return make_pair(i, j);
        }
        combined_idx += (nhaps - k);
        i++;
        j = i + 1;
        k++;
        if (k >= nhaps){
            return make_pair(-1, -1);
        }       
    }
    if (combined_idx == idx){
        return make_pair(i, j);
    }
    return make_pair(-1, -1);
}

/**
 * Given a numeric index (single or doublet combination) and a vector
 * of (string) donor names, returns the name of the given donor
 * or donor combination.
 *
 * Doublet names list the lower-index donor first, so that names
 * line up with the column order of doublet probability tables.
 */
string idx2name(int x, const vector<string>& samples){
    string indv_name;
    if (x < samples.size()){
        indv_name = samples[x];
    }
    else{
        pair<short, short> hc = idx_to_hap_comb(x, samples.size());
        if (hc.first < 0 || hc.second < 0){
            return "";
        }
        indv_name = samples[hc.first] + "+" + samples[hc.second];
    }
    return indv_name;
}

int n_doublet_combs(int n){
    if (n < 2){
        return 0;
    }
    return (n*(n-1))/2;
}

void default_donor_names(int n, vector<string>& names){
    names.clear();
    char buf[50];
    for (int i = 0; i < n; ++i){
        sprintf(&buf[0], "donor%d", i + 1);
        names.push_back(buf);
    }
}

/**
 * Trim the directory off of a full filename path
 */
string filename_nopath(const string& filename){
    size_t trim_idx = filename.find_last_of("\\/");
    if (trim_idx != string::npos){
        return filename.substr(trim_idx + 1, filename.length() - trim_idx - 1);
    }
    else{
        return filename;
    }
}

bool file_exists(string filename){
    struct stat buf;
    if (stat(filename.c_str(), &buf) != 0){
        return false;
    }
    return true;
}
