#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <map>
#include <cstdlib>
#include <utility>
#include <math.h>
#include "vb_numerics.h"
#include "ad_counts.h"

using namespace std;

ad_counts::ad_counts(){
    n_vars = 0;
    n_cells = 0;
    lchoose_tot = 0.0;
}

bool ad_counts::set_counts(const vector<vector<double> >& A,
    const vector<vector<double> >& D){
    
    if (A.size() != D.size()){
        fprintf(stderr, "ERROR: A and D must have the same size (%ld vs %ld variants)\n",
            A.size(), D.size());
        return false;
    }
    int ncol = -1;
    for (int i = 0; i < A.size(); ++i){
        if (A[i].size() != D[i].size() || (ncol != -1 && A[i].size() != ncol)){
            fprintf(stderr, "ERROR: A and D must have the same size (variant %d)\n", i);
            return false;
        }
        ncol = A[i].size();
    }
    this->n_vars = A.size();
    this->n_cells = (ncol == -1 ? 0 : ncol);
    this->cells.clear();
    this->cells.resize(this->n_cells);
    
    for (int i = 0; i < n_vars; ++i){
        for (int j = 0; j < n_cells; ++j){
            double a = A[i][j];
            double d = D[i][j];
            if (isnan(a) || a < 0){
                a = 0;
            }
            if (isnan(d) || d < 0){
                d = 0;
            }
            if (a > d){
                fprintf(stderr, "ERROR: A > D at variant %d, cell %d\n", i, j);
                return false;
            }
            if (d > 0){
                cells[j].push_back(site_count(i, a, d));
            }
        }
    }
    finish();
    return true;
}

bool ad_counts::set_counts(const sparse_mtx& A, const sparse_mtx& D){
    if (A.nrow != D.nrow || A.ncol != D.ncol){
        fprintf(stderr, "ERROR: A and D must have the same size (%d x %d vs %d x %d)\n",
            A.nrow, A.ncol, D.nrow, D.ncol);
        return false;
    }
    this->n_vars = A.nrow;
    this->n_cells = A.ncol;
    
    // Gather alt & depth per cell, keyed on variant
    vector<map<int, pair<float, float> > > bycell;
    bycell.resize(n_cells);
    for (vector<mtx_entry>::const_iterator e = D.entries.begin(); e != D.entries.end(); ++e){
        if (e->row < 0 || e->row >= n_vars || e->col < 0 || e->col >= n_cells){
            fprintf(stderr, "ERROR: D entry (%d, %d) out of bounds\n", e->row + 1, e->col + 1);
            return false;
        }
        if (e->val > 0){
            bycell[e->col][e->row].second += e->val;
        }
    }
    for (vector<mtx_entry>::const_iterator e = A.entries.begin(); e != A.entries.end(); ++e){
        if (e->row < 0 || e->row >= n_vars || e->col < 0 || e->col >= n_cells){
            fprintf(stderr, "ERROR: A entry (%d, %d) out of bounds\n", e->row + 1, e->col + 1);
            return false;
        }
        if (e->val > 0){
            bycell[e->col][e->row].first += e->val;
        }
    }
    this->cells.clear();
    this->cells.resize(n_cells);
    for (int j = 0; j < n_cells; ++j){
        for (map<int, pair<float, float> >::iterator x = bycell[j].begin(); 
            x != bycell[j].end(); ++x){
            if (x->second.first > x->second.second){
                fprintf(stderr, "ERROR: A > D at variant %d, cell %d\n", x->first + 1, j + 1);
                return false;
            }
            if (x->second.second > 0){
                cells[j].push_back(site_count(x->first, x->second.first, x->second.second));
            }
        }
    }
    finish();
    return true;
}

void ad_counts::finish(){
    covered.clear();
    lchoose_tot = 0.0;
    for (int j = 0; j < cells.size(); ++j){
        covered.push_back(cells[j].size());
        for (vector<site_count>::iterator s = cells[j].begin(); s != cells[j].end(); ++s){
            if (s->alt > 0 && s->alt < s->tot){
                lchoose_tot += log_choose(s->tot, s->alt);
            }
        }
    }
}

void ad_counts::set_names(const vector<string>& vars, const vector<string>& cellnames){
    this->var_names = vars;
    this->cell_names = cellnames;
}

void ad_counts::subset_vars(const vector<int>& keep){
    map<int, int> old2new;
    for (int i = 0; i < keep.size(); ++i){
        old2new.insert(make_pair(keep[i], i));
    }
    for (int j = 0; j < cells.size(); ++j){
        vector<site_count> kept;
        for (vector<site_count>::iterator s = cells[j].begin(); s != cells[j].end(); ++s){
            map<int, int>::iterator it = old2new.find(s->var);
            if (it != old2new.end()){
                kept.push_back(site_count(it->second, s->alt, s->tot));
            }
        }
        sort(kept.begin(), kept.end(), [](const site_count& a, const site_count& b){
            return a.var < b.var;
        });
        cells[j] = kept;
    }
    if (var_names.size() == n_vars){
        vector<string> names;
        for (int i = 0; i < keep.size(); ++i){
            names.push_back(var_names[keep[i]]);
        }
        var_names = names;
    }
    n_vars = keep.size();
    finish();
}

int ad_counts::n_vars_covered(int cell) const{
    return covered[cell];
}

const vector<int>& ad_counts::n_vars_covered() const{
    return covered;
}

double ad_counts::logchoose_sum() const{
    return lchoose_tot;
}
