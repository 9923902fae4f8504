#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>
#include <utility>
#include <math.h>
#include <float.h>
#include <mixtureDist/functions.h>
#include "vb_numerics.h"

using namespace std;

void init_mtx(prob_mtx& mtx, int nrow, int ncol, double val){
    mtx.clear();
    mtx.reserve(nrow);
    for (int i = 0; i < nrow; ++i){
        vector<double> row(ncol, val);
        mtx.push_back(row);
    }
}

double logsumexp(const vector<double>& x){
    double maxval = -INFINITY;
    for (int i = 0; i < x.size(); ++i){
        if (!isnan(x[i]) && x[i] > maxval){
            maxval = x[i];
        }
    }
    if (isinf(maxval)){
        return maxval;
    }
    double tot = 0.0;
    for (int i = 0; i < x.size(); ++i){
        if (!isnan(x[i])){
            tot += exp(x[i] - maxval);
        }
    }
    return maxval + log(tot);
}

double normalize_log_row(vector<double>& row){
    if (row.size() == 0){
        return 0.0;
    }
    double lse = logsumexp(row);
    if (isinf(lse) || isnan(lse)){
        // Nothing finite to normalize against (or an infinite value
        // dominates): fall back to uniform.
        for (int i = 0; i < row.size(); ++i){
            row[i] = 1.0 / (double)row.size();
        }
        return lse;
    }
    double maxval = -INFINITY;
    for (int i = 0; i < row.size(); ++i){
        if (!isnan(row[i]) && row[i] > maxval){
            maxval = row[i];
        }
    }
    double tot = 0.0;
    for (int i = 0; i < row.size(); ++i){
        if (isnan(row[i])){
            row[i] = 0.0;
        }
        else{
            row[i] = exp(row[i] - maxval);
        }
        tot += row[i];
    }
    for (int i = 0; i < row.size(); ++i){
        row[i] /= tot;
    }
    return lse;
}

void normalize_row(vector<double>& row){
    double tot = 0.0;
    for (int i = 0; i < row.size(); ++i){
        tot += row[i];
    }
    if (tot <= 0.0 || isnan(tot)){
        for (int i = 0; i < row.size(); ++i){
            row[i] = 1.0 / (double)row.size();
        }
        return;
    }
    for (int i = 0; i < row.size(); ++i){
        row[i] /= tot;
    }
}

void clamp_prob_rows(prob_mtx& mtx, double lower, double upper){
    for (int i = 0; i < mtx.size(); ++i){
        for (int j = 0; j < mtx[i].size(); ++j){
            if (mtx[i][j] > upper){
                mtx[i][j] = upper;
            }
            else if (mtx[i][j] < lower){
                mtx[i][j] = lower;
            }
        }
        normalize_row(mtx[i]);
    }
}

int row_argmax(const vector<double>& row){
    int maxidx = -1;
    double maxval = 0.0;
    for (int i = 0; i < row.size(); ++i){
        if (maxidx == -1 || row[i] > maxval){
            maxidx = i;
            maxval = row[i];
        }
    }
    return maxidx;
}

double sum_plogp(const prob_mtx& p){
    double tot = 0.0;
    for (int i = 0; i < p.size(); ++i){
        for (int j = 0; j < p[i].size(); ++j){
            if (p[i][j] > 0){
                tot += p[i][j] * log(p[i][j]);
            }
        }
    }
    return tot;
}

double sum_plogq(const prob_mtx& p, const prob_mtx& q){
    double tot = 0.0;
    for (int i = 0; i < p.size(); ++i){
        for (int j = 0; j < p[i].size(); ++j){
            if (p[i][j] > 0){
                tot += p[i][j] * log(q[i][j]);
            }
        }
    }
    return tot;
}

double log_beta_fn(double a, double b){
    return lgamma(a) + lgamma(b) - lgamma(a + b);
}

double log_choose(double n, double k){
    return lgamma(n + 1.0) - lgamma(k + 1.0) - lgamma(n - k + 1.0);
}

double nega_beta_entropy(const prob_mtx& shapes, const prob_mtx& prior){
    double val = 0.0;
    for (int i = 0; i < shapes.size(); ++i){
        double a = prior[i][0];
        double b = prior[i][1];
        val += -log_beta_fn(a, b) + 
            (a - 1.0) * digamma(shapes[i][0]) + 
            (b - 1.0) * digamma(shapes[i][1]) - 
            (a + b - 2.0) * digamma(shapes[i][0] + shapes[i][1]);
    }
    return val;
}

shape_digammas::shape_digammas(const prob_mtx& shapes){
    for (int i = 0; i < shapes.size(); ++i){
        d_alt.push_back(digamma(shapes[i][0]));
        d_ref.push_back(digamma(shapes[i][1]));
        d_sum.push_back(digamma(shapes[i][0] + shapes[i][1]));
    }
}
