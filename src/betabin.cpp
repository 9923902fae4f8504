#include <string>
#include <algorithm>
#include <vector>
#include <iterator>
#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>
#include <utility>
#include <math.h>
#include "vb_numerics.h"
#include "betabin.h"
#include "doublet_comb.h"

using namespace std;

void default_theta_prior(prob_mtx& prior){
    init_mtx(prior, N_GT_SINGLET, 2);
    prior[0][0] = 0.3;
    prior[0][1] = 29.7;
    prior[1][0] = 3.0;
    prior[1][1] = 3.0;
    prior[2][0] = 29.7;
    prior[2][1] = 0.3;
}

betabin_model::betabin_model(){
    default_theta_prior(this->prior);
    this->shapes = this->prior;
}

betabin_model::betabin_model(const prob_mtx& p){
    this->prior = p;
    this->shapes = p;
}

void betabin_model::reset(){
    this->shapes = this->prior;
}

void betabin_model::update(const vector<double>& alt_sum, const vector<double>& ref_sum){
    this->shapes = this->prior;
    for (int g = 0; g < shapes.size(); ++g){
        shapes[g][0] += alt_sum[g];
        shapes[g][1] += ref_sum[g];
    }
}

void betabin_model::doublet_shapes(prob_mtx& shapes_both) const{
    get_doublet_theta(this->shapes, shapes_both);
}

double betabin_model::lb_p() const{
    return nega_beta_entropy(shapes, prior);
}

double betabin_model::lb_q() const{
    return nega_beta_entropy(shapes, shapes);
}
