#ifndef _DEMUX_VB_BETABIN_H
#define _DEMUX_VB_BETABIN_H
#include <vector>
#include "vb_numerics.h"

// Singlet genotype states (number of alt alleles)
#define N_GT_SINGLET 3
// Singlet plus doublet (0.5, 1.5) states
#define N_GT_DOUBLET 5

/**
 * Beta distributions over the alt allele fraction of reads for each
 * genotype state (rows 0, 1, 2 alt alleles; columns alpha, beta).
 * Starts at a prior and absorbs genotype-weighted read counts.
 */
class betabin_model{
    public:
        prob_mtx prior;
        prob_mtx shapes;
        
        // Default prior: Beta(0.3, 29.7), Beta(3, 3), Beta(29.7, 0.3)
        betabin_model();
        betabin_model(const prob_mtx& prior);
        
        // Return shapes to the prior
        void reset();

        // Set shapes to prior + weighted counts. Both vectors hold one 
        // value per singlet genotype state.
        void update(const std::vector<double>& alt_sum, 
            const std::vector<double>& ref_sum);
        
        // Shapes for singlet states followed by doublet states 0.5 and 1.5
        void doublet_shapes(prob_mtx& shapes_both) const;

        // Expected log prior density and negative entropy of the shapes
        double lb_p() const;
        double lb_q() const;
};

// Default Beta prior on alt allele fraction for genotypes 0, 1, 2
void default_theta_prior(prob_mtx& prior);

#endif
