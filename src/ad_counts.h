#ifndef _DEMUX_VB_AD_COUNTS_H
#define _DEMUX_VB_AD_COUNTS_H
#include <string>
#include <vector>
#include <map>
#include <utility>

/**
 * One non-zero entry of a sparse integer matrix (0-based coordinates),
 * as read from a Matrix Market file.
 */
struct mtx_entry{
    int row;
    int col;
    double val;
    mtx_entry(int r, int c, double v){
        this->row = r;
        this->col = c;
        this->val = v;
    }
};

struct sparse_mtx{
    int nrow;
    int ncol;
    std::vector<mtx_entry> entries;
    sparse_mtx(){
        nrow = 0;
        ncol = 0;
    }
};

/**
 * Read counts at one variant in one cell: reads supporting the
 * alternate allele and total depth.
 */
struct site_count{
    int var;
    float alt;
    float tot;
    site_count(int v, float a, float t){
        this->var = v;
        this->alt = a;
        this->tot = t;
    }
};

/**
 * Alt (A) and depth (D) count matrices, variant x cell, stored
 * sparsely by cell. Only entries with non-zero depth are kept; anything
 * missing is treated as zero coverage. Read-only once set.
 */
class ad_counts{
    private:
        
        // Per-cell coverage and log binomial coefficient sum are 
        // filled in once counts are set.
        std::vector<int> covered;
        double lchoose_tot;
        
        void finish();

    public:
        int n_vars;
        int n_cells;
        
        // Entries per cell, sorted by variant index
        std::vector<std::vector<site_count> > cells;
        
        std::vector<std::string> var_names;
        std::vector<std::string> cell_names;

        ad_counts();
        
        // Dense variant x cell input; NaN or negative entries count as missing.
        // Returns false (after printing an error) on mismatched dimensions
        // or A > D.
        bool set_counts(const std::vector<std::vector<double> >& A,
            const std::vector<std::vector<double> >& D);
        
        // Sparse variant x cell input (Matrix Market)
        bool set_counts(const sparse_mtx& A, const sparse_mtx& D);
        
        void set_names(const std::vector<std::string>& vars, 
            const std::vector<std::string>& cells);

        // Keep only the given variants (indices into the current set), in order.
        void subset_vars(const std::vector<int>& keep);
        
        // Number of variants with non-zero depth in a cell
        int n_vars_covered(int cell) const;
        const std::vector<int>& n_vars_covered() const;
        
        // Sum of log(choose(D, A)) over entries with 0 < A < D
        double logchoose_sum() const;
};

#endif
