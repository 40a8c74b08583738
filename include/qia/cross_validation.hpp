//--------------------------------------------------------------
// repeated k-fold cross-validation over the (k, n) hyperparameter grid
//--------------------------------------------------------------
#ifndef _QIA_CROSS_VALIDATION_HPP
#define _QIA_CROSS_VALIDATION_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>
#include <qia/utilities/iterator.hpp>
#include <qia/utilities/stats.hpp>
#include <qia/pointset.hpp>
#include <qia/tensor_mesh.hpp>
#include <qia/knots.hpp>
#include <qia/anchors.hpp>
#include <qia/estimate.hpp>
#include <qia/evaluate.hpp>

#include <limits>

#ifdef QIA_TBB
#include    <tbb/parallel_for.h>
#include    <tbb/blocked_range.h>
#endif

namespace qia
{
    // settings of one hyperparameter search
    struct SearchInfo
    {
        VectorXi    p;                      // degree in each domain dimension                  [default 2, 2]
        int         k_max       {15};       // largest number of nearest neighbors              [default 15]
        int         n_max       {15};       // largest number of internal knot spans            [default 15]
        int         nreps       {5};        // number of cross-validation repetitions           [default 5]
        int         nfolds      {5};        // number of folds in each repetition               [default 5]
        int         rep_base    {1};        // index of the first repetition in file names      [default 1]
        int         verbose     {0};

        SearchInfo() :
            p(VectorXi::Constant(2, 2))     { }

        SearchInfo(int degree, int k_max_, int n_max_, int nreps_, int nfolds_, int verbose_ = 0) :
            p(VectorXi::Constant(2, degree)),
            k_max(k_max_),
            n_max(n_max_),
            nreps(nreps_),
            nfolds(nfolds_),
            verbose(verbose_)
        {
            validate();
        }

        void validate() const
        {
            if (p.size() != 2 || p.minCoeff() < 0)
                throw ConfigError(fmt::format("SearchInfo: need two nonnegative degrees, got {}", p.size() ? p.minCoeff() : -1));
            if (k_max < 1 || n_max < 1)
                throw ConfigError(fmt::format("SearchInfo: k_max = {} and n_max = {} must be >= 1", k_max, n_max));
            if (nreps < 1 || nfolds < 1)
                throw ConfigError(fmt::format("SearchInfo: nreps = {} and nfolds = {} must be >= 1", nreps, nfolds));
        }

        int ncells() const                  { return k_max * n_max; }

        // size of the cell grid with the first dimension (n) changing fastest, for VolIterator
        VectorXi cell_dims() const
        {
            VectorXi dims(2);
            dims << n_max, k_max;
            return dims;
        }
    };

    // training and validation points of every (repetition, fold)
    template <typename T>
    struct FoldSet
    {
        vector<vector<Fold<T>>>     folds;          // folds[repetition][fold], both 0-based

        int nreps() const                           { return folds.size(); }
        int nfolds() const                          { return folds.empty() ? 0 : folds[0].size(); }

        const Fold<T>& fold(int rep, int f) const   { return folds[rep][f]; }

        // smallest training set over all folds
        int min_train() const
        {
            int m = numeric_limits<int>::max();
            for (auto& rep : folds)
                for (auto& fd : rep)
                    m = std::min(m, fd.train.npts());
            return m;
        }

        void check(const SearchInfo& info) const
        {
            if (nreps() != info.nreps)
                throw DataError(fmt::format("FoldSet: {} repetitions, expected {}", nreps(), info.nreps));
            for (int r = 0; r < nreps(); r++)
            {
                if ((int)folds[r].size() != info.nfolds)
                    throw DataError(fmt::format("FoldSet: repetition {} has {} folds, expected {}",
                                r + info.rep_base, folds[r].size(), info.nfolds));
                for (int f = 0; f < info.nfolds; f++)
                {
                    if (folds[r][f].train.empty())
                        throw DataError(fmt::format("FoldSet: empty training set in repetition {} fold {}", r + info.rep_base, f));
                    if (folds[r][f].valid.empty())
                        throw DataError(fmt::format("FoldSet: empty validation set in repetition {} fold {}", r + info.rep_base, f));
                }
            }
        }

        // file name of one fold from a pattern with {rep} and {fold} fields
        static string fold_filename(const string& pattern, int rep, int f)
        {
            try
            {
                return fmt::format(fmt::runtime(pattern), fmt::arg("rep", rep), fmt::arg("fold", f));
            }
            catch (const fmt::format_error& e)
            {
                throw ConfigError(fmt::format("FoldSet: invalid file name pattern \"{}\": {}", pattern, e.what()));
            }
        }

        // reads all folds from files; any missing or malformed file is fatal
        static FoldSet<T> load(
                const string&       train_pattern,      // eg. "data/rep{rep}/train_{fold}.csv"
                const string&       valid_pattern,      // eg. "data/rep{rep}/valid_{fold}.csv"
                const SearchInfo&   info)
        {
            FoldSet<T> fs;
            fs.folds.resize(info.nreps);
            for (int r = 0; r < info.nreps; r++)
            {
                fs.folds[r].resize(info.nfolds);
                for (int f = 0; f < info.nfolds; f++)
                {
                    fs.folds[r][f].train = read_point_cloud<T>(fold_filename(train_pattern, r + info.rep_base, f));
                    fs.folds[r][f].valid = read_point_cloud<T>(fold_filename(valid_pattern, r + info.rep_base, f));
                    if (info.verbose > 1)
                        fmt::print(stderr, "FoldSet: repetition {} fold {}: {} training, {} validation points\n",
                                r + info.rep_base, f, fs.folds[r][f].train.npts(), fs.folds[r][f].valid.npts());
                }
            }
            fs.check(info);
            return fs;
        }

        // partitions one cloud into folds, reshuffled for each repetition with seed + repetition
        static FoldSet<T> split(
                const PointCloud<T>&    cloud,
                const SearchInfo&       info,
                unsigned                seed)
        {
            FoldSet<T> fs;
            fs.folds.resize(info.nreps);
            for (int r = 0; r < info.nreps; r++)
                fs.folds[r] = make_folds(cloud, info.nfolds, seed + r);
            fs.check(info);
            return fs;
        }

        // writes all folds following the same patterns as load()
        void write(
                const string&       train_pattern,
                const string&       valid_pattern,
                const SearchInfo&   info) const
        {
            for (int r = 0; r < nreps(); r++)
                for (int f = 0; f < (int)folds[r].size(); f++)
                {
                    write_point_cloud(fold_filename(train_pattern, r + info.rep_base, f), folds[r][f].train);
                    write_point_cloud(fold_filename(valid_pattern, r + info.rep_base, f), folds[r][f].valid);
                }
        }
    };

    enum class CellStatus
    {
        None    = -1,               // not computed (yet, or by another block)
        Ok      = 0,
        Failed  = 1
    };

    // averaged statistics of one (k, n) combination
    template <typename T>
    struct CellResult
    {
        int                 k{0};
        int                 n{0};
        CellStatus          status{CellStatus::None};
        ErrorSummary<T>     stats;
        string              message;            // reason of failure
    };

    // table of cell results over (k, n) in [1, k_max] x [1, n_max], row-major
    template <typename T>
    struct ErrorStatGrid
    {
        int                     k_max;
        int                     n_max;
        vector<CellResult<T>>   cells;

        static constexpr int    nvals = ErrorSummary<T>::nstats + 1;    // packed values per cell

        ErrorStatGrid(int k_max_, int n_max_) :
            k_max(k_max_),
            n_max(n_max_),
            cells((size_t)k_max_ * n_max_)
        {
            for (int k = 1; k <= k_max; k++)
                for (int n = 1; n <= n_max; n++)
                {
                    cells[idx(k, n)].k = k;
                    cells[idx(k, n)].n = n;
                }
        }

        ErrorStatGrid(const SearchInfo& info) :
            ErrorStatGrid(info.k_max, info.n_max)   { }

        size_t idx(int k, int n) const          { return (size_t)(k - 1) * n_max + (n - 1); }
        size_t size() const                     { return cells.size(); }

        CellResult<T>& cell(int k, int n)               { return cells[idx(k, n)]; }
        const CellResult<T>& cell(int k, int n) const   { return cells[idx(k, n)]; }

        // index of the cell with the smallest MSE among successful cells, first in row-major order on ties
        // returns -1 if no cell succeeded
        long argmin() const
        {
            long    best        = -1;
            T       best_mse    = 0;
            for (size_t i = 0; i < cells.size(); i++)
            {
                if (cells[i].status != CellStatus::Ok || std::isnan(cells[i].stats.mse))
                    continue;
                if (best < 0 || cells[i].stats.mse < best_mse)
                {
                    best        = i;
                    best_mse    = cells[i].stats.mse;
                }
            }
            return best;
        }

        vector<const CellResult<T>*> failed() const
        {
            vector<const CellResult<T>*> f;
            for (auto& c : cells)
                if (c.status == CellStatus::Failed)
                    f.push_back(&c);
            return f;
        }

        // flattens status and statistics of all cells, for reductions over blocks
        vector<T> pack() const
        {
            vector<T> vals(cells.size() * nvals);
            for (size_t i = 0; i < cells.size(); i++)
            {
                vals[i * nvals] = static_cast<int>(cells[i].status);
                for (int j = 0; j < ErrorSummary<T>::nstats; j++)
                    vals[i * nvals + 1 + j] = cells[i].stats.stat(j);
            }
            return vals;
        }

        // copies the computed cells of a packed grid into this one
        void merge(const vector<T>& vals)
        {
            if (vals.size() != cells.size() * nvals)
                throw QIAError(fmt::format("ErrorStatGrid: cannot merge {} values into {} cells", vals.size(), cells.size()));
            for (size_t i = 0; i < cells.size(); i++)
            {
                auto status = static_cast<CellStatus>(static_cast<int>(vals[i * nvals]));
                if (status == CellStatus::None)
                    continue;
                cells[i].status = status;
                for (int j = 0; j < ErrorSummary<T>::nstats; j++)
                    cells[i].stats.stat(j) = vals[i * nvals + 1 + j];
                cells[i].stats.std_defined = !std::isnan(cells[i].stats.stddev);
            }
        }

        // one row per cell: k, n, status, min, max, mean, median, std, mse
        void write(const string& filename) const
        {
            FILE* fd = open_output(filename);
            try
            {
                fmt::print(fd, "k,n,status,min,max,mean,median,std,mse\n");
                for (auto& c : cells)
                {
                    fmt::print(fd, "{},{},{}", c.k, c.n, static_cast<int>(c.status));
                    for (int j = 0; j < ErrorSummary<T>::nstats; j++)
                        fmt::print(fd, ",{}", c.stats.stat(j));
                    fmt::print(fd, "\n");
                }
            }
            catch (const std::system_error& e)
            {
                fclose(fd);
                throw DataError(fmt::format("ErrorStatGrid: error writing file {}: {}", filename, e.what()));
            }
            close_output(fd, filename);
        }
    };

    // selected hyperparameters and their averaged statistics
    template <typename T>
    struct SearchResult
    {
        int                 k;
        int                 n;
        ErrorSummary<T>     stats;

        void print(FILE* fd = stdout) const
        {
            fmt::print(fd, "Average min is {}\n",     stats.min);
            fmt::print(fd, "Average max is {}\n",     stats.max);
            fmt::print(fd, "Average mean is {}\n",    stats.mean);
            fmt::print(fd, "Average median is {}\n",  stats.median);
            fmt::print(fd, "Average std is {}\n",     stats.stddev);
            fmt::print(fd, "Average MSE is {}\n",     stats.mse);
            fmt::print(fd, "Optimal k is {}\n",       k);
            fmt::print(fd, "Optimal n is {}\n",       n);
        }
    };

    template <typename T>
    class GridSearch
    {
        const FoldSet<T>&   folds;
        SearchInfo          info;

    public:

        GridSearch(
                const FoldSet<T>&   folds_,
                const SearchInfo&   info_) :
            folds(folds_),
            info(info_)
        {
            info.validate();
            folds.check(info);
        }

        // validation statistics of one fold for one (k, n)
        ErrorSummary<T> fold_stats(
                const Fold<T>&  fd,
                int             k,
                int             n) const
        {
            VectorX<T> mins, maxs;
            union_bounds(fd.train, fd.valid, mins, maxs);

            // the mesh is rebuilt from scratch for every (k, n) and fold
            TensorMesh<T> mesh = build_mesh(mins, maxs, info.p, n);
            locate_anchors(mesh);

            KNNEstimator<T> estimator(fd.train, info.verbose);
            estimator.Estimate(mesh, k);

            Evaluator<T> evaluator(mesh, info.verbose);
            return evaluator.validate(fd.valid);
        }

        // Averages the statistics of one (k, n) over folds, then over repetitions:
        // each fold adds stat / nfolds, and the sum is divided by nreps at the end.
        // Configuration errors and non-finite fold statistics mark the cell failed; data errors propagate.
        // An undefined std (single validation point) is kept as NaN and does not fail the cell.
        CellResult<T> cell(int k, int n) const
        {
            CellResult<T> c;
            c.k = k;
            c.n = n;

            ErrorSummary<T> acc;
            try
            {
                for (int r = 0; r < info.nreps; r++)
                {
                    for (int f = 0; f < info.nfolds; f++)
                    {
                        ErrorSummary<T> s = fold_stats(folds.fold(r, f), k, n);
                        for (int j = 0; j < ErrorSummary<T>::nstats; j++)
                        {
                            if (!std::isfinite(s.stat(j)) && !(j == 4 && !s.std_defined))
                                throw NumericalError(fmt::format("non-finite {} in repetition {} fold {}",
                                            ErrorSummary<T>::name(j), r + info.rep_base, f));
                            acc.stat(j) += s.stat(j) / info.nfolds;
                        }
                        acc.npts += s.npts;
                        if (!s.std_defined)
                            acc.std_defined = false;
                    }
                }
            }
            catch (const ConfigError& e)
            {
                fail(c, e.what());
                return c;
            }
            catch (const NumericalError& e)
            {
                fail(c, e.what());
                return c;
            }

            for (int j = 0; j < ErrorSummary<T>::nstats; j++)
                acc.stat(j) /= info.nreps;

            c.status    = CellStatus::Ok;
            c.stats     = acc;

            if (info.verbose > 1)
                fmt::print(stderr, "GridSearch: cell k = {} n = {} MSE {:.6e}\n", k, n, c.stats.mse);

            return c;
        }

        // computes the given cells of the grid; each cell is an independent task
        void search(
                ErrorStatGrid<T>&       grid,
                const vector<size_t>&   cell_idxs,
                bool                    parallel = true) const
        {
            if (grid.k_max != info.k_max || grid.n_max != info.n_max)
                throw ConfigError(fmt::format("GridSearch: grid of {} x {} cells for a {} x {} search",
                            grid.k_max, grid.n_max, info.k_max, info.n_max));

#ifdef QIA_TBB      // TBB version
            if (parallel)
            {
                tbb::parallel_for(tbb::blocked_range<size_t>(0, cell_idxs.size()), [&](const tbb::blocked_range<size_t>& r)
                {
                    for (auto i = r.begin(); i < r.end(); i++)
                    {
                        CellResult<T>& c = grid.cells[cell_idxs[i]];
                        c = cell(c.k, c.n);
                    }
                });
                return;
            }
#endif
            for (auto i : cell_idxs)
            {
                CellResult<T>& c = grid.cells[i];
                c = cell(c.k, c.n);
            }
        }

        // computes all cells of the grid
        void search(
                ErrorStatGrid<T>&       grid,
                bool                    parallel = true) const
        {
            vector<size_t> cell_idxs(grid.size());
            for (size_t i = 0; i < cell_idxs.size(); i++)
                cell_idxs[i] = i;
            search(grid, cell_idxs, parallel);

            if (info.verbose)
                fmt::print(stderr, "GridSearch: {} cells, {} failed\n", grid.size(), grid.failed().size());
        }

        // optimum of a completed grid; throws if there is no valid optimum
        SearchResult<T> select(const ErrorStatGrid<T>& grid) const
        {
            long best = grid.argmin();
            if (best < 0)
                throw NumericalError(fmt::format("GridSearch: none of the {} cells produced a valid MSE", grid.size()));

            const CellResult<T>& c = grid.cells[best];
            if (!c.stats.finite())
                throw NumericalError(fmt::format("GridSearch: optimal cell k = {} n = {} has undefined statistics (std defined: {})",
                            c.k, c.n, c.stats.std_defined));

            return SearchResult<T>{c.k, c.n, c.stats};
        }

        SearchResult<T> run(ErrorStatGrid<T>& grid, bool parallel = true) const
        {
            search(grid, parallel);
            return select(grid);
        }

    private:

        void fail(CellResult<T>& c, const string& message) const
        {
            c.status    = CellStatus::Failed;
            c.message   = message;
            for (int j = 0; j < ErrorSummary<T>::nstats; j++)
                c.stats.stat(j) = numeric_limits<T>::quiet_NaN();
            c.stats.std_defined = false;
            if (info.verbose > 1)
                fmt::print(stderr, "GridSearch: cell k = {} n = {} failed: {}\n", c.k, c.n, c.message);
        }
    };
}   // namespace qia

#endif  // _QIA_CROSS_VALIDATION_HPP
