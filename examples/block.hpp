//--------------------------------------------------------------
// one diy block: a rectangle of cells of the (k, n) hyperparameter grid
//--------------------------------------------------------------
#ifndef _QIA_BLOCK_HPP
#define _QIA_BLOCK_HPP

#include    <qia/qia.hpp>

#include    <diy/master.hpp>
#include    <diy/reduce-operations.hpp>
#include    <diy/decomposition.hpp>
#include    <diy/assigner.hpp>
#include    <diy/reduce.hpp>
#include    <diy/partners/merge.hpp>

using namespace std;

using Bounds        = diy::DiscreteBounds;
using RCLink        = diy::RegularGridLink;
using Decomposer    = diy::RegularDecomposer<Bounds>;

// The cell grid is decomposed as a 2-d discrete domain with n in dimension 0 and k in dimension 1,
// so that cells are stored with n changing fastest (row-major in (k, n)).
template <typename T>
struct Block
{
    vector<int>         core_mins;          // first (n, k) cell of this block, 1-based
    vector<int>         core_maxs;          // last (n, k) cell of this block, inclusive
    int                 k_max{0};
    int                 n_max{0};
    vector<T>           cells_reduce;       // packed cells of the full grid, used in the reduction

    static
        void* create()          { return new Block; }

    static
        void destroy(void* b)   { delete static_cast<Block*>(b); }

    static
        void save(const void* b_, diy::BinaryBuffer& bb)
        {
            const Block* b = static_cast<const Block*>(b_);
            diy::save(bb, b->core_mins);
            diy::save(bb, b->core_maxs);
            diy::save(bb, b->k_max);
            diy::save(bb, b->n_max);
            diy::save(bb, b->cells_reduce);
        }

    static
        void load(void* b_, diy::BinaryBuffer& bb)
        {
            Block* b = static_cast<Block*>(b_);
            diy::load(bb, b->core_mins);
            diy::load(bb, b->core_maxs);
            diy::load(bb, b->k_max);
            diy::load(bb, b->n_max);
            diy::load(bb, b->cells_reduce);
        }

    static
        void add(                                   // add the block to the decomposition
                int                 gid,            // block global id
                const Bounds&       core,           // block bounds
                const Bounds&       bounds,         // block bounds including any ghost region added (unused)
                const Bounds&       domain,         // global cell bounds
                const RCLink&       link,           // neighborhood
                diy::Master&        master,         // diy master
                const qia::SearchInfo& info)
        {
            Block*          b   = new Block;
            RCLink*         l   = new RCLink(link);
            master.add(gid, b, l);

            b->core_mins    = {core.min[0], core.min[1]};
            b->core_maxs    = {core.max[0], core.max[1]};
            b->k_max        = info.k_max;
            b->n_max        = info.n_max;
        }

    // linear indices of the cells of this block in the full grid
    vector<size_t> cell_idxs(const qia::SearchInfo& info) const
    {
        VectorXi sub_npts(2), sub_starts(2);
        for (int i = 0; i < 2; i++)
        {
            sub_npts(i)     = core_maxs[i] - core_mins[i] + 1;
            sub_starts(i)   = core_mins[i] - 1;
        }

        vector<size_t>      idxs;
        qia::VolIterator    vol_iter(sub_npts, sub_starts, info.cell_dims());
        while (!vol_iter.done())
        {
            idxs.push_back(vol_iter.cur_iter_full());
            vol_iter.incr_iter();
        }
        return idxs;
    }

    // computes the cells of this block and packs them for the reduction
    void search_cells(
            const diy::Master::ProxyWithLink&   cp,
            const qia::GridSearch<T>&           search,
            const qia::SearchInfo&              info,
            bool                                parallel)
    {
        qia::ErrorStatGrid<T>   grid(info);
        vector<size_t>          idxs = cell_idxs(info);

        if (info.verbose)
            fmt::print(stderr, "block gid = {}: k in [{}, {}], n in [{}, {}], {} cells\n",
                    cp.gid(), core_mins[1], core_maxs[1], core_mins[0], core_maxs[0], idxs.size());

        search.search(grid, idxs, parallel);

        for (auto i : idxs)
        {
            const qia::CellResult<T>& c = grid.cells[i];
            if (c.status == qia::CellStatus::Failed)
                fmt::print(stderr, "block gid = {}: cell k = {} n = {} failed: {}\n", cp.gid(), c.k, c.n, c.message);
        }

        cells_reduce = grid.pack();
    }

    // full grid after the reduction (complete only in gid 0)
    qia::ErrorStatGrid<T> grid() const
    {
        qia::ErrorStatGrid<T> g(k_max, n_max);
        g.merge(cells_reduce);
        return g;
    }
};

// merge-based reduction of the packed cell grids of all blocks
template<typename T>
void merge_cells_cb(Block<T>* b,                          // local block
        const diy::ReduceProxy& rp,                     // communication proxy
        const diy::RegularMergePartners& partners)      // partners of the current block
{
    // step 1: dequeue and merge
    for (int i = 0; i < rp.in_link().size(); ++i)
    {
        int nbr_gid = rp.in_link().target(i).gid;
        if (nbr_gid == rp.gid())
            continue;

        std::vector<T> in_vals;
        rp.dequeue(nbr_gid, in_vals);

        qia::ErrorStatGrid<T> g = b->grid();
        g.merge(in_vals);
        b->cells_reduce = g.pack();
    }

    // step 2: enqueue
    for (int i = 0; i < rp.out_link().size(); ++i)
    {
        // only send to root of group, but not self
        if (rp.out_link().target(i).gid != rp.gid())
            rp.enqueue(rp.out_link().target(i), b->cells_reduce);
    }
}

#endif  // _QIA_BLOCK_HPP
