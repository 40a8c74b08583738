//--------------------------------------------------------------
// Iterator over a multidimensional index space
//--------------------------------------------------------------
#ifndef _QIA_ITERATOR_HPP
#define _QIA_ITERATOR_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>

namespace qia
{
    // iterates over a volume or a subvolume of a tensor index space
    // first dimension changes fastest
    struct VolIterator
    {
        size_t          dom_dim_;                   // number of dimensions
        VectorXi        npts_dim_;                  // size of volume or subvolume in each dimension
        VectorXi        starts_dim_;                // offset to start of subvolume in each dimension
        VectorXi        all_npts_dim_;              // size of total volume in each dimension
        VectorXi        ds_;                        // stride for subvolume points in each dim.
        size_t          tot_iters_;                 // total number of flattened iterations

        VectorXi        idx_dim_;                   // current iteration number in each dimension
        size_t          cur_iter_;                  // current flattened iteration number

    public:

        void init(size_t idx = 0)
        {
            if (npts_dim_.size() != (int)dom_dim_ || starts_dim_.size() != (int)dom_dim_ || all_npts_dim_.size() != (int)dom_dim_)
                throw ConfigError("VolIterator: sizes of sub_npts, sub_starts, all_npts are not equal");
            for (size_t i = 0; i < dom_dim_; i++)
            {
                if (starts_dim_(i) < 0)
                    throw ConfigError(fmt::format("VolIterator: sub_starts[{}] < 0", i));
                if (starts_dim_(i) + npts_dim_(i) > all_npts_dim_(i))
                    throw ConfigError(fmt::format("VolIterator: sub_starts[{0}] + sub_npts[{0}] > all_npts[{0}]", i));
            }

            ds_ = VectorXi::Ones(dom_dim_);
            for (size_t i = 1; i < dom_dim_; i++)
                ds_(i) = ds_(i - 1) * npts_dim_(i - 1);

            cur_iter_   = idx;
            idx_dim_    = VectorXi::Zero(dom_dim_);
            if (tot_iters_ > 0)
                idx_ijk(idx < tot_iters_ ? idx : 0, idx_dim_);
        }

        // subvolume version
        VolIterator(const   VectorXi& sub_npts,             // size of subvolume in each dimension
                    const   VectorXi& sub_starts,           // offset to start of subvolume in each dimension
                    const   VectorXi& all_npts,             // size of total volume in each dimension
                            size_t idx = 0) :               // linear iteration count within subvolume
                    dom_dim_(sub_npts.size()),
                    npts_dim_(sub_npts),
                    starts_dim_(sub_starts),
                    all_npts_dim_(all_npts),
                    tot_iters_(sub_npts.size() ? npts_dim_.prod() : 0),
                    cur_iter_(idx)                          { init(idx); }

        // full volume version
        VolIterator(const   VectorXi& npts,                 // size of volume in each dimension
                            size_t idx = 0) :               // linear iteration count within volume
                    dom_dim_(npts.size()),
                    npts_dim_(npts),
                    starts_dim_(VectorXi::Zero(npts.size())),
                    all_npts_dim_(npts),
                    tot_iters_(npts.size() ? npts_dim_.prod() : 0),
                    cur_iter_(idx)                          { init(idx); }

        // return total number of iterations in the volume
        // thread-safe
        size_t tot_iters() const        { return tot_iters_; }

        // return whether all iterations are done
        bool done() const               { return cur_iter_ >= tot_iters_; }

        // return current index in a dimension
        // in case of a subvolume, index is w.r.t. entire volume
        int idx_dim(int dim) const      { return idx_dim_[dim]; }

        // return vector of indices in each dimension
        VectorXi idx_dim() const        { return idx_dim_; }

        // return current total iteration count
        size_t cur_iter() const         { return cur_iter_; }

        // convert linear index into (i,j,k,...) multidimensional index
        // in case of subvolume, idx is w.r.t. subvolume but ijk is w.r.t entire volume
        // thread-safe
        void idx_ijk(
                size_t                  idx,            // linear index in subvolume
                VectorXi&               ijk) const      // (output) i,j,k,... indices in all dimensions
        {
            for (size_t i = 0; i < dom_dim_; i++)
            {
                if (i < dom_dim_ - 1)
                    ijk(i) = (idx % ds_[i + 1]) / ds_[i];
                else
                    ijk(i) = idx  / ds_[i];
            }
            ijk += starts_dim_;
        }

        // convert (i,j,k,...) multidimensional index into linear index
        // in the case of subvolume, both ijk and idx are w.r.t. entire volume
        // thread-safe
        size_t ijk_idx(const VectorXi& ijk) const
        {
            size_t idx          = 0;
            size_t stride       = 1;
            for (size_t i = 0; i < dom_dim_; i++)
            {
                idx     += ijk(i) * stride;
                stride  *= all_npts_dim_(i);
            }
            return idx;
        }

        // return current iteration count within full volume
        size_t cur_iter_full() const
        {
            return ijk_idx(idx_dim_);
        }

        // increment iteration; user must call incr_iter() near the bottom of the flattened loop
        void incr_iter()
        {
            cur_iter_++;
            if (cur_iter_ < tot_iters_)
                idx_ijk(cur_iter_, idx_dim_);
        }
    };
}   // namespace qia

#endif  // _QIA_ITERATOR_HPP
