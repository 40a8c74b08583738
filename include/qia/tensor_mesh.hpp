//--------------------------------------------------------------
// tensor product B-spline mesh: knots, basis functions, coefficients
// ref: [P&T] Piegl & Tiller, The NURBS Book, 1995
//--------------------------------------------------------------
#ifndef _QIA_TENSOR_MESH_HPP
#define _QIA_TENSOR_MESH_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>
#include <qia/utilities/iterator.hpp>

namespace qia
{
    // n.b. Not stored as a member of TensorMesh because multiple threads may evaluate
    //      the same mesh simultaneously. In a threaded environment, BasisFunInfo should be thread-local
    template<typename T>
    struct BasisFunInfo
    {
        vector<T>           right;  // right parameter differences (t_k - u)
        vector<T>           left;   // left parameter differences (u - t_l)
        int                 qmax;   // Largest spline order (p+1) among all dimensions

        BasisFunInfo(const VectorXi& p) :
            qmax(p.maxCoeff() + 1)
        {
            right.assign(qmax, 0);
            left.assign(qmax, 0);
        }
    };

    // computes and returns one basis function value for a given parameter value and local knot vector
    // based on algorithm 2.4 of P&T, p. 74
    template <typename T>
    T OneBasisFun(
            int                     p,                  // degree
            T                       u,                  // parameter value
            const vector<T>&        loc_knots)          // local knot vector (p + 2 knots)
    {
        vector<T> N(p + 1);                             // triangular table result
        const vector<T>& U = loc_knots;                 // alias for knot vector for current dimension

        // corner case: u at a clamped right edge of the local knot vector
        if (u == U[p + 1])
        {
            bool edge = true;
            for (auto j = 0; j < p + 1; j++)
            {
                if (U[1 + j] != u)
                {
                    edge = false;
                    break;
                }
            }
            if (edge)
                return 1.0;
        }

        // initialize 0-th degree functions
        for (auto j = 0; j <= p; j++)
        {
            if (u >= U[j] && u < U[j + 1])
                N[j] = 1.0;
            else
                N[j] = 0.0;
        }

        // compute triangular table
        T saved, uleft, uright, temp;
        for (auto k = 1; k <= p; k++)
        {
            if (N[0] == 0.0)
                saved = 0.0;
            else
                saved = ((u - U[0]) * N[0]) / (U[k] - U[0]);
            for (auto j = 0; j < p - k + 1; j++)
            {
                uleft     = U[j + 1];
                uright    = U[j + k + 1];
                if (N[j + 1] == 0.0)
                {
                    N[j]    = saved;
                    saved   = 0.0;
                }
                else
                {
                    temp    = N[j + 1] / (uright - uleft);
                    N[j]    = saved + (uright - u) * temp;
                    saved   = (u - uleft) * temp;
                }
            }
        }
        return N[0];
    }

    // One tensor product basis function and its control point value
    template <typename T>
    struct BasisFunction
    {
        VectorXi                ijk;            // index of the basis function in each dimension
        vector<vector<T>>       loc_knots;      // local knot window [dim][p + 2]
        T                       coef{0};        // control point value
        VectorX<T>              anchor;         // knot average in each dimension

        // value of this basis function (without its coefficient) at a point
        T value(const VectorXi& p, const VectorX<T>& pt) const
        {
            T b = 1.0;
            for (auto k = 0; k < p.size(); k++)
            {
                b *= OneBasisFun(p(k), pt(k), loc_knots[k]);
                if (b == 0.0)
                    break;
            }
            return b;
        }
    };

    // Tensor product of B-spline bases over clamped knot vectors.
    // The mesh exclusively owns its basis functions, stored with the first dimension changing fastest.
    template <typename T>
    struct TensorMesh
    {
        int                         dom_dim;        // number of domain dimensions
        VectorXi                    p;              // degree in each dimension
        vector<vector<T>>           all_knots;      // all_knots[dimension][index]
        VectorXi                    nbasis;         // number of basis functions in each dimension
        vector<BasisFunction<T>>    basis_set;      // all basis functions

        TensorMesh(
                const VectorXi&             p_,     // degree in each dimension
                const vector<vector<T>>&    knots_) // clamped knot vector in each dimension
            :
            dom_dim(p_.size()),
            p(p_),
            all_knots(knots_)
        {
            if ((int)all_knots.size() != dom_dim)
                throw ConfigError(fmt::format("TensorMesh: {} knot vectors for {} dimensions", all_knots.size(), dom_dim));

            nbasis.resize(dom_dim);
            for (auto k = 0; k < dom_dim; k++)
            {
                nbasis(k) = all_knots[k].size() - p(k) - 1;
                if (nbasis(k) < p(k) + 1)
                    throw ConfigError(fmt::format("TensorMesh: too few knots ({}) in dimension {} for degree {}",
                                all_knots[k].size(), k, p(k)));
            }

            init_basis();
        }

        // number of basis functions in total
        size_t size() const                     { return basis_set.size(); }

        BasisFunction<T>& operator[](size_t i)              { return basis_set[i]; }
        const BasisFunction<T>& operator[](size_t i) const  { return basis_set[i]; }

        // binary search to find the span in the knots vector containing a given parameter value
        // returns span index i s.t. u is in [ knots[i], knots[i + 1] )
        // NB closed interval at left and open interval at right, except the last span is closed at both ends
        //
        // i will be in the range [p, n], where n = number of basis functions - 1 because there are
        // p + 1 repeated knots at start and end of knot vector
        // algorithm 2.1, P&T, p. 68
        int FindSpan(
                int                     cur_dim,            // current dimension
                T                       u) const            // parameter value
        {
            const vector<T>& U = all_knots[cur_dim];
            int n = nbasis(cur_dim);

            if (!(u >= U[p(cur_dim)] && u <= U[n]))
                throw ConfigError(fmt::format("FindSpan(): value {} outside of knot range [{}, {}] in dimension {}",
                            u, U[p(cur_dim)], U[n], cur_dim));

            if (u == U[n])
                return n - 1;

            // binary search
            int low = p(cur_dim);
            int high = n;
            int mid = (low + high) / 2;
            while (u < U[mid] || u >= U[mid + 1])
            {
                if (u < U[mid])
                    high = mid;
                else
                    low = mid;
                mid = (low + high) / 2;
            }

            return mid;
        }

        // computes the p + 1 nonzero basis functions at a parameter value in place
        // algorithm 2.2 of P&T, p. 70
        //
        // NOTE: In a threaded environment, a thread-local BasisFunInfo should be passed
        //       as an argument. Concurrent access to the same BFI will cause a data race.
        void FastBasisFuns(
            int                 cur_dim,        // current dimension
            T                   u,              // parameter value
            int                 span,           // index of span in the knots vector containing u
            vector<T>&          N,              // vector of (output) basis function values, size p + 1
            BasisFunInfo<T>&    bfi) const      // scratch space
        {
            const vector<T>& U = all_knots[cur_dim];
            N[0] = 1;

            for (int j = 1; j <= p(cur_dim); j++)
            {
                bfi.left[j]  = u - U[span + 1 - j];
                bfi.right[j] = U[span + j] - u;

                T saved = 0.0;
                for (int r = 0; r < j; r++)
                {
                    T temp = N[r] / (bfi.right[r + 1] + bfi.left[j - r]);
                    N[r] = saved + bfi.right[r + 1] * temp;
                    saved = bfi.left[j - r] * temp;
                }
                N[j] = saved;
            }
        }

        // linear index of a basis function from its index in each dimension
        size_t basis_idx(const VectorXi& ijk) const
        {
            size_t idx      = 0;
            size_t stride   = 1;
            for (auto k = 0; k < dom_dim; k++)
            {
                idx     += ijk(k) * stride;
                stride  *= nbasis(k);
            }
            return idx;
        }

        // value of the spline: sum of coefficient times basis function
        T operator()(const VectorX<T>& pt) const
        {
            BasisFunInfo<T> bfi(p);
            return eval(pt, bfi);
        }

        T operator()(T x, T y) const
        {
            VectorX<T> pt(2);
            pt << x, y;
            return (*this)(pt);
        }

        // value of the spline with caller-supplied scratch space
        T eval(
                const VectorX<T>&   pt,
                BasisFunInfo<T>&    bfi) const
        {
            if (pt.size() != dom_dim)
                throw ConfigError(fmt::format("TensorMesh: point of dimension {} in a {}-d mesh", pt.size(), dom_dim));

            vector<vector<T>>   N(dom_dim);
            VectorXi            span(dom_dim);
            for (auto k = 0; k < dom_dim; k++)
            {
                span(k) = FindSpan(k, pt(k));
                N[k].resize(p(k) + 1);
                FastBasisFuns(k, pt(k), span(k), N[k], bfi);
            }

            // sum over the (p + 1)^dom_dim basis functions that are nonzero at pt
            VolIterator vol_iter((p.array() + 1).matrix());
            VectorXi    ijk(dom_dim);
            T           val = 0.0;
            while (!vol_iter.done())
            {
                T b = 1.0;
                for (auto k = 0; k < dom_dim; k++)
                {
                    int j   = vol_iter.idx_dim(k);
                    ijk(k)  = span(k) - p(k) + j;
                    b       *= N[k][j];
                }
                val += b * basis_set[basis_idx(ijk)].coef;
                vol_iter.incr_iter();
            }

            return val;
        }

    private:

        // creates the basis functions with their local knot windows; coefficients start at 0
        void init_basis()
        {
            VolIterator vol_iter(nbasis);
            basis_set.resize(vol_iter.tot_iters());
            while (!vol_iter.done())
            {
                BasisFunction<T>& b = basis_set[vol_iter.cur_iter()];
                b.ijk = vol_iter.idx_dim();
                b.loc_knots.resize(dom_dim);
                for (auto k = 0; k < dom_dim; k++)
                {
                    int i = b.ijk(k);
                    b.loc_knots[k].assign(all_knots[k].begin() + i, all_knots[k].begin() + i + p(k) + 2);
                }
                b.coef = 0.0;
                b.anchor = VectorX<T>::Zero(dom_dim);
                vol_iter.incr_iter();
            }
        }
    };
}   // namespace qia

#endif  // _QIA_TENSOR_MESH_HPP
