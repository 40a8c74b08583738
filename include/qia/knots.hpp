//--------------------------------------------------------------
// clamped uniform knot vectors and tensor mesh construction
//--------------------------------------------------------------
#ifndef _QIA_KNOTS_HPP
#define _QIA_KNOTS_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>
#include <qia/tensor_mesh.hpp>

namespace qia
{
    // compute knots
    // uniform spacing with p + 1 copies of each end value
    //
    // nknots = n + 1 + 2p, nbasis = nknots - p - 1 = n + p
    // eg, for p = 2, n = 4 on [0, 1]
    // knots = {0, 0, 0, 0.25, 0.5, 0.75, 1, 1, 1}
    // the n + 1 uniformly spaced values include both ends, which supply one of the p + 1 repeated end knots
    template <typename T>
    vector<T> uniform_knots(
            T       lo,                 // lower bound of the domain
            T       hi,                 // upper bound of the domain
            int     p,                  // degree
            int     n)                  // number of internal knot spans
    {
        if (p < 0)
            throw ConfigError(fmt::format("uniform_knots(): invalid degree {}", p));
        if (n < 1)
            throw ConfigError(fmt::format("uniform_knots(): refinement n must be >= 1, got {}", n));
        if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi))
            throw ConfigError(fmt::format("uniform_knots(): degenerate domain [{}, {}]", lo, hi));

        vector<T> knots;
        knots.reserve(n + 1 + 2 * p);

        for (int i = 0; i < p; i++)
            knots.push_back(lo);

        // n + 1 values, lo + i * step, with the last one set to hi exactly
        T step = (hi - lo) / n;
        for (int i = 0; i < n; i++)
            knots.push_back(i * step + lo);
        knots.push_back(hi);

        for (int i = 0; i < p; i++)
            knots.push_back(hi);

        return knots;
    }

    // checks that a knot vector is nondecreasing and (p + 1)-regular with a nonempty range
    template <typename T>
    bool regular_knots(
            const vector<T>&    knots,
            int                 p)
    {
        int nknots = knots.size();
        if (nknots < 2 * (p + 1))
            return false;
        for (int i = 1; i < nknots; i++)
            if (knots[i] < knots[i - 1])
                return false;
        for (int i = 1; i < p + 1; i++)
        {
            if (knots[i] != knots[0] || knots[nknots - 1 - i] != knots[nknots - 1])
                return false;
        }
        // exactly p + 1 copies at each end
        if (knots[p + 1] == knots[0] || knots[nknots - 2 - p] == knots[nknots - 1])
            return false;
        return true;
    }

    // Builds a tensor mesh over a bounding box with the same refinement n in each dimension
    template <typename T>
    TensorMesh<T> build_mesh(
            const VectorX<T>&   mins,           // minimum corner of the domain
            const VectorX<T>&   maxs,           // maximum corner of the domain
            const VectorXi&     p,              // degree in each dimension
            int                 n)              // number of internal knot spans in each dimension
    {
        if (mins.size() != p.size() || maxs.size() != p.size())
            throw ConfigError(fmt::format("build_mesh(): bounds of dimension {} and {} for {} degrees",
                        mins.size(), maxs.size(), p.size()));

        vector<vector<T>> knots(p.size());
        for (auto k = 0; k < p.size(); k++)
        {
            knots[k] = uniform_knots<T>(mins(k), maxs(k), p(k), n);
            if (!regular_knots(knots[k], p(k)))
                throw ConfigError(fmt::format("build_mesh(): knot vector {} in dimension {} is not {}-regular",
                            print_vec(knots[k]), k, p(k) + 1));
        }

        return TensorMesh<T>(p, knots);
    }
}   // namespace qia

#endif  // _QIA_KNOTS_HPP
