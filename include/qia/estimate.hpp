//--------------------------------------------------------------
// k-nearest-neighbor estimate of control point values
//--------------------------------------------------------------
#ifndef _QIA_ESTIMATE_HPP
#define _QIA_ESTIMATE_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>
#include <qia/pointset.hpp>
#include <qia/tensor_mesh.hpp>

#include <algorithm>
#include <numeric>

namespace qia
{
    // Sets each control point to the mean z-value of the k training points nearest to
    // the anchor of its basis function. This is the weighted estimator with weight 1/k on
    // the k nearest points and 0 elsewhere.
    template <typename T>
    class KNNEstimator
    {
        const PointCloud<T>&    train;          // training points
        int                     verbose;

    public:

        KNNEstimator(
                const PointCloud<T>&    train_,
                int                     verbose_ = 0) :
            train(train_),
            verbose(verbose_)
        {
            if (train.empty())
                throw DataError("KNNEstimator: empty training set");
        }

        // checks 1 <= k <= number of training points
        void check_k(int k) const
        {
            if (k < 1 || k > train.npts())
                throw ConfigError(fmt::format("KNNEstimator: k = {} outside of [1, {}] (training set size)", k, train.npts()));
        }

        // indices of the k training points nearest to a location in the (x,y) plane
        // ties in distance keep the order of the training points
        void neighbors(
                const VectorX<T>&   anchor,     // location
                int                 k,          // number of neighbors
                vector<int>&        idxs) const // (output) indices into training points, nearest first
        {
            check_k(k);

            int npts = train.npts();
            vector<T> dists(npts);
            for (int i = 0; i < npts; i++)
            {
                T dx = train.x(i) - anchor(0);
                T dy = train.y(i) - anchor(1);
                dists[i] = sqrt(dx * dx + dy * dy);
            }

            vector<int> order(npts);
            iota(order.begin(), order.end(), 0);
            stable_sort(order.begin(), order.end(), [&](int a, int b) { return dists[a] < dists[b]; });

            idxs.assign(order.begin(), order.begin() + k);
        }

        // mean z-value of the k nearest training points
        T estimate(
                const VectorX<T>&   anchor,
                int                 k) const
        {
            vector<int> idxs;
            neighbors(anchor, k, idxs);

            T sum = 0.0;
            for (auto i : idxs)
                sum += train.z(i);
            return sum / k;
        }

        // overwrites the coefficient of every basis function in the mesh
        // anchors must have been located beforehand
        void Estimate(
                TensorMesh<T>&      mesh,
                int                 k) const
        {
            check_k(k);

            for (auto& b : mesh.basis_set)
            {
                if (b.anchor.size() != 2)
                    throw ConfigError("KNNEstimator: basis function without a 2-d anchor");
                b.coef = estimate(b.anchor, k);
            }

            if (verbose > 1)
                fmt::print(stderr, "KNNEstimator: {} control points from k = {} of {} training points\n",
                        mesh.size(), k, train.npts());
        }
    };
}   // namespace qia

#endif  // _QIA_ESTIMATE_HPP
