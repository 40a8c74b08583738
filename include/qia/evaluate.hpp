//--------------------------------------------------------------
// evaluation of the quasi-interpolant and validation errors
//--------------------------------------------------------------
#ifndef _QIA_EVALUATE_HPP
#define _QIA_EVALUATE_HPP

#include <qia/types.hpp>
#include <qia/pointset.hpp>
#include <qia/tensor_mesh.hpp>
#include <qia/utilities/stats.hpp>

namespace qia
{
    template <typename T>
    class Evaluator
    {
        const TensorMesh<T>&    mesh;
        int                     verbose;

    public:

        Evaluator(
                const TensorMesh<T>&    mesh_,
                int                     verbose_ = 0) :
            mesh(mesh_),
            verbose(verbose_)           { }

        // spline value at the (x,y) location of every point
        VectorX<T> predict(const PointCloud<T>& pts) const
        {
            BasisFunInfo<T> bfi(mesh.p);
            VectorX<T>      pt(2);
            VectorX<T>      vals(pts.npts());
            for (int i = 0; i < pts.npts(); i++)
            {
                pt << pts.x(i), pts.y(i);
                vals(i) = mesh.eval(pt, bfi);
            }
            return vals;
        }

        // |predicted - z| for every validation point, in order
        vector<T> abs_errors(const PointCloud<T>& valid) const
        {
            if (valid.empty())
                throw DataError("Evaluator: empty validation set");

            VectorX<T> vals = predict(valid);
            vector<T> errs(valid.npts());
            for (int i = 0; i < valid.npts(); i++)
                errs[i] = fabs(vals(i) - valid.z(i));
            return errs;
        }

        ErrorSummary<T> validate(const PointCloud<T>& valid) const
        {
            ErrorSummary<T> s = summarize(abs_errors(valid));

            if (verbose > 1)
                fmt::print(stderr, "Evaluator: {} validation points, mean error {:.6e}, MSE {:.6e}\n",
                        s.npts, s.mean, s.mse);

            return s;
        }
    };
}   // namespace qia

#endif  // _QIA_EVALUATE_HPP
