//--------------------------------------------------------------
// knot average (Greville) anchors of basis functions
//--------------------------------------------------------------
#ifndef _QIA_ANCHORS_HPP
#define _QIA_ANCHORS_HPP

#include <qia/types.hpp>
#include <qia/tensor_mesh.hpp>

namespace qia
{
    // mean of the p interior knots of a local knot window of p + 2 knots
    // degree 0 has no interior knots; use the midpoint of the window instead
    template <typename T>
    T knot_average(
            const vector<T>&    loc_knots,
            int                 p)
    {
        if (p == 0)
            return (loc_knots[0] + loc_knots[1]) / 2;

        T sum = 0.0;
        for (int i = 1; i <= p; i++)
            sum += loc_knots[i];
        return sum / p;
    }

    // sets the anchor of every basis function in the mesh
    template <typename T>
    void locate_anchors(TensorMesh<T>& mesh)
    {
        for (auto& b : mesh.basis_set)
        {
            b.anchor.resize(mesh.dom_dim);
            for (auto k = 0; k < mesh.dom_dim; k++)
                b.anchor(k) = knot_average(b.loc_knots[k], mesh.p(k));
        }
    }
}   // namespace qia

#endif  // _QIA_ANCHORS_HPP
