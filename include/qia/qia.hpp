//--------------------------------------------------------------
// qia: quasi-interpolation of scattered height data
//
// A tensor product B-spline whose control points are set directly from the
// data (k-nearest-neighbor means at the knot averages) rather than by solving a
// least-squares system, with (k, n) chosen by repeated k-fold cross-validation.
//--------------------------------------------------------------
#ifndef _QIA_HPP
#define _QIA_HPP

#include    <qia/types.hpp>
#include    <qia/utilities/util.hpp>
#include    <qia/pointset.hpp>
#include    <qia/tensor_mesh.hpp>
#include    <qia/knots.hpp>
#include    <qia/anchors.hpp>
#include    <qia/estimate.hpp>
#include    <qia/evaluate.hpp>
#include    <qia/cross_validation.hpp>

#endif  // _QIA_HPP
