//--------------------------------------------------------------
// basic types for qia
//--------------------------------------------------------------
#ifndef _QIA_TYPES_HPP
#define _QIA_TYPES_HPP

// Basic includes so we don't need to add them elsewhere
#include    <string>
#include    <vector>
#include    <cstdio>
#include    <cmath>
#include    <iostream>
#include    <fstream>
#include    <sstream>
#include    <stdexcept>

// Eigen
#include    <Eigen/Dense>

// fmt
#include    <fmt/format.h>

// set input and ouptut precision here, float or double
#if 0
typedef float                          real_t;
#else
typedef double                         real_t;
#endif

using namespace std;

// Eigen typedefs
using Eigen::MatrixXd;
using Eigen::MatrixXi;
using Eigen::VectorXd;
using Eigen::VectorXi;
using Eigen::ArrayXi;

// NB, storing matrices and arrays in col-major order
template <typename T>
using MatrixX = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::ColMajor>;
template <typename T>
using VectorX  = Eigen::Matrix<T, Eigen::Dynamic, 1>;
template <typename T>
using ArrayX   = Eigen::Array<T, Eigen::Dynamic, 1>;

#endif  // _QIA_TYPES_HPP
