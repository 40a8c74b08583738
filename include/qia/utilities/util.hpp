//--------------------------------------------------------------
// qia utilities
//--------------------------------------------------------------
#ifndef _QIA_UTIL_HPP
#define _QIA_UTIL_HPP

#include <qia/utilities/logging.hpp>
#include <qia/utilities/iterator.hpp>
#include <qia/utilities/stats.hpp>

#endif  // _QIA_UTIL_HPP
