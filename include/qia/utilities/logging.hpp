//--------------------------------------------------------------
// Error types and logging/output utilities for qia
//--------------------------------------------------------------
#ifndef _QIA_LOGGING_HPP
#define _QIA_LOGGING_HPP

#include <qia/types.hpp>

namespace qia
{
    struct QIAError: public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // malformed or missing point data; fatal for a whole search
    struct DataError: public QIAError
    {
        using QIAError::QIAError;
    };

    // parameters that cannot produce a valid mesh or estimate
    struct ConfigError: public QIAError
    {
        using QIAError::QIAError;
    };

    // a result that is mathematically undefined
    struct NumericalError: public QIAError
    {
        using QIAError::QIAError;
    };

    // Not designed for efficiency, should not be used in large loops
    template<typename T>
    string print_vec(const vector<T>& vec)
    {
        if (vec.empty())
            return "{}";

        stringstream ss;
        ss << "{";
        for (size_t i = 0; i < vec.size() - 1; i++)
        {
            ss << vec[i] << " ";
        }
        ss << vec[vec.size()-1] << "}";

        return ss.str();
    }

    template<typename T>
    void print_bbox(const VectorX<T>& mins, const VectorX<T>& maxs, string label="Bounding")
    {
        if (mins.size() != maxs.size())
        {
            fmt::print(stderr, "{} Box: <invalid box>\n", label);
            return;
        }

        fmt::print(stderr, "{} Box:\n", label);
        for (int i = 0; i < mins.size(); i++)
        {
            fmt::print(stderr, "  Dim {}: [{:< 5.5g}, {:< 5.5g}]\n", i, mins(i), maxs(i));
        }
    }
}   // namespace qia

#endif  //_QIA_LOGGING_HPP
