//--------------------------------------------------------------
// Statistics helpers for qia
//--------------------------------------------------------------
#ifndef _QIA_STATS_HPP
#define _QIA_STATS_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>

#include <algorithm>
#include <limits>

namespace qia
{
    // summary of one sequence of absolute errors
    template <typename T>
    struct ErrorSummary
    {
        T       min{0};
        T       max{0};
        T       mean{0};
        T       median{0};
        T       stddev{0};              // sample standard deviation (N - 1), NaN if N == 1
        T       mse{0};                 // mean of squared errors
        int     npts{0};
        bool    std_defined{true};

        static constexpr int nstats = 6;

        static const char* name(int i)
        {
            static const char* names[nstats] = {"min", "max", "mean", "median", "std", "MSE"};
            return names[i];
        }

        // statistics in the order min, max, mean, median, std, mse
        T stat(int i) const
        {
            switch (i)
            {
                case 0: return min;
                case 1: return max;
                case 2: return mean;
                case 3: return median;
                case 4: return stddev;
                default: return mse;
            }
        }

        T& stat(int i)
        {
            switch (i)
            {
                case 0: return min;
                case 1: return max;
                case 2: return mean;
                case 3: return median;
                case 4: return stddev;
                default: return mse;
            }
        }

        bool finite() const
        {
            for (int i = 0; i < nstats; i++)
                if (!std::isfinite(stat(i)))
                    return false;
            return true;
        }
    };

    // median, averaging the two middle values of an even-sized sequence
    template <typename T>
    T median(vector<T> vals)
    {
        if (vals.empty())
            throw DataError("median(): empty sequence");

        sort(vals.begin(), vals.end());
        size_t n = vals.size();
        if (n % 2)
            return vals[n / 2];
        return (vals[n / 2 - 1] + vals[n / 2]) / 2;
    }

    // summarizes a sequence of absolute errors; NaN or infinite errors raise NumericalError
    // the standard deviation is taken over the errors centered on their mean, divided by N - 1
    template <typename T>
    ErrorSummary<T> summarize(const vector<T>& errs)
    {
        if (errs.empty())
            throw DataError("summarize(): no errors to summarize (empty validation set)");

        for (size_t i = 0; i < errs.size(); i++)
            if (!std::isfinite(errs[i]))
                throw NumericalError(fmt::format("summarize(): non-finite error {} at position {}", errs[i], i));

        ErrorSummary<T> s;
        s.npts  = errs.size();
        s.min   = *min_element(errs.begin(), errs.end());
        s.max   = *max_element(errs.begin(), errs.end());

        T sum = 0.0;
        T ssq = 0.0;
        for (auto e : errs)
        {
            sum += e;
            ssq += e * e;
        }
        s.mean      = sum / s.npts;
        s.mse       = ssq / s.npts;
        s.median    = median(errs);

        if (s.npts < 2)
        {
            s.stddev        = numeric_limits<T>::quiet_NaN();
            s.std_defined   = false;
        }
        else
        {
            T csq = 0.0;
            for (auto e : errs)
            {
                T c = e - s.mean;
                csq += c * c;
            }
            s.stddev = sqrt(csq / (s.npts - 1));
        }

        return s;
    }
}   // namespace qia

#endif  // _QIA_STATS_HPP
