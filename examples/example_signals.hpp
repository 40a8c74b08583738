#ifndef _QIA_EX_FNS
#define _QIA_EX_FNS

#include <set>
#include <random>
#include <qia/types.hpp>
#include <qia/pointset.hpp>
#include "domain_args.hpp"

// Define list of example keywords
set<string> analytical_signals = {"sinc", "ramp", "const"};
set<string> datasets = {"file", "folds"};

// evaluate sinc function
template<typename T>
T sinc(T x, T y, const DomainArgs& args)
{
    T r = sqrt(x * x + y * y) * args.f;
    if (r == 0.0)
        return args.s;
    return args.s * sin(r) / r;
}

// evaluate a tilted plane
template<typename T>
T ramp(T x, T y, const DomainArgs& args)
{
    return args.s * (x + 2 * y);
}

template<typename T>
T eval_signal(const string& fun, T x, T y, const DomainArgs& args)
{
    if (fun == "sinc")
        return sinc(x, y, args);
    if (fun == "ramp")
        return ramp(x, y, args);
    return args.s;
}

// synthetic analytic data sampled at uniformly random locations, as a stand-in for gauge stations
// noise is normal with standard deviation n * s
template<typename T>
qia::PointCloud<T> generate_scattered_data(
        const string&       fun,
        const DomainArgs&   args)
{
    if (analytical_signals.count(fun) != 1)
        throw qia::ConfigError(fmt::format("unknown analytical signal \"{}\"", fun));
    if (args.npts < 1)
        throw qia::ConfigError(fmt::format("cannot generate {} points", args.npts));

    std::mt19937 gen(args.rand_seed);
    std::uniform_real_distribution<double> u_dist(0.0, 1.0);
    std::normal_distribution<double> n_dist(0.0, 1.0);

    MatrixX<T> domain(args.npts, 3);
    for (int i = 0; i < args.npts; i++)
    {
        T x = args.min[0] + u_dist(gen) * (args.max[0] - args.min[0]);
        T y = args.min[1] + u_dist(gen) * (args.max[1] - args.min[1]);
        domain(i, 0) = x;
        domain(i, 1) = y;
        domain(i, 2) = eval_signal(fun, x, y, args);
        if (args.n > 0.0)
            domain(i, 2) += args.n * args.s * n_dist(gen);
    }

    return qia::PointCloud<T>(domain);
}

#endif  // _QIA_EX_FNS
