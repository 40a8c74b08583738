#ifndef _QIA_DOMAIN_ARGS
#define _QIA_DOMAIN_ARGS

#include <vector>
#include <string>
#include <qia/types.hpp>

// arguments for generating or reading the point data of an example
struct DomainArgs
{
    DomainArgs()
    {
        npts        = 0;
        min.assign(2, 0.0);
        max.assign(2, 1.0);
        s           = 1.0;
        f           = 1.0;
        n           = 0.0;
        rand_seed   = 0;
    }
    int                 npts;                       // number of scattered points to generate
    vector<real_t>      min;                        // minimum corner of domain
    vector<real_t>      max;                        // maximum corner of domain
    real_t              s;                          // scaling factor of the range
    real_t              f;                          // frequency multiplier
    real_t              n;                          // noise factor [0.0 - 1.0]
    string              infile;                     // single input file of all points
    string              train_pattern;              // training file name pattern with {rep} and {fold}
    string              valid_pattern;              // validation file name pattern with {rep} and {fold}
    unsigned            rand_seed;                  // seed for generating points and shuffling folds
};

#endif // _QIA_DOMAIN_ARGS
