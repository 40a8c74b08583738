//--------------------------------------------------------------
// splits one file of scattered points into the training and validation
// files of repeated k-fold cross-validation, named like cv_search reads them
//--------------------------------------------------------------

#include <qia/qia.hpp>

#include <iostream>
#include <string>

#include "opts.h"

using namespace std;

int main(int argc, char** argv)
{
    // default command line arguments
    string infile;                                          // input file of all points
    string train_pattern    = "rep{rep}/train_{fold}.csv";  // training fold files
    string valid_pattern    = "rep{rep}/valid_{fold}.csv";  // validation fold files
    int    nreps            = 5;                            // number of repetitions
    int    nfolds           = 5;                            // number of folds per repetition
    int    rep_base         = 1;                            // index of the first repetition in file names
    int    rand_seed        = 1;                            // seed of the first repetition's shuffle
    bool   help             = false;                        // show help

    // get command line arguments
    opts::Options ops;
    ops >> opts::Option('a', "infile",      infile,         " input file of all points");
    ops >> opts::Option('t', "train",       train_pattern,  " training fold files, with {rep} and {fold} fields");
    ops >> opts::Option('v', "valid",       valid_pattern,  " validation fold files, with {rep} and {fold} fields");
    ops >> opts::Option('r', "nreps",       nreps,          " number of repetitions");
    ops >> opts::Option('f', "nfolds",      nfolds,         " number of folds in each repetition");
    ops >> opts::Option('z', "rep_base",    rep_base,       " index of the first repetition in file names");
    ops >> opts::Option('y', "rand_seed",   rand_seed,      " seed for fold shuffling");
    ops >> opts::Option('h', "help",        help,           " show help");

    if (!ops.parse(argc, argv) || help || infile.empty())
    {
        std::cout << ops;
        return 1;
    }

    try
    {
        qia::SearchInfo info;
        info.nreps      = nreps;
        info.nfolds     = nfolds;
        info.rep_base   = rep_base;
        info.validate();

        qia::PointCloud<real_t> cloud = qia::read_point_cloud<real_t>(infile);
        qia::FoldSet<real_t>    folds = qia::FoldSet<real_t>::split(cloud, info, rand_seed);
        folds.write(train_pattern, valid_pattern, info);

        fmt::print(stderr, "split {} points of {} into {} repetitions of {} folds\n", cloud.npts(), infile, nreps, nfolds);
    }
    catch (const qia::QIAError& e)
    {
        fmt::print(stderr, "split: {}\n", e.what());
        return 1;
    }

    return 0;
}
