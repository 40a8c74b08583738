//--------------------------------------------------------------
// Command line parser for qia examples
//--------------------------------------------------------------
#ifndef _QIA_EX_PARSER_HPP
#define _QIA_EX_PARSER_HPP

#include "opts.h"
#include "domain_args.hpp"
#include "example_signals.hpp"
#include <qia/types.hpp>
#include <qia/qia.hpp>

struct QIAParser
{
    // default command line arguments
    int         degree          = 2;        // degree of the spline (same for all dims)
    int         k_max           = 15;       // largest number of nearest neighbors
    int         n_max           = 15;       // largest number of internal knot spans
    int         nreps           = 5;        // number of cross-validation repetitions
    int         nfolds          = 5;        // number of folds per repetition
    int         rep_base        = 1;        // index of the first repetition in file names
    string      input           = "folds";  // input dataset
    string      infile;                     // input file name of all points (input "file")
    string      train_pattern   = "rep{rep}/train_{fold}.csv";  // training fold files
    string      valid_pattern   = "rep{rep}/valid_{fold}.csv";  // validation fold files
    string      outfile;                    // optional output table of all cells
    int         ndomp           = 143;      // number of generated points for analytical input
    real_t      noise           = 0.0;      // fraction of noise
    int         rand_seed       = 1;        // seed for point generation and fold shuffling
    int         tot_blocks      = 1;        // total number of diy blocks over the (k, n) grid
    int         serial          = 0;        // evaluate the cells of a block serially (bool 0/1)
    int         verbose         = 1;        // verbosity (0 = only the report)
    bool        help            = false;    // show help

    opts::Options ops;

    QIAParser()
    {
        ops >> opts::Option('p', "degree",      degree,         " degree in each dimension of the spline");
        ops >> opts::Option('k', "k_max",       k_max,          " largest number of nearest neighbors");
        ops >> opts::Option('n', "n_max",       n_max,          " largest number of internal knot spans");
        ops >> opts::Option('r', "nreps",       nreps,          " number of cross-validation repetitions");
        ops >> opts::Option('f', "nfolds",      nfolds,         " number of folds in each repetition");
        ops >> opts::Option('z', "rep_base",    rep_base,       " index of the first repetition in fold file names");
        ops >> opts::Option('i', "input",       input,          " input dataset (folds, file, sinc, ramp, const)");
        ops >> opts::Option('a', "infile",      infile,         " input file of all points, split into folds");
        ops >> opts::Option('t', "train",       train_pattern,  " training fold files, with {rep} and {fold} fields");
        ops >> opts::Option('v', "valid",       valid_pattern,  " validation fold files, with {rep} and {fold} fields");
        ops >> opts::Option('o', "outfile",     outfile,        " write the statistics of all cells to this file");
        ops >> opts::Option('d', "ndomp",       ndomp,          " number of generated points for analytical input");
        ops >> opts::Option('s', "noise",       noise,          " fraction of noise (0.0 - 1.0)");
        ops >> opts::Option('y', "rand_seed",   rand_seed,      " seed for point generation and fold shuffling");
        ops >> opts::Option('b', "tot_blocks",  tot_blocks,     " total number of blocks");
        ops >> opts::Option('l', "serial",      serial,         " evaluate the cells of a block serially");
        ops >> opts::Option('w', "verbose",     verbose,        " verbosity level");
        ops >> opts::Option('h', "help",        help,           " show help");
    }

    // parse command line input and indicate if program should exit
    bool parse_input(int argc, char** argv)
    {
        bool success = ops.parse(argc, argv);
        bool proceed = success && !help;

        return proceed;
    }

    void setup_args(qia::SearchInfo& info, DomainArgs& d_args) const
    {
        info.p          = VectorXi::Constant(2, degree);
        info.k_max      = k_max;
        info.n_max      = n_max;
        info.nreps      = nreps;
        info.nfolds     = nfolds;
        info.rep_base   = rep_base;
        info.verbose    = verbose;
        info.validate();

        d_args.npts             = ndomp;
        d_args.n                = noise;
        d_args.infile           = infile;
        d_args.train_pattern    = train_pattern;
        d_args.valid_pattern    = valid_pattern;
        d_args.rand_seed        = rand_seed;
        if (input == "sinc")
        {
            d_args.min  = {-4.0 * M_PI, -4.0 * M_PI};
            d_args.max  = { 4.0 * M_PI,  4.0 * M_PI};
            d_args.s    = 10.0;
        }
        else
        {
            d_args.min  = {0.0, 0.0};
            d_args.max  = {1.0, 1.0};
            d_args.s    = 1.0;
        }
    }

    // Print basic info about data set
    void echo_data_settings(FILE* fd = stderr) const
    {
        bool is_analytical = (analytical_signals.count(input) == 1);

        fmt::print(fd, "--------- Data Settings ----------\n");
        fmt::print(fd, "input: {}\n", input);
        if (input == "folds")
        {
            fmt::print(fd, "train      = {}\n", train_pattern);
            fmt::print(fd, "valid      = {}\n", valid_pattern);
        }
        else if (input == "file")
            fmt::print(fd, "infile     = {}\trandom seed = {}\n", infile, rand_seed);
        if (is_analytical)
            fmt::print(fd, "num pts    = {}\tnoise       = {}\trandom seed = {}\n", ndomp, noise, rand_seed);
    }

    void echo_search_settings(string run_name, FILE* fd = stderr) const
    {
        fmt::print(fd, ">>> Running \'{}\'\n\n", run_name);
        fmt::print(fd, "--------- Search Settings ----------\n");
        fmt::print(fd, "degree     = {}\n", degree);
        fmt::print(fd, "k_max      = {}\tn_max      = {}\n", k_max, n_max);
        fmt::print(fd, "nreps      = {}\tnfolds     = {}\n", nreps, nfolds);
        fmt::print(fd, "tot_blocks = {}\n", tot_blocks);
#ifdef QIA_TBB
        fmt::print(fd, "threading: {}\n", serial ? "serial" : "TBB");
#endif
#ifdef QIA_SERIAL
        fmt::print(fd, "threading: serial\n");
#endif
    }
};

#endif  // _QIA_EX_PARSER_HPP
