//--------------------------------------------------------------
// selects the number of nearest neighbors k and the number of knot spans n
// of a quasi-interpolating spline by repeated k-fold cross-validation
//
// the (k, n) grid is decomposed into diy blocks, each block computes its cells,
// and the cells are gathered into block 0 by a merge reduction
//--------------------------------------------------------------

#include <qia/qia.hpp>

#include <vector>
#include <iostream>
#include <cmath>
#include <string>

#include <diy/master.hpp>
#include <diy/reduce-operations.hpp>
#include <diy/decomposition.hpp>
#include <diy/assigner.hpp>

#include "opts.h"

#include "block.hpp"
#include "parser.hpp"
#include "example_signals.hpp"

using namespace std;

// training and validation folds for the selected input
qia::FoldSet<real_t> setup_folds(
        const string&           input,
        const qia::SearchInfo&  info,
        const DomainArgs&       d_args)
{
    if (datasets.count(input) == 0 && analytical_signals.count(input) == 0)
        throw qia::ConfigError(fmt::format("unknown input dataset \"{}\"", input));

    if (input == "folds")
        return qia::FoldSet<real_t>::load(d_args.train_pattern, d_args.valid_pattern, info);

    qia::PointCloud<real_t> cloud;
    if (input == "file")
    {
        if (d_args.infile.empty())
            throw qia::ConfigError("input \"file\" needs an input file name (-a)");
        cloud = qia::read_point_cloud<real_t>(d_args.infile);
    }
    else
        cloud = generate_scattered_data<real_t>(input, d_args);

    if (info.verbose)
    {
        qia::print_bbox(cloud.mins(), cloud.maxs(), "Input");
        fmt::print(stderr, "splitting {} points into {} repetitions of {} folds\n", cloud.npts(), info.nreps, info.nfolds);
    }

    return qia::FoldSet<real_t>::split(cloud, info, d_args.rand_seed);
}

int main(int argc, char** argv)
{
    // initialize MPI
    diy::mpi::environment  env(argc, argv);     // equivalent of MPI_Init(argc, argv)/MPI_Finalize()
    diy::mpi::communicator world;               // equivalent of MPI_COMM_WORLD

    int mem_blocks  = -1;                       // everything in core for now
    int num_threads = 1;                        // needed in order to do timing

    QIAParser opts;
    if (!opts.parse_input(argc, argv))
    {
        if (world.rank() == 0)
            std::cout << opts.ops;
        return 1;
    }

    try
    {
        qia::SearchInfo search_info;
        DomainArgs      d_args;
        opts.setup_args(search_info, d_args);

        int tot_blocks = opts.tot_blocks;
        if (tot_blocks < world.size())
            tot_blocks = world.size();
        if (tot_blocks > search_info.ncells())
            throw qia::ConfigError(fmt::format("{} blocks for only {} cells", tot_blocks, search_info.ncells()));

        if (world.rank() == 0 && opts.verbose)
        {
            opts.echo_search_settings("cv_search");
            opts.echo_data_settings();
            fmt::print(stderr, "-------------------------------------\n\n");
        }

        double load_time = MPI_Wtime();
        qia::FoldSet<real_t> folds = setup_folds(opts.input, search_info, d_args);
        load_time = MPI_Wtime() - load_time;

        qia::GridSearch<real_t> search(folds, search_info);

        // initialize DIY
        diy::FileStorage          storage("./DIY.XXXXXX"); // used for blocks to be moved out of core
        diy::Master               master(world,
                                         num_threads,
                                         mem_blocks,
                                         &Block<real_t>::create,
                                         &Block<real_t>::destroy,
                                         &storage,
                                         &Block<real_t>::save,
                                         &Block<real_t>::load);
        diy::ContiguousAssigner   assigner(world.size(), tot_blocks);

        // cells are the integer lattice n in [1, n_max], k in [1, k_max]
        Bounds cell_bounds(2);
        cell_bounds.min[0] = 1;
        cell_bounds.max[0] = search_info.n_max;
        cell_bounds.min[1] = 1;
        cell_bounds.max[1] = search_info.k_max;
        Decomposer decomposer(2, cell_bounds, tot_blocks);
        decomposer.decompose(world.rank(),
                             assigner,
                             [&](int gid, const Bounds& core, const Bounds& bounds, const Bounds& domain, const RCLink& link)
                             { Block<real_t>::add(gid, core, bounds, domain, link, master, search_info); });

        // compute the cells of each block
        double search_time = MPI_Wtime();
        master.foreach([&](Block<real_t>* b, const diy::Master::ProxyWithLink& cp)
                { b->search_cells(cp, search, search_info, !opts.serial); });
        search_time = MPI_Wtime() - search_time;

        // gather all cells into block 0
        double reduce_time = MPI_Wtime();
        diy::RegularMergePartners partners(decomposer, 2, true);
        diy::reduce(master, assigner, partners, &merge_cells_cb<real_t>);
        reduce_time = MPI_Wtime() - reduce_time;

        master.foreach([&](Block<real_t>* b, const diy::Master::ProxyWithLink& cp)
        {
            if (cp.gid() != 0)
                return;

            qia::ErrorStatGrid<real_t> grid = b->grid();
            if (!opts.outfile.empty())
                grid.write(opts.outfile);

            auto failed = grid.failed();
            if (!failed.empty())
                fmt::print(stderr, "{} of {} cells failed\n", failed.size(), grid.size());

            qia::SearchResult<real_t> result = search.select(grid);
            result.print(stdout);

            if (opts.verbose)
            {
                fmt::print(stderr, "\n------- Final block results --------\n");
                fmt::print(stderr, "load time   = {:.3} s.\n", load_time);
                fmt::print(stderr, "search time = {:.3} s.\n", search_time);
                fmt::print(stderr, "reduce time = {:.3} s.\n", reduce_time);
                fmt::print(stderr, "-------------------------------------\n\n");
            }
        });
    }
    catch (const qia::QIAError& e)
    {
        fmt::print(stderr, "cv_search: {}\n", e.what());
        return 1;
    }

    return 0;
}
