//--------------------------------------------------------------
// qia point cloud data structure
//--------------------------------------------------------------
#ifndef _QIA_POINTSET_HPP
#define _QIA_POINTSET_HPP

#include <qia/types.hpp>
#include <qia/utilities/logging.hpp>

#include <algorithm>
#include <numeric>
#include <random>
#include <filesystem>
#include <system_error>

namespace qia
{
    // Scattered samples of a height field: one row per point, columns x, y, z.
    // The cloud is not modified after it is filled.
    template <typename T>
    struct PointCloud
    {
        MatrixX<T>  domain;                 // npts x 3

        PointCloud() :
            domain(0, 3)                    { }

        PointCloud(const MatrixX<T>& domain_) :
            domain(domain_)
        {
            if (domain.cols() != 3)
                throw DataError(fmt::format("PointCloud: expected 3 columns (x, y, z), got {}", domain.cols()));
        }

        int npts() const                    { return domain.rows(); }
        bool empty() const                  { return domain.rows() == 0; }

        T x(int i) const                    { return domain(i, 0); }
        T y(int i) const                    { return domain(i, 1); }
        T z(int i) const                    { return domain(i, 2); }

        // bounding box of the (x,y) coordinates
        VectorX<T> mins() const
        {
            if (empty())
                throw DataError("PointCloud: bounding box of an empty cloud");
            return domain.leftCols(2).colwise().minCoeff().transpose();
        }

        VectorX<T> maxs() const
        {
            if (empty())
                throw DataError("PointCloud: bounding box of an empty cloud");
            return domain.leftCols(2).colwise().maxCoeff().transpose();
        }

        // subset of the rows in the order given
        PointCloud<T> subset(const vector<int>& idxs) const
        {
            MatrixX<T> sub(idxs.size(), 3);
            for (size_t i = 0; i < idxs.size(); i++)
                sub.row(i) = domain.row(idxs[i]);
            return PointCloud<T>(sub);
        }
    };

    // bounding box of the (x,y) coordinates of the union of two clouds
    template <typename T>
    void union_bounds(
            const PointCloud<T>&    a,
            const PointCloud<T>&    b,
            VectorX<T>&             mins,       // (output) x_min, y_min
            VectorX<T>&             maxs)       // (output) x_max, y_max
    {
        if (a.empty() && b.empty())
            throw DataError("union_bounds: both point clouds are empty");
        if (a.empty())
        {
            mins = b.mins();
            maxs = b.maxs();
            return;
        }
        mins = a.mins();
        maxs = a.maxs();
        if (!b.empty())
        {
            mins = mins.cwiseMin(b.mins());
            maxs = maxs.cwiseMax(b.maxs());
        }
    }

    // reads comma separated x,y,z triples, no header, blank lines ignored
    template <typename T>
    PointCloud<T> read_point_cloud(const string& filename)
    {
        ifstream fd(filename);
        if (!fd.is_open())
            throw DataError(fmt::format("read_point_cloud(): unable to open file {}", filename));

        vector<T>   vals;
        string      line;
        int         line_num = 0;
        while (getline(fd, line))
        {
            line_num++;
            if (line.find_first_not_of(" \t\r") == string::npos)
                continue;

            stringstream    ss(line);
            string          field;
            int             ncols = 0;
            while (getline(ss, field, ','))
            {
                size_t pos = 0;
                double v;
                try
                {
                    v = stod(field, &pos);
                }
                catch (const std::logic_error&)
                {
                    throw DataError(fmt::format("read_point_cloud(): {}:{}: cannot parse value \"{}\"", filename, line_num, field));
                }
                if (field.find_first_not_of(" \t\r", pos) != string::npos)
                    throw DataError(fmt::format("read_point_cloud(): {}:{}: cannot parse value \"{}\"", filename, line_num, field));
                if (!std::isfinite(v))
                    throw DataError(fmt::format("read_point_cloud(): {}:{}: non-finite value \"{}\"", filename, line_num, field));
                vals.push_back(v);
                ncols++;
            }
            if (ncols != 3)
                throw DataError(fmt::format("read_point_cloud(): {}:{}: expected 3 values, found {}", filename, line_num, ncols));
        }

        if (vals.empty())
            throw DataError(fmt::format("read_point_cloud(): file {} contains no points", filename));

        MatrixX<T> domain(vals.size() / 3, 3);
        for (int i = 0; i < domain.rows(); i++)
            for (int j = 0; j < 3; j++)
                domain(i, j) = vals[3 * i + j];

        return PointCloud<T>(domain);
    }

    // opens a file for writing, creating its parent directories
    inline FILE* open_output(const string& filename)
    {
        std::filesystem::path parent = std::filesystem::path(filename).parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
                throw DataError(fmt::format("unable to create directory {}: {}", parent.string(), ec.message()));
        }

        FILE* fd = fopen(filename.c_str(), "w");
        if (!fd)
            throw DataError(fmt::format("unable to open file {}", filename));
        return fd;
    }

    // closes a file opened by open_output; any failed write is an error
    inline void close_output(FILE* fd, const string& filename)
    {
        bool failed = ferror(fd) != 0;
        if (fclose(fd) != 0 || failed)
            throw DataError(fmt::format("error writing file {}", filename));
    }

    template <typename T>
    void write_point_cloud(const string& filename, const PointCloud<T>& cloud)
    {
        FILE* fd = open_output(filename);
        try
        {
            for (int i = 0; i < cloud.npts(); i++)
                fmt::print(fd, "{},{},{}\n", cloud.x(i), cloud.y(i), cloud.z(i));
        }
        catch (const std::system_error& e)
        {
            fclose(fd);
            throw DataError(fmt::format("error writing file {}: {}", filename, e.what()));
        }
        close_output(fd, filename);
    }

    // one train/validate split of a point cloud
    template <typename T>
    struct Fold
    {
        PointCloud<T>   train;
        PointCloud<T>   valid;
    };

    // Shuffle the point indices with a seeded generator and cut them into nfolds contiguous
    // validation slices; fold f trains on the points outside slice f.
    // Slice f holds indices [f * npts / nfolds, (f + 1) * npts / nfolds) of the shuffled order.
    template <typename T>
    vector<Fold<T>> make_folds(
            const PointCloud<T>&    cloud,
            int                     nfolds,
            unsigned                seed)
    {
        if (nfolds < 2)
            throw ConfigError(fmt::format("make_folds(): need at least 2 folds, got {}", nfolds));
        if (cloud.npts() < nfolds)
            throw DataError(fmt::format("make_folds(): {} points cannot be split into {} folds", cloud.npts(), nfolds));

        vector<int> order(cloud.npts());
        iota(order.begin(), order.end(), 0);
        std::mt19937 gen(seed);
        shuffle(order.begin(), order.end(), gen);

        vector<Fold<T>> folds(nfolds);
        int npts = cloud.npts();
        for (int f = 0; f < nfolds; f++)
        {
            int start   = (long)f * npts / nfolds;
            int end     = (long)(f + 1) * npts / nfolds;

            vector<int> train_idxs, valid_idxs;
            for (int i = 0; i < npts; i++)
            {
                if (i >= start && i < end)
                    valid_idxs.push_back(order[i]);
                else
                    train_idxs.push_back(order[i]);
            }
            folds[f].train = cloud.subset(train_idxs);
            folds[f].valid = cloud.subset(valid_idxs);
        }

        return folds;
    }
}   // namespace qia

#endif  // _QIA_POINTSET_HPP
