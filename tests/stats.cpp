//--------------------------------------------------------------
// Tests of error statistics, validation errors, and point cloud input
//--------------------------------------------------------------

#include <qia/qia.hpp>

#include <vector>
#include <cmath>
#include <cstdio>
#include <filesystem>

using namespace std;

void check(bool ok, const string& what)
{
    if (!ok)
    {
        fmt::print(stderr, "Error: {}\n", what);
        abort();
    }
}

void test_median()
{
    check(qia::median(vector<real_t>{3.0, 1.0, 2.0}) == 2.0, "odd-sized median");
    check(qia::median(vector<real_t>{4.0, 1.0, 3.0, 2.0}) == 2.5, "even-sized median is not the mean of the middle values");

    bool threw = false;
    try { qia::median(vector<real_t>()); }
    catch (const qia::DataError&) { threw = true; }
    check(threw, "median of an empty sequence did not throw DataError");

    fmt::print(stderr, "median test passed\n");
}

void test_summarize()
{
    qia::ErrorSummary<real_t> s = qia::summarize(vector<real_t>{1.0, 2.0, 3.0, 4.0});
    check(s.npts == 4, "number of errors");
    check(s.min == 1.0 && s.max == 4.0, "min and max");
    check(s.mean == 2.5, fmt::format("mean {}", s.mean));
    check(s.median == 2.5, fmt::format("median {}", s.median));
    check(s.mse == 7.5, fmt::format("MSE {} is not the mean of squared errors", s.mse));
    check(fabs(s.stddev - sqrt(5.0 / 3.0)) < 1e-15, fmt::format("std {} does not divide by N - 1", s.stddev));
    check(s.std_defined && s.finite(), "statistics of four errors are not all defined");

    // std is 0 only when all errors are equal
    qia::ErrorSummary<real_t> same = qia::summarize(vector<real_t>{0.5, 0.5, 0.5});
    check(same.stddev == 0.0, fmt::format("std of identical errors is {}", same.stddev));
    check(s.stddev > 0.0, "std of distinct errors is 0");

    // a single error has no sample standard deviation
    qia::ErrorSummary<real_t> one = qia::summarize(vector<real_t>{0.7});
    check(std::isnan(one.stddev) && !one.std_defined, "std of one error is not flagged undefined");
    check(!one.finite(), "summary with undefined std reported finite");
    check(one.mse == 0.7 * 0.7 && one.median == 0.7, "statistics of one error");

    bool threw = false;
    try { qia::summarize(vector<real_t>()); }
    catch (const qia::DataError&) { threw = true; }
    check(threw, "summary of no errors did not throw DataError");

    threw = false;
    try { qia::summarize(vector<real_t>{0.1, numeric_limits<real_t>::quiet_NaN(), 0.3}); }
    catch (const qia::NumericalError&) { threw = true; }
    check(threw, "summary of a NaN error did not throw NumericalError");

    for (int i = 0; i < qia::ErrorSummary<real_t>::nstats; i++)
        check(s.stat(i) == (vector<real_t>{1.0, 4.0, 2.5, 2.5, s.stddev, 7.5})[i],
                fmt::format("statistic {} out of order", qia::ErrorSummary<real_t>::name(i)));

    fmt::print(stderr, "summarize test passed\n");
}

// absolute errors of a constant spline
void test_validation_errors()
{
    VectorX<real_t> mins(2), maxs(2);
    mins << 0.0, 0.0;
    maxs << 1.0, 1.0;
    qia::TensorMesh<real_t> mesh = qia::build_mesh(mins, maxs, VectorXi::Constant(2, 2), 3);
    for (auto& b : mesh.basis_set)
        b.coef = 2.0;

    MatrixX<real_t> domain(3, 3);
    domain <<   0.1, 0.2, 1.0,
                0.5, 0.5, 2.0,
                1.0, 1.0, 4.0;
    qia::PointCloud<real_t> valid(domain);

    qia::Evaluator<real_t> evaluator(mesh);
    vector<real_t> errs = evaluator.abs_errors(valid);
    check(errs.size() == 3, "one error per validation point");
    check(fabs(errs[0] - 1.0) < 1e-12 && fabs(errs[1]) < 1e-12 && fabs(errs[2] - 2.0) < 1e-12,
            fmt::format("errors {}", qia::print_vec(errs)));

    qia::ErrorSummary<real_t> s = evaluator.validate(valid);
    check(fabs(s.mse - 5.0 / 3.0) < 1e-12, fmt::format("MSE {}", s.mse));

    bool threw = false;
    try { evaluator.validate(qia::PointCloud<real_t>()); }
    catch (const qia::DataError&) { threw = true; }
    check(threw, "empty validation set did not throw DataError");

    fmt::print(stderr, "validation errors test passed\n");
}

void write_text(const string& filename, const string& text)
{
    FILE* fd = fopen(filename.c_str(), "w");
    check(fd != NULL, fmt::format("unable to write {}", filename));
    fmt::print(fd, "{}", text);
    fclose(fd);
}

bool throws_data_error(const string& filename)
{
    try
    {
        qia::read_point_cloud<real_t>(filename);
    }
    catch (const qia::DataError& e)
    {
        fmt::print(stderr, "  expected: {}\n", e.what());
        return true;
    }
    return false;
}

void test_read_point_cloud()
{
    string good = "qia_stats_test_good.csv";
    write_text(good, "0.5,1.5,2.5\n\n-1,2e-1,3\r\n");
    qia::PointCloud<real_t> cloud = qia::read_point_cloud<real_t>(good);
    check(cloud.npts() == 2, fmt::format("read {} points, expected 2", cloud.npts()));
    check(cloud.x(0) == 0.5 && cloud.y(0) == 1.5 && cloud.z(0) == 2.5, "first point");
    check(cloud.x(1) == -1.0 && cloud.y(1) == 0.2 && cloud.z(1) == 3.0, "second point");
    check(cloud.mins()(0) == -1.0 && cloud.maxs()(1) == 1.5, "bounding box");

    string bad_value = "qia_stats_test_bad_value.csv";
    write_text(bad_value, "0.5,1.5,2.5\n0.5,abc,1\n");
    check(throws_data_error(bad_value), "unparsable value did not throw DataError");

    string bad_cols = "qia_stats_test_bad_cols.csv";
    write_text(bad_cols, "0.5,1.5\n");
    check(throws_data_error(bad_cols), "two columns did not throw DataError");

    string empty = "qia_stats_test_empty.csv";
    write_text(empty, "\n");
    check(throws_data_error(empty), "empty file did not throw DataError");

    check(throws_data_error("qia_stats_test_missing.csv"), "missing file did not throw DataError");

    // nan and inf parse as numbers but are not valid samples
    vector<string> non_finite = {"nan,0.5,2.0\n", "0.9,inf,3.0\n", "0.4,0.4,nan\n", "0.1,0.2,-Infinity\n"};
    string bad_number = "qia_stats_test_non_finite.csv";
    for (auto& text : non_finite)
    {
        write_text(bad_number, "0.5,1.5,2.5\n" + text);
        check(throws_data_error(bad_number), fmt::format("non-finite row \"{}\" did not throw DataError", text));
    }

    for (auto& f : {good, bad_value, bad_cols, empty, bad_number})
        remove(f.c_str());

    fmt::print(stderr, "read point cloud test passed\n");
}

// written points read back, into directories that do not exist yet
void test_write_point_cloud()
{
    MatrixX<real_t> domain(2, 3);
    domain <<   0.1, 0.2, 0.3,
                -4.0, 1e-7, 12.5;
    qia::PointCloud<real_t> cloud(domain);

    string filename = "qia_stats_test_dir/sub/points.csv";
    qia::write_point_cloud(filename, cloud);
    qia::PointCloud<real_t> back = qia::read_point_cloud<real_t>(filename);
    check(back.domain == cloud.domain, "points written to a new directory do not read back");
    std::filesystem::remove_all("qia_stats_test_dir");

    // a device without space: the failed write is reported
    FILE* full = fopen("/dev/full", "w");
    if (full)
    {
        fclose(full);
        bool threw = false;
        try { qia::write_point_cloud("/dev/full", cloud); }
        catch (const qia::DataError& e)
        {
            fmt::print(stderr, "  expected: {}\n", e.what());
            threw = true;
        }
        check(threw, "write to a full device did not throw DataError");
    }

    fmt::print(stderr, "write point cloud test passed\n");
}

int main(int argc, char** argv)
{
    test_median();
    test_summarize();
    test_validation_errors();
    test_read_point_cloud();
    test_write_point_cloud();

    fmt::print(stderr, "\nAll stats tests passed\n");
    return 0;
}
