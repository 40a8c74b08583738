//--------------------------------------------------------------
// Tests of knot vectors, tensor meshes, anchors, and spline evaluation
//--------------------------------------------------------------

#include <qia/qia.hpp>

#include <vector>
#include <cmath>
#include <random>

using namespace std;

void check(bool ok, const string& what)
{
    if (!ok)
    {
        fmt::print(stderr, "Error: {}\n", what);
        abort();
    }
}

qia::TensorMesh<real_t> make_mesh(int n, real_t xmin, real_t xmax, real_t ymin, real_t ymax)
{
    VectorX<real_t> mins(2), maxs(2);
    mins << xmin, ymin;
    maxs << xmax, ymax;
    VectorXi p = VectorXi::Constant(2, 2);
    return qia::build_mesh(mins, maxs, p, n);
}

// knot values and their regularity
void test_knots()
{
    vector<real_t> knots = qia::uniform_knots<real_t>(0.0, 1.0, 2, 4);
    vector<real_t> expected = {0.0, 0.0, 0.0, 0.25, 0.5, 0.75, 1.0, 1.0, 1.0};
    check(knots == expected, fmt::format("uniform knots {} != {}", qia::print_vec(knots), qia::print_vec(expected)));
    check(qia::regular_knots(knots, 2), "uniform knots are not 3-regular");

    // the last interior value is the upper bound exactly, even when the step does not divide evenly
    knots = qia::uniform_knots<real_t>(-0.3, 0.7, 2, 3);
    check(knots[knots.size() - 3] == 0.7, "upper bound is not reproduced exactly");

    vector<real_t> not_regular = {0.0, 0.0, 0.5, 1.0, 1.0, 1.0};
    check(!qia::regular_knots(not_regular, 2), "knots with two copies of the lower bound accepted as 3-regular");

    bool threw = false;
    try { qia::uniform_knots<real_t>(0.0, 1.0, 2, 0); }
    catch (const qia::ConfigError&) { threw = true; }
    check(threw, "n = 0 did not throw ConfigError");

    fmt::print(stderr, "knots test passed\n");
}

// n + p basis functions per axis
void test_basis_count()
{
    for (int n : {1, 5, 15})
    {
        qia::TensorMesh<real_t> mesh = make_mesh(n, 0.0, 1.0, -2.0, 2.0);
        for (int k = 0; k < 2; k++)
        {
            check(mesh.nbasis(k) == n + 2, fmt::format("n = {}: {} basis functions in dimension {}", n, mesh.nbasis(k), k));
            check((int)mesh.all_knots[k].size() == n + 5, fmt::format("n = {}: {} knots", n, mesh.all_knots[k].size()));
        }
        check(mesh.size() == (size_t)(n + 2) * (n + 2), fmt::format("n = {}: {} basis functions in total", n, mesh.size()));

        // linear index: i + j * nbasis_u
        const qia::BasisFunction<real_t>& b = mesh[mesh.size() - 1];
        check(b.ijk(0) == n + 1 && b.ijk(1) == n + 1, "last basis function has the wrong index");
        check((int)mesh[1].ijk(0) == 1 && (int)mesh[1].ijk(1) == 0, "first dimension does not change fastest");
    }
    fmt::print(stderr, "basis count test passed\n");
}

// a zero-width bounding box cannot produce a mesh
void test_degenerate_bounds()
{
    bool threw = false;
    try
    {
        make_mesh(3, 0.5, 0.5, 0.0, 1.0);
    }
    catch (const qia::ConfigError&)
    {
        threw = true;
    }
    check(threw, "degenerate bounding box did not throw ConfigError");
    fmt::print(stderr, "degenerate bounds test passed\n");
}

// knot averages: ends of the domain at the corner basis functions, nondecreasing in between
void test_anchors()
{
    qia::TensorMesh<real_t> mesh = make_mesh(4, 0.0, 1.0, 0.0, 2.0);
    qia::locate_anchors(mesh);

    vector<real_t> expected_u = {0.0, 0.125, 0.375, 0.625, 0.875, 1.0};
    for (int i = 0; i < mesh.nbasis(0); i++)
    {
        real_t a = mesh[i].anchor(0);
        check(fabs(a - expected_u[i]) < 1e-15, fmt::format("anchor {} is {}, expected {}", i, a, expected_u[i]));
    }

    const qia::BasisFunction<real_t>& last = mesh[mesh.size() - 1];
    check(last.anchor(0) == 1.0 && last.anchor(1) == 2.0, "last anchor is not the upper corner");
    check(mesh[0].anchor(0) == 0.0 && mesh[0].anchor(1) == 0.0, "first anchor is not the lower corner");

    // degree 0 uses the midpoint of the window
    vector<real_t> window = {0.2, 0.4};
    check(qia::knot_average(window, 0) == (0.2 + 0.4) / 2, "degree 0 anchor is not the window midpoint");

    fmt::print(stderr, "anchors test passed\n");
}

// basis functions sum to one everywhere, including the upper boundary
void test_partition_of_unity()
{
    qia::TensorMesh<real_t> mesh = make_mesh(5, -1.0, 3.0, 0.0, 1.0);
    for (auto& b : mesh.basis_set)
        b.coef = 1.0;

    int ntest = 17;
    for (int j = 0; j < ntest; j++)
        for (int i = 0; i < ntest; i++)
        {
            real_t x = -1.0 + 4.0 * i / (ntest - 1);
            real_t y = 1.0 * j / (ntest - 1);
            real_t v = mesh(x, y);
            check(fabs(v - 1.0) < 1e-12, fmt::format("sum of basis functions at ({}, {}) is {}", x, y, v));
        }

    fmt::print(stderr, "partition of unity test passed\n");
}

// the span-based evaluation equals the sum of coefficient times basis function over all basis functions
void test_eval()
{
    qia::TensorMesh<real_t> mesh = make_mesh(6, 0.0, 1.0, 0.0, 1.0);

    std::mt19937 gen(7);
    std::uniform_real_distribution<double> dist(-5.0, 5.0);
    for (auto& b : mesh.basis_set)
        b.coef = dist(gen);

    std::uniform_real_distribution<double> u_dist(0.0, 1.0);
    vector<VectorX<real_t>> pts;
    for (int i = 0; i < 50; i++)
    {
        VectorX<real_t> pt(2);
        pt << u_dist(gen), u_dist(gen);
        pts.push_back(pt);
    }
    VectorX<real_t> corner(2);
    corner << 1.0, 1.0;
    pts.push_back(corner);
    corner << 0.0, 1.0;
    pts.push_back(corner);

    for (auto& pt : pts)
    {
        real_t sum = 0.0;
        for (auto& b : mesh.basis_set)
            sum += b.coef * b.value(mesh.p, pt);
        real_t v = mesh(pt);
        check(fabs(v - sum) < 1e-12, fmt::format("spline at ({}, {}) is {}, sum over basis functions is {}", pt(0), pt(1), v, sum));
    }

    // outside of the knot range
    bool threw = false;
    try { mesh(1.5, 0.5); }
    catch (const qia::ConfigError&) { threw = true; }
    check(threw, "evaluation outside of the domain did not throw ConfigError");

    fmt::print(stderr, "evaluation test passed\n");
}

int main(int argc, char** argv)
{
    test_knots();
    test_basis_count();
    test_degenerate_bounds();
    test_anchors();
    test_partition_of_unity();
    test_eval();

    fmt::print(stderr, "\nAll tensor mesh tests passed\n");
    return 0;
}
