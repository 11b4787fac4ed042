#include <vector>
#include <string>
#include <iostream>

#include "../include/topo_ops/topo_ops.hpp"

#define BOOST_TEST_MODULE TopoOpsRelateTests
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>


typedef double coord_t;

#include "wkt_input.hpp"

using namespace topo_ops;
namespace bdata = boost::unit_test::data;

const char *unit_square = "POLYGON((0 0,1 0,1 1,0 1,0 0))";
const char *holed_square = "POLYGON((0 0,10 0,10 10,0 10,0 0),(2 2,4 2,4 4,2 4,2 2))";
const char *forked_lines = "GEOMETRYCOLLECTION(LINESTRING(0 0,1 1),LINESTRING(1 1,2 0))";

/* Pairs of geometries and the DE-9IM matrix of the first relative to the
second. These are the same as what JTS produces. */
const std::vector<std::string> wkt_a{
    unit_square,
    unit_square,
    "LINESTRING(0 0,2 2)",
    "POINT(0.5 0.5)",
    holed_square,
    unit_square,
    "POLYGON((0 0,0 20,20 20,20 0,0 0))",
    "POLYGON((0 0,0 20,20 20,20 0,0 0))",
    "POLYGON((0 0,0 20,20 20,20 0,0 0))",
    "POLYGON((0 0,10 0,10 10,0 10,0 0))",
    "POINT(1 1)",
    "POINT(0 0)",
    "MULTIPOLYGON(((0 0,1 0,1 1,0 1,0 0)),((1 1,2 1,2 2,1 2,1 1)))",
    "MULTIPOINT(0 0,5 5)",
    "LINESTRING(0 0,1 0,1 1)",
    "LINESTRING(0 1,2 1)"};
const std::vector<std::string> wkt_b{
    unit_square,
    "POLYGON((2 2,3 2,3 3,2 3,2 2))",
    "LINESTRING(0 2,2 0)",
    "LINESTRING(0 0,1 1)",
    "POINT(2 3)",
    "POLYGON((1 0,2 0,2 1,1 1,1 0))",
    "POLYGON((55 55,50 60,60 60,60 55,55 55))",
    "POLYGON((5 5,5 10,10 10,10 5,5 5))",
    "POLYGON((5 5,5 30,30 30,30 5,5 5))",
    "LINESTRING(2 2,8 8)",
    forked_lines,
    forked_lines,
    "POINT(1 1)",
    "MULTIPOINT(5 5,6 6)",
    "LINESTRING(0 0,1 0,1 1)",
    "LINESTRING(1 0,1 2)"};
const std::vector<std::string> expected_im{
    "2FFF1FFF2",
    "FF2FF1212",
    "0F1FF0102",
    "0FFFFF102",
    "FF20F1FF2",
    "FF2F11212",
    "FF2FF1212",
    "212FF1FF2",
    "212101212",
    "102FF1FF2",
    "0FFFFF102",
    "F0FFFF102",
    "FF20F1FF2",
    "0F0FFF0F2",
    "1FFF0FFF2",
    "0F1FF0102"};

BOOST_DATA_TEST_CASE(
    test_relate,
    bdata::make(wkt_a) ^ bdata::make(wkt_b) ^ bdata::make(expected_im),
    a,b,expected)
{
    auto ga = read_wkt(a);
    auto gb = read_wkt(b);
    BOOST_TEST(relate(ga,gb).str() == expected);
}

BOOST_DATA_TEST_CASE(
    test_relate_symmetric,
    bdata::make(wkt_a) ^ bdata::make(wkt_b),
    a,b)
{
    auto ga = read_wkt(a);
    auto gb = read_wkt(b);
    BOOST_TEST(relate(gb,ga) == relate(ga,gb).transpose());
}

BOOST_DATA_TEST_CASE(test_relate_reflexive,bdata::make(wkt_a) + bdata::make(wkt_b),a) {
    auto g = read_wkt(a);
    auto im = relate(g,g);
    BOOST_TEST(im.is_equal_topo(),"matrix: " << im);
    BOOST_TEST(im.is_within());
    BOOST_TEST(im.is_contains());
}

BOOST_DATA_TEST_CASE(
    test_relate_intersector_agreement,
    bdata::make(wkt_a) ^ bdata::make(wkt_b),
    a,b)
{
    auto ga = read_wkt(a);
    auto gb = read_wkt(b);
    relate_operation<coord_t,robust_kernel,simple_edge_set_intersector> op(
        geometry_graph<coord_t>(0,ga),
        geometry_graph<coord_t>(1,gb));
    BOOST_TEST(op.compute_intersection_matrix() == relate(ga,gb));
}

BOOST_DATA_TEST_CASE(
    test_relate_simple_kernel,
    bdata::make(wkt_a) ^ bdata::make(wkt_b) ^ bdata::make(expected_im),
    a,b,expected)
{
    /* every coordinate here is small enough that the simple kernel is exact */
    auto ga = read_wkt(a);
    auto gb = read_wkt(b);
    BOOST_TEST(relate<simple_kernel>(ga,gb).str() == expected);
}

BOOST_DATA_TEST_CASE(
    test_prepared_geometry,
    bdata::make(wkt_a) ^ bdata::make(wkt_b) ^ bdata::make(expected_im),
    a,b,expected)
{
    prepared_geometry<coord_t> pa(read_wkt(a));
    prepared_geometry<coord_t> pb(read_wkt(b));

    BOOST_TEST(pa.relate(pb.parent_geometry()).str() == expected);
    BOOST_TEST(pa.relate(pb).str() == expected);
    BOOST_TEST(pb.relate(pa) == pa.relate(pb).transpose());

    /* the prepared graphs are not changed by relating them */
    BOOST_TEST(pa.relate(pb).str() == expected);
}

/* Shapes that have no area, and a geometry that each one touches or misses.
A shape without area is the point or line segment that its vertices cover. */
const std::vector<geometry<coord_t>> collapsed_shapes{
    triangle<coord_t>{{5,3},{5,3},{5,3}},
    read_wkt("POLYGON((5 3,5 3,5 3,5 3))"),
    rect<coord_t>{{2,2},{2,2}},
    rect<coord_t>{{2,2},{2,4}},
    triangle<coord_t>{{0,0},{2,2},{1,1}},
    read_wkt("POLYGON((0 0,2 0,0 0))")};
const std::vector<std::string> collapsed_others{
    "POINT(5 3)",
    "POINT(9 9)",
    "POINT(2 2)",
    "LINESTRING(2 2,2 4)",
    "POINT(1 1)",
    "LINESTRING(0 0,2 0)"};
const std::vector<std::string> collapsed_expected_im{
    "0FFFFFFF2",
    "FF0FFF0F2",
    "0FFFFFFF2",
    "1FFF0FFF2",
    "0F1FF0FF2",
    "1FFF0FFF2"};

BOOST_DATA_TEST_CASE(
    test_relate_collapsed_shapes,
    bdata::xrange(collapsed_shapes.size()) ^ bdata::make(collapsed_others) ^ bdata::make(collapsed_expected_im),
    i,other,expected)
{
    const geometry<coord_t> &g = collapsed_shapes[i];
    auto go = read_wkt(other);

    auto self = relate(g,g);
    BOOST_TEST(self.is_equal_topo(),"matrix: " << self);

    auto im = relate(g,go);
    BOOST_TEST(im.str() == expected);
    BOOST_TEST(relate(go,g) == im.transpose());
    BOOST_TEST(relate<simple_kernel>(g,go) == im);
}

BOOST_AUTO_TEST_CASE(test_relate_typed_geometries) {
    rect<coord_t> r{{2,2},{4,4}};

    auto im = relate(r,line<coord_t>{{2,2},{4,4}});
    BOOST_TEST(im.str() == "1F2F01FF2");
    BOOST_TEST(im.is_intersects());
    BOOST_TEST(im.is_contains());
    BOOST_TEST(!im.is_within());

    im = relate(r,line<coord_t>{{1,1},{5,5}});
    BOOST_TEST(im.is_intersects());
    BOOST_TEST(!im.is_contains());
    BOOST_TEST(!im.is_within());

    /* a polygon doesn't contain its own boundary */
    im = relate(r,line_string<coord_t>{{2,2},{4,2},{4,4},{2,4},{2,2}});
    BOOST_TEST(im.is_intersects());
    BOOST_TEST(!im.is_contains());
    BOOST_TEST(!im.is_within());
    BOOST_TEST(im.is_covers());

    im = relate(triangle<coord_t>{{0,0},{10,0},{5,10}},point_t<coord_t>{5,5});
    BOOST_TEST(im.str() == "0F2FF1FF2");
    BOOST_TEST(im.is_contains());

    im = relate(point_t<coord_t>{5,5},triangle<coord_t>{{0,0},{10,0},{5,10}});
    BOOST_TEST(im.is_within());
    BOOST_TEST(im.is_covered_by());
}

BOOST_AUTO_TEST_CASE(test_relate_empty) {
    geometry<coord_t> empty = polygon<coord_t>{};
    geometry<coord_t> square = read_wkt(unit_square);

    BOOST_TEST(relate(empty,square).str() == "FFFFFF212");
    BOOST_TEST(relate(square,empty).str() == "FF2FF1FF2");
    BOOST_TEST(relate(empty,empty) == intersection_matrix::empty_disjoint());
    BOOST_TEST(relate(empty,empty).is_equal_topo());
}

BOOST_AUTO_TEST_CASE(test_relate_disjoint_bounds) {
    std::vector<geometry<coord_t>> near{
        read_wkt(unit_square),
        read_wkt("LINESTRING(0 0,1 1)"),
        read_wkt("POINT(0.5 0.5)"),
        read_wkt(forked_lines)};
    std::vector<geometry<coord_t>> far{
        read_wkt("POLYGON((100 100,101 100,101 101,100 101,100 100))"),
        read_wkt("MULTILINESTRING((50 50,60 60),(70 50,80 50))"),
        read_wkt("MULTIPOINT(40 40,41 42)")};

    for(auto &a : near) {
        for(auto &b : far) {
            auto im = relate(a,b);
            BOOST_TEST(im.is_disjoint(),"matrix: " << im);
            BOOST_TEST(im.matches("FF*FF****"));
        }
    }
}

/* A proper crossing of a line through a polygon's boundary */
BOOST_AUTO_TEST_CASE(test_relate_line_crosses_area) {
    auto im = relate(read_wkt("LINESTRING(-1 0.5,0.5 0.5)"),read_wkt(unit_square));
    BOOST_TEST(im.str() == "1010F0212");
    BOOST_TEST(im.is_crosses());
    BOOST_TEST(!im.is_within());
    BOOST_TEST(relate(read_wkt(unit_square),read_wkt("LINESTRING(-1 0.5,0.5 0.5)")) == im.transpose());
}
