/* Conversion of WKT text into topo_ops geometries for tests. Parsing is done by
Boost.Geometry, into its own model types, which are then copied. */

#ifndef wkt_input_hpp
#define wkt_input_hpp

#include <string>
#include <string_view>
#include <vector>
#include <cctype>
#include <stdexcept>

#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/io/wkt/read.hpp>

#include "../include/topo_ops/geometry.hpp"


namespace wkt_detail {
namespace bg = boost::geometry;

using bg_point = bg::model::d2::point_xy<double>;
using bg_linestring = bg::model::linestring<bg_point>;
using bg_polygon = bg::model::polygon<bg_point,false>;
using bg_multi_point = bg::model::multi_point<bg_point>;
using bg_multi_linestring = bg::model::multi_linestring<bg_linestring>;
using bg_multi_polygon = bg::model::multi_polygon<bg_polygon>;

inline topo_ops::point_t<double> convert(const bg_point &p) {
    return {p.x(),p.y()};
}

template<typename R> std::vector<topo_ops::point_t<double>> convert_points(const R &points) {
    std::vector<topo_ops::point_t<double>> r;
    r.reserve(points.size());
    for(auto &p : points) r.push_back(convert(p));
    return r;
}

inline topo_ops::polygon<double> convert(const bg_polygon &p) {
    std::vector<topo_ops::line_string<double>> holes;
    for(auto &ring : p.inners()) holes.emplace_back(convert_points(ring));
    return {topo_ops::line_string<double>(convert_points(p.outer())),std::move(holes)};
}

inline std::string upper(std::string_view x) {
    std::string r;
    r.reserve(x.size());
    for(char c : x) r.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return r;
}

inline std::string_view trim(std::string_view x) {
    while(!x.empty() && std::isspace(static_cast<unsigned char>(x.front()))) x.remove_prefix(1);
    while(!x.empty() && std::isspace(static_cast<unsigned char>(x.back()))) x.remove_suffix(1);
    return x;
}

inline bool starts_with_token(const std::string &text,std::string_view token) {
    if(text.compare(0,token.size(),token) != 0) return false;
    if(text.size() == token.size()) return true;
    char c = text[token.size()];
    return c == '(' || std::isspace(static_cast<unsigned char>(c));
}

/* Split the members of "GEOMETRYCOLLECTION(a,b,...)" on the commas that are
not nested in brackets */
inline std::vector<std::string_view> split_collection(std::string_view body) {
    std::vector<std::string_view> r;
    body = trim(body);
    if(body.empty() || body.front() != '(' || body.back() != ')') {
        throw std::invalid_argument("malformed GEOMETRYCOLLECTION");
    }
    body = body.substr(1,body.size() - 2);
    if(trim(body).empty()) return r;

    std::size_t brack_level = 0;
    std::size_t start = 0;
    for(std::size_t i=0; i<body.size(); ++i) {
        switch(body[i]) {
        case '(':
            ++brack_level;
            break;
        case ')':
            if(brack_level == 0) throw std::invalid_argument("unbalanced brackets in GEOMETRYCOLLECTION");
            --brack_level;
            break;
        case ',':
            if(brack_level == 0) {
                r.push_back(trim(body.substr(start,i - start)));
                start = i + 1;
            }
            break;
        }
    }
    if(brack_level != 0) throw std::invalid_argument("unbalanced brackets in GEOMETRYCOLLECTION");
    r.push_back(trim(body.substr(start)));
    return r;
}
} // namespace wkt_detail

/* Parse any of POINT, LINESTRING, POLYGON, MULTIPOINT, MULTILINESTRING,
MULTIPOLYGON and GEOMETRYCOLLECTION. Throws boost::geometry::read_wkt_exception
or std::invalid_argument on malformed input. */
inline topo_ops::geometry<double> read_wkt(std::string_view text) {
    using namespace wkt_detail;

    std::string s{trim(text)};
    std::string u = upper(s);

    if(starts_with_token(u,"GEOMETRYCOLLECTION")) {
        std::vector<topo_ops::geometry<double>> members;
        for(auto m : split_collection(std::string_view(s).substr(std::string_view("GEOMETRYCOLLECTION").size()))) {
            members.push_back(read_wkt(m));
        }
        return topo_ops::geometry_collection<double>(std::move(members));
    }
    if(starts_with_token(u,"MULTIPOLYGON")) {
        bg_multi_polygon g;
        bg::read_wkt(s,g);
        std::vector<topo_ops::polygon<double>> polys;
        for(auto &p : g) polys.push_back(convert(p));
        return topo_ops::multi_polygon<double>(std::move(polys));
    }
    if(starts_with_token(u,"MULTILINESTRING")) {
        bg_multi_linestring g;
        bg::read_wkt(s,g);
        std::vector<topo_ops::line_string<double>> lines;
        for(auto &ls : g) lines.emplace_back(convert_points(ls));
        return topo_ops::multi_line_string<double>(std::move(lines));
    }
    if(starts_with_token(u,"MULTIPOINT")) {
        bg_multi_point g;
        bg::read_wkt(s,g);
        return topo_ops::multi_point<double>(convert_points(g));
    }
    if(starts_with_token(u,"POLYGON")) {
        bg_polygon g;
        bg::read_wkt(s,g);
        return convert(g);
    }
    if(starts_with_token(u,"LINESTRING")) {
        bg_linestring g;
        bg::read_wkt(s,g);
        return topo_ops::line_string<double>(convert_points(g));
    }
    if(starts_with_token(u,"POINT")) {
        bg_point g;
        bg::read_wkt(s,g);
        return convert(g);
    }
    throw std::invalid_argument("unsupported WKT geometry: " + s);
}

#endif
