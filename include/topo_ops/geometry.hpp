#ifndef TOPO_OPS_GEOMETRY_HPP
#define TOPO_OPS_GEOMETRY_HPP

#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <ranges>
#include <initializer_list>
#include <utility>
#include <cstddef>

#include "base.hpp"
#include "position.hpp"
#include "kernel.hpp"


namespace topo_ops {

template<coordinate T> struct line {
    using coord_type = T;

    point_t<T> start;
    point_t<T> end;

    line() = default;
    constexpr line(const point_t<T> &start,const point_t<T> &end) : start{start}, end{end} {}

    constexpr point_t<T> delta() const { return end - start; }

    friend constexpr bool operator==(const line &a,const line &b) {
        return a.start == b.start && a.end == b.end;
    }
};

template<coordinate T> struct line_string {
    using coord_type = T;

    std::vector<point_t<T>> points;

    line_string() = default;
    line_string(std::vector<point_t<T>> points) : points(std::move(points)) {}
    line_string(std::initializer_list<point_t<T>> points) : points(points) {}

    bool is_empty() const { return points.empty(); }

    /* an empty line string counts as closed */
    bool is_closed() const { return points.empty() || points.front() == points.back(); }

    void close() {
        if(!is_closed()) points.push_back(points.front());
    }

    std::size_t size() const { return points.size(); }

    line<T> segment(std::size_t i) const { return {points[i],points[i+1]}; }

    friend bool operator==(const line_string&,const line_string&) = default;
};

/** A polygon with an exterior ring and any number of holes.

The rings are closed on construction, if they aren't already. */
template<coordinate T> struct polygon {
    using coord_type = T;

    line_string<T> exterior;
    std::vector<line_string<T>> interiors;

    polygon() = default;
    polygon(line_string<T> exterior,std::vector<line_string<T>> interiors={})
        : exterior(std::move(exterior)), interiors(std::move(interiors))
    {
        this->exterior.close();
        for(auto &ring : this->interiors) ring.close();
    }

    bool is_empty() const { return exterior.is_empty(); }

    friend bool operator==(const polygon&,const polygon&) = default;
};

template<coordinate T> struct multi_point {
    using coord_type = T;

    std::vector<point_t<T>> points;

    multi_point() = default;
    multi_point(std::vector<point_t<T>> points) : points(std::move(points)) {}
    multi_point(std::initializer_list<point_t<T>> points) : points(points) {}

    friend bool operator==(const multi_point&,const multi_point&) = default;
};

template<coordinate T> struct multi_line_string {
    using coord_type = T;

    std::vector<line_string<T>> line_strings;

    multi_line_string() = default;
    multi_line_string(std::vector<line_string<T>> line_strings) : line_strings(std::move(line_strings)) {}

    bool is_closed() const {
        return std::ranges::all_of(line_strings,[](const line_string<T> &ls) { return ls.is_closed(); });
    }

    friend bool operator==(const multi_line_string&,const multi_line_string&) = default;
};

template<coordinate T> struct multi_polygon {
    using coord_type = T;

    std::vector<polygon<T>> polygons;

    multi_polygon() = default;
    multi_polygon(std::vector<polygon<T>> polygons) : polygons(std::move(polygons)) {}

    friend bool operator==(const multi_polygon&,const multi_polygon&) = default;
};

/** An axis-aligned rectangle. The corners are normalized on construction so
that "min" is never greater than "max" on either axis. */
template<coordinate T> class rect {
    point_t<T> _min;
    point_t<T> _max;

public:
    using coord_type = T;

    rect() = default;
    constexpr rect(const point_t<T> &a,const point_t<T> &b)
        : _min{std::min(a.x(),b.x()),std::min(a.y(),b.y())},
          _max{std::max(a.x(),b.x()),std::max(a.y(),b.y())} {}

    constexpr const point_t<T> &min() const noexcept { return _min; }
    constexpr const point_t<T> &max() const noexcept { return _max; }
    constexpr T width() const { return _max.x() - _min.x(); }
    constexpr T height() const { return _max.y() - _min.y(); }

    /* expand to include "p" */
    constexpr void add(const point_t<T> &p) {
        _min = {std::min(_min.x(),p.x()),std::min(_min.y(),p.y())};
        _max = {std::max(_max.x(),p.x()),std::max(_max.y(),p.y())};
    }

    constexpr void add(const rect &b) {
        add(b._min);
        add(b._max);
    }

    constexpr bool intersects(const rect &b) const {
        return !(_max.x() < b._min.x() || b._max.x() < _min.x()
            || _max.y() < b._min.y() || b._max.y() < _min.y());
    }

    constexpr bool intersects(const point_t<T> &p) const {
        return _min.x() <= p.x() && p.x() <= _max.x() && _min.y() <= p.y() && p.y() <= _max.y();
    }

    polygon<T> to_polygon() const {
        return polygon<T>{line_string<T>{
            {_max.x(),_min.y()},
            {_max.x(),_max.y()},
            {_min.x(),_max.y()},
            {_min.x(),_min.y()},
            {_max.x(),_min.y()}}};
    }

    friend constexpr bool operator==(const rect &a,const rect &b) {
        return a._min == b._min && a._max == b._max;
    }
};

template<coordinate T> struct triangle {
    using coord_type = T;

    point_t<T> a;
    point_t<T> b;
    point_t<T> c;

    triangle() = default;
    constexpr triangle(const point_t<T> &a,const point_t<T> &b,const point_t<T> &c) : a{a}, b{b}, c{c} {}

    polygon<T> to_polygon() const {
        return polygon<T>{line_string<T>{a,b,c,a}};
    }

    friend constexpr bool operator==(const triangle &x,const triangle &y) {
        return x.a == y.a && x.b == y.b && x.c == y.c;
    }
};

template<coordinate T> struct geometry;

template<coordinate T> struct geometry_collection {
    using coord_type = T;

    std::vector<geometry<T>> geometries;

    geometry_collection() = default;
    geometry_collection(std::vector<geometry<T>> geometries) : geometries(std::move(geometries)) {}

    friend bool operator==(const geometry_collection &a,const geometry_collection &b) {
        return a.geometries == b.geometries;
    }
};

/** Any one of the geometry types */
template<coordinate T> struct geometry {
    using coord_type = T;
    using variant_type = std::variant<
        point_t<T>,
        line<T>,
        line_string<T>,
        polygon<T>,
        multi_point<T>,
        multi_line_string<T>,
        multi_polygon<T>,
        rect<T>,
        triangle<T>,
        geometry_collection<T>>;

    variant_type value;

    geometry() = default;
    template<typename G> requires std::constructible_from<variant_type,G&&>
    geometry(G &&g) : value(std::forward<G>(g)) {}

    template<typename G> bool is() const { return std::holds_alternative<G>(value); }

    friend bool operator==(const geometry &a,const geometry &b) {
        return a.value == b.value;
    }
};

template<typename G> concept geometry_type = requires {
    typename G::coord_type;
} && std::constructible_from<geometry<typename G::coord_type>,const G&>;

template<typename G> using geometry_coord_t = typename G::coord_type;


/* Emptiness */

template<coordinate T> constexpr bool is_empty(const point_t<T>&) { return false; }
template<coordinate T> constexpr bool is_empty(const line<T>&) { return false; }
template<coordinate T> bool is_empty(const line_string<T> &g) { return g.points.empty(); }
template<coordinate T> bool is_empty(const polygon<T> &g) { return g.exterior.is_empty(); }
template<coordinate T> bool is_empty(const multi_point<T> &g) { return g.points.empty(); }
template<coordinate T> bool is_empty(const multi_line_string<T> &g) {
    return std::ranges::all_of(g.line_strings,[](const auto &x) { return is_empty(x); });
}
template<coordinate T> bool is_empty(const multi_polygon<T> &g) {
    return std::ranges::all_of(g.polygons,[](const auto &x) { return is_empty(x); });
}
template<coordinate T> constexpr bool is_empty(const rect<T>&) { return false; }
template<coordinate T> constexpr bool is_empty(const triangle<T>&) { return false; }
template<coordinate T> bool is_empty(const geometry_collection<T> &g) {
    return std::ranges::all_of(g.geometries,[](const auto &x) { return is_empty(x); });
}
template<coordinate T> bool is_empty(const geometry<T> &g) {
    return std::visit([](const auto &x) { return is_empty(x); },g.value);
}


/* Dimensions */

namespace detail {
/* The dimensions of a shape formed by a sequence of points, based on how many
distinct points there are */
template<typename R> dimensions point_sequence_dimensions(const R &points,bool can_be_area) {
    auto itr = std::ranges::begin(points);
    auto end = std::ranges::end(points);
    if(itr == end) return dimensions::empty;
    auto first = *itr;
    itr = std::find_if(itr,end,[&](const auto &p) { return p != first; });
    if(itr == end) return dimensions::point;
    if(!can_be_area) return dimensions::line;
    auto second = *itr;
    itr = std::find_if(itr,end,[&](const auto &p) { return p != first && p != second; });
    return itr == end ? dimensions::line : dimensions::area;
}

/* The boundary of a shape is one dimension less, except a point has no
boundary */
constexpr dimensions boundary_of(dimensions d) {
    switch(d) {
    case dimensions::line: return dimensions::point;
    case dimensions::area: return dimensions::line;
    default: return dimensions::empty;
    }
}
} // namespace detail

template<coordinate T> constexpr dimensions dimensions_of(const point_t<T>&) { return dimensions::point; }
template<coordinate T> constexpr dimensions dimensions_of(const line<T> &g) {
    return g.start == g.end ? dimensions::point : dimensions::line;
}
template<coordinate T> dimensions dimensions_of(const line_string<T> &g) {
    return detail::point_sequence_dimensions(g.points,false);
}
template<coordinate T> dimensions dimensions_of(const polygon<T> &g) {
    return detail::point_sequence_dimensions(g.exterior.points,true);
}
template<coordinate T> dimensions dimensions_of(const multi_point<T> &g) {
    return g.points.empty() ? dimensions::empty : dimensions::point;
}
template<coordinate T> dimensions dimensions_of(const multi_line_string<T> &g) {
    dimensions r = dimensions::empty;
    for(auto &ls : g.line_strings) {
        r = std::max(r,dimensions_of(ls));
        if(r == dimensions::line) break;
    }
    return r;
}
template<coordinate T> dimensions dimensions_of(const multi_polygon<T> &g) {
    dimensions r = dimensions::empty;
    for(auto &p : g.polygons) {
        r = std::max(r,dimensions_of(p));
        if(r == dimensions::area) break;
    }
    return r;
}
template<coordinate T> constexpr dimensions dimensions_of(const rect<T> &g) {
    if(g.min() == g.max()) return dimensions::point;
    if(g.min().x() == g.max().x() || g.min().y() == g.max().y()) return dimensions::line;
    return dimensions::area;
}
template<coordinate T> dimensions dimensions_of(const triangle<T> &g) {
    if(robust_kernel::orient2d(g.a,g.b,g.c) == orientation::collinear) {
        return (g.a == g.b && g.b == g.c) ? dimensions::point : dimensions::line;
    }
    return dimensions::area;
}
template<coordinate T> dimensions dimensions_of(const geometry<T> &g);
template<coordinate T> dimensions dimensions_of(const geometry_collection<T> &g) {
    dimensions r = dimensions::empty;
    for(auto &x : g.geometries) {
        r = std::max(r,dimensions_of(x));
        if(r == dimensions::area) break;
    }
    return r;
}
template<coordinate T> dimensions dimensions_of(const geometry<T> &g) {
    return std::visit([](const auto &x) { return dimensions_of(x); },g.value);
}

template<coordinate T> constexpr dimensions boundary_dimensions_of(const point_t<T>&) { return dimensions::empty; }
template<coordinate T> constexpr dimensions boundary_dimensions_of(const line<T> &g) {
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> dimensions boundary_dimensions_of(const line_string<T> &g) {
    if(g.is_closed()) return dimensions::empty;
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> dimensions boundary_dimensions_of(const polygon<T> &g) {
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> dimensions boundary_dimensions_of(const multi_point<T>&) { return dimensions::empty; }
template<coordinate T> dimensions boundary_dimensions_of(const multi_line_string<T> &g) {
    if(g.is_closed()) return dimensions::empty;
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> dimensions boundary_dimensions_of(const multi_polygon<T> &g) {
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> constexpr dimensions boundary_dimensions_of(const rect<T> &g) {
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> dimensions boundary_dimensions_of(const triangle<T> &g) {
    return detail::boundary_of(dimensions_of(g));
}
template<coordinate T> dimensions boundary_dimensions_of(const geometry<T> &g);
template<coordinate T> dimensions boundary_dimensions_of(const geometry_collection<T> &g) {
    dimensions r = dimensions::empty;
    for(auto &x : g.geometries) {
        r = std::max(r,boundary_dimensions_of(x));
        if(r == dimensions::line) break;
    }
    return r;
}
template<coordinate T> dimensions boundary_dimensions_of(const geometry<T> &g) {
    return std::visit([](const auto &x) { return boundary_dimensions_of(x); },g.value);
}


/* Shapes that can collapse. A polygon, rectangle or triangle with no area
stands for the point or line segment that its coordinates cover. A point is
returned as a line whose ends are equal. Nothing is returned for a shape that
has an area or is empty. */

template<coordinate T> std::optional<line<T>> collapsed_shape(const polygon<T> &g) {
    switch(dimensions_of(g)) {
    case dimensions::point:
        return line<T>{g.exterior.points[0],g.exterior.points[0]};
    case dimensions::line:
        {
            const point_t<T> &first = g.exterior.points[0];
            auto second = std::ranges::find_if(g.exterior.points,[&](const auto &p) { return p != first; });
            return line<T>{first,*second};
        }
    default:
        return std::nullopt;
    }
}
template<coordinate T> std::optional<line<T>> collapsed_shape(const rect<T> &g) {
    if(dimensions_of(g) == dimensions::area) return std::nullopt;
    return line<T>{g.min(),g.max()};
}
template<coordinate T> std::optional<line<T>> collapsed_shape(const triangle<T> &g) {
    if(dimensions_of(g) == dimensions::area) return std::nullopt;

    /* the points are collinear, so the lowest and highest in lexicographic
    order are the ends */
    auto [lo,hi] = std::minmax({g.a,g.b,g.c},point_less{});
    return line<T>{lo,hi};
}


/* Bounding rectangles. Empty geometries have none. */

namespace detail {
template<coordinate T,typename R> std::optional<rect<T>> points_bounding_rect(const R &points) {
    auto itr = std::ranges::begin(points);
    auto end = std::ranges::end(points);
    if(itr == end) return std::nullopt;
    rect<T> r{*itr,*itr};
    while(++itr != end) r.add(*itr);
    return r;
}

template<coordinate T,typename R> std::optional<rect<T>> union_bounding_rect(const R &items) {
    std::optional<rect<T>> r;
    for(auto &item : items) {
        auto br = bounding_rect(item);
        if(!br) continue;
        if(r) r->add(*br);
        else r = br;
    }
    return r;
}
} // namespace detail

template<coordinate T> std::optional<rect<T>> bounding_rect(const point_t<T> &g) { return rect<T>{g,g}; }
template<coordinate T> std::optional<rect<T>> bounding_rect(const line<T> &g) { return rect<T>{g.start,g.end}; }
template<coordinate T> std::optional<rect<T>> bounding_rect(const line_string<T> &g) {
    return detail::points_bounding_rect<T>(g.points);
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const polygon<T> &g) {
    return detail::points_bounding_rect<T>(g.exterior.points);
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const multi_point<T> &g) {
    return detail::points_bounding_rect<T>(g.points);
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const multi_line_string<T> &g) {
    return detail::union_bounding_rect<T>(g.line_strings);
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const multi_polygon<T> &g) {
    return detail::union_bounding_rect<T>(g.polygons);
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const rect<T> &g) { return g; }
template<coordinate T> std::optional<rect<T>> bounding_rect(const triangle<T> &g) {
    rect<T> r{g.a,g.b};
    r.add(g.c);
    return r;
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const geometry<T> &g);
template<coordinate T> std::optional<rect<T>> bounding_rect(const geometry_collection<T> &g) {
    return detail::union_bounding_rect<T>(g.geometries);
}
template<coordinate T> std::optional<rect<T>> bounding_rect(const geometry<T> &g) {
    return std::visit([](const auto &x) { return bounding_rect(x); },g.value);
}


/* Point location */

/** Returns true if "p" lies on the closed segment "l" */
template<typename Kernel=robust_kernel,coordinate T>
bool point_on_segment(const point_t<T> &p,const line<T> &l) {
    return Kernel::orient2d(l.start,l.end,p) == orientation::collinear
        && value_in_between(p.x(),l.start.x(),l.end.x())
        && value_in_between(p.y(),l.start.y(),l.end.y());
}

/** Determine the position of "p" relative to a closed ring, using the winding
number. Points on the ring are reported as on the boundary. */
template<typename Kernel=robust_kernel,coordinate T>
coord_pos coord_pos_relative_to_ring(const point_t<T> &p,const line_string<T> &ring) {
    TOPO_OPS_ASSERT(ring.is_closed());

    if(ring.points.empty()) return coord_pos::outside;
    if(ring.points.size() == 1) return p == ring.points[0] ? coord_pos::on_boundary : coord_pos::outside;

    int winding_number = 0;
    for(std::size_t i=0; i<ring.points.size()-1; ++i) {
        line<T> s = ring.segment(i);
        if(s.start.y() <= p.y()) {
            if(s.end.y() >= p.y()) {
                orientation o = Kernel::orient2d(s.start,s.end,p);
                if(o == orientation::counter_clockwise && s.end.y() != p.y()) {
                    ++winding_number;
                } else if(o == orientation::collinear && value_in_between(p.x(),s.start.x(),s.end.x())) {
                    return coord_pos::on_boundary;
                }
            }
        } else if(s.end.y() <= p.y()) {
            orientation o = Kernel::orient2d(s.start,s.end,p);
            if(o == orientation::clockwise) {
                --winding_number;
            } else if(o == orientation::collinear && value_in_between(p.x(),s.start.x(),s.end.x())) {
                return coord_pos::on_boundary;
            }
        }
    }

    return winding_number == 0 ? coord_pos::outside : coord_pos::inside;
}

/* Each of the following accumulates the position of "p" relative to one
geometry. "boundary_count" is incremented for each component whose boundary "p"
lies on, and "is_inside" is set if "p" is in the interior of a component. Across
a collection, an odd number of boundary hits means "p" is on the boundary. */

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const point_t<T> &g,const point_t<T> &p,bool &is_inside,std::size_t&) {
    if(g == p) is_inside = true;
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const line<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    if(g.start == g.end) {
        calculate_coordinate_position<Kernel>(g.start,p,is_inside,boundary_count);
    } else if(p == g.start || p == g.end) {
        ++boundary_count;
    } else if(point_on_segment<Kernel>(p,g)) {
        is_inside = true;
    }
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const line_string<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    if(g.points.empty()) return;
    if(g.points.size() == 1) {
        TOPO_OPS_DEBUG_LOG("line string with a single coordinate treated as a point");
        calculate_coordinate_position<Kernel>(g.points[0],p,is_inside,boundary_count);
        return;
    }
    if(g.points.size() == 2) {
        calculate_coordinate_position<Kernel>(g.segment(0),p,is_inside,boundary_count);
        return;
    }

    if(!bounding_rect(g)->intersects(p)) return;

    if(!g.is_closed() && (p == g.points.front() || p == g.points.back())) {
        ++boundary_count;
        return;
    }

    for(std::size_t i=0; i<g.points.size()-1; ++i) {
        if(point_on_segment<Kernel>(p,g.segment(i))) {
            is_inside = true;
            return;
        }
    }
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const polygon<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    if(g.is_empty()) return;
    if(auto c = collapsed_shape(g)) {
        calculate_coordinate_position<Kernel>(*c,p,is_inside,boundary_count);
        return;
    }

    switch(coord_pos_relative_to_ring<Kernel>(p,g.exterior)) {
    case coord_pos::outside:
        return;
    case coord_pos::on_boundary:
        ++boundary_count;
        return;
    case coord_pos::inside:
        for(auto &hole : g.interiors) {
            switch(coord_pos_relative_to_ring<Kernel>(p,hole)) {
            case coord_pos::outside:
                break;
            case coord_pos::on_boundary:
                ++boundary_count;
                return;
            case coord_pos::inside:
                return;
            }
        }
        is_inside = true;
    }
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const multi_point<T> &g,const point_t<T> &p,bool &is_inside,std::size_t&) {
    if(std::ranges::find(g.points,p) != g.points.end()) is_inside = true;
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const multi_line_string<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    for(auto &ls : g.line_strings) calculate_coordinate_position<Kernel>(ls,p,is_inside,boundary_count);
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const multi_polygon<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    for(auto &poly : g.polygons) calculate_coordinate_position<Kernel>(poly,p,is_inside,boundary_count);
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const rect<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    if(!g.intersects(p)) return;
    if(auto c = collapsed_shape(g)) {
        calculate_coordinate_position<Kernel>(*c,p,is_inside,boundary_count);
        return;
    }
    if(p.x() == g.min().x() || p.x() == g.max().x() || p.y() == g.min().y() || p.y() == g.max().y()) {
        ++boundary_count;
    } else {
        is_inside = true;
    }
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const triangle<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    if(auto c = collapsed_shape(g)) {
        calculate_coordinate_position<Kernel>(*c,p,is_inside,boundary_count);
        return;
    }
    calculate_coordinate_position<Kernel>(g.to_polygon(),p,is_inside,boundary_count);
}

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const geometry<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count);

template<typename Kernel=robust_kernel,coordinate T>
void calculate_coordinate_position(const geometry_collection<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    for(auto &x : g.geometries) calculate_coordinate_position<Kernel>(x,p,is_inside,boundary_count);
}

template<typename Kernel,coordinate T>
void calculate_coordinate_position(const geometry<T> &g,const point_t<T> &p,bool &is_inside,std::size_t &boundary_count) {
    std::visit([&](const auto &x) { calculate_coordinate_position<Kernel>(x,p,is_inside,boundary_count); },g.value);
}

/** Determine whether "p" is inside, on the boundary of, or outside of "g".

For collections, the boundary is determined with the "mod-2" rule: a point is on
the boundary if it lies on the boundary of an odd number of components. */
template<typename Kernel=robust_kernel,geometry_type G>
coord_pos coordinate_position(const G &g,const point_t<geometry_coord_t<G>> &p) {
    bool is_inside = false;
    std::size_t boundary_count = 0;
    calculate_coordinate_position<Kernel>(g,p,is_inside,boundary_count);
    if(boundary_count % 2 == 1) return coord_pos::on_boundary;
    return is_inside ? coord_pos::inside : coord_pos::outside;
}

} // namespace topo_ops

#endif
