#ifndef TOPO_OPS_GEOMETRY_GRAPH_HPP
#define TOPO_OPS_GEOMETRY_GRAPH_HPP

#include <vector>
#include <span>
#include <variant>
#include <cstddef>
#include <utility>
#include <type_traits>

#include "base.hpp"
#include "kernel.hpp"
#include "position.hpp"
#include "geometry.hpp"
#include "edge.hpp"
#include "node_map.hpp"
#include "segment_intersector.hpp"


namespace topo_ops {

/** The "mod-2" boundary determination rule: a point shared by an odd number of
boundaries is on the boundary, otherwise it's in the interior */
constexpr coord_pos determine_boundary(std::size_t boundary_count) noexcept {
    return boundary_count % 2 == 1 ? coord_pos::on_boundary : coord_pos::inside;
}

/** The planar graph of a single geometry.

Every ring and line string becomes an edge, and every point, line end point
and ring start point becomes a node. Each component is labeled with its
position relative to the geometry, under index "arg_index" of the label (0 for
the first geometry of a relate operation and 1 for the second).

The graph refers to the geometry it was built from, which must outlive it.

Self-intersections don't have to be vertices, so "compute_self_nodes" must be
called before the graph is topologically correct. */
template<coordinate T,typename Kernel=robust_kernel> class geometry_graph {
    std::size_t _arg_index;
    const geometry<T> *_geometry;
    dimensions _dimensions;
    bool _use_boundary_determination_rule = true;
    bool _has_computed_self_nodes = false;
    std::vector<edge<T>> _edges;
    node_map<T,coord_node<T>> _nodes;

    static std::vector<point_t<T>> remove_repeated_points(const std::vector<point_t<T>> &points) {
        std::vector<point_t<T>> r;
        r.reserve(points.size());
        for(auto &p : points) {
            if(r.empty() || r.back() != p) r.push_back(p);
        }
        return r;
    }

    void insert_point(std::size_t arg_index,const point_t<T> &p,coord_pos pos) {
        _nodes.insert_node_with_coordinate(p).set_label_on_position(arg_index,pos);
    }

    /* Add a boundary point of a line. A point that is already a boundary point
    becomes an interior point. */
    void insert_boundary_point(const point_t<T> &p) {
        topo_ops::label &lbl = _nodes.insert_node_with_coordinate(p).label();
        std::size_t boundary_count = 1;
        if(lbl.on_position(_arg_index) == coord_pos::on_boundary) ++boundary_count;
        lbl.set_on_position(_arg_index,determine_boundary(boundary_count));
    }

    /* The orientation of a closed ring without repeated points, taken at its
    lowest vertex. That vertex is convex unless the ring has no area. */
    static orientation ring_orientation(const std::vector<point_t<T>> &coords) {
        std::size_t n = coords.size() - 1;
        std::size_t lowest = 0;
        for(std::size_t i=1; i<n; ++i) {
            if(coords[i].y() < coords[lowest].y()
                || (coords[i].y() == coords[lowest].y() && coords[i].x() < coords[lowest].x())) lowest = i;
        }
        const point_t<T> &prev = coords[lowest == 0 ? n - 1 : lowest - 1];
        return Kernel::orient2d(prev,coords[lowest],coords[lowest + 1]);
    }

    void add_polygon_ring(const line_string<T> &ring,coord_pos cw_left,coord_pos cw_right) {
        TOPO_OPS_ASSERT(ring.is_closed());
        if(ring.is_empty()) return;

        std::vector<point_t<T>> coords = remove_repeated_points(ring.points);
        if(coords.size() < 4) {
            TOPO_OPS_DEBUG_LOG("ring with fewer than three distinct coordinates ignored");
            return;
        }

        coord_pos left = cw_left, right = cw_right;
        switch(ring_orientation(coords)) {
        case orientation::counter_clockwise:
            left = cw_right;
            right = cw_left;
            break;
        case orientation::collinear:
            TOPO_OPS_DEBUG_LOG("ring has no winding order, the result is undefined");
            break;
        default:
            break;
        }

        point_t<T> first = coords[0];
        _edges.emplace_back(
            std::move(coords),
            topo_ops::label(_arg_index,topology_position::area(coord_pos::on_boundary,left,right)));

        insert_point(_arg_index,first,coord_pos::on_boundary);
    }

    /* A shape with no area is added as the point or line it collapsed to */
    void add_collapsed(const line<T> &c) {
        TOPO_OPS_DEBUG_LOG(
            "shape with no area treated as a {}",
            c.start == c.end ? "point" : "line");
        add_component(c);
    }

    void add_component(const polygon<T> &g) {
        if(auto c = collapsed_shape(g)) {
            add_collapsed(*c);
            return;
        }

        add_polygon_ring(g.exterior,coord_pos::outside,coord_pos::inside);

        /* the interior of the polygon is on the opposite side of a hole */
        for(auto &hole : g.interiors) add_polygon_ring(hole,coord_pos::inside,coord_pos::outside);
    }

    void add_component(const line_string<T> &g) {
        if(g.is_empty()) return;

        std::vector<point_t<T>> coords = remove_repeated_points(g.points);
        if(coords.size() < 2) {
            TOPO_OPS_DEBUG_LOG("line string with a single distinct coordinate treated as a point");
            add_component(coords[0]);
            return;
        }

        insert_boundary_point(coords.front());
        insert_boundary_point(coords.back());

        _edges.emplace_back(
            std::move(coords),
            topo_ops::label(_arg_index,topology_position::line_or_point(coord_pos::inside)));
    }

    void add_component(const line<T> &g) {
        add_component(line_string<T>{g.start,g.end});
    }

    void add_component(const point_t<T> &g) {
        insert_point(_arg_index,g,coord_pos::inside);
    }

    void add_component(const multi_point<T> &g) {
        for(auto &p : g.points) add_component(p);
    }

    void add_component(const multi_line_string<T> &g) {
        for(auto &ls : g.line_strings) add_component(ls);
    }

    void add_component(const multi_polygon<T> &g) {
        /* a point where two polygons of the same multi-polygon touch is on
        the boundary, no matter how many rings meet there */
        _use_boundary_determination_rule = false;
        for(auto &poly : g.polygons) add_component(poly);
    }

    void add_component(const rect<T> &g) {
        if(auto c = collapsed_shape(g)) add_collapsed(*c);
        else add_component(g.to_polygon());
    }

    void add_component(const triangle<T> &g) {
        if(auto c = collapsed_shape(g)) add_collapsed(*c);
        else add_component(g.to_polygon());
    }

    void add_component(const geometry_collection<T> &g) {
        for(auto &x : g.geometries) add_geometry(x);
    }

    void add_geometry(const geometry<T> &g) {
        if(is_empty(g)) return;
        std::visit([this](const auto &x) { add_component(x); },g.value);
    }

    void add_self_intersection_node(const point_t<T> &p,coord_pos pos) {
        if(is_boundary_node(p)) return;

        if(pos == coord_pos::on_boundary && _use_boundary_determination_rule) {
            insert_boundary_point(p);
        } else {
            insert_point(_arg_index,p,pos);
        }
    }

    void add_self_intersection_nodes() {
        std::vector<std::pair<point_t<T>,coord_pos>> new_nodes;
        for(auto &e : _edges) {
            auto pos = e.label().on_position(_arg_index);
            TOPO_OPS_ASSERT(pos);
            for(auto &ei : e.intersections()) new_nodes.emplace_back(ei.coord,*pos);
        }
        for(auto &[p,pos] : new_nodes) add_self_intersection_node(p,pos);
    }

    /* Valid rings never intersect themselves, so a ring only needs to be
    tested against the other rings */
    bool is_rings() const {
        return std::visit([](const auto &x) {
            using G = std::decay_t<decltype(x)>;
            if constexpr(std::is_same_v<G,line_string<T>> || std::is_same_v<G,multi_line_string<T>>) {
                return x.is_closed();
            } else {
                return std::is_same_v<G,polygon<T>>
                    || std::is_same_v<G,multi_polygon<T>>
                    || std::is_same_v<G,rect<T>>
                    || std::is_same_v<G,triangle<T>>;
            }
        },_geometry->value);
    }

public:
    geometry_graph(std::size_t arg_index,const geometry<T> &g)
        : _arg_index{arg_index}, _geometry{&g}, _dimensions{dimensions_of(g)}
    {
        TOPO_OPS_ASSERT(arg_index < 2);
        add_geometry(g);
    }

    std::size_t arg_index() const noexcept { return _arg_index; }
    const geometry<T> &parent_geometry() const noexcept { return *_geometry; }
    dimensions parent_dimensions() const noexcept { return _dimensions; }

    std::span<edge<T>> edges() noexcept { return _edges; }
    std::span<const edge<T>> edges() const noexcept { return _edges; }

    const node_map<T,coord_node<T>> &nodes() const noexcept { return _nodes; }

    bool has_computed_self_nodes() const noexcept { return _has_computed_self_nodes; }

    bool is_boundary_node(const point_t<T> &p) const {
        const coord_node<T> *n = _nodes.find(p);
        return n && n->label().on_position(_arg_index) == coord_pos::on_boundary;
    }

    std::vector<point_t<T>> boundary_nodes() const {
        std::vector<point_t<T>> r;
        for(auto &[p,n] : _nodes) {
            if(n.label().on_position(_arg_index) == coord_pos::on_boundary) r.push_back(p);
        }
        return r;
    }

    /** Find the points where the geometry intersects itself and add them as
    nodes. Calling this more than once has no effect. */
    template<typename EdgeSetIntersector=sweep_edge_set_intersector> void compute_self_nodes() {
        if(_has_computed_self_nodes) return;
        _has_computed_self_nodes = true;

        segment_intersector<T,Kernel> si(true);
        EdgeSetIntersector::compute_intersections_within_set(edges(),!is_rings(),si);
        add_self_intersection_nodes();
    }

    /** Find the intersections between the edges of this graph and "other". The
    intersection points are recorded on the edges of both graphs. */
    template<typename EdgeSetIntersector=sweep_edge_set_intersector>
    segment_intersector<T,Kernel> compute_edge_intersections(geometry_graph &other) {
        segment_intersector<T,Kernel> si(false);
        si.set_boundary_nodes(boundary_nodes(),other.boundary_nodes());
        EdgeSetIntersector::compute_intersections_between_sets(edges(),other.edges(),si);
        return si;
    }

    /** Copy this graph, relabeled as argument "arg_index" of a relate operation.

    This is used to reuse a self-noded graph in more than one operation. */
    geometry_graph clone_for_arg_index(std::size_t arg_index) const {
        TOPO_OPS_ASSERT(_has_computed_self_nodes);
        TOPO_OPS_ASSERT(arg_index < 2);

        geometry_graph r = *this;
        if(arg_index != _arg_index) {
            r._arg_index = arg_index;
            for(auto &[p,n] : r._nodes) n.swap_label_args();
            for(auto &e : r._edges) e.swap_label_args();
        }
        return r;
    }
};

} // namespace topo_ops

#endif
