#ifndef TOPO_OPS_EDGE_HPP
#define TOPO_OPS_EDGE_HPP

#include <vector>
#include <set>
#include <cstddef>
#include <utility>
#include <ostream>

#include "base.hpp"
#include "position.hpp"
#include "geometry.hpp"
#include "line_intersector.hpp"
#include "intersection_matrix.hpp"


namespace topo_ops {

/** A point where an edge is cut.

"segment_index" is the index of the segment of the edge that the point lies on,
and "distance" is the position along that segment, as computed by
compute_edge_distance. A point on a vertex always refers to the segment that
starts at that vertex, with a distance of zero. */
template<coordinate T> struct edge_intersection {
    point_t<T> coord;
    std::size_t segment_index;
    T distance;

    /* Ordered along the edge. The coordinate is not part of the key. */
    friend bool operator<(const edge_intersection &a,const edge_intersection &b) {
        return a.segment_index == b.segment_index ? a.distance < b.distance : a.segment_index < b.segment_index;
    }

    friend bool operator==(const edge_intersection &a,const edge_intersection &b) {
        return a.segment_index == b.segment_index && a.distance == b.distance;
    }
};

/** A polyline from one input geometry, along with its label and the points
where it is cut by other edges.

An edge is "isolated" until an intersection with an edge of the other geometry
is found. */
template<coordinate T> class edge {
    std::vector<point_t<T>> _coords;
    std::set<edge_intersection<T>> _intersections;
    topo_ops::label _label;
    bool _isolated;

public:
    edge(std::vector<point_t<T>> coords,const topo_ops::label &lbl)
        : _coords(std::move(coords)), _label(lbl), _isolated(true)
    {
        TOPO_OPS_ASSERT(!_coords.empty());
        _coords.shrink_to_fit();
    }

    const std::vector<point_t<T>> &coords() const noexcept { return _coords; }
    const std::set<edge_intersection<T>> &intersections() const noexcept { return _intersections; }

    const topo_ops::label &label() const noexcept { return _label; }
    topo_ops::label &label() noexcept { return _label; }

    bool is_isolated() const noexcept { return _isolated; }
    void mark_as_unisolated() noexcept { _isolated = false; }

    bool is_closed() const { return _coords.front() == _coords.back(); }

    std::size_t segment_count() const noexcept { return _coords.size() - 1; }

    line<T> segment(std::size_t i) const { return {_coords[i],_coords[i+1]}; }

    void swap_label_args() noexcept { _label.swap_args(); }

    /** Record that the first and last coordinates are cut points. After this,
    the intersections partition the edge. */
    void add_edge_intersection_list_endpoints() {
        std::size_t last = _coords.size() - 1;
        _intersections.insert({_coords[0],0,T(0)});
        _intersections.insert({_coords[last],last,T(0)});
    }

    /** Record every point of "intr", which was found on segment
    "segment_index" */
    void add_intersections(const line_intersection<T> &intr,std::size_t segment_index) {
        add_intersection(intr.start,segment_index);
        if(intr.is_collinear()) add_intersection(intr.end,segment_index);
    }

    /** Record "p", which lies on segment "segment_index". Adding the same point
    twice has no effect. */
    void add_intersection(const point_t<T> &p,std::size_t segment_index) {
        T distance = compute_edge_distance(p,segment(segment_index));

        std::size_t next_segment_index = segment_index + 1;
        if(next_segment_index < _coords.size() && p == _coords[next_segment_index]) {
            segment_index = next_segment_index;
            distance = 0;
        }

        _intersections.insert({p,segment_index,distance});
    }

    friend std::ostream &operator<<(std::ostream &os,const edge &x) {
        os << "edge{";
        bool first = true;
        for(auto &p : x._coords) {
            if(!first) os << ',';
            first = false;
            os << '(' << p.x() << ' ' << p.y() << ')';
        }
        return os << "} " << x._label;
    }
};

/** Raise the cells of "im" that "lbl" has positions for. The "on" positions
contribute a line, and the sides of an area contribute an area. */
inline void update_intersection_matrix(const label &lbl,intersection_matrix &im) {
    im.set_at_least_if_in_both(lbl.on_position(0),lbl.on_position(1),dimensions::line);
    /* both positions of a label always have the same shape */
    if(lbl.is_area()) {
        im.set_at_least_if_in_both(
            lbl.position(0,direction::left),
            lbl.position(1,direction::left),
            dimensions::area);
        im.set_at_least_if_in_both(
            lbl.position(0,direction::right),
            lbl.position(1,direction::right),
            dimensions::area);
    }
}

} // namespace topo_ops

#endif
