#ifndef TOPO_OPS_NODE_MAP_HPP
#define TOPO_OPS_NODE_MAP_HPP

#include <map>
#include <ostream>

#include "base.hpp"
#include "position.hpp"
#include "intersection_matrix.hpp"


namespace topo_ops {

/** A point of a planar graph where edges meet, or a point of a point geometry */
template<coordinate T> class coord_node {
    point_t<T> _coordinate;
    topo_ops::label _label;

public:
    explicit coord_node(const point_t<T> &p)
        : _coordinate{p}, _label{topo_ops::label::empty_line_or_point()} {}

    const point_t<T> &coordinate() const noexcept { return _coordinate; }

    const topo_ops::label &label() const noexcept { return _label; }
    topo_ops::label &label() noexcept { return _label; }

    /** A node that only one of the geometries knows about */
    bool is_isolated() const noexcept { return _label.geometry_count() == 1; }

    void set_label_on_position(std::size_t geom_index,coord_pos p) noexcept {
        _label.set_on_position(geom_index,p);
    }

    /** Add one more boundary to this node, using the "mod-2" rule. An interior
    node becomes a boundary node and a boundary node becomes an interior node. */
    void set_label_boundary(std::size_t geom_index) noexcept {
        auto current = _label.on_position(geom_index);
        _label.set_on_position(
            geom_index,
            current == coord_pos::on_boundary ? coord_pos::inside : coord_pos::on_boundary);
    }

    void swap_label_args() noexcept { _label.swap_args(); }

    /** A node is zero-dimensional */
    void update_intersection_matrix(intersection_matrix &im) const {
        im.set_at_least_if_in_both(_label.on_position(0),_label.on_position(1),dimensions::point);
    }

    friend bool operator==(const coord_node &a,const coord_node &b) {
        return a._coordinate == b._coordinate && a._label == b._label;
    }

    friend std::ostream &operator<<(std::ostream &os,const coord_node &x) {
        return os << "node{(" << x._coordinate.x() << ' ' << x._coordinate.y() << ") " << x._label << '}';
    }
};

/** Nodes keyed by their coordinate, so that coincident points from different
components share a node.

"Node" must be constructible from a coordinate. */
template<coordinate T,typename Node> class node_map {
    std::map<point_t<T>,Node,point_less> _nodes;

public:
    using iterator = typename std::map<point_t<T>,Node,point_less>::iterator;
    using const_iterator = typename std::map<point_t<T>,Node,point_less>::const_iterator;

    /** Return the node at "p", creating it if it doesn't exist */
    Node &insert_node_with_coordinate(const point_t<T> &p) {
        return _nodes.try_emplace(p,p).first->second;
    }

    const Node *find(const point_t<T> &p) const {
        auto itr = _nodes.find(p);
        return itr == _nodes.end() ? nullptr : &itr->second;
    }
    Node *find(const point_t<T> &p) {
        auto itr = _nodes.find(p);
        return itr == _nodes.end() ? nullptr : &itr->second;
    }

    std::size_t size() const noexcept { return _nodes.size(); }
    bool empty() const noexcept { return _nodes.empty(); }

    iterator begin() { return _nodes.begin(); }
    iterator end() { return _nodes.end(); }
    const_iterator begin() const { return _nodes.begin(); }
    const_iterator end() const { return _nodes.end(); }

    friend bool operator==(const node_map &a,const node_map &b) { return a._nodes == b._nodes; }
};

} // namespace topo_ops

#endif
