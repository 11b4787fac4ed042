#ifndef TOPO_OPS_EDGE_END_HPP
#define TOPO_OPS_EDGE_END_HPP

#include <optional>
#include <compare>
#include <cstddef>
#include <ostream>

#include "base.hpp"
#include "kernel.hpp"
#include "position.hpp"


namespace topo_ops {

/** The quadrants of the plane, in counter-clockwise order starting with
north-east. Points on an axis belong to the quadrant that follows them in
clockwise order, except that the positive X axis belongs to north-east. */
enum class quadrant {ne,nw,sw,se};

/** Returns nothing if "delta" is the zero vector */
template<coordinate T> std::optional<quadrant> quadrant_of(const point_t<T> &delta) {
    if(delta.x() == 0 && delta.y() == 0) return std::nullopt;
    if(delta.y() >= 0) return delta.x() >= 0 ? quadrant::ne : quadrant::nw;
    return delta.x() >= 0 ? quadrant::se : quadrant::sw;
}

/** The direction of an edge end, leaving "coord_0" toward "coord_1" */
template<coordinate T> class edge_end_key {
    point_t<T> _coord_0;
    point_t<T> _coord_1;
    point_t<T> _delta;
    std::optional<quadrant> _quadrant;

public:
    edge_end_key(const point_t<T> &coord_0,const point_t<T> &coord_1)
        : _coord_0{coord_0}, _coord_1{coord_1}, _delta{coord_1 - coord_0}, _quadrant{quadrant_of(_delta)} {}

    const point_t<T> &coord_0() const noexcept { return _coord_0; }
    const point_t<T> &coord_1() const noexcept { return _coord_1; }
    const point_t<T> &delta() const noexcept { return _delta; }
    std::optional<quadrant> get_quadrant() const noexcept { return _quadrant; }

    /** Compare the angles of two edge ends that leave the same point.

    The angle is measured counter-clockwise from the positive X axis. The
    quadrants are compared first, which keeps the ordering transitive, and only
    edge ends in the same quadrant need an orientation test. Edge ends that
    point in the same direction are equivalent. */
    template<typename Kernel> std::weak_ordering compare_direction(const edge_end_key &b) const {
        if(_delta == b._delta) return std::weak_ordering::equivalent;

        if(_quadrant && b._quadrant) {
            if(*_quadrant > *b._quadrant) return std::weak_ordering::greater;
            if(*_quadrant < *b._quadrant) return std::weak_ordering::less;
        }

        switch(Kernel::orient2d(b._coord_0,b._coord_1,_coord_1)) {
        case orientation::clockwise: return std::weak_ordering::less;
        case orientation::counter_clockwise: return std::weak_ordering::greater;
        default: return std::weak_ordering::equivalent;
        }
    }

    friend std::ostream &operator<<(std::ostream &os,const edge_end_key &x) {
        return os << "edge_end_key{(" << x._coord_0.x() << ' ' << x._coord_0.y() << ") -> ("
            << x._coord_1.x() << ' ' << x._coord_1.y() << ")}";
    }
};

/* Orders edge ends that leave the same point by angle */
template<typename Kernel> struct edge_end_key_less {
    template<coordinate T> bool operator()(const edge_end_key<T> &a,const edge_end_key<T> &b) const {
        return a.template compare_direction<Kernel>(b) < 0;
    }
};

/** A directed stub of an edge, leaving a node.

"edge_index" is the index of the edge it came from, within the edges of the
graph of geometry "geom_index". */
template<coordinate T> class edge_end {
    edge_end_key<T> _key;
    topo_ops::label _label;
    std::size_t _geom_index;
    std::size_t _edge_index;

public:
    edge_end(const edge_end_key<T> &key,const topo_ops::label &lbl,std::size_t geom_index,std::size_t edge_index)
        : _key{key}, _label{lbl}, _geom_index{geom_index}, _edge_index{edge_index} {}

    const edge_end_key<T> &key() const noexcept { return _key; }
    const point_t<T> &coordinate() const noexcept { return _key.coord_0(); }

    const topo_ops::label &label() const noexcept { return _label; }
    topo_ops::label &label() noexcept { return _label; }

    std::size_t geom_index() const noexcept { return _geom_index; }
    std::size_t edge_index() const noexcept { return _edge_index; }

    friend std::ostream &operator<<(std::ostream &os,const edge_end &x) {
        return os << x._key << ' ' << x._label;
    }
};

} // namespace topo_ops

#endif
