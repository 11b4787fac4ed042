#ifndef TOPO_OPS_POSITION_HPP
#define TOPO_OPS_POSITION_HPP

#include <array>
#include <optional>
#include <utility>
#include <ostream>

#include "base.hpp"


namespace topo_ops {

/** The position of a coordinate relative to a geometry */
enum class coord_pos {inside,on_boundary,outside};

/** Topological dimension. These are ordered, and a value can be used as the
minimum dimension that a cell of an intersection matrix must have. */
enum class dimensions : signed char {
    empty = -1,
    point = 0,
    line = 1,
    area = 2};

/** A side of a directed edge. "left" and "right" only apply to edges that bound
an area. */
enum class direction {on,left,right};

constexpr char to_char(coord_pos x) noexcept {
    switch(x) {
    case coord_pos::inside: return 'i';
    case coord_pos::on_boundary: return 'b';
    default: return 'e';
    }
}

constexpr char to_char(dimensions x) noexcept {
    switch(x) {
    case dimensions::point: return '0';
    case dimensions::line: return '1';
    case dimensions::area: return '2';
    default: return 'F';
    }
}

inline std::ostream &operator<<(std::ostream &os,coord_pos x) {
    switch(x) {
    case coord_pos::inside: return os << "inside";
    case coord_pos::on_boundary: return os << "on_boundary";
    default: return os << "outside";
    }
}

inline std::ostream &operator<<(std::ostream &os,dimensions x) {
    return os << to_char(x);
}

/** The topological position of a graph component relative to one geometry.

There are two shapes: a line/point position has only an "on" value, while an
area position also has "left" and "right" values. The shape is chosen at
construction and never changes. Any of the values may be unknown. */
class topology_position {
    std::array<std::optional<coord_pos>,3> positions;
    bool _is_area;

    constexpr topology_position(bool is_area) noexcept : _is_area{is_area} {}

public:
    static constexpr topology_position empty_line_or_point() noexcept {
        return topology_position{false};
    }
    static constexpr topology_position empty_area() noexcept {
        return topology_position{true};
    }
    static constexpr topology_position line_or_point(coord_pos on) noexcept {
        topology_position r{false};
        r.positions[0] = on;
        return r;
    }
    static constexpr topology_position area(coord_pos on,coord_pos left,coord_pos right) noexcept {
        topology_position r{true};
        r.positions[0] = on;
        r.positions[1] = left;
        r.positions[2] = right;
        return r;
    }

    constexpr bool is_area() const noexcept { return _is_area; }
    constexpr bool is_line() const noexcept { return !_is_area; }

    std::optional<coord_pos> get(direction d) const {
        TOPO_OPS_ASSERT(_is_area || d == direction::on);
        return positions[static_cast<int>(d)];
    }

    /** True if every value is unknown */
    bool is_empty() const noexcept {
        if(positions[0]) return false;
        return !_is_area || (!positions[1] && !positions[2]);
    }

    /** True if at least one value is unknown */
    bool is_any_empty() const noexcept {
        if(!positions[0]) return true;
        return _is_area && (!positions[1] || !positions[2]);
    }

    void set_position(direction d,coord_pos p) {
        TOPO_OPS_ASSERT(_is_area || d == direction::on);
        positions[static_cast<int>(d)] = p;
    }

    void set_on_position(coord_pos p) noexcept { positions[0] = p; }

    void set_all_positions(coord_pos p) noexcept {
        positions[0] = p;
        if(_is_area) {
            positions[1] = p;
            positions[2] = p;
        }
    }

    void set_all_positions_if_empty(coord_pos p) noexcept {
        if(!positions[0]) positions[0] = p;
        if(_is_area) {
            if(!positions[1]) positions[1] = p;
            if(!positions[2]) positions[2] = p;
        }
    }

    /* walking an edge backwards swaps its sides */
    void flip() noexcept {
        if(_is_area) std::swap(positions[1],positions[2]);
    }

    friend bool operator==(const topology_position&,const topology_position&) = default;

    friend std::ostream &operator<<(std::ostream &os,const topology_position &x) {
        auto put = [&](const std::optional<coord_pos> &p) {
            os << (p ? to_char(*p) : '_');
        };
        if(x._is_area) {
            put(x.positions[1]);
            put(x.positions[0]);
            put(x.positions[2]);
        } else {
            put(x.positions[0]);
        }
        return os;
    }
};

/** A pair of topology positions, one for each geometry being related.

Index 0 refers to the first geometry and index 1 to the second. Both positions
always have the same shape. */
class label {
    std::array<topology_position,2> geometry_topologies;

    explicit label(const topology_position &p) noexcept : geometry_topologies{p,p} {}

public:
    static label empty_line_or_point() noexcept {
        return label{topology_position::empty_line_or_point()};
    }
    static label empty_area() noexcept {
        return label{topology_position::empty_area()};
    }

    /** Create a label with "position" for geometry "geom_index" and an empty
    position of the same shape for the other geometry. */
    label(std::size_t geom_index,const topology_position &position)
        : label{position.is_area() ? topology_position::empty_area() : topology_position::empty_line_or_point()}
    {
        geometry_topologies[geom_index] = position;
    }

    void swap_args() noexcept {
        std::swap(geometry_topologies[0],geometry_topologies[1]);
    }

    void flip() noexcept {
        geometry_topologies[0].flip();
        geometry_topologies[1].flip();
    }

    std::optional<coord_pos> position(std::size_t geom_index,direction d) const {
        return geometry_topologies[geom_index].get(d);
    }
    std::optional<coord_pos> on_position(std::size_t geom_index) const {
        return geometry_topologies[geom_index].get(direction::on);
    }

    void set_position(std::size_t geom_index,direction d,coord_pos p) {
        geometry_topologies[geom_index].set_position(d,p);
    }
    void set_on_position(std::size_t geom_index,coord_pos p) noexcept {
        geometry_topologies[geom_index].set_on_position(p);
    }
    void set_all_positions(std::size_t geom_index,coord_pos p) noexcept {
        geometry_topologies[geom_index].set_all_positions(p);
    }
    void set_all_positions_if_empty(std::size_t geom_index,coord_pos p) noexcept {
        geometry_topologies[geom_index].set_all_positions_if_empty(p);
    }

    /** The number of geometries that have at least one known position */
    std::size_t geometry_count() const noexcept {
        return std::size_t(!geometry_topologies[0].is_empty()) + std::size_t(!geometry_topologies[1].is_empty());
    }

    bool is_empty(std::size_t geom_index) const noexcept {
        return geometry_topologies[geom_index].is_empty();
    }
    bool is_any_empty(std::size_t geom_index) const noexcept {
        return geometry_topologies[geom_index].is_any_empty();
    }

    bool is_area() const noexcept {
        return geometry_topologies[0].is_area() || geometry_topologies[1].is_area();
    }
    bool is_geom_area(std::size_t geom_index) const noexcept {
        return geometry_topologies[geom_index].is_area();
    }
    bool is_line(std::size_t geom_index) const noexcept {
        return geometry_topologies[geom_index].is_line();
    }

    const topology_position &operator[](std::size_t geom_index) const noexcept {
        return geometry_topologies[geom_index];
    }

    friend bool operator==(const label&,const label&) = default;

    friend std::ostream &operator<<(std::ostream &os,const label &x) {
        return os << "A:" << x.geometry_topologies[0] << " B:" << x.geometry_topologies[1];
    }
};

} // namespace topo_ops

#endif
