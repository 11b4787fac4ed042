#ifndef TOPO_OPS_INTERSECTION_MATRIX_HPP
#define TOPO_OPS_INTERSECTION_MATRIX_HPP

#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <ostream>

#include "position.hpp"
#include "geometry.hpp"


namespace topo_ops {

/** Thrown when a DE-9IM string or pattern is malformed */
class invalid_de9im_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

namespace detail {
constexpr std::array<coord_pos,3> all_positions = {
    coord_pos::inside,coord_pos::on_boundary,coord_pos::outside};

inline dimensions dimension_from_char(char c) {
    switch(c) {
    case 'F': case 'f': return dimensions::empty;
    case '0': return dimensions::point;
    case '1': return dimensions::line;
    case '2': return dimensions::area;
    default:
        throw invalid_de9im_error(std::string("expected '0', '1', '2' or 'F', found '") + c + '\'');
    }
}

/* A single character of a DE-9IM pattern */
inline bool dimension_matches(char pattern,dimensions d) {
    switch(pattern) {
    case '*': return true;
    case 'T': case 't': return d != dimensions::empty;
    default: return dimension_from_char(pattern) == d;
    }
}

inline void check_de9im_length(std::string_view str) {
    if(str.size() != 9) {
        throw invalid_de9im_error("a DE-9IM string must have exactly 9 characters, got " + std::to_string(str.size()));
    }
}
} // namespace detail

/** The Dimensionally Extended 9-Intersection Model matrix of two geometries.

Each cell holds the dimension of the intersection of the interior, boundary or
exterior of the first geometry ("A") with the interior, boundary or exterior of
the second geometry ("B"). While being computed, cells are only ever raised to
a higher dimension. */
class intersection_matrix {
    std::array<std::array<dimensions,3>,3> cells;

    static constexpr std::size_t index(coord_pos p) noexcept { return static_cast<std::size_t>(p); }

    dimensions &at(coord_pos a,coord_pos b) noexcept { return cells[index(a)][index(b)]; }

public:
    /** A matrix with every cell empty */
    intersection_matrix() noexcept {
        for(auto &row : cells) row.fill(dimensions::empty);
    }

    /** A matrix with every cell empty except exterior/exterior, which is two
    dimensional. This is the relationship between two empty geometries. */
    static intersection_matrix empty_disjoint() noexcept {
        intersection_matrix r;
        r.at(coord_pos::outside,coord_pos::outside) = dimensions::area;
        return r;
    }

    /** Parse a 9-character DE-9IM string consisting of 'F', '0', '1' and '2'.

    Throws invalid_de9im_error if the string is malformed. */
    static intersection_matrix from_string(std::string_view str) {
        intersection_matrix r;
        r.set_at_least_from_string(str);
        return r;
    }

    dimensions get(coord_pos a,coord_pos b) const noexcept { return cells[index(a)][index(b)]; }

    void set(coord_pos a,coord_pos b,dimensions d) noexcept { at(a,b) = d; }

    void set_at_least(coord_pos a,coord_pos b,dimensions minimum) noexcept {
        dimensions &cell = at(a,b);
        if(cell < minimum) cell = minimum;
    }

    /** Raise the cell only if both positions are known */
    void set_at_least_if_in_both(std::optional<coord_pos> a,std::optional<coord_pos> b,dimensions minimum) noexcept {
        if(a && b) set_at_least(*a,*b,minimum);
    }

    /** Raise each cell to the dimension given by the corresponding character of
    "str". 'F' leaves the cell unchanged. */
    void set_at_least_from_string(std::string_view str) {
        detail::check_de9im_length(str);

        /* validate everything first so that a bad string leaves the matrix
        untouched */
        std::array<dimensions,9> dims;
        for(std::size_t i=0; i<9; ++i) dims[i] = detail::dimension_from_char(str[i]);

        std::size_t i = 0;
        for(coord_pos a : detail::all_positions) {
            for(coord_pos b : detail::all_positions) set_at_least(a,b,dims[i++]);
        }
    }

    /** Fill in the cells for two geometries that are known not to intersect */
    template<coordinate T> void compute_disjoint(const geometry<T> &a,const geometry<T> &b) {
        dimensions d = dimensions_of(a);
        if(d != dimensions::empty) {
            set(coord_pos::inside,coord_pos::outside,d);
            dimensions bd = boundary_dimensions_of(a);
            if(bd != dimensions::empty) set(coord_pos::on_boundary,coord_pos::outside,bd);
        }

        d = dimensions_of(b);
        if(d != dimensions::empty) {
            set(coord_pos::outside,coord_pos::inside,d);
            dimensions bd = boundary_dimensions_of(b);
            if(bd != dimensions::empty) set(coord_pos::outside,coord_pos::on_boundary,bd);
        }
    }

    /** The matrix of the relationship with the geometries swapped */
    intersection_matrix transpose() const noexcept {
        intersection_matrix r;
        for(std::size_t i=0; i<3; ++i) {
            for(std::size_t j=0; j<3; ++j) r.cells[j][i] = cells[i][j];
        }
        return r;
    }

    /** Test against a 9-character DE-9IM pattern.

    Each character can be one of:
    - '*' matches any value
    - 'T' matches any non-empty value
    - 'F' matches only an empty value
    - '0', '1' or '2' matches exactly that dimension

    Throws invalid_de9im_error if the pattern is malformed. */
    bool matches(std::string_view pattern) const {
        detail::check_de9im_length(pattern);

        bool r = true;
        std::size_t i = 0;
        for(coord_pos a : detail::all_positions) {
            for(coord_pos b : detail::all_positions) {
                /* every character is checked even after a mismatch, so that an
                invalid pattern is always reported */
                if(!detail::dimension_matches(pattern[i++],get(a,b))) r = false;
            }
        }
        return r;
    }

    /** True if the geometries have no point in common. Pattern: "FF*FF****" */
    bool is_disjoint() const noexcept {
        return get(coord_pos::inside,coord_pos::inside) == dimensions::empty
            && get(coord_pos::inside,coord_pos::on_boundary) == dimensions::empty
            && get(coord_pos::on_boundary,coord_pos::inside) == dimensions::empty
            && get(coord_pos::on_boundary,coord_pos::on_boundary) == dimensions::empty;
    }

    bool is_intersects() const noexcept { return !is_disjoint(); }

    /** True if A lies in B, with at least one interior point in common.
    Pattern: "T*F**F***" */
    bool is_within() const noexcept {
        return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
            && get(coord_pos::inside,coord_pos::outside) == dimensions::empty
            && get(coord_pos::on_boundary,coord_pos::outside) == dimensions::empty;
    }

    /** Pattern: "T*****FF*" */
    bool is_contains() const noexcept {
        return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
            && get(coord_pos::outside,coord_pos::inside) == dimensions::empty
            && get(coord_pos::outside,coord_pos::on_boundary) == dimensions::empty;
    }

    /** True if the geometries are topologically equal. Pattern: "T*F**FFF*".

    Two empty geometries are also considered equal. */
    bool is_equal_topo() const noexcept {
        if(*this == empty_disjoint()) return true;

        return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
            && get(coord_pos::inside,coord_pos::outside) == dimensions::empty
            && get(coord_pos::outside,coord_pos::inside) == dimensions::empty
            && get(coord_pos::outside,coord_pos::on_boundary) == dimensions::empty
            && get(coord_pos::on_boundary,coord_pos::outside) == dimensions::empty;
    }

    /** True if every point of A is a point of B. Any of the patterns:
    "T*F**F***", "*TF**F***", "**FT*F***" or "**F*TF***" */
    bool is_covered_by() const noexcept {
        if(get(coord_pos::inside,coord_pos::outside) != dimensions::empty
            || get(coord_pos::on_boundary,coord_pos::outside) != dimensions::empty) return false;

        return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
            || get(coord_pos::inside,coord_pos::on_boundary) != dimensions::empty
            || get(coord_pos::on_boundary,coord_pos::inside) != dimensions::empty
            || get(coord_pos::on_boundary,coord_pos::on_boundary) != dimensions::empty;
    }

    /** True if every point of B is a point of A. Any of the patterns:
    "T*****FF*", "*T****FF*", "***T**FF*" or "****T*FF*" */
    bool is_covers() const noexcept {
        if(get(coord_pos::outside,coord_pos::inside) != dimensions::empty
            || get(coord_pos::outside,coord_pos::on_boundary) != dimensions::empty) return false;

        return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
            || get(coord_pos::inside,coord_pos::on_boundary) != dimensions::empty
            || get(coord_pos::on_boundary,coord_pos::inside) != dimensions::empty
            || get(coord_pos::on_boundary,coord_pos::on_boundary) != dimensions::empty;
    }

    /** True if the geometries have at least one boundary point in common, but
    their interiors don't intersect. Any of the patterns: "FT*******",
    "F**T*****" or "F***T****" */
    bool is_touches() const noexcept {
        return get(coord_pos::inside,coord_pos::inside) == dimensions::empty
            && (get(coord_pos::inside,coord_pos::on_boundary) != dimensions::empty
                || get(coord_pos::on_boundary,coord_pos::inside) != dimensions::empty
                || get(coord_pos::on_boundary,coord_pos::on_boundary) != dimensions::empty);
    }

    /** True if the interiors intersect, and the intersection has a lower
    dimension than the higher-dimensional geometry, which extends beyond the
    other.

    The dimensions of A and B are inferred from the matrix. Lines that cross
    must intersect in a point. */
    bool is_crosses() const noexcept {
        dimensions dims_a = std::max({
            get(coord_pos::inside,coord_pos::inside),
            get(coord_pos::inside,coord_pos::on_boundary),
            get(coord_pos::inside,coord_pos::outside)});
        dimensions dims_b = std::max({
            get(coord_pos::inside,coord_pos::inside),
            get(coord_pos::on_boundary,coord_pos::inside),
            get(coord_pos::outside,coord_pos::inside)});

        if(dims_a < dims_b) {
            return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
                && get(coord_pos::inside,coord_pos::outside) != dimensions::empty;
        }
        if(dims_a > dims_b) {
            return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
                && get(coord_pos::outside,coord_pos::inside) != dimensions::empty;
        }
        if(dims_a == dimensions::line) {
            return get(coord_pos::inside,coord_pos::inside) == dimensions::point;
        }
        return false;
    }

    /** True if the geometries have the same dimension, their interiors
    intersect, and each has a part outside of the other. For lines, the
    intersection of the interiors must also be a line. */
    bool is_overlaps() const noexcept {
        dimensions dims_a = std::max({
            get(coord_pos::inside,coord_pos::inside),
            get(coord_pos::inside,coord_pos::on_boundary),
            get(coord_pos::inside,coord_pos::outside)});
        dimensions dims_b = std::max({
            get(coord_pos::inside,coord_pos::inside),
            get(coord_pos::on_boundary,coord_pos::inside),
            get(coord_pos::outside,coord_pos::inside)});

        if(dims_a != dims_b) return false;

        switch(dims_a) {
        case dimensions::line:
            return get(coord_pos::inside,coord_pos::inside) == dimensions::line
                && get(coord_pos::inside,coord_pos::outside) != dimensions::empty
                && get(coord_pos::outside,coord_pos::inside) != dimensions::empty;
        case dimensions::point:
        case dimensions::area:
            return get(coord_pos::inside,coord_pos::inside) != dimensions::empty
                && get(coord_pos::inside,coord_pos::outside) != dimensions::empty
                && get(coord_pos::outside,coord_pos::inside) != dimensions::empty;
        default:
            return false;
        }
    }

    /** The 9-character DE-9IM string, in row-major order */
    std::string str() const {
        std::string r;
        r.reserve(9);
        for(auto &row : cells) {
            for(dimensions d : row) r.push_back(to_char(d));
        }
        return r;
    }

    friend bool operator==(const intersection_matrix&,const intersection_matrix&) = default;

    friend std::ostream &operator<<(std::ostream &os,const intersection_matrix &x) {
        return os << x.str();
    }
};

} // namespace topo_ops

#endif
