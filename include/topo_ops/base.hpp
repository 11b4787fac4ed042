#ifndef TOPO_OPS_BASE_HPP
#define TOPO_OPS_BASE_HPP

#include <cmath>
#include <limits>
#include <utility>
#include <type_traits>
#include <concepts>
#include <cstddef>


#ifndef TOPO_OPS_ASSERT
#include <cassert>
#define TOPO_OPS_ASSERT assert
#endif

// used for checks that will significantly slow down the algorithm
#ifndef TOPO_OPS_ASSERT_SLOW
#define TOPO_OPS_ASSERT_SLOW(X) (void)0
#endif

/* The debug-log program defines this. The arguments are forwarded to
std::format. */
#ifndef TOPO_OPS_DEBUG_LOG
#define TOPO_OPS_DEBUG_LOG(...) (void)0
#endif


namespace topo_ops {

/** Mathematical operations on coordinate types. This struct can be specialized
by users of this library. */
template<typename Coord> struct coord_ops {
    static Coord abs(Coord x) { return std::abs(x); }

    /** Compute "a*b + c" with a single rounding. The robust kernel depends on
    this being exact for the error term of a product. */
    static Coord fma(Coord a,Coord b,Coord c) { return std::fma(a,b,c); }

    static Coord sqrt(Coord x) { return std::sqrt(x); }

    static bool is_finite(Coord x) { return std::isfinite(x); }

    /** Half of the difference between 1 and the next representable value.
    This is the unit roundoff used in the error bounds of the robust kernel. */
    static constexpr Coord unit_roundoff() {
        return std::numeric_limits<Coord>::epsilon() / 2;
    }
};

/* Getters for point-like objects. This can be specialized by the user for other
types. Static functions "get_x" and "get_y" should be defined to get the X and Y
coordinates respectively. */
template<typename T> struct point_ops {};

/* Coordinates must be binary floating point numbers. Exact arithmetic in the
robust kernel relies on the rounding behavior of IEEE 754. */
template<typename T> concept coordinate =
    std::floating_point<T>
    && requires(T c) {
        { coord_ops<T>::abs(c) } -> std::same_as<T>;
        { coord_ops<T>::fma(c,c,c) } -> std::same_as<T>;
        { coord_ops<T>::sqrt(c) } -> std::same_as<T>;
        { coord_ops<T>::is_finite(c) } -> std::same_as<bool>;
        { coord_ops<T>::unit_roundoff() } -> std::same_as<T>;
    };


template<typename T,typename Coord> concept point = requires(const T &v) {
    { point_ops<T>::get_x(v) } -> std::convertible_to<Coord>;
    { point_ops<T>::get_y(v) } -> std::convertible_to<Coord>;
};

template<typename T> struct point_t {
    using coord_type = T;

    T _data[2];

    point_t() = default;
    constexpr point_t(const T &x,const T &y) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : _data{x,y} {}
    constexpr point_t(const point_t &b) = default;
    template<point<T> U> constexpr point_t(const U &b)
        noexcept(std::is_nothrow_copy_constructible_v<T>
            && noexcept(point_ops<U>::get_x(b))
            && noexcept(point_ops<U>::get_y(b)))
        : _data{point_ops<U>::get_x(b),point_ops<U>::get_y(b)} {}

    constexpr point_t &operator=(const point_t &b) noexcept(std::is_nothrow_copy_constructible_v<T>) = default;

    constexpr T &operator[](std::size_t i) noexcept { return _data[i]; }
    constexpr const T &operator[](std::size_t i) const noexcept { return _data[i]; }

    constexpr T &x() noexcept { return _data[0]; }
    constexpr const T &x() const noexcept { return _data[0]; }
    constexpr T &y() noexcept { return _data[1]; }
    constexpr const T &y() const noexcept { return _data[1]; }

    constexpr T *begin() noexcept { return _data; }
    constexpr const T *begin() const noexcept { return _data; }
    constexpr T *end() noexcept { return _data+2; }
    constexpr const T *end() const noexcept { return _data+2; }

    constexpr std::size_t size() const noexcept { return 2; }

    constexpr point_t &operator+=(const point_t &b) {
        _data[0] += b[0];
        _data[1] += b[1];
        return *this;
    }

    constexpr point_t &operator-=(const point_t &b) {
        _data[0] -= b[0];
        _data[1] -= b[1];
        return *this;
    }

    constexpr point_t operator-() const {
        return {-_data[0],-_data[1]};
    }

    friend constexpr void swap(point_t &a,point_t &b) noexcept(std::is_nothrow_swappable_v<T>) {
        using std::swap;
        swap(a._data[0],b._data[0]);
        swap(a._data[1],b._data[1]);
    }
};

template<typename T> struct point_ops<point_t<T>> {
    static constexpr const T &get_x(const point_t<T> &p) noexcept { return p[0]; }
    static constexpr const T &get_y(const point_t<T> &p) noexcept { return p[1]; }
};

template<typename T>
constexpr point_t<T> operator+(const point_t<T> &a,const point_t<T> &b) {
    return {a[0]+b[0],a[1]+b[1]};
}

template<typename T>
constexpr point_t<T> operator-(const point_t<T> &a,const point_t<T> &b) {
    return {a[0]-b[0],a[1]-b[1]};
}

template<typename T>
constexpr point_t<T> operator*(const point_t<T> &a,T b) {
    return {a[0]*b,a[1]*b};
}
template<typename T>
constexpr point_t<T> operator*(T a,const point_t<T> &b) {
    return {a*b[0],a*b[1]};
}

template<typename T>
constexpr bool operator==(const point_t<T> &a,const point_t<T> &b) {
    return a[0] == b[0] && a[1] == b[1];
}
template<typename T>
constexpr bool operator!=(const point_t<T> &a,const point_t<T> &b) {
    return a[0] != b[0] || a[1] != b[1];
}

/* A functor to provide STL containers an arbitrary but consistent order for
point_t */
struct point_less {
    template<typename T>
    constexpr bool operator()(const point_t<T> &a,const point_t<T> &b) const {
        return (a[0] == b[0]) ? (a[1] < b[1]) : (a[0] < b[0]);
    }
};

template<typename T> constexpr T vdot(const point_t<T> &a,const point_t<T> &b) {
    return a[0]*b[0] + a[1]*b[1];
}

template<typename T> constexpr T square(const point_t<T> &a) {
    return vdot(a,a);
}

template<coordinate Coord> Coord vmag(const point_t<Coord> &x) {
    return coord_ops<Coord>::sqrt(square(x));
}

/* Returns true if "x" lies between "a" and "b" inclusive, regardless of which
of "a" and "b" is greater */
template<typename T> constexpr bool value_in_between(T x,T a,T b) {
    return a < b ? (a <= x && x <= b) : (b <= x && x <= a);
}

} // namespace topo_ops

#endif
